//Volume_Pair_Loader.h - A part of CropAutomaton.

#pragma once

#include <filesystem>
#include <string>

#include "Buffer3.h"
#include "Structs.h"


// CT intensities are always limited to this window after loading.
constexpr float CRPA_CT_CLIP_LOWER = -512.0f;
constexpr float CRPA_CT_CLIP_UPPER =  512.0f;

// Every occurrence of 'volume' replaced by 'segmentation', e.g., 'volume-3.nii' -> 'segmentation-3.nii'.
std::string
Paired_Label_Name(const std::string &ct_name);

// Location of the label file paired with a CT file: '<root>/ct/volume-3.nii' -> '<root>/seg/segmentation-3.nii'.
std::filesystem::path
Paired_Label_Filename(const std::filesystem::path &ct_filename);

// Limits every voxel to [lower, upper].
void
Clip_Intensities(buffer3<float> &vol,
                 float lower = CRPA_CT_CLIP_LOWER,
                 float upper = CRPA_CT_CLIP_UPPER);

// Loads a CT volume and its label volume and clips the CT intensities.
//
// Throws std::runtime_error naming the CT file if either file is unreadable or the shapes differ.
Volume_Pair
Load_Volume_Pair(const std::filesystem::path &ct_filename,
                 const std::filesystem::path &seg_filename);
