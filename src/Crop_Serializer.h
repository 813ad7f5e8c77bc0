//Crop_Serializer.h - A part of CropAutomaton.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "Buffer3.h"
#include "Structs.h"


// Output directory name for the crop dataset mode,
// e.g., "LiverData_(S-1_MS-(4, 10, 10)_MM-1RL-True_CP-[CL-2_margins-(1, 20, 20)_OB-0.5_MD-3])".
std::string
Dataset_Directory_Name(const Dataset_Options &opts);

// Output directory name for the torso normalization mode, e.g., "Full-Torso-(0.5,2)".
std::string
Torso_Directory_Name(const Torso_Options &opts);

// File stems ('<base>-(<tag>)') for crops cut from one volume, in the order given.
//
// Repeated tags receive a '_<n>' suffix inside the parentheses, starting at 1, so every stem is unique.
std::vector<std::string>
Crop_File_Stems(const std::string &base,
                const std::vector<std::string> &location_tags);

// File stem for an uncropped volume: '<base>-<index>'.
std::string
Whole_Volume_File_Stem(const std::string &base,
                       int64_t index);

// Creates '<dir>/ct' and '<dir>/seg' if needed.
void
Create_Output_Directories(const std::filesystem::path &dir);

struct Written_Crop {
    std::filesystem::path ct_path;
    std::filesystem::path seg_path;
};

// Writes the CT array to '<dir>/ct/<stem>.npy' and the labels to '<dir>/seg/' with 'volume' replaced by
// 'segmentation' in the name.
Written_Crop
Write_Crop_Pair(const buffer3<float> &ct,
                const buffer3<float> &labels,
                const std::filesystem::path &dir,
                const std::string &stem);
