//Cropping.h - A part of CropAutomaton.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Buffer3.h"
#include "Structs.h"


// Half-extent of the box along each axis, joined by '-' in axis order, e.g., "6-7-7".
std::string
Location_Tag(const Bounding_Box &box);

// Cuts the margined region around a blob out of both volumes.
Crop
Crop_Around_Blob(const buffer3<float> &ct,
                 const buffer3<float> &labels,
                 const Blob &blob,
                 const shape3_t &margins,
                 int64_t blob_index);

struct Cropping_Result {
    std::vector<Crop> crops;
    int64_t N_candidates = 0;
    int64_t N_rejected = 0;  // Blobs rejected by the overlap filter.
};

// Runs blob extraction, the overlap filter, and cropping over one CT/label pair.
Cropping_Result
Crop_Volume_Pair(const buffer3<float> &ct,
                 const buffer3<float> &labels,
                 const Cropping_Params &params);

// Drops the liver label (1 -> 0) and then shifts the tumour label down (2 -> 1). Values are matched after rounding to
// the nearest integer, as in Make_Label_Mask. Other values are untouched.
void
Remap_Liver_Labels(buffer3<float> &labels);

// True when every axis is at least as long as the corresponding minimum.
bool
Passes_Size_Gate(const shape3_t &shape,
                 const shape3_t &min_sizes);
