//Blob_Extraction.h - A part of CropAutomaton.

#pragma once

#include <cstdint>
#include <vector>

#include "Buffer3.h"
#include "Structs.h"
#include "Connected_Components.h"


// Binary mask of the voxels carrying exactly the given label.
buffer3<uint8_t>
Make_Label_Mask(const buffer3<float> &labels,
                int64_t label);

struct Blob_Extraction_Result {
    buffer3<component_id_t> component_ids; // Labelling of the undilated mask; 0 is background.
    std::vector<Blob> blobs;        // In component id order.
};

// Finds the connected components of the cropping label and their tight bounding boxes.
//
// When dilation is requested the components are found on the dilated mask and then projected back onto the
// undilated mask, so nearby pieces are merged but no component gains voxels. Contamination is computed for every
// blob, but no blob is rejected here.
Blob_Extraction_Result
Extract_Blobs(const buffer3<float> &labels,
              const Cropping_Params &params);

// Fraction of the blob's tight box occupied by voxels that belong to something else.
double
Compute_Contamination(const buffer3<component_id_t> &component_ids,
                      const buffer3<float> &labels,
                      const Blob &blob,
                      const Cropping_Params &params);

// Rejection happens only when the contamination strictly exceeds the tolerance.
bool
Passes_Overlap_Filter(const Blob &blob,
                      double allowed_perc_other_blobs);
