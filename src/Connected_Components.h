//Connected_Components.h - A part of CropAutomaton.

#pragma once

#include <cstdint>

#include "Buffer3.h"


// Voxel neighbourhoods for connectivity and morphology.
enum class Adjacency {
    Face,              // 6-connected.
    Face_Edge,         // 18-connected.
    Face_Edge_Vertex,  // 26-connected.
};

// Component ids. 0 is background.
using component_id_t = int32_t;

struct Component_Labelling {
    buffer3<component_id_t> ids;  // 0 for background, 1..N_components otherwise.
    int64_t N_components = 0;
};

// Labels connected components of the non-zero voxels in the mask.
//
// Ids are assigned in raster order ([slice][row][col]) of each component's first voxel, so the labelling is
// deterministic. The output shares the mask's geometry. Throws std::overflow_error if the ids would not fit.
Component_Labelling
Label_Connected_Components(const buffer3<uint8_t> &mask,
                           Adjacency adjacency = Adjacency::Face_Edge_Vertex);

// Iterated binary dilation with a 6-connected cross structuring element. Voxels outside the volume are background.
buffer3<uint8_t>
Binary_Dilation(const buffer3<uint8_t> &mask,
                int64_t iterations);
