//Resampling.h - A part of CropAutomaton.
//
// Spatial normalization of volumes by zoom factors, with end-points of each axis kept aligned.
//

#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "Buffer3.h"
#include "Structs.h"


using zoom3_t = std::array<double, 3>; // Per-axis zoom factors in (slice, row, column) order.

enum class Interpolation {
    Nearest,       // For label volumes.
    Cubic_Spline,  // Prefiltered cubic B-spline, for intensities.
};

// Zoom factors that bring the slice thickness to 'slice_size_mm' and scale the in-plane axes by 'scale'.
//
// Throws if any argument is non-positive.
zoom3_t
Zoom_Factors(double native_slice_spacing,
             double slice_size_mm,
             double scale);

// Resampling is a no-op when neither the slice thickness nor the in-plane scale change.
bool
Resampling_Needed(double slice_size_mm,
                  double scale);

// round(len * factor) along each axis, but never less than one voxel.
shape3_t
Resampled_Shape(const shape3_t &shape,
                const zoom3_t &factors);

// Resamples the volume onto a grid zoomed by the given factors. Spacing is divided by the factors and the first
// voxel keeps its position.
buffer3<float>
Resample_Volume(const buffer3<float> &in,
                const zoom3_t &factors,
                Interpolation interp);

// Applies the cubic B-spline prefilter (mirror boundaries) to a single line of samples in-place.
void
Cubic_Spline_Prefilter(std::vector<double> &line);
