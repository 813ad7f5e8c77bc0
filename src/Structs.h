//Structs.h - A part of CropAutomaton.

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <list>
#include <optional>
#include <string>

#include "YgorImages.h"
#include "YgorMath.h"

#include "Buffer3.h"


// Holds a loaded image volume as a stack of planar images, alongside the file it originated from.
class Image_Array {
    public:

        planar_image_collection<float,double> imagecoll;

        std::string filename; //The filename from which the data originated, if applicable.

        //Constructor/Destructors.
        Image_Array();
        Image_Array(const Image_Array &rhs); //Performs a deep copy (unless copying self).

        //Member functions.
        Image_Array & operator=(const Image_Array &rhs); //Performs a deep copy (unless copying self).
};


// Volume shapes are always given in (slice, row, column) order, i.e., (depth, height, width).
using shape3_t = std::array<int64_t, 3>;


// A half-open integer interval [start, stop).
struct Index_Range {
    int64_t start = 0;
    int64_t stop  = 0;

    int64_t length() const;
    bool operator==(const Index_Range &rhs) const;
};


// An axis-aligned box of voxel indices, one half-open interval per axis.
//
// Boxes can only be created through the clamping constructor, which limits every interval to [0, dim) of the volume
// the box refers to. An interval that would be empty after clamping is an error.
class Bounding_Box {
    public:
        std::array<Index_Range, 3> ranges;

        Bounding_Box(const shape3_t &lower,   // Inclusive.
                     const shape3_t &upper,   // Exclusive.
                     const shape3_t &volume_shape);

        // Grows each interval by the per-axis margin, clamping both ends to the volume.
        Bounding_Box expanded(const shape3_t &margins,
                              const shape3_t &volume_shape) const;

        shape3_t extents() const;
        int64_t voxel_count() const;
        bool contains(int64_t slice, int64_t row, int64_t col) const;

        bool operator==(const Bounding_Box &rhs) const;

        // Python-like slice notation, e.g., "[9:21, 28:42, 28:42]".
        std::string to_string() const;
};


// Parameters controlling blob discovery and blob acceptance.
//
// Validated on construction; invalid values throw std::invalid_argument.
class Cropping_Params {
    public:
        int64_t cropping_label           = 1;         // Label value to search for connected components.
        shape3_t slice_margins           = {{ 2, 10, 10 }}; // Voxels of padding around each blob, per axis.
        double allowed_perc_other_blobs  = 0.5;       // Contamination tolerance in [0,1].
        int64_t mask_dilation            = 3;         // Dilation iterations applied before labelling.
        bool count_other_labels          = false;     // Also treat other non-zero labels as contamination.

        Cropping_Params();
        Cropping_Params(int64_t cropping_label,
                        const shape3_t &slice_margins,
                        double allowed_perc_other_blobs,
                        int64_t mask_dilation,
                        bool count_other_labels = false);

        // Compact description used in output directory names,
        // e.g., "[CL-2_margins-(1, 20, 20)_OB-0.5_MD-3]".
        std::string to_string() const;
};


// One connected component of the cropping label.
struct Blob {
    int64_t component_id = 0;   // Unique within one labelling pass only.
    Bounding_Box tight_box;     // Exact extent of the component's voxels.
    int64_t voxel_count = 0;
    double contamination = 0.0; // Fraction of tight-box voxels belonging to something else.
};


// A CT/label sub-volume pair cut from a source volume.
struct Crop {
    buffer3<float> ct;
    buffer3<float> labels;
    Bounding_Box margined_box;  // Region of the source volume the crop was cut from.
    std::string location_tag;   // Half-extents of the margined box, e.g., "6-7-7".
    int64_t blob_index = 0;     // Position of the crop amongst those produced from its source volume.
};


// A loaded CT volume and its matching label volume.
struct Volume_Pair {
    buffer3<float> ct;
    buffer3<float> labels;

    std::filesystem::path ct_filename;
    std::filesystem::path seg_filename;
};


// Settings for the crop dataset mode.
struct Dataset_Options {
    double slice_size_mm = 1.0;               // Target slice thickness.
    double spatial_scale = 1.0;               // In-plane zoom factor.
    shape3_t min_sizes = {{ 4, 10, 10 }};     // Crops smaller than this along any axis are dropped.
    bool remove_liver_label = false;
    std::optional<Cropping_Params> cropping;  // Whole volumes are kept when absent.

    std::filesystem::path output_root = ".";
    int64_t threads = 1;
    bool halt_on_error = false;

    // Throws std::invalid_argument for non-positive scales, sizes, or thread counts.
    void validate() const;
};

// Settings for the torso normalization mode.
struct Torso_Options {
    double spatial_subsample = 0.5;
    double slice_size_mm = 2.0;
    int64_t expand_slice = 20;  // Slices kept on either side of the labelled slab.
    int64_t min_depth = 48;     // Volumes with fewer slices after expansion are dropped.

    std::filesystem::path output_root = ".";
    int64_t threads = 1;
    bool halt_on_error = false;

    void validate() const;
};
