//Structs.cc - A part of CropAutomaton.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "YgorMisc.h"
#include "YgorString.h"

#include "String_Parsing.h"
#include "Structs.h"


//---------------------------------------------------------------------------------------------------------------------------
//------------------------------------------------------- Image_Array -------------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
Image_Array::Image_Array() = default;

Image_Array::Image_Array(const Image_Array &rhs){
    *this = rhs; //Performs a deep copy (unless copying self).
}

Image_Array & Image_Array::operator=(const Image_Array &rhs){
    if(this != &rhs){
        this->imagecoll = rhs.imagecoll;
        this->filename  = rhs.filename;
    }
    return *this;
}

//---------------------------------------------------------------------------------------------------------------------------
//------------------------------------------------------- Index_Range -------------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
int64_t Index_Range::length() const {
    return (this->stop - this->start);
}

bool Index_Range::operator==(const Index_Range &rhs) const {
    return (this->start == rhs.start) && (this->stop == rhs.stop);
}

//---------------------------------------------------------------------------------------------------------------------------
//------------------------------------------------------- Bounding_Box ------------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
Bounding_Box::Bounding_Box(const shape3_t &lower,
                           const shape3_t &upper,
                           const shape3_t &volume_shape){
    for(size_t i = 0; i < 3; ++i){
        const auto start = std::clamp<int64_t>(lower[i], 0, volume_shape[i]);
        const auto stop  = std::clamp<int64_t>(upper[i], 0, volume_shape[i]);
        if(stop <= start){
            throw std::invalid_argument("Bounding box is empty along axis "_s + std::to_string(i)
                                        + " after clamping to the volume");
        }
        this->ranges[i].start = start;
        this->ranges[i].stop  = stop;
    }
}

Bounding_Box Bounding_Box::expanded(const shape3_t &margins,
                                    const shape3_t &volume_shape) const {
    shape3_t lower;
    shape3_t upper;
    for(size_t i = 0; i < 3; ++i){
        if(margins[i] < 0) throw std::invalid_argument("Margins cannot be negative");
        lower[i] = this->ranges[i].start - margins[i];
        upper[i] = this->ranges[i].stop + margins[i];
    }
    return Bounding_Box(lower, upper, volume_shape);
}

shape3_t Bounding_Box::extents() const {
    return {{ this->ranges[0].length(),
              this->ranges[1].length(),
              this->ranges[2].length() }};
}

int64_t Bounding_Box::voxel_count() const {
    const auto e = this->extents();
    return e[0] * e[1] * e[2];
}

bool Bounding_Box::contains(int64_t slice, int64_t row, int64_t col) const {
    return (this->ranges[0].start <= slice) && (slice < this->ranges[0].stop)
        && (this->ranges[1].start <= row)   && (row   < this->ranges[1].stop)
        && (this->ranges[2].start <= col)   && (col   < this->ranges[2].stop);
}

bool Bounding_Box::operator==(const Bounding_Box &rhs) const {
    return (this->ranges == rhs.ranges);
}

std::string Bounding_Box::to_string() const {
    std::string out = "[";
    for(size_t i = 0; i < 3; ++i){
        if(i != 0) out += ", ";
        out += std::to_string(this->ranges[i].start) + ":" + std::to_string(this->ranges[i].stop);
    }
    out += "]";
    return out;
}

//---------------------------------------------------------------------------------------------------------------------------
//----------------------------------------------------- Cropping_Params -----------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
Cropping_Params::Cropping_Params() = default;

Cropping_Params::Cropping_Params(int64_t cropping_label,
                                 const shape3_t &slice_margins,
                                 double allowed_perc_other_blobs,
                                 int64_t mask_dilation,
                                 bool count_other_labels)
    : cropping_label(cropping_label),
      slice_margins(slice_margins),
      allowed_perc_other_blobs(allowed_perc_other_blobs),
      mask_dilation(mask_dilation),
      count_other_labels(count_other_labels) {

    if(cropping_label == 0){
        throw std::invalid_argument("The background label (0) cannot be used as the cropping label");
    }
    for(const auto &m : slice_margins){
        if(m < 0) throw std::invalid_argument("Slice margins cannot be negative");
    }
    if( !std::isfinite(allowed_perc_other_blobs)
    ||  (allowed_perc_other_blobs < 0.0)
    ||  (1.0 < allowed_perc_other_blobs) ){
        throw std::invalid_argument("Allowed fraction of other blobs must be within [0,1]");
    }
    if(mask_dilation < 0){
        throw std::invalid_argument("Mask dilation iterations cannot be negative");
    }
}

std::string Cropping_Params::to_string() const {
    return "[CL-"_s + std::to_string(this->cropping_label)
         + "_margins-" + triplet_to_string(this->slice_margins)
         + "_OB-" + to_string_shortest(this->allowed_perc_other_blobs)
         + "_MD-" + std::to_string(this->mask_dilation)
         + "]";
}

//---------------------------------------------------------------------------------------------------------------------------
//------------------------------------------------------ Dataset_Options ----------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
void Dataset_Options::validate() const {
    if( !std::isfinite(this->slice_size_mm) || !(0.0 < this->slice_size_mm) ){
        throw std::invalid_argument("Slice size must be positive");
    }
    if( !std::isfinite(this->spatial_scale) || !(0.0 < this->spatial_scale) ){
        throw std::invalid_argument("Spatial scale must be positive");
    }
    for(const auto &m : this->min_sizes){
        if(m < 1) throw std::invalid_argument("Minimum sizes must be positive");
    }
    if(this->threads < 1){
        throw std::invalid_argument("At least one thread is required");
    }
    return;
}

//---------------------------------------------------------------------------------------------------------------------------
//------------------------------------------------------- Torso_Options -----------------------------------------------------
//---------------------------------------------------------------------------------------------------------------------------
void Torso_Options::validate() const {
    if( !std::isfinite(this->spatial_subsample) || !(0.0 < this->spatial_subsample) ){
        throw std::invalid_argument("Spatial subsample factor must be positive");
    }
    if( !std::isfinite(this->slice_size_mm) || !(0.0 < this->slice_size_mm) ){
        throw std::invalid_argument("Slice size must be positive");
    }
    if(this->expand_slice < 0){
        throw std::invalid_argument("Slab expansion cannot be negative");
    }
    if(this->min_depth < 1){
        throw std::invalid_argument("Minimum depth must be positive");
    }
    if(this->threads < 1){
        throw std::invalid_argument("At least one thread is required");
    }
    return;
}
