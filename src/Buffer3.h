//Buffer3.h - A part of CropAutomaton.
//
// This file provides a templated buffer3 class: a contiguous, single-channel 3D array that carries the spatial
// conventions of planar_image_collection. It is the working representation for CT and label volumes, component
// maps, and masks.
//
// Key design points:
//   - Contiguous memory: data is stored in a flat std::vector in [slice][row][col] order, i.e., the
//     (depth, height, width) axis order that the persisted arrays use.
//   - Spatial awareness: voxel positions are computed from spacing, orientation, and per-slice offsets.
//     As with DICOM ImagePositionPatient, the offset of a slice refers to the centre of its first voxel.
//   - Marshalling: conversion to/from planar_image_collection preserves the collection's image order, so slice
//     ordering always matches file storage order.

#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <functional>
#include <stdexcept>
#include <algorithm>
#include <cmath>
#include <string>

#include "YgorMath.h"
#include "YgorImages.h"


template <typename T>
class buffer3 {
  public:

    // Dimensions.
    int64_t N_slices = 0;
    int64_t N_rows   = 0;
    int64_t N_cols   = 0;

    // Spatial parameters (shared across all voxels, matching planar_image conventions).
    double pxl_dx = 1.0; // Spacing between columns, along row_unit.
    double pxl_dy = 1.0; // Spacing between rows, along col_unit.
    double pxl_dz = 1.0; // Spacing between slices.
    vec3<double> anchor   = vec3<double>(0.0, 0.0, 0.0);
    vec3<double> row_unit = vec3<double>(1.0, 0.0, 0.0);
    vec3<double> col_unit = vec3<double>(0.0, 1.0, 0.0);

    // Per-slice offsets (planar_image stores an offset per image).
    std::vector<vec3<double>> slice_offsets;

    // Contiguous data storage: [slice][row][col].
    std::vector<T> data;

    // ----- Constructors -----

    buffer3() = default;

    buffer3(int64_t slices, int64_t rows, int64_t cols, T fill = T(0))
        : N_slices(slices), N_rows(rows), N_cols(cols) {
        if((slices < 0) || (rows < 0) || (cols < 0)){
            throw std::invalid_argument("buffer3 dimensions cannot be negative");
        }
        data.resize(static_cast<size_t>(N_slices * N_rows * N_cols), fill);
        slice_offsets.resize(static_cast<size_t>(N_slices));
        for(int64_t s = 0; s < N_slices; ++s){
            slice_offsets[static_cast<size_t>(s)] = ortho_unit() * (static_cast<double>(s) * pxl_dz);
        }
    }

    // ----- Shape -----

    std::array<int64_t, 3> shape() const {
        return {{ N_slices, N_rows, N_cols }};
    }

    int64_t size() const {
        return N_slices * N_rows * N_cols;
    }

    bool empty() const {
        return (this->size() == 0);
    }

    template <typename U>
    bool same_shape(const buffer3<U> &other) const {
        return (this->shape() == other.shape());
    }

    // ----- Indexing -----

    int64_t index(int64_t slice, int64_t row, int64_t col) const {
        return (slice * N_rows + row) * N_cols + col;
    }

    T value(int64_t slice, int64_t row, int64_t col) const {
        return data[static_cast<size_t>(index(slice, row, col))];
    }

    T& reference(int64_t slice, int64_t row, int64_t col) {
        return data[static_cast<size_t>(index(slice, row, col))];
    }

    bool in_bounds(int64_t slice, int64_t row, int64_t col) const {
        return slice >= 0 && slice < N_slices
            && row   >= 0 && row   < N_rows
            && col   >= 0 && col   < N_cols;
    }

    // ----- Spatial functions -----

    vec3<double> ortho_unit() const {
        return row_unit.Cross(col_unit).unit();
    }

    // Position of the centre of voxel (slice, row, col).
    vec3<double> position(int64_t slice, int64_t row, int64_t col) const {
        return anchor
             + slice_offsets[static_cast<size_t>(slice)]
             + row_unit * (pxl_dx * static_cast<double>(col))
             + col_unit * (pxl_dy * static_cast<double>(row));
    }

    // Copies spacing and orientation (but not offsets or voxels) from another buffer.
    template <typename U>
    void copy_spatial_from(const buffer3<U> &other){
        this->pxl_dx   = other.pxl_dx;
        this->pxl_dy   = other.pxl_dy;
        this->pxl_dz   = other.pxl_dz;
        this->anchor   = other.anchor;
        this->row_unit = other.row_unit;
        this->col_unit = other.col_unit;
    }

    // Creates an empty (zero-filled) buffer with the same shape and geometry as another buffer.
    template <typename U>
    static buffer3 like(const buffer3<U> &other, T fill = T(0)) {
        buffer3 out(other.N_slices, other.N_rows, other.N_cols, fill);
        out.copy_spatial_from(other);
        out.slice_offsets = other.slice_offsets;
        return out;
    }

    // ----- Visitor -----

    void visit_all(const std::function<void(int64_t slice, int64_t row, int64_t col)> &f) const {
        for(int64_t s = 0; s < N_slices; ++s){
            for(int64_t r = 0; r < N_rows; ++r){
                for(int64_t c = 0; c < N_cols; ++c){
                    f(s, r, c);
                }
            }
        }
    }

    // ----- Sub-volume extraction -----
    //
    // Copies the half-open index box [s_begin,s_end) x [r_begin,r_end) x [c_begin,c_end). The extracted buffer keeps
    // the parent's spatial frame: its offsets point at the same physical locations as the parent's voxels.
    buffer3 subvolume(int64_t s_begin, int64_t s_end,
                      int64_t r_begin, int64_t r_end,
                      int64_t c_begin, int64_t c_end) const {
        if( (s_begin < 0) || (r_begin < 0) || (c_begin < 0)
        ||  (N_slices < s_end) || (N_rows < r_end) || (N_cols < c_end)
        ||  (s_end <= s_begin) || (r_end <= r_begin) || (c_end <= c_begin) ){
            throw std::out_of_range("Requested sub-volume is empty or exceeds the buffer extent");
        }

        buffer3 out(s_end - s_begin, r_end - r_begin, c_end - c_begin);
        out.copy_spatial_from(*this);

        const auto in_plane_shift = row_unit * (pxl_dx * static_cast<double>(c_begin))
                                  + col_unit * (pxl_dy * static_cast<double>(r_begin));
        for(int64_t s = s_begin; s < s_end; ++s){
            out.slice_offsets[static_cast<size_t>(s - s_begin)] = slice_offsets[static_cast<size_t>(s)] + in_plane_shift;

            for(int64_t r = r_begin; r < r_end; ++r){
                const auto src = data.begin() + index(s, r, c_begin);
                std::copy(src, src + (c_end - c_begin),
                          out.data.begin() + out.index(s - s_begin, r - r_begin, 0));
            }
        }
        return out;
    }

    // ----- Marshalling: from planar_image_collection -----
    //
    // Images are taken in collection order. Loaders emit images in file storage order, so slice indices match the
    // on-disk array. All images must share rows and columns; only the first channel is used.
    template <typename U>
    static buffer3 from_planar_image_collection(const planar_image_collection<U, double> &coll) {
        if(coll.images.empty()){
            throw std::invalid_argument("Cannot create buffer3 from empty image collection");
        }

        const auto &first = coll.images.front();

        buffer3 buf(static_cast<int64_t>(coll.images.size()), first.rows, first.columns);
        buf.pxl_dx   = first.pxl_dx;
        buf.pxl_dy   = first.pxl_dy;
        buf.pxl_dz   = first.pxl_dz;
        buf.anchor   = first.anchor;
        buf.row_unit = first.row_unit;
        buf.col_unit = first.col_unit;

        int64_t s = 0;
        for(const auto &img : coll.images){
            if( (img.rows != buf.N_rows) || (img.columns != buf.N_cols) ){
                throw std::invalid_argument("Images differ in number of rows or columns; volume is not rectilinear");
            }
            if(img.channels < 1){
                throw std::invalid_argument("Image has no channels");
            }
            buf.slice_offsets[static_cast<size_t>(s)] = img.offset;

            for(int64_t r = 0; r < buf.N_rows; ++r){
                for(int64_t c = 0; c < buf.N_cols; ++c){
                    buf.reference(s, r, c) = static_cast<T>(img.value(r, c, 0));
                }
            }
            ++s;
        }

        return buf;
    }

    // ----- Marshalling: to planar_image_collection -----
    //
    // One image per slice, in slice order. Metadata is not populated; callers add it as needed.
    template <typename U = float>
    planar_image_collection<U, double> to_planar_image_collection() const {
        planar_image_collection<U, double> coll;

        for(int64_t s = 0; s < N_slices; ++s){
            planar_image<U, double> img;
            img.init_orientation(row_unit, col_unit);
            img.init_buffer(N_rows, N_cols, 1);
            img.init_spatial(pxl_dx, pxl_dy, pxl_dz, anchor, slice_offsets[static_cast<size_t>(s)]);

            for(int64_t r = 0; r < N_rows; ++r){
                for(int64_t c = 0; c < N_cols; ++c){
                    img.reference(r, c, 0) = static_cast<U>(value(s, r, c));
                }
            }

            coll.images.push_back(std::move(img));
        }

        return coll;
    }
};

