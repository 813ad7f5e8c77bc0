//NIfTI_File_Writer.cc - A part of CropAutomaton.
//
// This file writes NIfTI-1 single-file volumes.
//

#include <array>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "YgorMath.h"
#include "YgorLog.h"
#include "YgorStats.h"
#include "YgorString.h"

#include "Binary_Encoding.h"
#include "Buffer3.h"
#include "NIfTI_File_Writer.h"


namespace {

template <class T>
void
put_at(std::string &hdr, size_t offset, const T &x){
    if(hdr.size() < (offset + sizeof(T))){
        throw std::logic_error("Header field exceeds header size");
    }
    std::memcpy(&hdr[offset], &x, sizeof(T));
    return;
}

void
write_header_and_voxels(std::ostream &os,
                        const std::string &hdr,
                        const buffer3<float> &vol){
    write_to_stream(os, hdr, hdr.size());
    for(const auto &v : vol.data){
        const int16_t x = to_int16_saturated(static_cast<double>(v));
        write_to_stream(os, x, sizeof(int16_t));
    }
    return;
}

} // namespace


void
Write_NIfTI_File(const buffer3<float> &vol,
                 const std::filesystem::path &filename,
                 const std::string &description){
    Verify_Little_Endian_Host();
    if(vol.empty()){
        throw std::invalid_argument("Refusing to write an empty volume");
    }
    for(const auto &n : vol.shape()){
        if(32767 < n) throw std::invalid_argument("Volume is too large for a NIfTI-1 header");
    }

    // Header (348 bytes) followed by an empty 4-byte extension block.
    std::string hdr(352, '\0');
    put_at(hdr, 0, static_cast<int32_t>(348));

    const std::array<int16_t, 8> dim = {{ 3, static_cast<int16_t>(vol.N_cols),
                                             static_cast<int16_t>(vol.N_rows),
                                             static_cast<int16_t>(vol.N_slices), 1, 1, 1, 1 }};
    for(size_t i = 0; i < 8; ++i) put_at(hdr, 40 + 2 * i, dim[i]);

    put_at(hdr, 70, static_cast<int16_t>(4));   // datatype: int16.
    put_at(hdr, 72, static_cast<int16_t>(16));  // bitpix.

    const std::array<float, 8> pixdim = {{ 1.0f, static_cast<float>(vol.pxl_dx),
                                                 static_cast<float>(vol.pxl_dy),
                                                 static_cast<float>(vol.pxl_dz), 0.0f, 0.0f, 0.0f, 0.0f }};
    for(size_t i = 0; i < 8; ++i) put_at(hdr, 76 + 4 * i, pixdim[i]);

    put_at(hdr, 108, 352.0f); // vox_offset.
    put_at(hdr, 112, 1.0f);   // scl_slope.
    put_at(hdr, 116, 0.0f);   // scl_inter.
    put_at(hdr, 123, static_cast<uint8_t>(2 | 8)); // xyzt_units: mm and s.

    Stats::Running_MinMax<float> minmax_pixel;
    for(const auto &v : vol.data) minmax_pixel.Digest(v);
    put_at(hdr, 124, minmax_pixel.Current_Max()); // cal_max.
    put_at(hdr, 128, minmax_pixel.Current_Min()); // cal_min.

    {
        auto descrip = description.substr(0, 79);
        std::memcpy(&hdr[148], descrip.data(), descrip.size());
    }

    put_at(hdr, 252, static_cast<int16_t>(0)); // qform_code.
    put_at(hdr, 254, static_cast<int16_t>(1)); // sform_code: scanner anatomical.

    // Affine columns in LPS, then converted to RAS by negating x and y.
    auto slice_dir = vol.ortho_unit();
    if(1 < vol.N_slices){
        const auto d = vol.slice_offsets.back() - vol.slice_offsets.front();
        if(0.0 < d.length()) slice_dir = d.unit();
    }
    const std::array<vec3<double>, 4> cols = {{ vol.row_unit * vol.pxl_dx,
                                                vol.col_unit * vol.pxl_dy,
                                                slice_dir * vol.pxl_dz,
                                                vol.position(0, 0, 0) }};
    for(size_t c = 0; c < 4; ++c){
        put_at(hdr, 280 + 4 * c, static_cast<float>(-cols[c].x));
        put_at(hdr, 296 + 4 * c, static_cast<float>(-cols[c].y));
        put_at(hdr, 312 + 4 * c, static_cast<float>( cols[c].z));
    }

    put_at(hdr, 344, 'n');
    put_at(hdr, 345, '+');
    put_at(hdr, 346, '1');

    try{
        std::ofstream ofs(filename, std::ios::out | std::ios::trunc | std::ios::binary);
        if(!ofs.good()){
            throw std::runtime_error("Unable to open file for writing.");
        }

        if(boost::algorithm::iends_with(filename.string(), ".gz")){
            boost::iostreams::filtering_ostream ofsb;
            boost::iostreams::gzip_params gzparams(boost::iostreams::gzip::best_speed);
            ofsb.push(boost::iostreams::gzip_compressor(gzparams));
            ofsb.push(ofs);
            write_header_and_voxels(ofsb, hdr, vol);
            ofsb.flush();
            if(!ofsb.good()) throw std::runtime_error("Unable to compress voxel data.");
            ofsb.reset(); // Flushes the gzip trailer.
        }else{
            write_header_and_voxels(ofs, hdr, vol);
        }
        ofs.flush();
        if(!ofs.good()){
            throw std::runtime_error("Unable to write voxel data.");
        }
    }catch(const std::exception &e){
        throw std::runtime_error("Unable to write NIfTI file '"_s + filename.string() + "': " + e.what());
    }

    YLOGINFO("Wrote " << vol.N_slices << "x" << vol.N_rows << "x" << vol.N_cols
             << " NIfTI volume to '" << filename.string() << "'");
    return;
}
