//NIfTI_File_Loader.cc - A part of CropAutomaton.
//
// This program loads NIfTI-1 single-file volumes.
//

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "YgorMath.h"
#include "YgorMisc.h"
#include "YgorLog.h"
#include "YgorString.h"

#include "Structs.h"
#include "NIfTI_File_Loader.h"


namespace {

// Raw file contents, transparently decompressed when the file begins with the gzip magic bytes.
std::string
read_file_contents(const std::filesystem::path &filename){
    std::ifstream ifs(filename, std::ios::in | std::ios::binary);
    if(!ifs.good()){
        throw std::runtime_error("Unable to open file.");
    }

    std::array<char, 2> magic = {{ 0, 0 }};
    ifs.read(magic.data(), magic.size());
    const bool is_gzipped = (ifs.gcount() == 2)
                         && (static_cast<unsigned char>(magic[0]) == 0x1F)
                         && (static_cast<unsigned char>(magic[1]) == 0x8B);
    ifs.clear();
    ifs.seekg(0, std::ios::beg);

    std::string contents;
    if(is_gzipped){
        boost::iostreams::filtering_istream ifsb;
        ifsb.push(boost::iostreams::gzip_decompressor());
        ifsb.push(ifs);
        contents.assign(std::istreambuf_iterator<char>(ifsb), std::istreambuf_iterator<char>());
    }else{
        contents.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }
    return contents;
}

template <class T>
T
read_at(const std::string &buf, size_t offset, bool swap){
    if(buf.size() < (offset + sizeof(T))){
        throw std::runtime_error("File is truncated.");
    }
    std::array<char, sizeof(T)> bytes;
    std::memcpy(bytes.data(), buf.data() + offset, sizeof(T));
    if(swap) std::reverse(std::begin(bytes), std::end(bytes));

    T x;
    std::memcpy(&x, bytes.data(), sizeof(T));
    return x;
}

size_t
voxel_size_for_datatype(int16_t datatype){
    switch(datatype){
        case 2:    return 1; // uint8.
        case 256:  return 1; // int8.
        case 4:    return 2; // int16.
        case 512:  return 2; // uint16.
        case 8:    return 4; // int32.
        case 768:  return 4; // uint32.
        case 16:   return 4; // float32.
        case 1024: return 8; // int64.
        case 1280: return 8; // uint64.
        case 64:   return 8; // float64.
        default: break;
    }
    throw std::runtime_error("Unsupported NIfTI datatype "_s + std::to_string(datatype) + ".");
}

double
voxel_value(const std::string &buf, size_t offset, int16_t datatype, bool swap){
    switch(datatype){
        case 2:    return static_cast<double>(read_at<uint8_t>(buf, offset, swap));
        case 256:  return static_cast<double>(read_at<int8_t>(buf, offset, swap));
        case 4:    return static_cast<double>(read_at<int16_t>(buf, offset, swap));
        case 512:  return static_cast<double>(read_at<uint16_t>(buf, offset, swap));
        case 8:    return static_cast<double>(read_at<int32_t>(buf, offset, swap));
        case 768:  return static_cast<double>(read_at<uint32_t>(buf, offset, swap));
        case 16:   return static_cast<double>(read_at<float>(buf, offset, swap));
        case 1024: return static_cast<double>(read_at<int64_t>(buf, offset, swap));
        case 1280: return static_cast<double>(read_at<uint64_t>(buf, offset, swap));
        case 64:   return read_at<double>(buf, offset, swap);
        default: break;
    }
    throw std::runtime_error("Unsupported NIfTI datatype "_s + std::to_string(datatype) + ".");
}

} // namespace


bool
Has_NIfTI_Extension(const std::filesystem::path &filename){
    const auto name = filename.filename().string();
    return boost::algorithm::iends_with(name, ".nii")
        || boost::algorithm::iends_with(name, ".nii.gz");
}


std::string
Strip_NIfTI_Extension(const std::filesystem::path &filename){
    auto name = filename.filename().string();
    if(boost::algorithm::iends_with(name, ".nii.gz")){
        name.resize(name.size() - 7);
    }else if(boost::algorithm::iends_with(name, ".nii")){
        name.resize(name.size() - 4);
    }
    return name;
}


std::unique_ptr<Image_Array>
Load_NIfTI_File(const std::filesystem::path &filename,
                const std::string &modality){

    // The NIfTI-1 header is a fixed 348-byte structure. Only the single-file ('n+1') layout is accepted; voxel data
    // follows the header (and any extensions) at vox_offset.
    //
    // Note: 'i' is the fastest-varying voxel index. It is mapped to columns, 'j' to rows, and 'k' to slices so that
    //       the (slice, row, column) array order matches the on-disk (k, j, i) order.
    try{
        YLOGINFO("Loading NIfTI file '" << filename.string() << "'");
        const auto buf = read_file_contents(filename);
        if(buf.size() < 348){
            throw std::runtime_error("File is too small to contain a NIfTI-1 header.");
        }

        // Detect byte order using the header size, which must be 348.
        bool swap = false;
        if(read_at<int32_t>(buf, 0, false) != 348){
            if(read_at<int32_t>(buf, 0, true) != 348){
                throw std::runtime_error("Not a NIfTI-1 file (sizeof_hdr is not 348).");
            }
            swap = true;
        }
        if(buf.compare(344, 4, std::string("n+1\0", 4)) != 0){
            throw std::runtime_error("Only single-file NIfTI-1 ('n+1') volumes are supported.");
        }

        std::array<int64_t, 8> dim;
        for(size_t i = 0; i < 8; ++i) dim[i] = read_at<int16_t>(buf, 40 + 2 * i, swap);
        const auto N_dims = dim[0];
        if( (N_dims < 1) || (7 < N_dims) ){
            throw std::runtime_error("Invalid number of dimensions.");
        }
        for(int64_t i = 1; i <= 7; ++i){
            if( (N_dims < i) || (dim[static_cast<size_t>(i)] < 1) ) dim[static_cast<size_t>(i)] = 1;
        }
        for(size_t i = 4; i < 8; ++i){
            if(dim[i] != 1){
                throw std::runtime_error("Volume has more than three non-unit dimensions.");
            }
        }
        const auto N_i = dim[1];
        const auto N_j = dim[2];
        const auto N_k = dim[3];

        const auto datatype = read_at<int16_t>(buf, 70, swap);
        const auto voxel_bytes = voxel_size_for_datatype(datatype);

        std::array<double, 8> pixdim;
        for(size_t i = 0; i < 8; ++i) pixdim[i] = static_cast<double>(read_at<float>(buf, 76 + 4 * i, swap));

        const auto vox_offset = static_cast<size_t>(std::max(352.0f, read_at<float>(buf, 108, swap)));
        auto scl_slope = static_cast<double>(read_at<float>(buf, 112, swap));
        auto scl_inter = static_cast<double>(read_at<float>(buf, 116, swap));
        if(!std::isfinite(scl_slope) || !std::isfinite(scl_inter) || (scl_slope == 0.0)){
            scl_slope = 1.0;
            scl_inter = 0.0;
        }

        const auto N_voxels = static_cast<size_t>(N_i * N_j * N_k);
        if(buf.size() < (vox_offset + N_voxels * voxel_bytes)){
            throw std::runtime_error("File is truncated; voxel data is incomplete.");
        }

        // Voxel-to-world affine, in RAS coordinates. Columns are the i, j, k axes and the translation.
        std::array<std::array<double, 4>, 3> A = {{ {{ 0.0, 0.0, 0.0, 0.0 }},
                                                    {{ 0.0, 0.0, 0.0, 0.0 }},
                                                    {{ 0.0, 0.0, 0.0, 0.0 }} }};
        const auto qform_code = read_at<int16_t>(buf, 252, swap);
        const auto sform_code = read_at<int16_t>(buf, 254, swap);
        if(0 < sform_code){
            for(size_t r = 0; r < 3; ++r){
                for(size_t c = 0; c < 4; ++c){
                    A[r][c] = static_cast<double>(read_at<float>(buf, 280 + 16 * r + 4 * c, swap));
                }
            }
        }else if(0 < qform_code){
            const auto b = static_cast<double>(read_at<float>(buf, 256, swap));
            const auto c = static_cast<double>(read_at<float>(buf, 260, swap));
            const auto d = static_cast<double>(read_at<float>(buf, 264, swap));
            const auto a = std::sqrt(std::max(0.0, 1.0 - (b*b + c*c + d*d)));
            const double qfac = (pixdim[0] < 0.0) ? -1.0 : 1.0;

            const std::array<std::array<double, 3>, 3> R = {{
                {{ a*a + b*b - c*c - d*d, 2.0*(b*c - a*d),       2.0*(b*d + a*c)       }},
                {{ 2.0*(b*c + a*d),       a*a + c*c - b*b - d*d, 2.0*(c*d - a*b)       }},
                {{ 2.0*(b*d - a*c),       2.0*(c*d + a*b),       a*a + d*d - c*c - b*b }} }};
            const std::array<double, 3> scale = {{ pixdim[1], pixdim[2], pixdim[3] * qfac }};
            for(size_t r = 0; r < 3; ++r){
                for(size_t k = 0; k < 3; ++k) A[r][k] = R[r][k] * scale[k];
            }
            A[0][3] = static_cast<double>(read_at<float>(buf, 268, swap));
            A[1][3] = static_cast<double>(read_at<float>(buf, 272, swap));
            A[2][3] = static_cast<double>(read_at<float>(buf, 276, swap));
        }else{
            A[0][0] = pixdim[1];
            A[1][1] = pixdim[2];
            A[2][2] = pixdim[3];
        }

        // RAS -> LPS.
        const auto column = [&](size_t c){
            return vec3<double>(-A[0][c], -A[1][c], A[2][c]);
        };
        const auto axis_i = column(0);
        const auto axis_j = column(1);
        const auto axis_k = column(2);
        const auto origin = column(3);

        const auto pxl_dx = axis_i.length();
        const auto pxl_dy = axis_j.length();
        const auto pxl_dz = axis_k.length();
        if( !(0.0 < pxl_dx) || !(0.0 < pxl_dy) || !(0.0 < pxl_dz)
        ||  !std::isfinite(pxl_dx) || !std::isfinite(pxl_dy) || !std::isfinite(pxl_dz) ){
            throw std::runtime_error("Voxel spacing is degenerate.");
        }
        const auto row_unit = axis_i.unit();
        const auto col_unit = axis_j.unit();
        const auto ImageAnchor = vec3<double>(0.0, 0.0, 0.0);

        auto out = std::make_unique<Image_Array>();
        out->filename = filename.string();
        for(int64_t k = 0; k < N_k; ++k){
            const auto ImagePosition = origin + axis_k * static_cast<double>(k);

            out->imagecoll.images.emplace_back();
            auto &img = out->imagecoll.images.back();
            img.init_orientation(row_unit, col_unit);
            img.init_buffer(N_j, N_i, 1);
            img.init_spatial(pxl_dx, pxl_dy, pxl_dz, ImageAnchor, ImagePosition);

            img.metadata["Filename"] = filename.string();
            img.metadata["Modality"] = modality;
            img.metadata["Rows"] = std::to_string(N_j);
            img.metadata["Columns"] = std::to_string(N_i);
            img.metadata["SliceThickness"] = std::to_string(pxl_dz);
            img.metadata["SpacingBetweenSlices"] = std::to_string(pxl_dz);
            img.metadata["ImagePositionPatient"] = std::to_string(ImagePosition.x) + "\\"
                                                 + std::to_string(ImagePosition.y) + "\\"
                                                 + std::to_string(ImagePosition.z);
            img.metadata["ImageOrientationPatient"] = std::to_string(row_unit.x) + "\\"
                                                    + std::to_string(row_unit.y) + "\\"
                                                    + std::to_string(row_unit.z) + "\\"
                                                    + std::to_string(col_unit.x) + "\\"
                                                    + std::to_string(col_unit.y) + "\\"
                                                    + std::to_string(col_unit.z);
            img.metadata["PixelSpacing"] = std::to_string(pxl_dy) + "\\" + std::to_string(pxl_dx);

            for(int64_t j = 0; j < N_j; ++j){
                for(int64_t i = 0; i < N_i; ++i){
                    const auto n = static_cast<size_t>(i + N_i * (j + N_j * k));
                    const auto x = voxel_value(buf, vox_offset + n * voxel_bytes, datatype, swap);
                    img.reference(j, i, 0) = static_cast<float>(x * scl_slope + scl_inter);
                }
            }
        }

        YLOGINFO("Loaded NIfTI volume with dimensions " << N_k << "x" << N_j << "x" << N_i
                 << " and spacing " << pxl_dz << "x" << pxl_dy << "x" << pxl_dx);
        return out;

    }catch(const std::exception &e){
        throw std::runtime_error("Unable to load NIfTI file '"_s + filename.string() + "': " + e.what());
    }
}
