//Volume_Pair_Loader.cc - A part of CropAutomaton.

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <boost/algorithm/string/replace.hpp>

#include "YgorLog.h"
#include "YgorString.h"

#include "Buffer3.h"
#include "Structs.h"
#include "NIfTI_File_Loader.h"
#include "Volume_Pair_Loader.h"


std::string
Paired_Label_Name(const std::string &ct_name){
    return boost::algorithm::replace_all_copy(ct_name, "volume", "segmentation");
}


std::filesystem::path
Paired_Label_Filename(const std::filesystem::path &ct_filename){
    const auto root = ct_filename.parent_path().parent_path();
    return root / "seg" / Paired_Label_Name(ct_filename.filename().string());
}


void
Clip_Intensities(buffer3<float> &vol,
                 float lower,
                 float upper){
    if(upper < lower){
        throw std::invalid_argument("Clipping window is inverted");
    }
    for(auto &v : vol.data){
        v = std::clamp(v, lower, upper);
    }
    return;
}


Volume_Pair
Load_Volume_Pair(const std::filesystem::path &ct_filename,
                 const std::filesystem::path &seg_filename){
    Volume_Pair out;
    out.ct_filename = ct_filename;
    out.seg_filename = seg_filename;

    {
        auto ct_arr = Load_NIfTI_File(ct_filename, "CT");
        out.ct = buffer3<float>::from_planar_image_collection(ct_arr->imagecoll);
    }
    {
        auto seg_arr = Load_NIfTI_File(seg_filename, "SEG");
        out.labels = buffer3<float>::from_planar_image_collection(seg_arr->imagecoll);
    }

    if(!out.ct.same_shape(out.labels)){
        const auto cs = out.ct.shape();
        const auto ls = out.labels.shape();
        throw std::runtime_error("Shape mismatch between '"_s + ct_filename.string() + "' ("
                                 + std::to_string(cs[0]) + "x" + std::to_string(cs[1]) + "x" + std::to_string(cs[2])
                                 + ") and its labels ("
                                 + std::to_string(ls[0]) + "x" + std::to_string(ls[1]) + "x" + std::to_string(ls[2])
                                 + ")");
    }

    Clip_Intensities(out.ct);
    return out;
}
