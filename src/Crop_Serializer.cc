//Crop_Serializer.cc - A part of CropAutomaton.

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "YgorString.h"

#include "Buffer3.h"
#include "Structs.h"
#include "String_Parsing.h"
#include "NPY_File_Writer.h"
#include "Volume_Pair_Loader.h"
#include "Crop_Serializer.h"


std::string
Dataset_Directory_Name(const Dataset_Options &opts){
    std::string out = "LiverData_(S-"_s + to_string_shortest(opts.spatial_scale)
                    + "_MS-" + triplet_to_string(opts.min_sizes)
                    + "_MM-" + to_string_shortest(opts.slice_size_mm)
                    + "RL-" + (opts.remove_liver_label ? "True" : "False");
    if(opts.cropping){
        out += "_CP-" + opts.cropping->to_string();
    }
    out += ")";
    return out;
}


std::string
Torso_Directory_Name(const Torso_Options &opts){
    return "Full-Torso-("_s + to_string_shortest(opts.spatial_subsample) + ","
                           + to_string_shortest(opts.slice_size_mm) + ")";
}


std::vector<std::string>
Crop_File_Stems(const std::string &base,
                const std::vector<std::string> &location_tags){
    std::vector<std::string> out;
    std::set<std::string> used;
    std::map<std::string, int64_t> repeats;

    for(const auto &tag : location_tags){
        auto candidate = tag;
        while(used.count(candidate) != 0){
            candidate = tag + "_" + std::to_string(++repeats[tag]);
        }
        used.insert(candidate);
        out.push_back(base + "-(" + candidate + ")");
    }
    return out;
}


std::string
Whole_Volume_File_Stem(const std::string &base,
                       int64_t index){
    return base + "-" + std::to_string(index);
}


void
Create_Output_Directories(const std::filesystem::path &dir){
    for(const auto &sub : { "ct", "seg" }){
        std::error_code ec;
        std::filesystem::create_directories(dir / sub, ec);
        if(ec){
            throw std::runtime_error("Unable to create directory '"_s + (dir / sub).string() + "': " + ec.message());
        }
    }
    return;
}


Written_Crop
Write_Crop_Pair(const buffer3<float> &ct,
                const buffer3<float> &labels,
                const std::filesystem::path &dir,
                const std::string &stem){
    if(!ct.same_shape(labels)){
        throw std::invalid_argument("Refusing to write a crop whose CT and labels differ in shape");
    }

    Written_Crop out;
    out.ct_path = dir / "ct" / (stem + ".npy");
    out.seg_path = dir / "seg" / (Paired_Label_Name(stem) + ".npy");

    Write_NPY_Int16(ct, out.ct_path);
    Write_NPY_Int16(labels, out.seg_path);
    return out;
}
