//Cropping.cc - A part of CropAutomaton.

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "YgorLog.h"
#include "YgorString.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Blob_Extraction.h"
#include "Cropping.h"


std::string
Location_Tag(const Bounding_Box &box){
    std::string out;
    for(size_t i = 0; i < 3; ++i){
        if(i != 0) out += "-";
        out += std::to_string(box.ranges[i].length() / 2);
    }
    return out;
}


Crop
Crop_Around_Blob(const buffer3<float> &ct,
                 const buffer3<float> &labels,
                 const Blob &blob,
                 const shape3_t &margins,
                 int64_t blob_index){
    if(!ct.same_shape(labels)){
        throw std::invalid_argument("CT and label volumes differ in shape");
    }

    const auto box = blob.tight_box.expanded(margins, ct.shape());
    const auto &R = box.ranges;
    Crop out = { ct.subvolume(R[0].start, R[0].stop, R[1].start, R[1].stop, R[2].start, R[2].stop),
                 labels.subvolume(R[0].start, R[0].stop, R[1].start, R[1].stop, R[2].start, R[2].stop),
                 box,
                 Location_Tag(box),
                 blob_index };
    return out;
}


Cropping_Result
Crop_Volume_Pair(const buffer3<float> &ct,
                 const buffer3<float> &labels,
                 const Cropping_Params &params){
    Cropping_Result out;

    const auto extracted = Extract_Blobs(labels, params);
    out.N_candidates = static_cast<int64_t>(extracted.blobs.size());

    for(const auto &blob : extracted.blobs){
        if(!Passes_Overlap_Filter(blob, params.allowed_perc_other_blobs)){
            ++out.N_rejected;
            continue;
        }
        out.crops.push_back( Crop_Around_Blob(ct, labels, blob, params.slice_margins,
                                              static_cast<int64_t>(out.crops.size())) );
        YLOGINFO("Cropped blob " << blob.component_id << " at " << out.crops.back().margined_box.to_string());
    }
    return out;
}


void
Remap_Liver_Labels(buffer3<float> &labels){
    for(auto &v : labels.data){
        if(!std::isfinite(v)) continue;
        const auto l = std::llround(v);
        if(l == 1){
            v = 0.0f;
        }else if(l == 2){
            v = 1.0f;
        }
    }
    return;
}


bool
Passes_Size_Gate(const shape3_t &shape,
                 const shape3_t &min_sizes){
    for(size_t i = 0; i < 3; ++i){
        if(shape[i] < min_sizes[i]) return false;
    }
    return true;
}
