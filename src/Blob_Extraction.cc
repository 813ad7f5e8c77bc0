//Blob_Extraction.cc - A part of CropAutomaton.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "YgorLog.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Connected_Components.h"
#include "Blob_Extraction.h"


buffer3<uint8_t>
Make_Label_Mask(const buffer3<float> &labels,
                int64_t label){
    auto mask = buffer3<uint8_t>::like(labels, 0);
    for(size_t i = 0; i < labels.data.size(); ++i){
        mask.data[i] = (std::llround(labels.data[i]) == label) ? 1 : 0;
    }
    return mask;
}


Blob_Extraction_Result
Extract_Blobs(const buffer3<float> &labels,
              const Cropping_Params &params){
    Blob_Extraction_Result out;

    const auto mask = Make_Label_Mask(labels, params.cropping_label);

    Component_Labelling cl;
    if(0 < params.mask_dilation){
        const auto dilated = Binary_Dilation(mask, params.mask_dilation);
        cl = Label_Connected_Components(dilated, Adjacency::Face_Edge_Vertex);

        // Project back onto the undilated mask.
        for(size_t i = 0; i < mask.data.size(); ++i){
            if(mask.data[i] == 0) cl.ids.data[i] = 0;
        }
    }else{
        cl = Label_Connected_Components(mask, Adjacency::Face_Edge_Vertex);
    }
    out.component_ids = std::move(cl.ids);
    const auto N = cl.N_components;
    if(N == 0) return out;

    // Tight boxes and voxel counts, indexed by component id.
    const auto i64_max = std::numeric_limits<int64_t>::max();
    std::vector<shape3_t> lower(static_cast<size_t>(N + 1), shape3_t{{ i64_max, i64_max, i64_max }});
    std::vector<shape3_t> upper(static_cast<size_t>(N + 1), shape3_t{{ -1, -1, -1 }});
    std::vector<int64_t> counts(static_cast<size_t>(N + 1), 0);

    const auto &ids = out.component_ids;
    ids.visit_all([&](int64_t s, int64_t r, int64_t c){
        const auto id = ids.value(s, r, c);
        if(id == 0) return;
        const auto k = static_cast<size_t>(id);
        const shape3_t v = {{ s, r, c }};
        for(size_t a = 0; a < 3; ++a){
            lower[k][a] = std::min(lower[k][a], v[a]);
            upper[k][a] = std::max(upper[k][a], v[a] + 1);
        }
        ++counts[k];
    });

    for(int64_t id = 1; id <= N; ++id){
        const auto k = static_cast<size_t>(id);
        if(counts[k] == 0){
            // A dilated component always contains at least one original voxel.
            throw std::logic_error("Component lost all voxels during projection");
        }
        Blob b = { id, Bounding_Box(lower[k], upper[k], ids.shape()), counts[k], 0.0 };
        b.contamination = Compute_Contamination(ids, labels, b, params);
        out.blobs.push_back(b);
    }
    YLOGINFO("Found " << out.blobs.size() << " blob(s) with label " << params.cropping_label);
    return out;
}


double
Compute_Contamination(const buffer3<component_id_t> &component_ids,
                      const buffer3<float> &labels,
                      const Blob &blob,
                      const Cropping_Params &params){
    if(!component_ids.same_shape(labels)){
        throw std::invalid_argument("Component map and label volume differ in shape");
    }

    const auto &box = blob.tight_box;
    int64_t other = 0;
    for(int64_t s = box.ranges[0].start; s < box.ranges[0].stop; ++s){
        for(int64_t r = box.ranges[1].start; r < box.ranges[1].stop; ++r){
            for(int64_t c = box.ranges[2].start; c < box.ranges[2].stop; ++c){
                const auto id = component_ids.value(s, r, c);
                if( (id != 0) && (id != blob.component_id) ){
                    ++other;
                    continue;
                }
                if(params.count_other_labels){
                    const auto l = std::llround(labels.value(s, r, c));
                    if( (l != 0) && (l != params.cropping_label) ) ++other;
                }
            }
        }
    }
    return static_cast<double>(other) / static_cast<double>(box.voxel_count());
}


bool
Passes_Overlap_Filter(const Blob &blob,
                      double allowed_perc_other_blobs){
    return !(allowed_perc_other_blobs < blob.contamination);
}
