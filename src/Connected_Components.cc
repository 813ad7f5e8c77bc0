//Connected_Components.cc - A part of CropAutomaton.
//
// This file provides a two-pass union-find connected-component labeller over provisional labels, and binary
// dilation over buffer3 masks.
//

#include <array>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "YgorLog.h"

#include "Buffer3.h"
#include "Connected_Components.h"


namespace {

struct offset3 {
    int64_t ds;
    int64_t dr;
    int64_t dc;
};

// Neighbours that precede a voxel in raster order, i.e., those already visited during the first pass.
std::vector<offset3>
preceding_neighbours(Adjacency adjacency){
    int64_t max_nonzero = 3;
    if(adjacency == Adjacency::Face)      max_nonzero = 1;
    if(adjacency == Adjacency::Face_Edge) max_nonzero = 2;

    std::vector<offset3> out;
    for(int64_t ds = -1; ds <= 0; ++ds){
        for(int64_t dr = -1; dr <= 1; ++dr){
            for(int64_t dc = -1; dc <= 1; ++dc){
                // Only offsets lexicographically before (0,0,0).
                if( (ds == 0) && (0 < dr) ) continue;
                if( (ds == 0) && (dr == 0) && (0 <= dc) ) continue;

                const auto nonzero = std::abs(ds) + std::abs(dr) + std::abs(dc);
                if(max_nonzero < nonzero) continue;
                out.push_back({ ds, dr, dc });
            }
        }
    }
    return out;
}

// Disjoint-set forest over provisional labels. The root of each set is its smallest label.
class disjoint_sets {
    std::vector<component_id_t> parent;

  public:
    component_id_t make_set(){
        if(static_cast<int64_t>(std::numeric_limits<component_id_t>::max()) <= static_cast<int64_t>(parent.size())){
            throw std::overflow_error("Too many provisional components to label");
        }
        const auto l = static_cast<component_id_t>(parent.size());
        parent.push_back(l);
        return l;
    }

    component_id_t size() const {
        return static_cast<component_id_t>(parent.size());
    }

    component_id_t find(component_id_t i){
        while(parent[static_cast<size_t>(i)] != i){
            auto &p = parent[static_cast<size_t>(i)];
            p = parent[static_cast<size_t>(p)]; // Path halving.
            i = p;
        }
        return i;
    }

    void join(component_id_t a, component_id_t b){
        a = this->find(a);
        b = this->find(b);
        if(a == b) return;
        if(a < b){
            parent[static_cast<size_t>(b)] = a;
        }else{
            parent[static_cast<size_t>(a)] = b;
        }
    }
};

} // namespace


Component_Labelling
Label_Connected_Components(const buffer3<uint8_t> &mask,
                           Adjacency adjacency){
    Component_Labelling out;
    out.ids = buffer3<component_id_t>::like(mask, 0);
    if(mask.empty()) return out;

    const auto neighbours = preceding_neighbours(adjacency);
    disjoint_sets sets;
    sets.make_set(); // Label 0 is background.

    // First pass: provisional labels, merged with those of already-visited foreground neighbours.
    // The first voxel of a component never has a labelled neighbour, so provisional labels are created in the raster
    // order of each component's first voxel and the smallest label of a set belongs to that voxel.
    for(int64_t s = 0; s < mask.N_slices; ++s){
        for(int64_t r = 0; r < mask.N_rows; ++r){
            for(int64_t c = 0; c < mask.N_cols; ++c){
                if(mask.value(s, r, c) == 0) continue;

                component_id_t l = 0;
                for(const auto &n : neighbours){
                    const auto ns = s + n.ds;
                    const auto nr = r + n.dr;
                    const auto nc = c + n.dc;
                    if(!mask.in_bounds(ns, nr, nc)) continue;
                    const auto nl = out.ids.value(ns, nr, nc);
                    if(nl == 0) continue;
                    if(l == 0){
                        l = nl;
                    }else if(l != nl){
                        sets.join(l, nl);
                    }
                }
                out.ids.reference(s, r, c) = (l == 0) ? sets.make_set() : l;
            }
        }
    }

    // Dense final ids, following the order in which roots were created.
    std::vector<component_id_t> final_id(static_cast<size_t>(sets.size()), 0);
    for(component_id_t l = 1; l < sets.size(); ++l){
        const auto root = sets.find(l);
        if(root == l){
            final_id[static_cast<size_t>(l)] = static_cast<component_id_t>(++out.N_components);
        }else{
            final_id[static_cast<size_t>(l)] = final_id[static_cast<size_t>(root)];
        }
    }

    // Second pass.
    for(auto &id : out.ids.data){
        if(id != 0) id = final_id[static_cast<size_t>(id)];
    }
    return out;
}


buffer3<uint8_t>
Binary_Dilation(const buffer3<uint8_t> &mask,
                int64_t iterations){
    if(iterations < 0){
        throw std::invalid_argument("Dilation iterations cannot be negative");
    }

    const std::array<offset3, 6> cross = {{ { -1, 0, 0 }, { 1, 0, 0 },
                                            { 0, -1, 0 }, { 0, 1, 0 },
                                            { 0, 0, -1 }, { 0, 0, 1 } }};
    auto current = mask;
    for(int64_t it = 0; it < iterations; ++it){
        auto next = current;
        for(int64_t s = 0; s < current.N_slices; ++s){
            for(int64_t r = 0; r < current.N_rows; ++r){
                for(int64_t c = 0; c < current.N_cols; ++c){
                    if(current.value(s, r, c) == 0) continue;
                    for(const auto &n : cross){
                        const auto ns = s + n.ds;
                        const auto nr = r + n.dr;
                        const auto nc = c + n.dc;
                        if(current.in_bounds(ns, nr, nc)) next.reference(ns, nr, nc) = 1;
                    }
                }
            }
        }
        current = std::move(next);
    }
    return current;
}
