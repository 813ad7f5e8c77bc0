//Resampling.cc - A part of CropAutomaton.
//
// Separable resampling. Each axis is resampled in turn, which is equivalent to full tensor-product interpolation
// because both the spline prefilter and the interpolation weights factor per axis.
//

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "YgorLog.h"
#include "YgorMath.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Resampling.h"


zoom3_t
Zoom_Factors(double native_slice_spacing,
             double slice_size_mm,
             double scale){
    if( !(0.0 < native_slice_spacing) || !(0.0 < slice_size_mm) || !(0.0 < scale)
    ||  !std::isfinite(native_slice_spacing) || !std::isfinite(slice_size_mm) || !std::isfinite(scale) ){
        throw std::invalid_argument("Zoom factors require positive, finite spacings and scale");
    }
    return {{ native_slice_spacing / slice_size_mm, scale, scale }};
}


bool
Resampling_Needed(double slice_size_mm,
                  double scale){
    return !( (slice_size_mm == 1.0) && (scale == 1.0) );
}


shape3_t
Resampled_Shape(const shape3_t &shape,
                const zoom3_t &factors){
    shape3_t out;
    for(size_t i = 0; i < 3; ++i){
        if( !(0.0 < factors[i]) || !std::isfinite(factors[i]) ){
            throw std::invalid_argument("Zoom factors must be positive and finite");
        }
        out[i] = std::max<int64_t>(1, static_cast<int64_t>(std::llround(static_cast<double>(shape[i]) * factors[i])));
    }
    return out;
}


void
Cubic_Spline_Prefilter(std::vector<double> &c){
    const auto N = static_cast<int64_t>(c.size());
    if(N < 2) return;

    const double z = std::sqrt(3.0) - 2.0;
    const double gain = 6.0; // (1 - z)(1 - 1/z).
    for(auto &x : c) x *= gain;

    // Causal initialization for whole-sample mirror boundaries.
    {
        const double zn = std::pow(z, static_cast<double>(N - 1));
        double sum = c[0] + zn * c[N - 1];
        double z1 = z;
        double z2 = zn * zn / z;
        for(int64_t k = 1; k < (N - 1); ++k){
            sum += (z1 + z2) * c[k];
            z1 *= z;
            z2 /= z;
        }
        c[0] = sum / (1.0 - zn * zn);
    }
    for(int64_t k = 1; k < N; ++k){
        c[k] += z * c[k - 1];
    }

    // Anti-causal.
    c[N - 1] = (z / (z * z - 1.0)) * (c[N - 1] + z * c[N - 2]);
    for(int64_t k = N - 2; 0 <= k; --k){
        c[k] = z * (c[k + 1] - c[k]);
    }
    return;
}


namespace {

int64_t
mirror_index(int64_t k, int64_t N){
    if(N == 1) return 0;
    const auto period = 2 * (N - 1);
    k = k % period;
    if(k < 0) k += period;
    return (k < N) ? k : (period - k);
}

double
evaluate_cubic_spline(const std::vector<double> &coeffs, double x){
    const auto N = static_cast<int64_t>(coeffs.size());
    const auto i = static_cast<int64_t>(std::floor(x));
    const double t = x - static_cast<double>(i);
    const double t2 = t * t;
    const double t3 = t2 * t;

    const std::array<double, 4> w = {{ (1.0 - t) * (1.0 - t) * (1.0 - t) / 6.0,
                                       (4.0 - 6.0 * t2 + 3.0 * t3) / 6.0,
                                       (1.0 + 3.0 * t + 3.0 * t2 - 3.0 * t3) / 6.0,
                                       t3 / 6.0 }};
    double out = 0.0;
    for(int64_t j = 0; j < 4; ++j){
        out += w[static_cast<size_t>(j)] * coeffs[static_cast<size_t>(mirror_index(i - 1 + j, N))];
    }
    return out;
}

// Input coordinate of output sample 'o' with end-points aligned.
double
source_coordinate(int64_t o, int64_t N_in, int64_t N_out){
    if( (N_out <= 1) || (N_in <= 1) ) return 0.0;
    return static_cast<double>(o) * static_cast<double>(N_in - 1) / static_cast<double>(N_out - 1);
}

buffer3<float>
resample_axis(const buffer3<float> &in,
              size_t axis,
              int64_t N_out,
              Interpolation interp){
    auto shape = in.shape();
    const auto N_in = shape[axis];
    shape[axis] = N_out;

    buffer3<float> out(shape[0], shape[1], shape[2]);
    out.copy_spatial_from(in);
    if(axis != 0) out.slice_offsets = in.slice_offsets;

    // Lines run along 'axis'; the two other axes enumerate them.
    const auto at = [&](const shape3_t &v, size_t a, int64_t k){
        auto w = v;
        w[a] = k;
        return w;
    };

    std::vector<double> line(static_cast<size_t>(N_in));
    const shape3_t outer = out.shape();
    for(int64_t u = 0; u < ((axis == 0) ? 1 : outer[0]); ++u){
        for(int64_t v = 0; v < ((axis == 1) ? 1 : outer[1]); ++v){
            for(int64_t w = 0; w < ((axis == 2) ? 1 : outer[2]); ++w){
                const shape3_t base = {{ u, v, w }};

                for(int64_t k = 0; k < N_in; ++k){
                    const auto p = at(base, axis, k);
                    line[static_cast<size_t>(k)] = static_cast<double>(in.value(p[0], p[1], p[2]));
                }
                if(interp == Interpolation::Cubic_Spline){
                    Cubic_Spline_Prefilter(line);
                }

                for(int64_t o = 0; o < N_out; ++o){
                    const auto x = source_coordinate(o, N_in, N_out);
                    double val = 0.0;
                    if(interp == Interpolation::Cubic_Spline){
                        val = evaluate_cubic_spline(line, x);
                    }else{
                        auto k = static_cast<int64_t>(std::floor(x + 0.5));
                        k = std::clamp<int64_t>(k, 0, N_in - 1);
                        val = line[static_cast<size_t>(k)];
                    }
                    const auto p = at(base, axis, o);
                    out.reference(p[0], p[1], p[2]) = static_cast<float>(val);
                }
            }
        }
    }
    return out;
}

} // namespace


buffer3<float>
Resample_Volume(const buffer3<float> &in,
                const zoom3_t &factors,
                Interpolation interp){
    if(in.empty()){
        throw std::invalid_argument("Cannot resample an empty volume");
    }
    const auto shape_out = Resampled_Shape(in.shape(), factors);

    // Direction of increasing slice index, taken from the offsets when possible.
    auto slice_dir = in.ortho_unit();
    if(1 < in.N_slices){
        const auto d = in.slice_offsets.back() - in.slice_offsets.front();
        if(0.0 < d.length()) slice_dir = d.unit();
    }

    auto out = in;
    for(size_t axis = 0; axis < 3; ++axis){
        if(shape_out[axis] == in.shape()[axis]) continue; // Aligned end-points make this an identity.
        out = resample_axis(out, axis, shape_out[axis], interp);
    }

    out.pxl_dz = in.pxl_dz / factors[0];
    out.pxl_dy = in.pxl_dy / factors[1];
    out.pxl_dx = in.pxl_dx / factors[2];
    out.slice_offsets.resize(static_cast<size_t>(out.N_slices));
    for(int64_t s = 0; s < out.N_slices; ++s){
        out.slice_offsets[static_cast<size_t>(s)] = in.slice_offsets.front()
                                                  + slice_dir * (out.pxl_dz * static_cast<double>(s));
    }

    YLOGINFO("Resampled volume from " << in.N_slices << "x" << in.N_rows << "x" << in.N_cols
             << " to " << out.N_slices << "x" << out.N_rows << "x" << out.N_cols);
    return out;
}
