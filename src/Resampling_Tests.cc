//Resampling_Tests.cc - A part of CropAutomaton.

#include <cmath>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <vector>

#include "doctest/doctest.h"

#include "YgorMath.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Resampling.h"


TEST_CASE( "Zoom_Factors and Resampling_Needed" ){
    const auto f = Zoom_Factors(2.5, 1.0, 0.5);
    CHECK(f[0] == doctest::Approx(2.5));
    CHECK(f[1] == doctest::Approx(0.5));
    CHECK(f[2] == doctest::Approx(0.5));

    CHECK_FALSE(Resampling_Needed(1.0, 1.0));
    CHECK(Resampling_Needed(2.0, 1.0));
    CHECK(Resampling_Needed(1.0, 0.5));

    CHECK_THROWS_AS(Zoom_Factors(0.0, 1.0, 1.0), std::invalid_argument);
    CHECK_THROWS_AS(Zoom_Factors(1.0, -1.0, 1.0), std::invalid_argument);
}

TEST_CASE( "Resampled_Shape rounds and never collapses an axis" ){
    CHECK(Resampled_Shape({{ 12, 14, 14 }}, {{ 2.5, 0.5, 0.5 }}) == shape3_t{{ 30, 7, 7 }});
    CHECK(Resampled_Shape({{ 10, 3, 3 }}, {{ 1.0, 0.1, 0.1 }}) == shape3_t{{ 10, 1, 1 }});
    CHECK(Resampled_Shape({{ 5, 5, 5 }}, {{ 1.3, 1.0, 1.0 }}) == shape3_t{{ 7, 5, 5 }});
}

TEST_CASE( "Cubic_Spline_Prefilter interpolates the samples" ){
    std::vector<double> samples = { 1.0, 4.0, -2.0, 7.0, 3.0, 0.0 };
    auto c = samples;
    Cubic_Spline_Prefilter(c);

    // The B-spline with these coefficients passes through the samples: (c[k-1] + 4 c[k] + c[k+1]) / 6.
    const auto N = static_cast<int64_t>(c.size());
    const auto mirror = [N](int64_t k){ return (k < 0) ? -k : ((N <= k) ? 2 * (N - 1) - k : k); };
    for(int64_t k = 0; k < N; ++k){
        const auto v = (c[static_cast<size_t>(mirror(k - 1))]
                      + 4.0 * c[static_cast<size_t>(k)]
                      + c[static_cast<size_t>(mirror(k + 1))]) / 6.0;
        CHECK(v == doctest::Approx(samples[static_cast<size_t>(k)]).epsilon(1e-9));
    }
}

TEST_CASE( "Resample_Volume cubic interpolation" ){
    buffer3<float> vol(5, 6, 7);
    vol.pxl_dx = 0.8;
    vol.pxl_dy = 0.8;
    vol.pxl_dz = 2.0;
    vol.slice_offsets.clear();
    for(int64_t s = 0; s < 5; ++s) vol.slice_offsets.emplace_back(10.0, 20.0, 30.0 + 2.0 * static_cast<double>(s));

    SUBCASE("constant volumes stay constant"){
        for(auto &v : vol.data) v = 100.0f;
        const auto out = Resample_Volume(vol, {{ 2.0, 0.5, 0.5 }}, Interpolation::Cubic_Spline);
        CHECK(out.shape() == shape3_t{{ 10, 3, 4 }});
        for(const auto &v : out.data) CHECK(v == doctest::Approx(100.0).epsilon(1e-4));
    }

    SUBCASE("outputs that coincide with input samples reproduce them"){
        vol.visit_all([&](int64_t s, int64_t r, int64_t c){
            vol.reference(s, r, c) = static_cast<float>(10.0 * s + 3.0 * r * r - 2.0 * c);
        });

        // Five slices become nine, so every even output slice lands exactly on an input slice.
        const auto out = Resample_Volume(vol, {{ 1.8, 1.0, 1.0 }}, Interpolation::Cubic_Spline);
        REQUIRE(out.shape() == shape3_t{{ 9, 6, 7 }});
        for(int64_t s = 0; s < 5; ++s){
            CHECK(out.value(2 * s, 2, 3) == doctest::Approx(vol.value(s, 2, 3)).epsilon(1e-4));
            CHECK(out.value(2 * s, 5, 0) == doctest::Approx(vol.value(s, 5, 0)).epsilon(1e-4));
        }
        CHECK(out.value(1, 2, 3) > vol.value(0, 2, 3));
        CHECK(out.value(1, 2, 3) < vol.value(1, 2, 3));
    }

    SUBCASE("spacing is divided by the factors and the first voxel is fixed"){
        const auto out = Resample_Volume(vol, {{ 2.0, 0.5, 0.5 }}, Interpolation::Cubic_Spline);
        CHECK(out.pxl_dz == doctest::Approx(1.0));
        CHECK(out.pxl_dy == doctest::Approx(1.6));
        CHECK(out.pxl_dx == doctest::Approx(1.6));
        REQUIRE(out.slice_offsets.size() == 10);
        CHECK(out.slice_offsets[0].z == doctest::Approx(30.0));
        CHECK(out.slice_offsets[1].z == doctest::Approx(31.0));
        CHECK(out.slice_offsets[0].x == doctest::Approx(10.0));
    }
}

TEST_CASE( "Resample_Volume nearest-neighbour preserves label values" ){
    buffer3<float> labels(6, 8, 8);
    labels.visit_all([&](int64_t s, int64_t r, int64_t c){
        if(2 <= s && s < 4 && 2 <= r && r < 6) labels.reference(s, r, c) = (c < 4) ? 1.0f : 2.0f;
    });

    for(const auto &f : std::vector<zoom3_t>{ {{ 2.0, 0.5, 0.5 }}, {{ 0.7, 1.5, 1.5 }}, {{ 1.0, 0.25, 1.0 }} }){
        const auto out = Resample_Volume(labels, f, Interpolation::Nearest);
        CHECK(out.shape() == Resampled_Shape(labels.shape(), f));

        std::set<float> values(std::begin(out.data), std::end(out.data));
        for(const auto &v : values){
            CHECK( ((v == 0.0f) || (v == 1.0f) || (v == 2.0f)) );
        }
    }

    SUBCASE("an identity zoom leaves the volume unchanged"){
        const auto out = Resample_Volume(labels, {{ 1.0, 1.0, 1.0 }}, Interpolation::Nearest);
        CHECK(out.data == labels.data);
    }
}
