//Buffer3_Tests.cc - A part of CropAutomaton.

#include <cstdint>
#include <functional>
#include <stdexcept>

#include "doctest/doctest.h"

#include "YgorImages.h"
#include "YgorMath.h"

#include "Buffer3.h"


static planar_image_collection<float, double>
make_test_image_collection(
    int64_t slices,
    int64_t rows,
    int64_t cols,
    const std::function<float(int64_t, int64_t, int64_t)> &value_fn,
    double pxl_dx = 1.0,
    double pxl_dy = 1.0,
    double pxl_dz = 1.0){

    planar_image_collection<float, double> coll;
    const vec3<double> row_unit(1.0, 0.0, 0.0);
    const vec3<double> col_unit(0.0, 1.0, 0.0);
    const vec3<double> z_unit(0.0, 0.0, 1.0);
    const vec3<double> anchor(0.0, 0.0, 0.0);

    for(int64_t slice = 0; slice < slices; ++slice){
        planar_image<float, double> img;
        img.init_orientation(row_unit, col_unit);
        img.init_buffer(rows, cols, 1);
        img.init_spatial(pxl_dx, pxl_dy, pxl_dz, anchor, z_unit * (static_cast<double>(slice) * pxl_dz));

        for(int64_t row = 0; row < rows; ++row){
            for(int64_t col = 0; col < cols; ++col){
                img.reference(row, col, 0) = value_fn(slice, row, col);
            }
        }
        coll.images.push_back(img);
    }
    return coll;
}


TEST_CASE( "buffer3 construction and element access" ){
    buffer3<double> buf(2, 3, 4);

    CHECK(buf.N_slices == 2);
    CHECK(buf.N_rows == 3);
    CHECK(buf.N_cols == 4);
    CHECK(buf.data.size() == static_cast<size_t>(2 * 3 * 4));
    CHECK(buf.slice_offsets.size() == 2);

    for(const auto &v : buf.data){
        CHECK(v == 0.0);
    }

    buf.reference(0, 1, 2) = 42.0;
    CHECK(buf.value(0, 1, 2) == doctest::Approx(42.0));

    buf.reference(1, 2, 3) = -7.5;
    CHECK(buf.value(1, 2, 3) == doctest::Approx(-7.5));
    CHECK(buf.data.back() == doctest::Approx(-7.5));

    CHECK_THROWS_AS(buffer3<double>(-1, 2, 2), std::invalid_argument);
}

TEST_CASE( "buffer3 in_bounds" ){
    buffer3<double> buf(3, 4, 5);
    CHECK(buf.in_bounds(0, 0, 0));
    CHECK(buf.in_bounds(2, 3, 4));
    CHECK_FALSE(buf.in_bounds(-1, 0, 0));
    CHECK_FALSE(buf.in_bounds(3, 0, 0));
    CHECK_FALSE(buf.in_bounds(0, -1, 0));
    CHECK_FALSE(buf.in_bounds(0, 4, 0));
    CHECK_FALSE(buf.in_bounds(0, 0, -1));
    CHECK_FALSE(buf.in_bounds(0, 0, 5));
}

TEST_CASE( "buffer3 subvolume copies voxels and keeps positions" ){
    auto coll = make_test_image_collection(4, 5, 6,
        [](int64_t s, int64_t r, int64_t c){ return static_cast<float>(s * 100 + r * 10 + c); },
        0.5, 0.75, 2.0);
    const auto buf = buffer3<float>::from_planar_image_collection(coll);

    const auto sub = buf.subvolume(1, 3, 2, 5, 1, 4);
    REQUIRE(sub.shape() == std::array<int64_t, 3>{{ 2, 3, 3 }});
    CHECK(sub.value(0, 0, 0) == doctest::Approx(buf.value(1, 2, 1)));
    CHECK(sub.value(1, 2, 2) == doctest::Approx(buf.value(2, 4, 3)));

    const auto p_sub = sub.position(1, 2, 2);
    const auto p_buf = buf.position(2, 4, 3);
    CHECK(p_sub.x == doctest::Approx(p_buf.x));
    CHECK(p_sub.y == doctest::Approx(p_buf.y));
    CHECK(p_sub.z == doctest::Approx(p_buf.z));

    SUBCASE("empty or out-of-range boxes are rejected"){
        CHECK_THROWS_AS(buf.subvolume(1, 1, 0, 5, 0, 6), std::out_of_range);
        CHECK_THROWS_AS(buf.subvolume(0, 5, 0, 5, 0, 6), std::out_of_range);
        CHECK_THROWS_AS(buf.subvolume(-1, 2, 0, 5, 0, 6), std::out_of_range);
    }
}

TEST_CASE( "buffer3 marshalling round-trip with planar_image_collection" ){
    auto coll = make_test_image_collection(3, 4, 5,
        [](int64_t s, int64_t r, int64_t c){ return static_cast<float>(s * 100 + r * 10 + c); },
        0.8, 0.9, 2.5);

    const auto buf = buffer3<float>::from_planar_image_collection(coll);
    CHECK(buf.N_slices == 3);
    CHECK(buf.N_rows == 4);
    CHECK(buf.N_cols == 5);
    CHECK(buf.pxl_dx == doctest::Approx(0.8));
    CHECK(buf.pxl_dy == doctest::Approx(0.9));
    CHECK(buf.pxl_dz == doctest::Approx(2.5));
    CHECK(buf.value(1, 2, 3) == doctest::Approx(123.0));
    CHECK(buf.slice_offsets[2].z == doctest::Approx(5.0));

    const auto coll2 = buf.to_planar_image_collection();
    REQUIRE(coll2.images.size() == 3);
    const auto buf2 = buffer3<float>::from_planar_image_collection(coll2);
    CHECK(buf2.data == buf.data);
    CHECK(buf2.slice_offsets[2].z == doctest::Approx(5.0));

    SUBCASE("empty and non-rectilinear collections are rejected"){
        planar_image_collection<float, double> empty;
        CHECK_THROWS_AS(buffer3<float>::from_planar_image_collection(empty), std::invalid_argument);

        auto ragged = make_test_image_collection(2, 4, 5, [](int64_t, int64_t, int64_t){ return 0.0f; });
        ragged.images.back().init_buffer(3, 5, 1);
        CHECK_THROWS_AS(buffer3<float>::from_planar_image_collection(ragged), std::invalid_argument);
    }
}
