//Blob_Extraction_Tests.cc - A part of CropAutomaton.

#include <cstdint>
#include <vector>

#include "doctest/doctest.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Blob_Extraction.h"


static void
fill_box(buffer3<float> &vol,
         int64_t s0, int64_t s1,
         int64_t r0, int64_t r1,
         int64_t c0, int64_t c1,
         float value){
    for(int64_t s = s0; s < s1; ++s){
        for(int64_t r = r0; r < r1; ++r){
            for(int64_t c = c0; c < c1; ++c){
                vol.reference(s, r, c) = value;
            }
        }
    }
}

// A thin 'shell' blob whose tight box encloses a dense cube that is a separate component.
static buffer3<float>
make_nested_blobs(){
    buffer3<float> labels(20, 20, 20);
    fill_box(labels, 0, 1, 0, 10, 0, 10, 2.0f);  // Floor plate.
    fill_box(labels, 0, 10, 0, 1, 0, 1, 2.0f);   // Pillar rising from one corner.
    fill_box(labels, 2, 10, 2, 10, 2, 10, 2.0f); // Separate dense cube inside the shell's box.
    return labels;
}


TEST_CASE( "Make_Label_Mask selects exactly one label" ){
    buffer3<float> labels(1, 1, 4);
    labels.data = { 0.0f, 1.0f, 2.0f, 2.0f };
    const auto mask = Make_Label_Mask(labels, 2);
    CHECK(mask.data == std::vector<uint8_t>{ 0, 0, 1, 1 });
}

TEST_CASE( "Extract_Blobs tight boxes bound their components" ){
    buffer3<float> labels(30, 40, 40);
    fill_box(labels, 2, 5, 3, 9, 4, 6, 1.0f);
    fill_box(labels, 20, 28, 30, 35, 10, 39, 1.0f);
    labels.reference(10, 10, 10) = 2.0f; // Different label; ignored.

    const Cropping_Params params(1, {{ 0, 0, 0 }}, 0.5, 0);
    const auto res = Extract_Blobs(labels, params);
    REQUIRE(res.blobs.size() == 2);

    CHECK(res.blobs[0].component_id == 1);
    CHECK(res.blobs[0].tight_box.to_string() == "[2:5, 3:9, 4:6]");
    CHECK(res.blobs[0].voxel_count == 3 * 6 * 2);
    CHECK(res.blobs[0].contamination == doctest::Approx(0.0));

    CHECK(res.blobs[1].component_id == 2);
    CHECK(res.blobs[1].tight_box.to_string() == "[20:28, 30:35, 10:39]");
}

TEST_CASE( "Extract_Blobs projects dilated components onto the original mask" ){
    // Two pieces separated by a two-voxel gap.
    buffer3<float> labels(10, 10, 20);
    fill_box(labels, 4, 6, 4, 6, 2, 5, 1.0f);
    fill_box(labels, 4, 6, 4, 6, 7, 10, 1.0f);

    SUBCASE("without dilation the pieces are separate"){
        const auto res = Extract_Blobs(labels, Cropping_Params(1, {{ 0, 0, 0 }}, 0.5, 0));
        CHECK(res.blobs.size() == 2);
    }

    SUBCASE("dilation merges the pieces without growing the box"){
        const auto res = Extract_Blobs(labels, Cropping_Params(1, {{ 0, 0, 0 }}, 0.5, 1));
        REQUIRE(res.blobs.size() == 1);
        CHECK(res.blobs[0].tight_box.to_string() == "[4:6, 4:6, 2:10]");
        CHECK(res.blobs[0].voxel_count == 2 * 2 * 6);

        // Gap voxels do not belong to the component.
        CHECK(res.component_ids.value(4, 4, 5) == 0);
        CHECK(res.component_ids.value(4, 4, 2) == 1);
        CHECK(res.component_ids.value(4, 4, 9) == 1);
    }
}

TEST_CASE( "Overlap filter rejects a blob contaminated by another blob" ){
    const auto labels = make_nested_blobs();
    const Cropping_Params params(2, {{ 0, 0, 0 }}, 0.5, 0);

    const auto res = Extract_Blobs(labels, params);
    REQUIRE(res.blobs.size() == 2);

    const auto &shell = res.blobs[0];
    const auto &cube = res.blobs[1];
    CHECK(shell.tight_box.to_string() == "[0:10, 0:10, 0:10]");
    CHECK(cube.tight_box.to_string() == "[2:10, 2:10, 2:10]");

    CHECK(shell.contamination == doctest::Approx(512.0 / 1000.0));
    CHECK(cube.contamination == doctest::Approx(0.0));

    CHECK_FALSE(Passes_Overlap_Filter(shell, params.allowed_perc_other_blobs));
    CHECK(Passes_Overlap_Filter(cube, params.allowed_perc_other_blobs));

    SUBCASE("rejection requires strictly exceeding the tolerance"){
        CHECK(Passes_Overlap_Filter(shell, 0.512));
        CHECK_FALSE(Passes_Overlap_Filter(shell, 0.511));
    }

    SUBCASE("rejections never grow as the tolerance grows"){
        int64_t previous = static_cast<int64_t>(res.blobs.size()) + 1;
        for(double tol = 0.0; tol <= 1.0; tol += 0.05){
            int64_t rejected = 0;
            for(const auto &b : res.blobs) rejected += Passes_Overlap_Filter(b, tol) ? 0 : 1;
            CHECK(rejected <= previous);
            previous = rejected;
        }
        CHECK(Passes_Overlap_Filter(shell, 1.0));
        CHECK(Passes_Overlap_Filter(cube, 0.0));
    }
}

TEST_CASE( "Overlap filter can count other labels" ){
    buffer3<float> labels(10, 10, 10);
    fill_box(labels, 0, 4, 0, 4, 0, 4, 1.0f);   // Liver-like background organ.
    fill_box(labels, 1, 3, 1, 3, 1, 3, 2.0f);   // Tumour embedded within it.

    const auto plain = Extract_Blobs(labels, Cropping_Params(2, {{ 0, 0, 0 }}, 0.5, 0, false));
    REQUIRE(plain.blobs.size() == 1);
    CHECK(plain.blobs[0].contamination == doctest::Approx(0.0));

    // Make the organ fill part of the tumour's tight box by carving an L-shaped tumour.
    labels.reference(1, 1, 1) = 1.0f;
    const auto counted = Extract_Blobs(labels, Cropping_Params(2, {{ 0, 0, 0 }}, 0.5, 0, true));
    REQUIRE(counted.blobs.size() == 1);
    CHECK(counted.blobs[0].contamination == doctest::Approx(1.0 / 8.0));
}
