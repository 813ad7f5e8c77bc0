//NIfTI_File_Tests.cc - A part of CropAutomaton.

#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include "doctest/doctest.h"

#include "YgorMath.h"

#include "Buffer3.h"
#include "Structs.h"
#include "NIfTI_File_Loader.h"
#include "NIfTI_File_Writer.h"
#include "Volume_Pair_Loader.h"


static buffer3<float>
make_test_volume(){
    buffer3<float> vol(4, 5, 6);
    vol.pxl_dx = 0.75;
    vol.pxl_dy = 0.8;
    vol.pxl_dz = 2.5;
    for(int64_t s = 0; s < 4; ++s){
        vol.slice_offsets[static_cast<size_t>(s)] = vec3<double>(-100.0, 50.0, 10.0 + 2.5 * static_cast<double>(s));
    }
    vol.visit_all([&](int64_t s, int64_t r, int64_t c){
        vol.reference(s, r, c) = static_cast<float>(100 * s + 10 * r + c - 200);
    });
    return vol;
}

static void
check_same_volume(const buffer3<float> &a, const buffer3<float> &b){
    REQUIRE(a.shape() == b.shape());
    CHECK(a.data == b.data);
    CHECK(a.pxl_dx == doctest::Approx(b.pxl_dx));
    CHECK(a.pxl_dy == doctest::Approx(b.pxl_dy));
    CHECK(a.pxl_dz == doctest::Approx(b.pxl_dz));
    for(const auto &v : { std::array<int64_t, 3>{{ 0, 0, 0 }}, std::array<int64_t, 3>{{ 3, 4, 5 }} }){
        const auto pa = a.position(v[0], v[1], v[2]);
        const auto pb = b.position(v[0], v[1], v[2]);
        CHECK(pa.x == doctest::Approx(pb.x));
        CHECK(pa.y == doctest::Approx(pb.y));
        CHECK(pa.z == doctest::Approx(pb.z));
    }
}

// Minimal little-endian header without sform or qform.
static std::string
make_minimal_header(int16_t datatype, int16_t bitpix, const std::array<int16_t, 8> &dim){
    std::string hdr(352, '\0');
    const auto put = [&](size_t off, const auto &x){ std::memcpy(&hdr[off], &x, sizeof(x)); };
    put(0, static_cast<int32_t>(348));
    for(size_t i = 0; i < 8; ++i) put(40 + 2 * i, dim[i]);
    put(70, datatype);
    put(72, bitpix);
    const std::array<float, 8> pixdim = {{ 1.0f, 2.0f, 3.0f, 4.0f, 0.0f, 0.0f, 0.0f, 0.0f }};
    for(size_t i = 0; i < 8; ++i) put(76 + 4 * i, pixdim[i]);
    put(108, 352.0f);
    put(112, 2.0f);  // scl_slope.
    put(116, -1.0f); // scl_inter.
    std::memcpy(&hdr[344], "n+1\0", 4);
    return hdr;
}


TEST_CASE( "NIfTI filename helpers" ){
    CHECK(Has_NIfTI_Extension("volume-3.nii"));
    CHECK(Has_NIfTI_Extension("/a/b/volume-3.nii.gz"));
    CHECK(Has_NIfTI_Extension("VOLUME.NII"));
    CHECK_FALSE(Has_NIfTI_Extension("volume-3.npy"));

    CHECK(Strip_NIfTI_Extension("volume-3.nii") == "volume-3");
    CHECK(Strip_NIfTI_Extension("/data/ct/volume-3.nii.gz") == "volume-3");
}

TEST_CASE( "NIfTI write then read" ){
    const auto vol = make_test_volume();
    const auto dir = std::filesystem::temp_directory_path();

    SUBCASE("plain"){
        const auto fname = dir / "crpa_nifti_test.nii";
        Write_NIfTI_File(vol, fname);
        const auto arr = Load_NIfTI_File(fname);
        std::filesystem::remove(fname);

        REQUIRE(arr->imagecoll.images.size() == 4);
        CHECK(arr->imagecoll.images.front().metadata.at("Modality") == "CT");
        CHECK(arr->imagecoll.images.front().metadata.at("Rows") == "5");
        CHECK(arr->imagecoll.images.front().metadata.at("Columns") == "6");
        check_same_volume(buffer3<float>::from_planar_image_collection(arr->imagecoll), vol);
    }

    SUBCASE("gzip-compressed"){
        const auto fname = dir / "crpa_nifti_test.nii.gz";
        Write_NIfTI_File(vol, fname);

        std::ifstream ifs(fname, std::ios::in | std::ios::binary);
        std::array<char, 2> magic = {{ 0, 0 }};
        ifs.read(magic.data(), 2);
        ifs.close();
        CHECK(static_cast<unsigned char>(magic[0]) == 0x1F);
        CHECK(static_cast<unsigned char>(magic[1]) == 0x8B);

        const auto arr = Load_NIfTI_File(fname);
        std::filesystem::remove(fname);
        check_same_volume(buffer3<float>::from_planar_image_collection(arr->imagecoll), vol);
    }
}

TEST_CASE( "NIfTI reader without orientation uses pixdim and applies scaling" ){
    auto contents = make_minimal_header(4, 16, {{ 3, 2, 3, 2, 1, 1, 1, 1 }});
    for(int16_t i = 0; i < 12; ++i){
        contents.append(reinterpret_cast<const char *>(&i), sizeof(i));
    }
    const auto fname = std::filesystem::temp_directory_path() / "crpa_nifti_minimal.nii";
    {
        std::ofstream ofs(fname, std::ios::out | std::ios::trunc | std::ios::binary);
        ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }
    const auto arr = Load_NIfTI_File(fname);
    std::filesystem::remove(fname);

    const auto vol = buffer3<float>::from_planar_image_collection(arr->imagecoll);
    REQUIRE(vol.shape() == shape3_t{{ 2, 3, 2 }});
    CHECK(vol.pxl_dx == doctest::Approx(2.0));
    CHECK(vol.pxl_dy == doctest::Approx(3.0));
    CHECK(vol.pxl_dz == doctest::Approx(4.0));

    // Voxel (i=1, j=2, k=1) is element 1 + 2*(2 + 3*1) = 11, scaled as 11*2 - 1.
    CHECK(vol.value(1, 2, 1) == doctest::Approx(21.0));
    CHECK(vol.value(0, 0, 0) == doctest::Approx(-1.0));

    // RAS identity becomes LPS: the column axis points towards -x.
    CHECK(vol.row_unit.x == doctest::Approx(-1.0));
    CHECK(vol.col_unit.y == doctest::Approx(-1.0));
}

TEST_CASE( "NIfTI reader rejects malformed files" ){
    const auto fname = std::filesystem::temp_directory_path() / "crpa_nifti_bad.nii";

    SUBCASE("truncated voxel data"){
        const auto contents = make_minimal_header(4, 16, {{ 3, 2, 3, 2, 1, 1, 1, 1 }});
        std::ofstream(fname, std::ios::out | std::ios::trunc | std::ios::binary)
            .write(contents.data(), static_cast<std::streamsize>(contents.size()));
        CHECK_THROWS_AS(Load_NIfTI_File(fname), std::runtime_error);
    }

    SUBCASE("four-dimensional volume"){
        auto contents = make_minimal_header(2, 8, {{ 4, 2, 2, 2, 3, 1, 1, 1 }});
        contents += std::string(24, '\0');
        std::ofstream(fname, std::ios::out | std::ios::trunc | std::ios::binary)
            .write(contents.data(), static_cast<std::streamsize>(contents.size()));
        CHECK_THROWS_AS(Load_NIfTI_File(fname), std::runtime_error);
    }

    SUBCASE("not a NIfTI file"){
        std::ofstream(fname, std::ios::out | std::ios::trunc | std::ios::binary) << "definitely not a NIfTI file";
        CHECK_THROWS_AS(Load_NIfTI_File(fname), std::runtime_error);
    }

    std::filesystem::remove(fname);
    CHECK_THROWS_AS(Load_NIfTI_File(fname), std::runtime_error);
}

TEST_CASE( "Paired_Label_Filename and Clip_Intensities" ){
    CHECK(Paired_Label_Filename("/data/raw/ct/volume-12.nii") == std::filesystem::path("/data/raw/seg/segmentation-12.nii"));
    CHECK(Paired_Label_Name("volume-volume.nii") == "segmentation-segmentation.nii");

    buffer3<float> vol(1, 1, 4);
    vol.data = { -1024.0f, -100.0f, 600.0f, 3000.0f };
    Clip_Intensities(vol);
    CHECK(vol.data == std::vector<float>{ -512.0f, -100.0f, 512.0f, 512.0f });
}

TEST_CASE( "Load_Volume_Pair rejects mismatched shapes" ){
    const auto dir = std::filesystem::temp_directory_path();
    const auto ct_fname = dir / "crpa_pair_volume.nii";
    const auto seg_fname = dir / "crpa_pair_segmentation.nii";

    auto ct = make_test_volume();
    Write_NIfTI_File(ct, ct_fname);

    SUBCASE("matching shapes load and clip"){
        ct.data.front() = -3000.0f;
        Write_NIfTI_File(ct, ct_fname);
        Write_NIfTI_File(buffer3<float>::like(ct, 1.0f), seg_fname);
        const auto pair = Load_Volume_Pair(ct_fname, seg_fname);
        CHECK(pair.ct.same_shape(pair.labels));
        CHECK(pair.ct.data.front() == doctest::Approx(-512.0));
    }

    SUBCASE("mismatched shapes name the CT file"){
        Write_NIfTI_File(buffer3<float>(4, 5, 7), seg_fname);
        try{
            Load_Volume_Pair(ct_fname, seg_fname);
            FAIL("Mismatched shapes were accepted");
        }catch(const std::runtime_error &e){
            CHECK(std::string(e.what()).find("crpa_pair_volume.nii") != std::string::npos);
        }
    }

    std::filesystem::remove(ct_fname);
    std::filesystem::remove(seg_fname);
}
