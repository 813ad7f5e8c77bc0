//CropAutomaton.cc - A part of CropAutomaton.
//
// This program prepares paired CT/label volumes for model training, either as crops around labelled blobs or as
// slab-restricted whole volumes.
//

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/algorithm/string/predicate.hpp>

#include "YgorArguments.h"    //Needed for ArgumentHandler class.
#include "YgorMisc.h"
#include "YgorLog.h"
#include "YgorString.h"

#include "CRPA_Version.h"
#include "Structs.h"
#include "String_Parsing.h"
#include "Batch_Driver.h"


int main(int argc, char* argv[]){

    std::filesystem::path RootDir;
    std::string Mode("crops");

    Dataset_Options DatasetOpts;
    Torso_Options TorsoOpts;

    std::filesystem::path OutputRoot(".");
    std::optional<double> SliceSizeMM; // Mode-dependent default.
    int64_t Threads = 1;
    bool HaltOnError = false;

    // Cropping is enabled by specifying a cropping label. The other cropping knobs are collected either way.
    std::optional<int64_t> CroppingLabel;
    Cropping_Params CropDefaults;
    shape3_t SliceMargins = CropDefaults.slice_margins;
    double AllowedPercOtherBlobs = CropDefaults.allowed_perc_other_blobs;
    int64_t MaskDilation = CropDefaults.mask_dilation;
    bool CountOtherLabels = CropDefaults.count_other_labels;

    //================================================ Argument Parsing ==============================================

    class ArgumentHandler arger;
    const std::string progname(argv[0]);
    arger.examples = { { "--help",
                         "Show the help screen and some info about the program." },
                       { "-r /data/raw_data --remove-liver-label --min-sizes 3,30,30 -l 2 --slice-margins 1,20,20",
                         "Crop every tumour (label 2) with margins, drop the liver label, and keep crops that are"
                         " at least 3x30x30 voxels." },
                       { "-r /data/raw_data --slice-size-mm 2 --spatial-scale 0.5",
                         "Keep whole volumes, resampled to 2mm slices and half the in-plane resolution." },
                       { "-r /data/raw_data -m torso --spatial-subsample 0.5 --slice-size-mm 2 --expand-slice 5"
                         " --min-depth 16",
                         "Restrict volumes to the labelled slab and write NIfTI files." }
                     };
    arger.description = "A program for cropping labelled regions from CT volumes. Version: "_s + CRPA_VERSION_STR;

    arger.default_callback = [](int, const std::string &optarg) -> void {
      throw std::invalid_argument("Unrecognized option with argument: '"_s + optarg + "'");
    };
    arger.optionless_callback = [](const std::string &optarg) -> void {
      throw std::invalid_argument("Unrecognized option with argument: '"_s + optarg + "'");
    };

    arger.push_back( ygor_arg_handlr_t(1, 'r', "root-dir", true, "/data/raw_data",
      "Dataset directory containing 'ct' and 'seg' subdirectories.",
      [&](const std::string &optarg) -> void {
        RootDir = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 'o', "output-root", true, ".",
      "Directory in which the output dataset directory is created.",
      [&](const std::string &optarg) -> void {
        OutputRoot = optarg;
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 'm', "mode", true, Mode,
      "Processing mode. Supported: 'crops' (NumPy crops or whole volumes) and 'torso' (slab-restricted NIfTI"
      " volumes).",
      [&](const std::string &optarg) -> void {
        if( !boost::iequals(optarg, "crops") && !boost::iequals(optarg, "torso") ){
          throw std::invalid_argument("Unrecognized mode '"_s + optarg + "'");
        }
        Mode = boost::iequals(optarg, "torso") ? "torso" : "crops";
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 't', "threads", true, "1",
      "Number of volumes to process concurrently.",
      [&](const std::string &optarg) -> void {
        Threads = std::stoll(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(1, 'H', "halt-on-error", false, "",
      "Stop the batch at the first volume that cannot be processed, rather than continuing.",
      [&](const std::string &) -> void {
        HaltOnError = true;
        return;
      })
    );

    //------------------------------------------------- Crop mode -----------------------------------------------------
    arger.push_back( ygor_arg_handlr_t(2, 's', "spatial-scale", true, "1",
      "In-plane zoom factor applied to every crop.",
      [&](const std::string &optarg) -> void {
        DatasetOpts.spatial_scale = std::stod(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(2, 'z', "slice-size-mm", true, "1",
      "Target slice thickness in mm. Defaults to 1 in crop mode and 2 in torso mode.",
      [&](const std::string &optarg) -> void {
        SliceSizeMM = std::stod(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(2, 'S', "min-sizes", true, "4,10,10",
      "Minimum crop dimensions (slices, rows, columns). Smaller crops are dropped.",
      [&](const std::string &optarg) -> void {
        DatasetOpts.min_sizes = parse_index_triplet(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(2, 'R', "remove-liver-label", false, "",
      "Drop label 1 and relabel 2 as 1.",
      [&](const std::string &) -> void {
        DatasetOpts.remove_liver_label = true;
        return;
      })
    );

    //------------------------------------------------- Cropping ------------------------------------------------------
    arger.push_back( ygor_arg_handlr_t(3, 'l', "cropping-label", true, "1",
      "Label whose connected blobs are cropped. Without this option whole volumes are kept.",
      [&](const std::string &optarg) -> void {
        CroppingLabel = std::stoll(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(3, 'g', "slice-margins", true, "2,10,10",
      "Voxels of padding around each blob (slices, rows, columns).",
      [&](const std::string &optarg) -> void {
        SliceMargins = parse_index_triplet(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(3, 'b', "allowed-perc-other-blobs", true, "0.5",
      "Largest tolerated fraction of a blob's bounding box occupied by other blobs.",
      [&](const std::string &optarg) -> void {
        AllowedPercOtherBlobs = std::stod(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(3, 'd', "mask-dilation", true, "3",
      "Dilation iterations applied before finding blobs. Larger values merge blobs separated by bigger gaps.",
      [&](const std::string &optarg) -> void {
        MaskDilation = std::stoll(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(3, 'c', "count-other-labels", false, "",
      "Also count other non-zero labels as contamination inside a blob's bounding box.",
      [&](const std::string &) -> void {
        CountOtherLabels = true;
        return;
      })
    );

    //------------------------------------------------- Torso mode ----------------------------------------------------
    arger.push_back( ygor_arg_handlr_t(4, 'u', "spatial-subsample", true, "0.5",
      "In-plane zoom factor applied to whole volumes in torso mode.",
      [&](const std::string &optarg) -> void {
        TorsoOpts.spatial_subsample = std::stod(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(4, 'e', "expand-slice", true, "20",
      "Slices kept on either side of the labelled slab in torso mode.",
      [&](const std::string &optarg) -> void {
        TorsoOpts.expand_slice = std::stoll(optarg);
        return;
      })
    );

    arger.push_back( ygor_arg_handlr_t(4, 'D', "min-depth", true, "48",
      "Volumes whose expanded slab is shallower than this are skipped in torso mode.",
      [&](const std::string &optarg) -> void {
        TorsoOpts.min_depth = std::stoll(optarg);
        return;
      })
    );

    //============================================== Input Verification ==============================================

    try{
        arger.Launch(argc, argv);

        if(RootDir.empty()){
            throw std::invalid_argument("A dataset root directory is required");
        }
        if(!std::filesystem::is_directory(RootDir)){
            throw std::invalid_argument("Dataset root directory '"_s + RootDir.string() + "' is not reachable");
        }

        if(CroppingLabel){
            DatasetOpts.cropping = Cropping_Params(CroppingLabel.value(), SliceMargins, AllowedPercOtherBlobs,
                                                   MaskDilation, CountOtherLabels);
        }
        DatasetOpts.output_root = OutputRoot;
        DatasetOpts.threads = Threads;
        DatasetOpts.halt_on_error = HaltOnError;

        TorsoOpts.output_root = OutputRoot;
        TorsoOpts.threads = Threads;
        TorsoOpts.halt_on_error = HaltOnError;
        if(SliceSizeMM){
            DatasetOpts.slice_size_mm = SliceSizeMM.value();
            TorsoOpts.slice_size_mm = SliceSizeMM.value();
        }

        DatasetOpts.validate();
        TorsoOpts.validate();

    }catch(const std::exception &e){
        YLOGERR("Invalid configuration: " << e.what());
        return 1;
    }

    //=================================================== Processing =================================================

    try{
        const auto report = (Mode == "torso") ? Create_Torso_Dataset(RootDir, TorsoOpts)
                                              : Create_Crop_Dataset(RootDir, DatasetOpts);
        Log_Batch_Summary(report);

        if(0 < report.count(Volume_Status::Failed)){
            YLOGWARN(report.count(Volume_Status::Failed) << " volume(s) could not be processed");
            return 1;
        }
    }catch(const std::exception &e){
        YLOGERR("Processing failed: " << e.what());
        return 1;
    }

    return 0;
}
