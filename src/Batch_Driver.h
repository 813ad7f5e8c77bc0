//Batch_Driver.h - A part of CropAutomaton.
//
// Walks a dataset directory and runs the per-volume pipelines, collecting the outcome of every source volume.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <list>
#include <string>
#include <vector>

#include "Structs.h"
#include "Crop_Serializer.h"


enum class Volume_Status {
    Succeeded,  // Processed; zero or more files written.
    Skipped,    // Deliberately not written (e.g., too few labelled slices).
    Failed,     // An error occurred; see the reason.
    Not_Run,    // The batch was halted before this volume was processed.
};

struct Volume_Outcome {
    std::filesystem::path ct_filename;
    Volume_Status status = Volume_Status::Not_Run;
    std::string reason;

    std::vector<Written_Crop> written;
    int64_t N_rejected_overlap = 0;   // Blobs rejected by the overlap filter.
    int64_t N_dropped_size = 0;       // Crops dropped by the size gate.
    double native_slice_spacing = 0.0;
};

struct Batch_Report {
    std::filesystem::path output_dir;
    std::vector<Volume_Outcome> outcomes; // In sorted filename order.

    int64_t count(Volume_Status status) const;
    int64_t crops_written() const;
    int64_t crops_rejected_overlap() const;
    int64_t crops_dropped_size() const;
    std::vector<double> slice_spacings() const;
};

// Regular files in '<root>/ct' with a NIfTI extension, sorted by filename. Throws if the directory is missing.
std::list<std::filesystem::path>
List_CT_Files(const std::filesystem::path &root_dir);

// Crop dataset pipeline for a single pair: load, crop, remap, resample, size gate, and write.
Volume_Outcome
Process_Volume_Crops(const std::filesystem::path &ct_filename,
                     const std::filesystem::path &seg_filename,
                     const Dataset_Options &opts,
                     const std::filesystem::path &output_dir);

// Torso normalization pipeline for a single pair: load, resample, restrict to the labelled slab, and write NIfTI.
Volume_Outcome
Process_Volume_Torso(const std::filesystem::path &ct_filename,
                     const std::filesystem::path &seg_filename,
                     const Torso_Options &opts,
                     const std::filesystem::path &output_dir);

// Runs a per-volume pipeline over every file. Exceptions are converted into failed outcomes.
//
// With 'halt_on_error' the first failure stops the batch: volumes not yet started are left as Not_Run and a
// std::runtime_error describing the failure is thrown after in-flight volumes finish.
using volume_processor_t = std::function<Volume_Outcome(const std::filesystem::path &ct_filename,
                                                        const std::filesystem::path &seg_filename)>;
Batch_Report
Run_Batch(const std::list<std::filesystem::path> &ct_files,
          const volume_processor_t &processor,
          int64_t threads,
          bool halt_on_error);

// Crop dataset mode over '<root>/ct' and '<root>/seg'. Output goes to a directory named after the options.
Batch_Report
Create_Crop_Dataset(const std::filesystem::path &root_dir,
                    const Dataset_Options &opts);

// Torso normalization mode over '<root>/ct' and '<root>/seg'.
Batch_Report
Create_Torso_Dataset(const std::filesystem::path &root_dir,
                     const Torso_Options &opts);

// Logs the average native slice spacing and any failures.
void
Log_Batch_Summary(const Batch_Report &report);
