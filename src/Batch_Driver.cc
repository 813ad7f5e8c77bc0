//Batch_Driver.cc - A part of CropAutomaton.

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <list>
#include <mutex>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "YgorLog.h"
#include "YgorMisc.h"
#include "YgorStats.h"
#include "YgorString.h"

#include "Buffer3.h"
#include "Structs.h"
#include "Thread_Pool.h"
#include "NIfTI_File_Loader.h"
#include "NIfTI_File_Writer.h"
#include "Volume_Pair_Loader.h"
#include "Cropping.h"
#include "Resampling.h"
#include "Crop_Serializer.h"
#include "Batch_Driver.h"


int64_t Batch_Report::count(Volume_Status status) const {
    return static_cast<int64_t>(std::count_if(std::begin(this->outcomes), std::end(this->outcomes),
                                              [status](const Volume_Outcome &o){ return (o.status == status); }));
}

int64_t Batch_Report::crops_written() const {
    int64_t N = 0;
    for(const auto &o : this->outcomes) N += static_cast<int64_t>(o.written.size());
    return N;
}

int64_t Batch_Report::crops_rejected_overlap() const {
    int64_t N = 0;
    for(const auto &o : this->outcomes) N += o.N_rejected_overlap;
    return N;
}

int64_t Batch_Report::crops_dropped_size() const {
    int64_t N = 0;
    for(const auto &o : this->outcomes) N += o.N_dropped_size;
    return N;
}

std::vector<double> Batch_Report::slice_spacings() const {
    std::vector<double> out;
    for(const auto &o : this->outcomes){
        if(0.0 < o.native_slice_spacing) out.push_back(o.native_slice_spacing);
    }
    return out;
}


std::list<std::filesystem::path>
List_CT_Files(const std::filesystem::path &root_dir){
    const auto ct_dir = root_dir / "ct";
    if(!std::filesystem::is_directory(ct_dir)){
        throw std::runtime_error("CT directory '"_s + ct_dir.string() + "' does not exist");
    }

    std::list<std::filesystem::path> out;
    for(const auto &e : std::filesystem::directory_iterator(ct_dir)){
        if(!e.is_regular_file()) continue;
        if(!Has_NIfTI_Extension(e.path())){
            YLOGWARN("Ignoring non-NIfTI file '" << e.path().string() << "'");
            continue;
        }
        out.push_back(e.path());
    }
    out.sort([](const std::filesystem::path &a, const std::filesystem::path &b){
        return (a.filename().string() < b.filename().string());
    });
    return out;
}


Volume_Outcome
Process_Volume_Crops(const std::filesystem::path &ct_filename,
                     const std::filesystem::path &seg_filename,
                     const Dataset_Options &opts,
                     const std::filesystem::path &output_dir){
    Volume_Outcome out;
    out.ct_filename = ct_filename;

    const auto pair = Load_Volume_Pair(ct_filename, seg_filename);
    out.native_slice_spacing = pair.ct.pxl_dz;

    std::vector<Crop> crops;
    if(opts.cropping){
        auto cropped = Crop_Volume_Pair(pair.ct, pair.labels, opts.cropping.value());
        out.N_rejected_overlap = cropped.N_rejected;
        crops = std::move(cropped.crops);
    }else{
        const auto shape = pair.ct.shape();
        const Bounding_Box whole({{ 0, 0, 0 }}, shape, shape);
        crops.push_back( Crop{ pair.ct, pair.labels, whole, "", 0 } );
    }

    const bool resample = Resampling_Needed(opts.slice_size_mm, opts.spatial_scale);
    std::vector<Crop> kept;
    for(auto &crop : crops){
        if(opts.remove_liver_label){
            Remap_Liver_Labels(crop.labels);
        }

        if(resample){
            const auto factors = Zoom_Factors(out.native_slice_spacing, opts.slice_size_mm, opts.spatial_scale);
            crop.ct = Resample_Volume(crop.ct, factors, Interpolation::Cubic_Spline);
            Clip_Intensities(crop.ct);
            crop.labels = Resample_Volume(crop.labels, factors, Interpolation::Nearest);
        }

        if(!Passes_Size_Gate(crop.ct.shape(), opts.min_sizes)){
            ++out.N_dropped_size;
            continue;
        }
        kept.push_back(std::move(crop));
    }

    const auto base = Strip_NIfTI_Extension(ct_filename);
    std::vector<std::string> stems;
    if(opts.cropping){
        std::vector<std::string> tags;
        for(const auto &crop : kept) tags.push_back(crop.location_tag);
        stems = Crop_File_Stems(base, tags);
    }else{
        for(const auto &crop : kept) stems.push_back(Whole_Volume_File_Stem(base, crop.blob_index));
    }

    for(size_t i = 0; i < kept.size(); ++i){
        out.written.push_back( Write_Crop_Pair(kept[i].ct, kept[i].labels, output_dir, stems[i]) );
    }

    out.status = Volume_Status::Succeeded;
    return out;
}


Volume_Outcome
Process_Volume_Torso(const std::filesystem::path &ct_filename,
                     const std::filesystem::path &seg_filename,
                     const Torso_Options &opts,
                     const std::filesystem::path &output_dir){
    Volume_Outcome out;
    out.ct_filename = ct_filename;

    const auto pair = Load_Volume_Pair(ct_filename, seg_filename);
    out.native_slice_spacing = pair.ct.pxl_dz;

    const auto factors = Zoom_Factors(out.native_slice_spacing, opts.slice_size_mm, opts.spatial_subsample);
    auto ct = Resample_Volume(pair.ct, factors, Interpolation::Cubic_Spline);
    Clip_Intensities(ct);
    auto labels = Resample_Volume(pair.labels, factors, Interpolation::Nearest);

    // Labelled slab.
    std::optional<int64_t> first;
    std::optional<int64_t> last;
    for(int64_t s = 0; s < labels.N_slices; ++s){
        const auto begin = std::begin(labels.data) + labels.index(s, 0, 0);
        const auto end = begin + (labels.N_rows * labels.N_cols);
        if(std::any_of(begin, end, [](float v){ return (v != 0.0f); })){
            if(!first) first = s;
            last = s;
        }
    }
    if(!first){
        out.status = Volume_Status::Skipped;
        out.reason = "No labelled slices";
        YLOGINFO("Skipping '" << ct_filename.string() << "': " << out.reason);
        return out;
    }

    const auto start = std::max<int64_t>(0, first.value() - opts.expand_slice);
    const auto stop = std::min<int64_t>(labels.N_slices, last.value() + opts.expand_slice + 1);
    if((stop - start) < opts.min_depth){
        out.status = Volume_Status::Skipped;
        out.reason = "Labelled slab is only "_s + std::to_string(stop - start) + " slices deep";
        YLOGINFO("Skipping '" << ct_filename.string() << "': " << out.reason);
        return out;
    }

    ct = ct.subvolume(start, stop, 0, ct.N_rows, 0, ct.N_cols);
    labels = labels.subvolume(start, stop, 0, labels.N_rows, 0, labels.N_cols);
    for(auto *vol : { &ct, &labels }){
        vol->pxl_dz = opts.slice_size_mm;
    }

    Written_Crop w;
    w.ct_path = output_dir / "ct" / ct_filename.filename();
    w.seg_path = output_dir / "seg" / Paired_Label_Name(ct_filename.filename().string());
    Write_NIfTI_File(ct, w.ct_path);
    Write_NIfTI_File(labels, w.seg_path);
    out.written.push_back(w);

    out.status = Volume_Status::Succeeded;
    return out;
}


Batch_Report
Run_Batch(const std::list<std::filesystem::path> &ct_files,
          const volume_processor_t &processor,
          int64_t threads,
          bool halt_on_error){
    if(threads < 1){
        throw std::invalid_argument("At least one thread is required");
    }

    Batch_Report report;
    report.outcomes.resize(ct_files.size());

    std::mutex report_mutex;
    std::atomic<bool> halted = false;
    std::string halt_reason;

    const auto N = ct_files.size();
    std::atomic<size_t> started = 0;

    const auto process = [&](size_t i, const std::filesystem::path &ct_filename){
        if(halted.load()){
            std::lock_guard<std::mutex> lock(report_mutex);
            report.outcomes[i].ct_filename = ct_filename;
            report.outcomes[i].status = Volume_Status::Not_Run;
            return;
        }
        const auto n = ++started;
        YLOGINFO("Processing file #" << n << "/" << N << " = " << 100*n/N << "%");

        Volume_Outcome outcome;
        try{
            outcome = processor(ct_filename, Paired_Label_Filename(ct_filename));
        }catch(const std::exception &e){
            outcome = Volume_Outcome();
            outcome.ct_filename = ct_filename;
            outcome.status = Volume_Status::Failed;
            outcome.reason = e.what();
            YLOGWARN("Failed to process '" << ct_filename.string() << "': " << e.what());
        }

        std::lock_guard<std::mutex> lock(report_mutex);
        if( halt_on_error
        &&  (outcome.status == Volume_Status::Failed)
        &&  !halted.exchange(true) ){
            halt_reason = "Halting after failure on '"_s + ct_filename.string() + "': " + outcome.reason;
        }
        report.outcomes[i] = std::move(outcome);
    };

    if(threads == 1){
        size_t i = 0;
        for(const auto &f : ct_files) process(i++, f);
    }else{
        work_queue<std::function<void()>> wq(static_cast<unsigned int>(threads));
        size_t i = 0;
        for(const auto &f : ct_files){
            wq.submit_task([&process, i, f](){ process(i, f); });
            ++i;
        }
        wq.wait_until_idle();
        if(0 < wq.get_escaped_failure_count()){
            throw std::logic_error("A volume task failed outside of its error handling");
        }
    }

    if(halted.load()){
        throw std::runtime_error(halt_reason);
    }
    return report;
}


Batch_Report
Create_Crop_Dataset(const std::filesystem::path &root_dir,
                    const Dataset_Options &opts){
    opts.validate();

    const auto output_dir = opts.output_root / Dataset_Directory_Name(opts);
    Create_Output_Directories(output_dir);
    YLOGINFO("Writing crops to '" << output_dir.string() << "'");

    const auto processor = [&](const std::filesystem::path &ct, const std::filesystem::path &seg){
        return Process_Volume_Crops(ct, seg, opts, output_dir);
    };
    auto report = Run_Batch(List_CT_Files(root_dir), processor, opts.threads, opts.halt_on_error);
    report.output_dir = output_dir;
    return report;
}


Batch_Report
Create_Torso_Dataset(const std::filesystem::path &root_dir,
                     const Torso_Options &opts){
    opts.validate();

    const auto output_dir = opts.output_root / Torso_Directory_Name(opts);
    Create_Output_Directories(output_dir);
    YLOGINFO("Writing normalized volumes to '" << output_dir.string() << "'");

    const auto processor = [&](const std::filesystem::path &ct, const std::filesystem::path &seg){
        return Process_Volume_Torso(ct, seg, opts, output_dir);
    };
    auto report = Run_Batch(List_CT_Files(root_dir), processor, opts.threads, opts.halt_on_error);
    report.output_dir = output_dir;
    return report;
}


void
Log_Batch_Summary(const Batch_Report &report){
    for(const auto &o : report.outcomes){
        if(o.status == Volume_Status::Failed){
            YLOGWARN("Failed: '" << o.ct_filename.string() << "': " << o.reason);
        }
    }

    YLOGINFO("Processed " << report.outcomes.size() << " volume(s): "
             << report.count(Volume_Status::Succeeded) << " succeeded, "
             << report.count(Volume_Status::Skipped) << " skipped, "
             << report.count(Volume_Status::Failed) << " failed");
    YLOGINFO("Wrote " << report.crops_written() << " crop(s); "
             << report.crops_rejected_overlap() << " rejected by the overlap filter and "
             << report.crops_dropped_size() << " dropped by the size gate");

    const auto spacings = report.slice_spacings();
    if(!spacings.empty()){
        YLOGINFO("Done. Avg spacing: " << Stats::Mean(spacings));
    }else{
        YLOGINFO("Done. No volumes were loaded");
    }
    return;
}
