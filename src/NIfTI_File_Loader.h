//NIfTI_File_Loader.h - A part of CropAutomaton.

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "Structs.h"


// Loads a single-file NIfTI-1 volume (.nii or gzip-compressed .nii.gz) as one planar image per slice.
//
// Geometry is converted to DICOM LPS patient coordinates. Throws std::runtime_error naming the file when the file
// cannot be read or is not understood.
std::unique_ptr<Image_Array>
Load_NIfTI_File(const std::filesystem::path &filename,
                const std::string &modality = "CT");

// True if the filename carries a NIfTI extension ('.nii' or '.nii.gz', case-insensitive).
bool
Has_NIfTI_Extension(const std::filesystem::path &filename);

// Filename with the NIfTI extension removed, e.g., 'volume-3.nii.gz' -> 'volume-3'.
std::string
Strip_NIfTI_Extension(const std::filesystem::path &filename);
