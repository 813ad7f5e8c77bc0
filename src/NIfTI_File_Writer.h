//NIfTI_File_Writer.h - A part of CropAutomaton.

#pragma once

#include <filesystem>
#include <string>

#include "Buffer3.h"


// Writes the volume as an int16 NIfTI-1 single file. Output is gzip-compressed when the filename ends in '.gz'.
//
// Geometry is stored in the sform (converted from LPS to RAS). Values are rounded to nearest and saturated.
// Throws std::runtime_error if the file cannot be written.
void
Write_NIfTI_File(const buffer3<float> &vol,
                 const std::filesystem::path &filename,
                 const std::string &description = "CropAutomaton");
