//NPY_File_Writer.h - A part of CropAutomaton.

#pragma once

#include <filesystem>
#include <string>

#include "Buffer3.h"
#include "Structs.h"


// The complete NumPy format 1.0 preamble (magic, version, header length, and padded header dictionary) for a
// C-ordered little-endian int16 array of the given shape.
std::string
NPY_Int16_Preamble(const shape3_t &shape);

// Writes the volume as a (slices, rows, columns) int16 '.npy' array. Values are rounded to nearest and saturated.
//
// Throws std::runtime_error if the file cannot be written.
void
Write_NPY_Int16(const buffer3<float> &vol,
                const std::filesystem::path &filename);
