//NPY_File_Writer.cc - A part of CropAutomaton.
//
// This file writes NumPy '.npy' arrays (format version 1.0).
//

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "YgorLog.h"
#include "YgorString.h"

#include "Binary_Encoding.h"
#include "Buffer3.h"
#include "Structs.h"
#include "NPY_File_Writer.h"


std::string
NPY_Int16_Preamble(const shape3_t &shape){
    const std::string magic = "\x93NUMPY";
    const std::string version("\x01\x00", 2);

    std::string header = "{'descr': '<i2', 'fortran_order': False, 'shape': ("_s
                       + std::to_string(shape[0]) + ", "
                       + std::to_string(shape[1]) + ", "
                       + std::to_string(shape[2]) + "), }";

    // Pad with spaces so the data begins on a 64-byte boundary. The header ends with a newline.
    const auto fixed = magic.size() + version.size() + 2;
    auto total = fixed + header.size() + 1;
    const auto padding = (64 - (total % 64)) % 64;
    header += std::string(padding, ' ') + "\n";
    total = fixed + header.size();

    const auto header_len = static_cast<uint16_t>(header.size());
    std::string out = magic + version;
    out.push_back(static_cast<char>(header_len & 0xFF));
    out.push_back(static_cast<char>((header_len >> 8) & 0xFF));
    out += header;

    if((out.size() != total) || ((out.size() % 64) != 0)){
        throw std::logic_error("NPY preamble is misaligned");
    }
    return out;
}


void
Write_NPY_Int16(const buffer3<float> &vol,
                const std::filesystem::path &filename){
    Verify_Little_Endian_Host();

    std::ofstream ofs(filename, std::ios::out | std::ios::trunc | std::ios::binary);
    if(!ofs.good()){
        throw std::runtime_error("Unable to open '"_s + filename.string() + "' for writing");
    }

    const auto preamble = NPY_Int16_Preamble(vol.shape());
    write_to_stream(ofs, preamble, preamble.size());
    for(const auto &v : vol.data){
        const int16_t x = to_int16_saturated(static_cast<double>(v));
        write_to_stream(ofs, x, sizeof(int16_t));
    }
    ofs.flush();
    if(!ofs.good()){
        throw std::runtime_error("Unable to write '"_s + filename.string() + "'");
    }

    YLOGINFO("Wrote " << vol.N_slices << "x" << vol.N_rows << "x" << vol.N_cols << " array to '" << filename.string() << "'");
    return;
}
