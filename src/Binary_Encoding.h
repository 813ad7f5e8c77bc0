//Binary_Encoding.h - A part of CropAutomaton.
//
// Helpers for emitting little-endian binary file formats.
//

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>


// Throws unless this computer stores integers in little-endian order.
//
// Note: When C++20 is available we can use std::endian at compile time here instead.
inline void
Verify_Little_Endian_Host(){
    uint16_t test { 0x01 };
    auto * first_byte = reinterpret_cast<unsigned char *>(&test);
    if(static_cast<uint16_t>(*first_byte) != test){
        throw std::runtime_error("This computer is not little-endian. This is not supported.");
    }
    return;
}

// Writes the object's bytes, verifying the expected length. The number of bytes written is returned.
template<class T>
uint64_t
write_to_stream( std::ostream &os,
                 const T &x,
                 uint64_t expected_length ){
    if(sizeof(T) != expected_length){
        throw std::runtime_error("Expected number of bytes does not match type size. (Is this intentional?)");
    }
    os.write(reinterpret_cast<const char *>(&x), sizeof(x));
    return expected_length;
}

// Raw bytes of a string, written in byte order.
template<>
inline uint64_t
write_to_stream( std::ostream &os,
                 const std::string &x,
                 uint64_t expected_length ){
    const auto available_length = static_cast<uint64_t>(x.length());
    if(available_length != expected_length){
        throw std::runtime_error("Expected number of bytes in string does not match type size. (Is this intentional?)");
    }
    os.write(x.data(), static_cast<std::streamsize>(available_length));
    return available_length;
}

// Rounds to nearest and saturates to the int16 range. NaNs become 0.
inline int16_t
to_int16_saturated(double x){
    if(!std::isfinite(x)){
        if(std::isnan(x)) return 0;
        return (x < 0.0) ? std::numeric_limits<int16_t>::min() : std::numeric_limits<int16_t>::max();
    }
    const auto r = std::round(x);
    const auto lo = static_cast<double>(std::numeric_limits<int16_t>::min());
    const auto hi = static_cast<double>(std::numeric_limits<int16_t>::max());
    return static_cast<int16_t>(std::clamp(r, lo, hi));
}
