//String_Parsing.h - A part of CropAutomaton.

#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <string>

#include "YgorString.h"

// Parser for exactly three non-negative integers, e.g., "1,20,20".
//
// Throws std::invalid_argument when the list does not hold exactly three whole numbers >= 0, or when any token is not
// entirely a number (e.g., "1a").
std::array<int64_t, 3> parse_index_triplet(const std::string &in);

// Shortest decimal representation that reads back to the same double, e.g., "1", "0.5", "2.25".
std::string to_string_shortest(double x);

// Formats a triplet like a Python tuple, e.g., "(1, 20, 20)".
std::string triplet_to_string(const std::array<int64_t, 3> &t);
