//String_Parsing.cc - A part of CropAutomaton.

#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <vector>
#include <string>

#include "YgorString.h"
#include "YgorMisc.h"

#include "String_Parsing.h"


std::array<int64_t, 3>
parse_index_triplet(const std::string &in){
    std::vector<std::string> split;
    split.emplace_back(in);
    for(const auto& c : std::string(", \t()")){
        split = SplitVector(split, c, 'd');
    }

    std::vector<double> numbers;
    for(const auto &w : split){
        if(w.empty()) continue;

        size_t consumed = 0;
        double x = 0.0;
        try{
            x = std::stod(w, &consumed);
        }catch(const std::exception &){
            throw std::invalid_argument("Unable to parse '"_s + w + "' as a number in '" + in + "'");
        }
        if(consumed != w.size()){
            throw std::invalid_argument("Unable to parse '"_s + w + "' as a number in '" + in + "'");
        }
        numbers.emplace_back(x);
    }
    if(numbers.size() != 3){
        throw std::invalid_argument("Expected three numbers in '"_s + in + "'");
    }

    std::array<int64_t, 3> out;
    for(size_t i = 0; i < 3; ++i){
        const auto x = numbers[i];
        if( !std::isfinite(x)
        ||  (x < 0.0)
        ||  (std::floor(x) != x) ){
            throw std::invalid_argument("Expected whole, non-negative numbers in '"_s + in + "'");
        }
        out[i] = static_cast<int64_t>(x);
    }
    return out;
}


std::string
to_string_shortest(double x){
    if(!std::isfinite(x)) return std::to_string(x);

    std::array<char, 64> buf;
    for(int precision = 1; precision <= 17; ++precision){
        std::snprintf(buf.data(), buf.size(), "%.*g", precision, x);
        if(std::stod(std::string(buf.data())) == x) break;
    }
    return std::string(buf.data());
}


std::string
triplet_to_string(const std::array<int64_t, 3> &t){
    return "("_s + std::to_string(t[0]) + ", "
                 + std::to_string(t[1]) + ", "
                 + std::to_string(t[2]) + ")";
}
