//CRPA_Version.cc - A part of CropAutomaton.

#include <string>
#include "CRPA_Version.h"

#ifndef CRPA_VERSION
    #define CRPA_VERSION unknown
#endif
#ifndef CRPA_xSTR
    #define CRPA_xSTR(x) CRPA_STR(x)
#endif
#ifndef CRPA_STR
    #define CRPA_STR(x) #x
#endif

extern const std::string CRPA_VERSION_STR( CRPA_xSTR(CRPA_VERSION) );

#undef CRPA_VERSION
#undef CRPA_xSTR
#undef CRPA_STR
