//CRPA_Version.h.

#pragma once

#include <string>

// Populated by the build system via the CRPA_VERSION definition.
extern const std::string CRPA_VERSION_STR;
