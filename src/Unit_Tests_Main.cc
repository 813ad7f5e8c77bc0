//Unit_Tests_Main.cc - A part of CropAutomaton.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
