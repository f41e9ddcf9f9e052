/// \file main.cpp
///
/// Catch test runner for the mascpcr unit tests
///
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
