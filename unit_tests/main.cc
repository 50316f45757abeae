/*
 * main.cc
 *
 * entry point for the cbd unit tests
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
