#pragma once

#include <gtest/gtest.h>

/*
 * Utilities for Google Test executables.
 *
 * Every unit-test executable has a main() of the form:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */

// Dispatches to standard gtest main function, while adding LoggingUtil cmdline params
int launch_gtest(int argc, char** argv);
