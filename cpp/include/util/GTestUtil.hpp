#pragma once

#include <gtest/gtest.h>

// Runs all registered tests. Accepts gtest's own flags plus the util::Logging options; test
// binaries log at warn level and without timestamps unless told otherwise.
int launch_gtest(int argc, char** argv);
