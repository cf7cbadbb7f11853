#pragma once

#include "config.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

struct BuildResult {
    bool success = false;
    int exit_code = -1;
    size_t relayed_lines = 0;
    std::string message; // set when the command could not be launched
};

// <install_command...> <spark_home>/R/lib <dir>/R/pkg
std::vector<std::string> make_install_command(const std::filesystem::path& dir, const RBuildConfig& config);

// Runs the standard R package installation on the sources extracted to dir.
// Combined stdout/stderr of the child is relayed to out while it runs.
// Multiple runs on the same dir are fine; R CMD INSTALL overwrites.
// Throws RjarConfigException if config has no Spark home.
BuildResult build_r_package(const std::filesystem::path& dir, const RBuildConfig& config, std::ostream& out, bool verbose);
