#pragma once

#include "config.hpp"

#include <filesystem>
#include <ostream>
#include <string>

// Documentation on how the R source file layout should be in the jar.
extern const std::string R_JAR_DOC;

enum class RJarStatus {
    NotFound,
    NoRCode,
    HasRCode,
    BuildSucceeded,
    BuildFailed,
    ExtractFailed
};

// Processes one jar: manifest check, extraction, build, cleanup.
// Only RjarConfigException escapes; every other failure is reported to out.
RJarStatus check_and_build_jar(const std::filesystem::path& jar_path, std::ostream& out, bool verbose, const RBuildConfig& config);

// jars is a comma separated list of jar paths, handled one after the other.
void check_and_build_r_package(const std::string& jars, std::ostream& out, bool verbose, const RBuildConfig& config);

// Manifest check only, without extracting or building.
RJarStatus check_jar_for_r(const std::filesystem::path& jar_path, std::ostream& out, bool verbose);
