#pragma once

#include "archive.hpp"
#include "utils.hpp"

#include <ostream>

// R source code should exist under R/pkg in a jar.
inline constexpr std::string_view R_JAR_ENTRIES = "R/pkg";

// Copies every entry whose name contains R/pkg into a fresh scratch directory,
// keeping the part of the name that starts at R/pkg. The scratch directory is
// removed again if extraction fails.
ScratchDir extract_r_folder(const JarFile& jar, std::ostream& out, bool verbose);
ScratchDir extract_r_folder(const JarFile& jar, std::ostream& out, bool verbose, const fs::path& scratch_parent);
