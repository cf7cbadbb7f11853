#pragma once

#include <string>

// Packs the R package in source_dir (the directory holding DESCRIPTION) into a
// jar at output_filename, under R/pkg/, with Spark-HasRPackage: true in its manifest.
// Returns the SHA256 of the written jar.
std::string bundle_r_package(const std::string& output_filename, const std::string& source_dir);
