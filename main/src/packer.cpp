#include "packer.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "extractor.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace {
    std::string build_manifest_text() {
        std::string text;
        text += "Manifest-Version: 1.0\r\n";
        text += "Created-By: rjar\r\n";
        text += std::string(HAS_R_PACKAGE) + ": true\r\n";
        text += "\r\n";
        return text;
    }

    void add_dir_recursive(JarWriter& jar, const fs::path& dir, const std::string& archive_prefix) {
        std::vector<fs::path> entries;
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            entries.push_back(entry.path());
        }
        // Stable order: parents come before their children.
        std::sort(entries.begin(), entries.end());

        for (const auto& path : entries) {
            const std::string entry_name = archive_prefix + "/" + path.lexically_relative(dir).generic_string();
            if (fs::is_directory(path)) {
                jar.add_directory(entry_name);
            } else if (fs::is_regular_file(path)) {
                jar.add_file_from_disk(entry_name, path);
            } else {
                log_warning(string_format("warning.bundle_skip_special", path.string()));
            }
        }
    }
}

std::string bundle_r_package(const std::string& output_filename, const std::string& source_dir) {
    const fs::path pkg_dir = source_dir;
    if (!fs::is_directory(pkg_dir)) {
        throw RjarException(string_format("error.bundle_source_not_found", pkg_dir.string()));
    }
    if (!fs::is_regular_file(pkg_dir / "DESCRIPTION")) {
        throw RjarException(string_format("error.bundle_no_description", pkg_dir.string()));
    }

    log_info(get_string("info.bundle_scanning"));
    try {
        JarWriter jar(output_filename);
        jar.add_directory("META-INF");
        jar.add_file(MANIFEST_PATH, build_manifest_text());
        jar.add_directory("R");
        jar.add_directory(std::string(R_JAR_ENTRIES));
        add_dir_recursive(jar, pkg_dir, std::string(R_JAR_ENTRIES));
        jar.close();
    } catch (const RjarException&) {
        std::error_code ec;
        fs::remove(output_filename, ec);
        throw;
    }

    std::string hash = calculate_sha256(output_filename);
    log_info(string_format("info.bundle_success", output_filename));
    log_info("SHA256: " + hash);
    return hash;
}
