#pragma once

#include "../main/src/archive.hpp"
#include "../main/src/localization.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

// Loads the English catalogue from the source tree.
inline void init_test_localization() {
    setenv("RJAR_L10N_DIR", RJAR_SOURCE_DIR "/l10n", 1);
    setenv("LANG", "C", 1);
    init_localization();
}

// Entry names ending in '/' become directory entries.
inline void make_jar(const fs::path& path, const std::optional<std::string>& manifest,
                     const std::vector<std::pair<std::string, std::string>>& entries) {
    JarWriter jar(path);
    if (manifest) {
        jar.add_directory("META-INF");
        jar.add_file("META-INF/MANIFEST.MF", *manifest);
    }
    for (const auto& [name, content] : entries) {
        if (name.ends_with('/')) {
            jar.add_directory(name);
        } else {
            jar.add_file(name, content);
        }
    }
    jar.close();
}

inline std::string r_manifest(const std::string& value = "true") {
    return "Manifest-Version: 1.0\r\nSpark-HasRPackage: " + value + "\r\n\r\n";
}

// Executable /bin/sh script standing in for "R". Only shell builtins are
// usable inside, since the builder starts it with an empty environment.
inline fs::path write_script(const fs::path& path, const std::string& body) {
    std::ofstream f(path);
    f << "#!/bin/sh\n" << body << "\n";
    f.close();
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline size_t count_entries(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    size_t n = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(dir)) ++n;
    return n;
}
