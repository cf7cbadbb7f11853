#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Scratch directory owned by one jar's extract/build cycle.
// Created with a collision-free name, removed (recursively) on destruction.
class ScratchDir {
public:
    ScratchDir();
    explicit ScratchDir(const fs::path& parent);
    ~ScratchDir();

    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return path_; }
    void remove();

private:
    fs::path path_;
};

inline constexpr std::string_view SCRATCH_PREFIX = "rjar_";

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
void cleanup_tmp_dirs();
fs::path validate_path(const fs::path& path, const fs::path& root);

// String utilities
std::string trim(std::string_view s);
std::vector<std::string> split_paths(std::string_view list, char delimiter = ',');
std::string join(const std::vector<std::string>& parts, std::string_view separator);
