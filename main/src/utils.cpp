#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

ScratchDir::ScratchDir() : ScratchDir(fs::temp_directory_path()) {}

ScratchDir::ScratchDir(const fs::path& parent) {
    ensure_dir_exists(parent);
    std::string tmpl = (parent / (std::string(SCRATCH_PREFIX) + "XXXXXX")).string();
    if (mkdtemp(tmpl.data()) == nullptr) {
        throw RjarException(string_format("error.create_dir_failed", tmpl) + ": " + std::strerror(errno));
    }
    path_ = tmpl;
}

ScratchDir::~ScratchDir() {
    try {
        remove();
    } catch (const fs::filesystem_error& e) {
        log_warning(string_format("warning.scratch_cleanup_failed", path_.string(), e.what()));
    }
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        std::error_code ec;
        if (!path_.empty()) fs::remove_all(path_, ec);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDir::remove() {
    if (path_.empty()) return;
    fs::remove_all(path_);
    path_.clear();
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw RjarException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw RjarException(string_format("error.path_not_dir", path.string()));
    }
}

void cleanup_tmp_dirs() {
    const auto twenty_four_hours = std::chrono::hours(24);
    const auto now = std::chrono::system_clock::now();

    std::error_code ec;
    const fs::path tmp_path = fs::temp_directory_path(ec);
    if (ec || !fs::is_directory(tmp_path, ec)) {
        return;
    }

    uid_t current_uid = geteuid();

    for (const auto& entry : fs::directory_iterator(tmp_path, fs::directory_options::skip_permission_denied, ec)) {
        try {
            if (entry.is_symlink()) {
                continue;
            }

            if (entry.is_directory() && entry.path().filename().string().starts_with(SCRATCH_PREFIX)) {
                struct stat st;
                if (lstat(entry.path().c_str(), &st) != 0 || st.st_uid != current_uid) {
                    continue;
                }

                auto ftime = fs::last_write_time(entry.path());
                auto sctp = std::chrono::file_clock::to_sys(ftime);

                if ((now - sctp) > twenty_four_hours) {
                    fs::remove_all(entry.path());
                }
            }
        } catch (const fs::filesystem_error& e) {
            log_warning(string_format("warning.scratch_cleanup_failed", entry.path().string(), e.what()));
        }
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw RjarException(string_format("error.absolute_entry_path", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw RjarException(string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string trim(std::string_view s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; };
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return std::string(s.substr(begin, end - begin));
}

std::vector<std::string> split_paths(std::string_view list, char delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start <= list.size()) {
        size_t pos = list.find(delimiter, start);
        if (pos == std::string_view::npos) pos = list.size();
        std::string item = trim(list.substr(start, pos - start));
        if (!item.empty()) result.push_back(std::move(item));
        start = pos + 1;
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}
