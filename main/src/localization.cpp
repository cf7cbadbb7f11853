#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <limits.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count == -1) {
            return fs::current_path();
        }
        result[count] = '\0';
        return fs::path(result).parent_path();
    }

    // Catalogue directory: $RJAR_L10N_DIR, then <exe>/../l10n, then the installed path.
    fs::path find_l10n_dir() {
        if (const char* env_dir = std::getenv("RJAR_L10N_DIR"); env_dir && *env_dir) {
            return env_dir;
        }
        fs::path relative_l10n_dir = get_executable_dir() / ".." / "l10n";
        std::error_code ec;
        if (fs::is_directory(relative_l10n_dir, ec)) {
            return relative_l10n_dir;
        }
        return L10N_DIR;
    }

    void load_strings(const std::string& lang, const fs::path& base_dir) {
        std::ifstream file(base_dir / (lang + ".txt"));
        if (!file.is_open()) {
            if (lang != "en") {
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                load_strings("en", base_dir);
            }
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
    }
}

void init_localization() {
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).starts_with("zh")) {
        lang = "zh";
    }
    load_strings(lang, find_l10n_dir());
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
