#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

const fs::path CONFIG_DIR = RJAR_CONF_DIR;
const fs::path CONFIG_FILE = fs::path(RJAR_CONF_DIR) / "rjar.conf";
const fs::path L10N_DIR = RJAR_L10N_DIR;

namespace {
    const char* const KNOWN_KEYS[] = {"spark_home", "r_command"};

    std::vector<std::string> split_words(const std::string& s) {
        std::vector<std::string> words;
        std::istringstream iss(s);
        std::string word;
        while (iss >> word) words.push_back(word);
        return words;
    }
}

std::optional<std::string> Settings::get(const std::string& key) const {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::vector<std::string> RBuildConfig::default_install_command() {
    return {"R", "CMD", "INSTALL", "-l"};
}

Settings load_settings(const fs::path& path, bool required) {
    Settings settings;
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw RjarException(string_format("error.open_file_failed", path.string()));
        }
        return settings;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        const auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            log_warning(string_format("warning.config_bad_line", path.string(), line_no));
            continue;
        }
        std::string key = trim(std::string_view(stripped).substr(0, pos));
        std::string value = trim(std::string_view(stripped).substr(pos + 1));

        bool known = false;
        for (const char* k : KNOWN_KEYS) {
            if (key == k) known = true;
        }
        if (!known) {
            log_warning(string_format("warning.config_unknown_key", path.string(), key));
        }
        settings.values[key] = value;
    }
    return settings;
}

std::optional<fs::path> resolve_spark_home(const std::string& cli_value, const Settings& settings) {
    if (!cli_value.empty()) {
        return fs::path(cli_value);
    }
    if (const char* env = std::getenv("SPARK_HOME"); env && *env) {
        return fs::path(env);
    }
    if (auto value = settings.get("spark_home")) {
        return fs::path(*value);
    }
    return std::nullopt;
}

std::vector<std::string> resolve_install_command(const std::string& cli_value, const Settings& settings) {
    std::vector<std::string> command;
    if (!cli_value.empty()) {
        command = split_words(cli_value);
    } else if (auto value = settings.get("r_command")) {
        command = split_words(*value);
    }
    if (command.empty()) {
        command = RBuildConfig::default_install_command();
    }
    return command;
}

const fs::path& require_spark_home(const RBuildConfig& config) {
    if (!config.spark_home || config.spark_home->empty()) {
        throw RjarConfigException(get_string("error.spark_home_not_set"));
    }
    return *config.spark_home;
}
