#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#ifndef RJAR_CONF_DIR
#define RJAR_CONF_DIR "/etc/rjar"
#endif
#ifndef RJAR_L10N_DIR
#define RJAR_L10N_DIR "/usr/share/rjar/l10n"
#endif

extern const std::filesystem::path CONFIG_DIR;
extern const std::filesystem::path CONFIG_FILE;
extern const std::filesystem::path L10N_DIR;

// Values read from rjar.conf ("key = value" per line).
struct Settings {
    std::map<std::string, std::string> values;

    std::optional<std::string> get(const std::string& key) const;
};

// Everything the R package builder needs. Passed explicitly, never looked up
// from the environment by the builder itself.
struct RBuildConfig {
    std::optional<std::filesystem::path> spark_home;
    std::vector<std::string> install_command = default_install_command();

    static std::vector<std::string> default_install_command();
};

Settings load_settings(const std::filesystem::path& path, bool required = false);

// Resolution order: --spark-home, $SPARK_HOME, spark_home in rjar.conf.
std::optional<std::filesystem::path> resolve_spark_home(const std::string& cli_value, const Settings& settings);

// Resolution order: --r-command, r_command in rjar.conf, "R CMD INSTALL -l".
std::vector<std::string> resolve_install_command(const std::string& cli_value, const Settings& settings);

// Throws RjarConfigException when no Spark home was resolved.
const std::filesystem::path& require_spark_home(const RBuildConfig& config);
