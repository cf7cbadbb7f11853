#pragma once

#include "archive.hpp"

#include <map>
#include <optional>
#include <string>

inline constexpr const char* MANIFEST_PATH = "META-INF/MANIFEST.MF";

// Key in the jar manifest announcing that R source code is bundled under R/pkg.
inline constexpr const char* HAS_R_PACKAGE = "Spark-HasRPackage";

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// Main section of a jar manifest. Header names compare case-insensitively.
class Manifest {
public:
    std::optional<std::string> main_attribute(const std::string& name) const;
    void set_main_attribute(const std::string& name, const std::string& value);
    size_t size() const { return main_.size(); }

private:
    std::map<std::string, std::string, CaseInsensitiveLess> main_;
};

Manifest parse_manifest(const std::string& text);

// Returns std::nullopt when the jar has no manifest.
std::optional<Manifest> read_manifest(const JarFile& jar);

// True when the manifest carries Spark-HasRPackage and its trimmed value is exactly "true".
bool check_manifest_for_r(const JarFile& jar);
bool check_manifest_for_r(const Manifest& manifest);
