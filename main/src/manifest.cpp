#include "manifest.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

std::optional<std::string> Manifest::main_attribute(const std::string& name) const {
    auto it = main_.find(name);
    if (it == main_.end()) return std::nullopt;
    return it->second;
}

void Manifest::set_main_attribute(const std::string& name, const std::string& value) {
    main_[name] = value;
}

Manifest parse_manifest(const std::string& text) {
    Manifest manifest;

    // Normalise CRLF and lone CR to LF.
    std::string normalized;
    normalized.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            normalized += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            normalized += text[i];
        }
    }

    std::istringstream in(normalized);
    std::string line;
    std::string name;
    std::string value;
    bool have_header = false;

    auto flush = [&]() {
        if (have_header) manifest.set_main_attribute(name, value);
        have_header = false;
    };

    while (std::getline(in, line)) {
        if (line.empty()) {
            // End of the main section.
            break;
        }
        if (line[0] == ' ') {
            if (have_header) value += line.substr(1);
            continue;
        }
        flush();
        const auto pos = line.find(':');
        if (pos == std::string::npos || pos == 0) {
            continue;
        }
        name = line.substr(0, pos);
        value = line.substr(pos + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
        have_header = true;
    }
    flush();
    return manifest;
}

std::optional<Manifest> read_manifest(const JarFile& jar) {
    auto text = jar.read_entry(MANIFEST_PATH, true);
    if (!text) return std::nullopt;
    return parse_manifest(*text);
}

bool check_manifest_for_r(const Manifest& manifest) {
    auto value = manifest.main_attribute(HAS_R_PACKAGE);
    return value && trim(*value) == "true";
}

bool check_manifest_for_r(const JarFile& jar) {
    auto manifest = read_manifest(jar);
    return manifest && check_manifest_for_r(*manifest);
}
