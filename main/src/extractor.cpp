#include "extractor.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <fstream>

namespace {

void extract_into(const JarFile& jar, const fs::path& root, std::ostream& out, bool verbose) {
    jar.for_each_entry([&](const JarEntry& entry, EntryReader& reader) {
        const auto r_index = entry.name.find(R_JAR_ENTRIES);
        if (r_index == std::string::npos) return;

        const fs::path dest = validate_path(entry.name.substr(r_index), root);

        if (entry.is_directory) {
            if (verbose) {
                out << string_format("info.creating_directory", dest.string()) << std::endl;
            }
            fs::create_directories(dest);
            return;
        }

        fs::create_directories(dest.parent_path());
        std::ofstream file(dest, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw RjarException(string_format("error.create_file_failed", dest.string()));
        }
        if (verbose) {
            out << string_format("info.extracting_entry", entry.name, dest.string()) << std::endl;
        }
        reader.copy_to(file);
        file.close();
        if (!file) {
            throw RjarException(string_format("error.write_failed", dest.string()));
        }
    });
}

} // anonymous namespace

ScratchDir extract_r_folder(const JarFile& jar, std::ostream& out, bool verbose, const fs::path& scratch_parent) {
    ScratchDir scratch(scratch_parent);
    extract_into(jar, scratch.path(), out, verbose);
    return scratch;
}

ScratchDir extract_r_folder(const JarFile& jar, std::ostream& out, bool verbose) {
    return extract_r_folder(jar, out, verbose, fs::temp_directory_path());
}
