#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    constexpr size_t BLOCK_SIZE = 10240;

    struct ArchiveEntryDeleter {
        void operator()(struct archive_entry* e) const {
            if (e) archive_entry_free(e);
        }
    };
    using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

    std::string error_of(struct archive* a, const std::string& fallback_key) {
        const char* err = archive_error_string(a);
        return err ? std::string(err) : get_string(fallback_key);
    }

    // Jar entry names are UTF-8. The locale-converted name is missing when the
    // current locale (C, unless setlocale was called) cannot represent them.
    const char* entry_pathname(struct archive_entry* entry, const fs::path& jar_path) {
        const char* name = archive_entry_pathname_utf8(entry);
        if (!name) name = archive_entry_pathname(entry);
        if (!name) {
            throw RjarException(string_format("error.entry_name_unreadable", jar_path.string()));
        }
        return name;
    }

    void set_entry_name(struct archive_entry* entry, const std::string& name) {
        archive_entry_update_pathname_utf8(entry, name.c_str());
    }

    bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }
}

void ArchiveReadDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_read_close(a);
        archive_read_free(a);
    }
}

void ArchiveWriteDeleter::operator()(struct archive* a) const {
    if (a) {
        archive_write_close(a);
        archive_write_free(a);
    }
}

std::uint64_t EntryReader::copy_to(std::ostream& out) {
    char buffer[8192];
    std::uint64_t total = 0;
    while (true) {
        la_ssize_t n = archive_read_data(a_, buffer, sizeof(buffer));
        if (n == 0) break;
        if (n < 0) {
            throw RjarException(string_format("error.read_entry_failed", jar_path_.string()) + ": " + error_of(a_, "error.data_block_read"));
        }
        out.write(buffer, n);
        if (!out) {
            throw RjarException(string_format("error.write_failed", jar_path_.string()));
        }
        total += static_cast<std::uint64_t>(n);
    }
    return total;
}

std::string EntryReader::read_all() {
    std::ostringstream ss;
    copy_to(ss);
    return ss.str();
}

JarFile::JarFile(fs::path path) : path_(std::move(path)) {
    // Fail early on unreadable or non-archive files.
    open();
}

ArchiveReadHandle JarFile::open() const {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw RjarException(string_format("error.open_archive_failed", path_.string()));
    }
    archive_read_support_format_zip_seekable(a.get());

    if (archive_read_open_filename(a.get(), path_.c_str(), BLOCK_SIZE) != ARCHIVE_OK) {
        throw RjarException(string_format("error.open_archive_failed", path_.string()) + ": " + error_of(a.get(), "error.unknown"));
    }
    return a;
}

void JarFile::for_each_entry(const Visitor& visitor) const {
    ArchiveReadHandle a = open();
    EntryReader reader(a.get(), path_);

    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw RjarException(string_format("error.read_archive_failed", path_.string()) + ": " + error_of(a.get(), "error.fatal_read"));
        }

        JarEntry info;
        info.name = entry_pathname(entry, path_);
        info.is_directory = archive_entry_filetype(entry) == AE_IFDIR || info.name.ends_with('/');
        if (info.is_directory && !info.name.ends_with('/')) info.name += '/';
        info.size = archive_entry_size(entry);
        visitor(info, reader);
    }
}

std::optional<std::string> JarFile::read_entry(const std::string& name, bool case_insensitive) const {
    ArchiveReadHandle a = open();
    EntryReader reader(a.get(), path_);

    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw RjarException(string_format("error.read_archive_failed", path_.string()) + ": " + error_of(a.get(), "error.fatal_read"));
        }

        std::string path = entry_pathname(entry, path_);
        if (path.starts_with("./")) path = path.substr(2);

        if (case_insensitive ? iequals(path, name) : path == name) {
            return reader.read_all();
        }
    }
    return std::nullopt;
}

JarWriter::JarWriter(const fs::path& output_path) : output_path_(output_path), a_(archive_write_new()) {
    if (!a_) {
        throw RjarException(string_format("error.create_file_failed", output_path_.string()));
    }
    archive_write_set_format_zip(a_.get());
    if (archive_write_set_options(a_.get(), "zip:hdrcharset=UTF-8") < ARCHIVE_WARN) {
        throw RjarException(string_format("error.create_file_failed", output_path_.string()) + ": " + error_of(a_.get(), "error.unknown"));
    }
    if (archive_write_open_filename(a_.get(), output_path_.c_str()) != ARCHIVE_OK) {
        throw RjarException(string_format("error.create_file_failed", output_path_.string()) + ": " + error_of(a_.get(), "error.unknown"));
    }
}

JarWriter::~JarWriter() = default;

void JarWriter::write_header(struct archive_entry* entry) {
    if (archive_write_header(a_.get(), entry) != ARCHIVE_OK) {
        throw RjarException(string_format("error.write_archive_failed", output_path_.string()) + ": " + error_of(a_.get(), "error.fatal_write"));
    }
}

void JarWriter::add_directory(const std::string& entry_name) {
    std::string name = entry_name;
    if (!name.ends_with('/')) name += '/';

    ArchiveEntryHandle entry(archive_entry_new());
    set_entry_name(entry.get(), name);
    archive_entry_set_filetype(entry.get(), AE_IFDIR);
    archive_entry_set_perm(entry.get(), 0755);
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    write_header(entry.get());
}

void JarWriter::add_file(const std::string& entry_name, const std::string& content) {
    ArchiveEntryHandle entry(archive_entry_new());
    set_entry_name(entry.get(), entry_name);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    write_header(entry.get());

    if (!content.empty() && archive_write_data(a_.get(), content.data(), content.size()) < 0) {
        throw RjarException(string_format("error.write_archive_failed", output_path_.string()) + ": " + error_of(a_.get(), "error.data_block_write"));
    }
}

void JarWriter::add_file_from_disk(const std::string& entry_name, const fs::path& source) {
    struct stat st;
    if (stat(source.c_str(), &st) != 0) {
        throw RjarException(string_format("error.open_file_failed", source.string()));
    }

    ArchiveEntryHandle entry(archive_entry_new());
    archive_entry_copy_stat(entry.get(), &st);
    set_entry_name(entry.get(), entry_name);
    write_header(entry.get());

    std::ifstream f(source, std::ios::binary);
    if (!f) {
        throw RjarException(string_format("error.open_file_failed", source.string()));
    }
    char buffer[8192];
    while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
        if (archive_write_data(a_.get(), buffer, static_cast<size_t>(f.gcount())) < 0) {
            throw RjarException(string_format("error.write_archive_failed", output_path_.string()) + ": " + error_of(a_.get(), "error.data_block_write"));
        }
    }
}

void JarWriter::close() {
    if (!a_) return;
    if (archive_write_close(a_.get()) != ARCHIVE_OK) {
        std::string err = error_of(a_.get(), "error.fatal_write");
        a_.reset();
        throw RjarException(string_format("error.write_archive_failed", output_path_.string()) + ": " + err);
    }
    a_.reset();
}
