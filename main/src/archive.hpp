#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

struct archive;

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const;
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const;
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

struct JarEntry {
    std::string name;
    bool is_directory = false;
    std::int64_t size = 0;
};

// Gives access to the data of the entry currently visited by JarFile::for_each_entry.
// Valid only inside the visitor call.
class EntryReader {
public:
    EntryReader(struct archive* a, const std::filesystem::path& jar_path) : a_(a), jar_path_(jar_path) {}

    std::uint64_t copy_to(std::ostream& out);
    std::string read_all();

private:
    struct archive* a_;
    const std::filesystem::path& jar_path_;
};

// Read-only view of a jar (zip) file. Each traversal opens its own libarchive
// read handle, so a JarFile can be enumerated any number of times.
class JarFile {
public:
    // Throws RjarException if the file cannot be opened as an archive.
    explicit JarFile(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    using Visitor = std::function<void(const JarEntry&, EntryReader&)>;
    void for_each_entry(const Visitor& visitor) const;

    std::optional<std::string> read_entry(const std::string& name, bool case_insensitive = false) const;

private:
    ArchiveReadHandle open() const;

    std::filesystem::path path_;
};

class JarWriter {
public:
    explicit JarWriter(const std::filesystem::path& output_path);
    ~JarWriter();

    JarWriter(const JarWriter&) = delete;
    JarWriter& operator=(const JarWriter&) = delete;

    void add_directory(const std::string& entry_name);
    void add_file(const std::string& entry_name, const std::string& content);
    void add_file_from_disk(const std::string& entry_name, const std::filesystem::path& source);
    void close();

private:
    void write_header(struct archive_entry* entry);

    std::filesystem::path output_path_;
    ArchiveWriteHandle a_;
};
