#include <gtest/gtest.h>
#include "../main/src/extractor.hpp"
#include "../main/src/exception.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <sstream>

namespace fs = std::filesystem;

class ExtractorTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path scratch_parent;

    void SetUp() override {
        init_test_localization();
        suite_work_dir = fs::absolute("tmp_extractor_test");
        scratch_parent = suite_work_dir / "scratch";
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(scratch_parent);
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }
};

TEST_F(ExtractorTest, ExtractsOnlyRPackageEntries) {
    fs::path jar_path = suite_work_dir / "pkg.jar";
    const std::string binary("\x00\x01\x02\xff\xfe", 5);
    make_jar(jar_path, r_manifest(), {
        {"R/", ""},
        {"R/pkg/", ""},
        {"R/pkg/DESCRIPTION", "Package: demo\nVersion: 0.1\n"},
        {"R/pkg/NAMESPACE", "export(hello)\n"},
        {"R/pkg/R/", ""},
        {"R/pkg/R/code.R", "hello <- function() 'world'\n"},
        {"R/pkg/inst/extdata/blob.bin", binary},
        {"org/apache/A.class", "cafebabe"},
        {"R/other.txt", "not part of the package"},
    });

    JarFile jar(jar_path);
    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, false, scratch_parent);

    EXPECT_EQ(dir.path().parent_path(), scratch_parent);
    EXPECT_TRUE(dir.path().filename().string().starts_with("rjar_"));
    EXPECT_EQ(read_file(dir.path() / "R/pkg/DESCRIPTION"), "Package: demo\nVersion: 0.1\n");
    EXPECT_EQ(read_file(dir.path() / "R/pkg/NAMESPACE"), "export(hello)\n");
    EXPECT_EQ(read_file(dir.path() / "R/pkg/R/code.R"), "hello <- function() 'world'\n");
    EXPECT_EQ(read_file(dir.path() / "R/pkg/inst/extdata/blob.bin"), binary);
    EXPECT_TRUE(fs::is_directory(dir.path() / "R/pkg/R"));
    EXPECT_FALSE(fs::exists(dir.path() / "org"));
    EXPECT_FALSE(fs::exists(dir.path() / "R/other.txt"));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ExtractorTest, KeepsPathFromMarkerOnwards) {
    fs::path jar_path = suite_work_dir / "nested.jar";
    make_jar(jar_path, r_manifest(), {
        {"resources/R/pkg/DESCRIPTION", "Package: nested\n"},
        {"resources/R/pkg/R/", ""},
    });

    JarFile jar(jar_path);
    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, false, scratch_parent);

    EXPECT_EQ(read_file(dir.path() / "R/pkg/DESCRIPTION"), "Package: nested\n");
    EXPECT_TRUE(fs::is_directory(dir.path() / "R/pkg/R"));
    EXPECT_FALSE(fs::exists(dir.path() / "resources"));
}

TEST_F(ExtractorTest, FilesWithoutDirectoryEntries) {
    fs::path jar_path = suite_work_dir / "flat.jar";
    make_jar(jar_path, r_manifest(), {{"R/pkg/R/deep/er/code.R", "x <- 1\n"}});

    JarFile jar(jar_path);
    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, false, scratch_parent);
    EXPECT_EQ(read_file(dir.path() / "R/pkg/R/deep/er/code.R"), "x <- 1\n");
}

TEST_F(ExtractorTest, NonAsciiEntryNames) {
    // Runs in the C locale: gtest_main never calls setlocale.
    const std::string vignette = "R/pkg/inst/doc/caf\xc3\xa9.Rmd";
    const std::string data_dir = "R/pkg/inst/\xe6\x95\xb0\xe6\x8d\xae/";
    fs::path jar_path = suite_work_dir / "utf8.jar";
    make_jar(jar_path, r_manifest(), {
        {"R/pkg/DESCRIPTION", "Package: demo\n"},
        {vignette, "---\ntitle: caf\xc3\xa9\n---\n"},
        {data_dir, ""},
    });

    JarFile jar(jar_path);
    std::vector<std::string> names;
    jar.for_each_entry([&](const JarEntry& entry, EntryReader&) { names.push_back(entry.name); });
    EXPECT_NE(std::find(names.begin(), names.end(), vignette), names.end());
    EXPECT_EQ(jar.read_entry(vignette).value_or(""), "---\ntitle: caf\xc3\xa9\n---\n");

    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, false, scratch_parent);
    EXPECT_EQ(read_file(dir.path() / vignette), "---\ntitle: caf\xc3\xa9\n---\n");
    EXPECT_TRUE(fs::is_directory(dir.path() / data_dir));
    EXPECT_EQ(read_file(dir.path() / "R/pkg/DESCRIPTION"), "Package: demo\n");
}

TEST_F(ExtractorTest, DefaultScratchLocationHonoursTmpdir) {
    const char* old = std::getenv("TMPDIR");
    const std::string saved = old ? old : "";
    setenv("TMPDIR", scratch_parent.c_str(), 1);

    fs::path jar_path = suite_work_dir / "default.jar";
    make_jar(jar_path, r_manifest(), {{"R/pkg/DESCRIPTION", "Package: demo\n"}});
    fs::path extracted;
    {
        JarFile jar(jar_path);
        std::ostringstream out;
        ScratchDir dir = extract_r_folder(jar, out, false);
        extracted = dir.path();
        EXPECT_EQ(extracted.parent_path(), scratch_parent);
        EXPECT_EQ(read_file(extracted / "R/pkg/DESCRIPTION"), "Package: demo\n");
    }
    EXPECT_FALSE(fs::exists(extracted));

    if (old) setenv("TMPDIR", saved.c_str(), 1);
    else unsetenv("TMPDIR");
}

TEST_F(ExtractorTest, VerboseReportsEachEntry) {
    fs::path jar_path = suite_work_dir / "verbose.jar";
    make_jar(jar_path, r_manifest(), {
        {"R/pkg/", ""},
        {"R/pkg/DESCRIPTION", "Package: demo\n"},
        {"lib/Other.class", "x"},
    });

    JarFile jar(jar_path);
    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, true, scratch_parent);

    const std::string log = out.str();
    EXPECT_NE(log.find("Creating directory: " + (dir.path() / "R/pkg/").string()), std::string::npos);
    EXPECT_NE(log.find("Extracting R/pkg/DESCRIPTION to " + (dir.path() / "R/pkg/DESCRIPTION").string()), std::string::npos);
    EXPECT_EQ(log.find("Other.class"), std::string::npos);
}

TEST_F(ExtractorTest, ScratchDirIsRemovedWithHandle) {
    fs::path jar_path = suite_work_dir / "cleanup.jar";
    make_jar(jar_path, r_manifest(), {{"R/pkg/DESCRIPTION", "Package: demo\n"}});

    fs::path extracted;
    {
        JarFile jar(jar_path);
        std::ostringstream out;
        ScratchDir dir = extract_r_folder(jar, out, false, scratch_parent);
        extracted = dir.path();
        ASSERT_TRUE(fs::exists(extracted / "R/pkg/DESCRIPTION"));
    }
    EXPECT_FALSE(fs::exists(extracted));
    EXPECT_EQ(count_entries(scratch_parent), 0u);
}

TEST_F(ExtractorTest, EachExtractionGetsItsOwnDirectory) {
    fs::path jar_path = suite_work_dir / "twice.jar";
    make_jar(jar_path, r_manifest(), {{"R/pkg/DESCRIPTION", "Package: demo\n"}});

    JarFile jar(jar_path);
    std::ostringstream out;
    ScratchDir first = extract_r_folder(jar, out, false, scratch_parent);
    ScratchDir second = extract_r_folder(jar, out, false, scratch_parent);
    EXPECT_NE(first.path(), second.path());
    EXPECT_EQ(count_entries(scratch_parent), 2u);
}

TEST_F(ExtractorTest, TraversalAbortsAndCleansUp) {
    fs::path jar_path = suite_work_dir / "evil.jar";
    make_jar(jar_path, r_manifest(), {
        {"R/pkg/DESCRIPTION", "Package: demo\n"},
        {"R/pkg/../../../escaped.txt", "gotcha"},
    });

    JarFile jar(jar_path);
    std::ostringstream out;
    EXPECT_THROW(extract_r_folder(jar, out, false, scratch_parent), RjarException);
    EXPECT_EQ(count_entries(scratch_parent), 0u);
    EXPECT_FALSE(fs::exists(suite_work_dir / "escaped.txt"));
}
