#include <gtest/gtest.h>
#include "../main/src/packer.hpp"
#include "../main/src/archive.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/extractor.hpp"
#include "../main/src/hash.hpp"
#include "../main/src/manifest.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

class PackerTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    fs::path pkg_dir;
    fs::path output_jar;

    void SetUp() override {
        init_test_localization();
        suite_work_dir = fs::absolute("tmp_packer_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        pkg_dir = suite_work_dir / "demo";
        output_jar = suite_work_dir / "demo.jar";
        fs::create_directories(pkg_dir / "R");
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    void write(const fs::path& p, const std::string& content) {
        std::ofstream f(p, std::ios::binary);
        f << content;
    }
};

TEST_F(PackerTest, BundleProducesRJar) {
    write(pkg_dir / "DESCRIPTION", "Package: demo\nVersion: 0.1\n");
    write(pkg_dir / "NAMESPACE", "export(hello)\n");
    write(pkg_dir / "R/code.R", "hello <- function() 'world'\n");

    std::string hash = bundle_r_package(output_jar.string(), pkg_dir.string());
    ASSERT_TRUE(fs::exists(output_jar));
    EXPECT_EQ(hash, calculate_sha256(output_jar));
    EXPECT_EQ(hash.size(), 64u);

    JarFile jar(output_jar);
    EXPECT_TRUE(check_manifest_for_r(jar));

    std::set<std::string> names;
    jar.for_each_entry([&](const JarEntry& entry, EntryReader&) { names.insert(entry.name); });
    EXPECT_TRUE(names.count("META-INF/MANIFEST.MF"));
    EXPECT_TRUE(names.count("R/"));
    EXPECT_TRUE(names.count("R/pkg/"));
    EXPECT_TRUE(names.count("R/pkg/DESCRIPTION"));
    EXPECT_TRUE(names.count("R/pkg/NAMESPACE"));
    EXPECT_TRUE(names.count("R/pkg/R/"));
    EXPECT_TRUE(names.count("R/pkg/R/code.R"));
}

TEST_F(PackerTest, BundledJarExtractsBack) {
    write(pkg_dir / "DESCRIPTION", "Package: demo\n");
    write(pkg_dir / "R/code.R", "x <- 42\n");
    bundle_r_package(output_jar.string(), pkg_dir.string());

    JarFile jar(output_jar);
    std::ostringstream out;
    ScratchDir dir = extract_r_folder(jar, out, false, suite_work_dir);
    EXPECT_EQ(read_file(dir.path() / "R/pkg/DESCRIPTION"), "Package: demo\n");
    EXPECT_EQ(read_file(dir.path() / "R/pkg/R/code.R"), "x <- 42\n");
}

TEST_F(PackerTest, RequiresDescription) {
    write(pkg_dir / "R/code.R", "x <- 1\n");
    EXPECT_THROW(bundle_r_package(output_jar.string(), pkg_dir.string()), RjarException);
    EXPECT_FALSE(fs::exists(output_jar));
}

TEST_F(PackerTest, RequiresSourceDir) {
    EXPECT_THROW(bundle_r_package(output_jar.string(), (suite_work_dir / "absent").string()), RjarException);
}

TEST_F(PackerTest, HashOfMissingFileThrows) {
    EXPECT_THROW(calculate_sha256(suite_work_dir / "missing.jar"), RjarException);
}

TEST_F(PackerTest, KnownHash) {
    write(suite_work_dir / "abc.txt", "abc");
    EXPECT_EQ(calculate_sha256(suite_work_dir / "abc.txt"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
