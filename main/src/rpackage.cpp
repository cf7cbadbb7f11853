#include "rpackage.hpp"
#include "archive.hpp"
#include "builder.hpp"
#include "exception.hpp"
#include "extractor.hpp"
#include "localization.hpp"
#include "manifest.hpp"
#include "utils.hpp"

#include <optional>

namespace fs = std::filesystem;

const std::string R_JAR_DOC = std::string(
R"(In order for Spark to build R packages that are parts of Spark Packages, there are a few
requirements. The R source code must be shipped in a jar, with additional Java/Scala
classes. The jar must be in the following format:
  1- The Manifest (META-INF/MANIFEST.mf) must contain the key-value: )") + HAS_R_PACKAGE + R"(: true
  2- The standard R package layout must be preserved under R/pkg/ inside the jar. More
  information on the standard R package layout can be found in:
  http://cran.r-project.org/doc/contrib/Leisch-CreatingPackages.pdf
  An example layout is given below. After running `jar tf $JAR_FILE | sort`:

META-INF/MANIFEST.MF
R/
R/pkg/
R/pkg/DESCRIPTION
R/pkg/NAMESPACE
R/pkg/R/
R/pkg/R/myRcode.R
org/
org/apache/
...)";

namespace {

// A path that cannot even be stat'ed (name too long, no permission) counts as missing.
bool jar_exists(const fs::path& jar_path) {
    std::error_code ec;
    return fs::exists(jar_path, ec) && !ec;
}

// A jar that cannot be read, or has no manifest, is treated as having no R code.
std::optional<JarFile> open_jar_with_r_code(const fs::path& jar_path, std::ostream& out, bool verbose) {
    try {
        JarFile jar(jar_path);
        if (check_manifest_for_r(jar)) {
            return jar;
        }
    } catch (const RjarException& e) {
        if (verbose) {
            out << string_format("warning.unreadable_jar", jar_path.string(), e.what()) << std::endl;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

RJarStatus check_jar_for_r(const fs::path& jar_path, std::ostream& out, bool verbose) {
    if (!jar_exists(jar_path)) {
        out << string_format("warning.jar_not_found", jar_path.string()) << std::endl;
        return RJarStatus::NotFound;
    }
    if (open_jar_with_r_code(jar_path, out, verbose)) {
        out << string_format("info.jar_has_r_code", jar_path.string()) << std::endl;
        return RJarStatus::HasRCode;
    }
    out << string_format("info.jar_no_r_code", jar_path.string()) << std::endl;
    return RJarStatus::NoRCode;
}

RJarStatus check_and_build_jar(const fs::path& jar_path, std::ostream& out, bool verbose, const RBuildConfig& config) {
    if (!jar_exists(jar_path)) {
        out << string_format("warning.jar_not_found", jar_path.string()) << std::endl;
        return RJarStatus::NotFound;
    }

    std::optional<JarFile> jar = open_jar_with_r_code(jar_path, out, verbose);
    if (!jar) {
        if (verbose) {
            out << string_format("info.skipping_jar", jar_path.string()) << std::endl;
        }
        return RJarStatus::NoRCode;
    }

    out << string_format("info.installing_r_package", jar_path.string()) << std::endl;
    // Fail before touching the disk if the build could never run.
    require_spark_home(config);

    std::optional<ScratchDir> r_source;
    try {
        r_source.emplace(extract_r_folder(*jar, out, verbose));
    } catch (const RjarException& e) {
        out << string_format("error.extract_r_failed", jar_path.string(), e.what()) << std::endl;
        return RJarStatus::ExtractFailed;
    } catch (const fs::filesystem_error& e) {
        out << string_format("error.extract_r_failed", jar_path.string(), e.what()) << std::endl;
        return RJarStatus::ExtractFailed;
    }

    BuildResult result = build_r_package(r_source->path(), config, out, verbose);
    if (!result.success) {
        out << string_format("error.build_r_failed", jar_path.string()) << std::endl;
        out << R_JAR_DOC << std::endl;
    }
    // r_source goes out of scope here and removes the extracted sources.
    return result.success ? RJarStatus::BuildSucceeded : RJarStatus::BuildFailed;
}

void check_and_build_r_package(const std::string& jars, std::ostream& out, bool verbose, const RBuildConfig& config) {
    for (const auto& jar_path : split_paths(jars)) {
        check_and_build_jar(jar_path, out, verbose, config);
    }
}
