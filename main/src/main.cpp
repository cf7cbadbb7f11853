#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "packer.hpp"
#include "rpackage.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
    std::cerr << get_string("info.bundle_desc") << std::endl;
    std::cerr << get_string("info.doc_desc") << std::endl;
}

std::vector<std::string> positional_args(const cxxopts::ParseResult& result) {
    if (!result.count("jars")) return {};
    return result["jars"].as<std::vector<std::string>>();
}

void pre_operation_check(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    size_t count = positional_args(result).size();
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage_func();
        throw RjarException(get_string("error.invalid_arg_count"));
    }
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("spark-home", get_string("help.spark_home"), cxxopts::value<std::string>())
            ("r-command", get_string("help.r_command"), cxxopts::value<std::string>())
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("o,output", get_string("help.output_file"), cxxopts::value<std::string>())
            ("source", get_string("help.bundle_source"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("jars", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "jars"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        const bool verbose = result["verbose"].as<bool>();
        auto usage_printer = [&]() { print_usage(options); };

        if (command == "install") {
            pre_operation_check(result, usage_printer, 1);
            cleanup_tmp_dirs();

            Settings settings = result.count("config")
                ? load_settings(result["config"].as<std::string>(), true)
                : load_settings(CONFIG_FILE);

            RBuildConfig config;
            config.spark_home = resolve_spark_home(
                result.count("spark-home") ? result["spark-home"].as<std::string>() : std::string(), settings);
            config.install_command = resolve_install_command(
                result.count("r-command") ? result["r-command"].as<std::string>() : std::string(), settings);

            check_and_build_r_package(join(positional_args(result), ","), std::cout, verbose, config);
        } else if (command == "check") {
            pre_operation_check(result, usage_printer, 1);
            for (const auto& arg : positional_args(result)) {
                for (const auto& jar_path : split_paths(arg)) {
                    check_jar_for_r(jar_path, std::cout, verbose);
                }
            }
        } else if (command == "bundle") {
            pre_operation_check(result, usage_printer, 0, 0);
            if (!result.count("output")) {
                throw RjarException(get_string("error.bundle_no_output"));
            }
            if (!result.count("source")) {
                throw RjarException(get_string("error.bundle_no_source"));
            }
            bundle_r_package(result["output"].as<std::string>(), result["source"].as<std::string>());
        } else if (command == "doc") {
            pre_operation_check(result, usage_printer, 0, 0);
            std::cout << R_JAR_DOC << std::endl;
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const RjarConfigException& e) {
        log_error(string_format("error.config_error", e.what()));
        return 1;
    } catch (const RjarException& e) {
        log_error(string_format("error.rjar_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
