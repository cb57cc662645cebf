#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "installer.hpp"
#include "localization.hpp"
#include "path_manager.hpp"
#include "utils.hpp"
#include "cxxopts.hpp"

#include <curl/curl.h>

#include <filesystem>
#include <iostream>
#include <string>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
}

void report_failure(const InstallReport& report) {
    log_error(string_format("error.install_failed_at", install_step_name(report.failed_step),
                            error_kind_name(report.error_kind), report.message));
    log_error(string_format("error.contact_support", std::string(SUPPORT_CONTACT)));
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("v,version", get_string("help.version"), cxxopts::value<std::string>())
            ("proxy", get_string("help.proxy"), cxxopts::value<std::string>())
            ("base-url", get_string("help.base_url"), cxxopts::value<std::string>())
            ("app-data", get_string("help.app_data"), cxxopts::value<std::string>())
            ("env-file", get_string("help.env_file"), cxxopts::value<std::string>())
            ("arch", get_string("help.arch"), cxxopts::value<std::string>())
            ("os", get_string("help.os"), cxxopts::value<std::string>())
            ("c,config", get_string("help.config"), cxxopts::value<std::string>());

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        std::error_code ec;
        if (result.count("config")) {
            load_config_file(result["config"].as<std::string>());
        } else if (std::filesystem::exists(CONFIG_FILE, ec)) {
            load_config_file(CONFIG_FILE);
        }

        if (result.count("proxy")) apply_config_value("proxy", result["proxy"].as<std::string>());
        if (result.count("base-url")) apply_config_value("base_url", result["base-url"].as<std::string>());
        if (result.count("app-data")) apply_config_value("app_data", result["app-data"].as<std::string>());
        if (result.count("env-file")) apply_config_value("env_file", result["env-file"].as<std::string>());
        if (result.count("arch")) apply_config_value("arch", result["arch"].as<std::string>());
        if (result.count("os")) apply_config_value("os", result["os"].as<std::string>());

        InstallOptions install_options = options_from_config();
        // An explicit --proxy, empty included, is validated rather than dropped.
        if (result.count("proxy")) {
            install_options.proxy = result["proxy"].as<std::string>();
        }
        if (result.count("version")) {
            install_options.version = result["version"].as<std::string>();
        }

        CurlHttpClient client;
        EnvFileStore store(ENV_FILE);
        Installer installer(client, store);

        InstallReport report = installer.run(install_options);
        if (!report.succeeded) {
            report_failure(report);
            return 1;
        }
        log_info(string_format("info.install_complete", report.version, report.install_dir.string()));
        log_info(get_string("info.restart_shell"));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", std::string(e.what())));
        return 1;
    } catch (const VciException& e) {
        log_error(string_format("error.vci_error", std::string(e.what())));
        log_error(string_format("error.contact_support", std::string(SUPPORT_CONTACT)));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        log_error(string_format("error.contact_support", std::string(SUPPORT_CONTACT)));
        return 1;
    }

    return 0;
}
