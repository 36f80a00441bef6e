#include "analyzer/audit_runner.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>

using namespace ormaudit;

// Exit codes: 0 clean, 1 persistence issues, 2 setup failure
int main(int argc, char* argv[]) {
    std::string config_file = "ormaudit.toml";
    const bool explicit_config = argc > 1;
    if (explicit_config) {
        config_file = argv[1];
    }

    AnalyzerConfig config;
    if (explicit_config || std::filesystem::exists(config_file)) {
        utils::log::info(std::format("Loading configuration from {}", config_file));
        const auto loaded = ConfigLoader::load_from_file(config_file).to_result();
        if (loaded.is_error()) {
            utils::log::error(loaded.error_message());
            return 2;
        }
        config = loaded.value();
    } else {
        utils::log::info("No ormaudit.toml found, using defaults");
    }

    const AuditRunner runner(std::move(config));
    const auto report = runner.run();
    if (report.is_error()) {
        std::cerr << std::format("ormaudit: {} error: {}\n",
                                 error_category_to_string(report.error_category()),
                                 report.error_message());
        return 2;
    }

    std::cout << runner.render(report.value()) << '\n';
    return report.value().issues.empty() ? EXIT_SUCCESS : 1;
}
