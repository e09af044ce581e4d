#include "account_config.hpp"  // for parse_accounts_config

// import acplan
#include "acplan/account_plan.hpp"
#include "acplan/emitter.hpp"
#include "acplan/file_utils.hpp"
#include "acplan/logger.hpp"
#include "acplan/os_info.hpp"

#include <cstdio>       // for fputs, stdout
#include <filesystem>   // for exists
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <vector>       // for vector

#include <fmt/core.h>

#include <spdlog/common.h>                    // for debug
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_mt
#include <spdlog/spdlog.h>                    // for set_default_logger, set_level

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        fmt::print(stderr, "Usage: {} <config.json> [os-family]\n", argv[0]);
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::stderr_color_mt("acplan_logger");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::info);

    // Set acplan logger.
    acplan::logger::set_logger(logger);

    const std::string_view config_path{argv[1]};
    std::error_code err{};
    if (!fs::exists(config_path, err)) {
        spdlog::error("Config file '{}' does not exist", config_path);
        return 1;
    }

    const auto& config_content = acplan::file_utils::read_whole_file(config_path);
    auto config                = planner::parse_accounts_config(config_content);
    if (!config) {
        spdlog::error("Failed to parse config '{}': {}", config_path, config.error());
        return 1;
    }

    // command line wins over config, config wins over detection
    std::string os_family{};
    if (argc == 3) {
        os_family = argv[2];
    } else if (config->os_family) {
        os_family = *config->os_family;
    } else {
        os_family = acplan::os::detect_os_family();
    }
    spdlog::info("Planning {} accounts for OS family {}", config->accounts.size(), os_family);

    std::vector<std::pair<std::string, std::vector<acplan::emit::ResourceDescriptor>>> plans{};
    bool has_failed{false};
    for (const auto& params : config->accounts) {
        auto account_plan = acplan::build_account_plan(params, os_family);
        if (!account_plan) {
            spdlog::error("Skipping account '{}': {}", params.title, account_plan.error());
            has_failed = true;
            continue;
        }
        plans.emplace_back(params.title, std::move(account_plan->descriptors));
    }

    const auto& plans_json = acplan::emit::plans_to_json(plans, true);
    std::fputs(plans_json.c_str(), stdout);
    std::fputs("\n", stdout);

    spdlog::shutdown();
    return has_failed ? 2 : 0;
}
