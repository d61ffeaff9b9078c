#include "portwarden/cli/app.hpp"
#include "portwarden/cli/commands.hpp"
#include "portwarden/core/logger.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DPORTWARDEN_VERSION_STRING=...
#ifndef PORTWARDEN_VERSION_STRING
#define PORTWARDEN_VERSION_STRING "0.1.0-dev"
#endif

namespace portwarden::cli {

App::App()
    : cli_("portwarden", "Local port allocation and server lifecycle supervisor")
{
    cli_.set_version_flag("--version", PORTWARDEN_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("PORTWARDEN_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // Subcommand callbacks have already run inside parse().
    Logger::flush();
    return exit_code_;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    if (config_loaded_) {
        return config_;
    }
    config_loaded_ = true;

    config_ = read_config();
    Logger::init("portwarden", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }
    return config_;
}

auto App::reload_config() -> Config {
    config_ = read_config();
    config_loaded_ = true;
    Logger::set_level(config_.log_level);
    LOG_INFO("Configuration reloaded{}",
             config_path_.empty() ? std::string{} : " from: " + config_path_);
    return config_;
}

auto App::read_config() const -> Config {
    Config config;
    if (!config_path_.empty()) {
        config = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(config);
    if (!log_level_.empty()) {
        config.log_level = log_level_;
    }
    return config;
}

void App::setup_commands() {
    auto load = [this]() -> Config& { return config(); };
    auto reload = [this]() -> Config { return reload_config(); };
    auto set_exit = [this](int code) { exit_code_ = code; };

    register_serve_command(cli_, load, reload, set_exit);
    register_scan_command(cli_, load, set_exit);
    register_preferred_command(cli_, load, set_exit);
    register_check_command(cli_, load, set_exit);
    register_common_ports_command(cli_, load);
    register_config_command(cli_, load, set_exit);
}

} // namespace portwarden::cli
