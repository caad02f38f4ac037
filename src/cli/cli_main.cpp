// cli_main.cpp
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "quorum/cli/cli_interface.h"
#include "quorum/cli/command_parser.h"
#include "quorum/config/engine_config.h"
#include "quorum/core/quorum_types.h"

using namespace quorum;

namespace {

void showHelp() {
    std::cout << "Usage: quorum_cli [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>      Load engine settings from a JSON file" << std::endl;
    std::cout << "  --log-level <level>  trace, debug, info, warn, error, critical or off" << std::endl;
    std::cout << "  --help               Show this help" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto flags = cli::CommandParser::extractFlags(args);

    if (cli::CommandParser::hasFlag(flags, "help")) {
        showHelp();
        return 0;
    }

    if (!args.empty()) {
        std::cerr << "Unexpected argument: " << args[0] << std::endl;
        showHelp();
        return 1;
    }

    config::EngineConfig engineConfig;
    try {
        std::string configPath = cli::CommandParser::getFlagValue(flags, "config");
        if (!configPath.empty()) {
            engineConfig = config::EngineConfig::loadFromFile(configPath);
        }
        engineConfig.log_level = cli::CommandParser::getFlagValue(flags, "log-level", engineConfig.log_level);
        config::applyLogging(engineConfig);
    } catch (const core::ConfigException& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    cli::CLIInterface cli(engineConfig);
    return cli.run();
}
