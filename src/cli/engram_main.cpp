// File: src/cli/engram_main.cpp
//
// Entry point for the engram driver
//
// Usage: engram [--config FILE] [command args...]
// Without a command, commands are read from stdin.

#include "cli/engram_cli.hpp"
#include "cli/engram_config.hpp"
#include "core/logging.hpp"
#include <iostream>
#include <optional>
#include <string>

using namespace engram;

static void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [command args...]\n"
              << "Commands: train <dir>, learn <file>, say <text>, predict <w1> <w2> <w3>,\n"
              << "          consolidate, tick, stats, save, load, help\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && arg == "--config") {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 2;
            }
            config_path = argv[++i];
        } else if (command.empty() && (arg == "--help" || arg == "-h")) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            command += command.empty() ? "/" + arg : " " + arg;
        }
    }

    std::optional<EngramConfig> config = config_path.empty()
        ? EngramConfig::Default()
        : EngramConfig::LoadFromFile(config_path);
    if (!config) {
        std::cerr << "Invalid configuration: " << config_path << "\n";
        return 1;
    }
    ConfigureLogging(config->logging.level);

    try {
        EngramCli cli(*config);
        cli.LoadIfExists();

        if (!command.empty()) {
            cli.ProcessCommand(command);

            // One-shot commands that change state persist it
            std::string verb = command.substr(1, command.find(' ') - 1);
            if (verb == "train" || verb == "learn" || verb == "say" ||
                verb == "consolidate" || verb == "tick") {
                cli.ProcessCommand("/save");
            }
        } else {
            cli.Run(std::cin);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
