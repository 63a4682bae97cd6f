#ifndef COMMAND_REGISTRY_H
#define COMMAND_REGISTRY_H

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace ByteBlock {

struct Action
{
    std::string usage;
    std::string help;
    std::function<int(const std::vector<std::string>& args)> handler;
};

struct Command
{
    std::string help;
    std::map<std::string, Action> actions;
};

using CommandTable = std::map<std::string, Command>;

// Function signature for command registration
using CommandRegistrationFunction = void(*)(CommandTable&);

// Strips "-c <file>" and "-c=<file>" from the arguments, returning the config path if present
static std::string extractConfigOption(std::vector<std::string>& args) {
    std::string configFile;
    std::vector<std::string> remaining;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-c" && i + 1 < args.size()) {
            configFile = args[i + 1];
            ++i;
            continue;
        }
        if (a.rfind("-c=", 0) == 0 && a.size() > 3) {
            configFile = a.substr(3);
            continue;
        }
        remaining.push_back(a);
    }
    args = std::move(remaining);
    return configFile;
}

// args holds <type> <action> [arguments...]
static int prepareCommands(const CommandTable& commandTable, const std::vector<std::string>& args) {
    std::string type = !args.empty() ? args[0] : "";
    std::string action = args.size() > 1 ? args[1] : "";

    // Find and execute command
    auto commandIt = commandTable.find(type);
    if (commandIt == commandTable.end()) {
        std::cerr << "Unknown command type: " << type << std::endl;
        std::cerr << "Available commands:" << std::endl;
        for (const auto& cmd : commandTable) {
            std::cerr << "  " << cmd.first << " - " << cmd.second.help << std::endl;
        }
        return 1;
    }

    auto actionIt = commandIt->second.actions.find(action);
    if (actionIt == commandIt->second.actions.end()) {
        std::cerr << "Unknown action: " << action << " for command: " << type << std::endl;
        std::cerr << "Available actions for " << type << ":" << std::endl;
        for (const auto& act : commandIt->second.actions) {
            std::cerr << "  " << act.first << " " << act.second.usage << " - " << act.second.help << std::endl;
        }
        return 1;
    }

    std::vector<std::string> actionArgs(args.begin() + 2, args.end());
    return actionIt->second.handler(actionArgs);
}

static void printHelp(const CommandTable& commandTable, const char* programName) {
    std::cout << "Usage: " << programName << " <type> <action> [arguments] [-c config_file]" << std::endl;
    std::cout << "\nTypes:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << "  " << cmd.first << " - " << cmd.second.help << std::endl;
    }
    std::cout << "\nActions:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << cmd.first << " actions:" << std::endl;
        for (const auto& act : cmd.second.actions) {
            std::cout << "  " << act.first << " " << act.second.usage << " - " << act.second.help << std::endl;
        }
        std::cout << std::endl;
    }
    std::cout << "Optional:\n  -c <config_file> - ByteBlock configuration file (defaults apply if none is found)" << std::endl;
}

} // namespace ByteBlock
#endif // COMMAND_REGISTRY_H
