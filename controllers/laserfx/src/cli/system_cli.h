/**
 * @file system_cli.h
 * @brief System-level commands (help, version, config)
 */

#ifndef SYSTEM_CLI_H
#define SYSTEM_CLI_H

#include "../cli/command_handler.h"
#include <vector>

class ConfigReader;

class SystemCli : public CommandHandler {
private:
    std::vector<CommandHandler*> allHandlers;
    const ConfigReader* _config = nullptr;
    const char* _version = "0.1.0";

public:
    SystemCli() {}

    void registerHandlers(const std::vector<CommandHandler*>& handlers) {
        allHandlers = handlers;
    }

    void setConfig(const ConfigReader* config) { _config = config; }
    void setVersion(const char* version) { _version = version; }

    bool handleCommand(const std::string& cmd) override;
    void printHelp() const override;
    const char* getName() const override { return "System"; }
};

#endif // SYSTEM_CLI_H
