/**
 * @file port_cli.h
 * @brief Serial port discovery commands (ports, bauds)
 */

#ifndef PORT_CLI_H
#define PORT_CLI_H

#include "../cli/command_handler.h"

class GrblController;

class PortCli : public CommandHandler {
private:
    GrblController* _controller;

public:
    explicit PortCli(GrblController* controller) : _controller(controller) {}

    bool handleCommand(const std::string& cmd) override;
    void printHelp() const override;
    const char* getName() const override { return "Ports"; }
};

#endif // PORT_CLI_H
