/**
 * @file machine_cli.h
 * @brief Machine commands (connect, status, jog, home, overrides, frame)
 */

#ifndef MACHINE_CLI_H
#define MACHINE_CLI_H

#include "../cli/command_handler.h"
#include "../controller/controller_types.h"
#include <grbl_protocol.h>

class CommandParser;
class GrblController;
struct LaserFXSettings;

class MachineCli : public CommandHandler {
private:
    GrblController* _controller;
    const LaserFXSettings* _settings;

    bool report(const CommandParser& p, const char* command, const CommandResult& result) const;
    void printStatus(bool json) const;
    void printStats(bool json) const;

    bool handleConnect(const CommandParser& p);
    bool handleJog(const CommandParser& p);
    bool handleOverride(const CommandParser& p);
    bool handleFrame(const CommandParser& p);
    bool handlePoller(const CommandParser& p);
    bool handleQuery(const CommandParser& p, const char* command, DeviceQuery query);

public:
    MachineCli(GrblController* controller, const LaserFXSettings* settings)
        : _controller(controller), _settings(settings) {}

    bool handleCommand(const std::string& cmd) override;
    void printHelp() const override;
    const char* getName() const override { return "Machine"; }
};

#endif // MACHINE_CLI_H
