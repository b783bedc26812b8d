/*
 * LaserFX - GRBL laser controller host
 *
 * Console front end for one GRBL 1.1 controller on a serial port.
 *
 * Main loop:
 *   - Reads command lines from stdin (non-blocking, 100 ms slices)
 *   - Routes them through the CLI handlers
 *   - Announces each new alarm instance and link loss exactly once
 *
 * Usage:
 *   laserfx [-c laserfx.yaml] [-p /dev/ttyUSB0] [-b 115200] [-a]
 */

#define LASERFX_VERSION "0.3.0"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "controller/grbl_controller.h"
#include "storage/config_reader.h"
#include "debug_config.h"

// CLI System
#include "cli/command_router.h"
#include "cli/machine_cli.h"
#include "cli/port_cli.h"
#include "cli/system_cli.h"

// ============================================================================
// Globals
// ============================================================================

static volatile sig_atomic_t g_running = 1;

static void handle_signal(int) {
    g_running = 0;
}

// ============================================================================
// Event Notifier
// ============================================================================

/**
 * @brief Prints alarms and link loss once per occurrence
 *
 * Snapshots are compared by alarm id, so a latched alarm that keeps
 * showing up in status reports is announced a single time.
 */
class EventNotifier {
public:
    explicit EventNotifier(const GrblController& controller) : _controller(controller) {}

    void update() {
        ControllerSnapshot snap = _controller.snapshot();

        if (snap.pendingAlarm && snap.pendingAlarm->id != _lastAlarmId) {
            _lastAlarmId = snap.pendingAlarm->id;
            printf("\n!! ALARM:%u - %s (use 'unlock' or 'home')\n",
                   (unsigned)snap.pendingAlarm->code,
                   GrblProtocol::alarmDescription(snap.pendingAlarm->code));
            fflush(stdout);
        }

        const Connection::Error* linkError = std::get_if<Connection::Error>(&snap.connection);
        if (linkError && !_linkErrorShown) {
            printf("\n!! Connection lost: %s\n", linkError->message.c_str());
            fflush(stdout);
        }
        _linkErrorShown = linkError != nullptr;
    }

private:
    const GrblController& _controller;
    uint64_t _lastAlarmId = 0;
    bool _linkErrorShown = false;
};

// ============================================================================
// Serial Command Handler
// ============================================================================

static void handle_command(CommandRouter& router, std::string cmd) {
    // trim
    size_t first = cmd.find_first_not_of(" \t\r");
    if (first == std::string::npos) return;
    cmd = cmd.substr(first, cmd.find_last_not_of(" \t\r") - first + 1);

    if (cmd == "quit" || cmd == "exit") {
        g_running = 0;
        return;
    }

    // Route command to appropriate handler
    if (!router.routeCommand(cmd)) {
        printf("Unknown command. Type 'help' for available commands.\n");
    }
    fflush(stdout);
}

static void print_usage(const char* prog) {
    printf("Usage: %s [-c config.yaml] [-p port] [-b baud] [-a]\n", prog);
    printf("  -c  Configuration file (default: %s)\n", ConfigReaderConfig::DEFAULT_CONFIG_FILE);
    printf("  -p  Serial port, overrides serial.port\n");
    printf("  -b  Baud rate, overrides serial.baud\n");
    printf("  -a  Connect on startup and start status polling\n");
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    const char* configFile = ConfigReaderConfig::DEFAULT_CONFIG_FILE;
    const char* portArg = nullptr;
    long baudArg = 0;
    bool autoConnect = false;

    int opt;
    while ((opt = getopt(argc, argv, "c:p:b:ah")) != -1) {
        switch (opt) {
            case 'c': configFile = optarg; break;
            case 'p': portArg = optarg; break;
            case 'b': baudArg = strtol(optarg, nullptr, 10); break;
            case 'a': autoConnect = true; break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    printf("========================================\n");
    printf("  LaserFX - GRBL Laser Controller Host\n");
    printf("  Version %s\n", LASERFX_VERSION);
    printf("========================================\n\n");

    // Configuration
    ConfigReader configReader;
    if (configReader.load(configFile)) {
        MAIN_LOG("Configuration loaded from %s", configFile);
    } else {
        MAIN_LOG("Using default configuration");
    }

    LaserFXSettings settings = configReader.settings();
    if (portArg) settings.port = portArg;
    if (baudArg > 0) settings.baudRate = (uint32_t)baudArg;

    GrblController controller(settings.controller);
    EventNotifier notifier(controller);

    // CLI System
    CommandRouter cmdRouter;
    SystemCli systemCli;
    PortCli portCli(&controller);
    MachineCli machineCli(&controller, &settings);

    systemCli.setVersion(LASERFX_VERSION);
    systemCli.setConfig(&configReader);

    // Register all command handlers (order matters - first match wins)
    cmdRouter.addHandler(&systemCli);   // help, version, config
    cmdRouter.addHandler(&portCli);     // ports, bauds
    cmdRouter.addHandler(&machineCli);  // connect, status, jog, ...
    systemCli.registerHandlers(cmdRouter.getHandlers());

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    if (autoConnect) {
        if (settings.port.empty()) {
            printf("No port configured, skipping auto-connect\n");
        } else {
            handle_command(cmdRouter, "connect " + settings.port + " " + std::to_string(settings.baudRate));
            if (std::holds_alternative<Connection::Connected>(controller.snapshot().connection)) {
                controller.startPolling();
            }
        }
    }

    printf("Type 'help' for commands\n> ");
    fflush(stdout);

    std::string pending;
    char buf[256];
    while (g_running) {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, 100);

        if (ready < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            break;
        }

        if (ready > 0) {
            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) break;      // EOF
            pending.append(buf, (size_t)n);

            size_t nl;
            while ((nl = pending.find('\n')) != std::string::npos) {
                handle_command(cmdRouter, pending.substr(0, nl));
                pending.erase(0, nl + 1);
                if (g_running) {
                    printf("> ");
                    fflush(stdout);
                }
            }
        }

        notifier.update();
    }

    MAIN_LOG("Shutting down");
    controller.stopPolling();
    CommandResult result = controller.disconnect();
    if (!result.ok()) {
        fprintf(stderr, "%s\n", formatError(*result.error).c_str());
    }
    printf("\n");
    return 0;
}
