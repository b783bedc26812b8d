/**
 * @file system_cli.cpp
 * @brief System command handler implementation
 */

#include "system_cli.h"
#include "command_parser.h"
#include "../storage/config_reader.h"
#include <stdio.h>

bool SystemCli::handleCommand(const std::string& cmd) {
    CommandParser p(cmd);

    // ---- HELP ----
    if (p.is("help") || p.is("?")) {
        if (p.jsonRequested()) {
            // JSON help: list all command groups
            printf("{\"commands\":[");
            bool first = true;
            for (auto* handler : allHandlers) {
                if (!first) printf(",");
                first = false;
                printf("\"%s\"", handler->getName());
            }
            printf("]}\n");
        } else {
            printf("\n=== LaserFX - Command Help ===\n\n");
            for (auto* handler : allHandlers) {
                handler->printHelp();
                printf("\n");
            }
            printf("Tip: Commands are case-insensitive\n\n");
        }
        return true;
    }

    // ---- VERSION [--json] ----
    if (p.is("version") || p.is("ver")) {
        if (p.jsonRequested()) {
            printf("{\"version\":\"v%s\",\"protocol\":\"grbl-1.1\"}\n", _version);
        } else {
            printf("LaserFX v%s (GRBL 1.1 host)\n", _version);
        }
        return true;
    }

    // ---- CONFIG ----
    if (p.is("config")) {
        if (_config) {
            _config->print();
        } else {
            printf("No configuration loaded\n");
        }
        return true;
    }

    return false;
}

void SystemCli::printHelp() const {
    printf("=== System Commands ===\n");
    printf("  help [--json]            - Show this help\n");
    printf("  version [--json]         - Show version info\n");
    printf("  config                   - Show loaded configuration\n");
    printf("  quit                     - Disconnect and exit\n");
}
