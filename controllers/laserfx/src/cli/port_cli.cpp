/**
 * @file port_cli.cpp
 * @brief Serial port discovery command handler
 */

#include "port_cli.h"
#include "command_parser.h"
#include "../controller/grbl_controller.h"
#include <stdio.h>

static void printOptionalJson(const char* key, const std::optional<std::string>& value) {
    if (value) {
        printf(",\"%s\":\"%s\"", key, value->c_str());
    } else {
        printf(",\"%s\":null", key);
    }
}

bool PortCli::handleCommand(const std::string& cmd) {
    CommandParser p(cmd);

    // ---- PORTS [--json] ----
    if (p.is("ports") || p.is("ls")) {
        std::vector<PortInfo> ports = _controller->listPorts();
        if (p.jsonRequested()) {
            printf("{\"ports\":[");
            bool first = true;
            for (const PortInfo& port : ports) {
                if (!first) printf(",");
                first = false;
                printf("{\"path\":\"%s\",\"type\":\"%s\"", port.path.c_str(), port.portType.c_str());
                printOptionalJson("manufacturer", port.manufacturer);
                printOptionalJson("product", port.product);
                printOptionalJson("serialNumber", port.serialNumber);
                printf("}");
            }
            printf("]}\n");
        } else {
            if (ports.empty()) {
                printf("No serial ports found\n");
            }
            for (const PortInfo& port : ports) {
                printf("  %-20s %-10s", port.path.c_str(), port.portType.c_str());
                if (port.manufacturer) printf(" %s", port.manufacturer->c_str());
                if (port.product) printf(" %s", port.product->c_str());
                if (port.serialNumber) printf(" [%s]", port.serialNumber->c_str());
                printf("\n");
            }
        }
        return true;
    }

    // ---- BAUDS [--json] ----
    if (p.is("bauds")) {
        std::vector<uint32_t> rates = GrblController::supportedBaudRates();
        if (p.jsonRequested()) printf("{\"baudRates\":[");
        for (size_t i = 0; i < rates.size(); i++) {
            if (p.jsonRequested()) {
                printf("%s%u", i ? "," : "", (unsigned)rates[i]);
            } else {
                printf("%u\n", (unsigned)rates[i]);
            }
        }
        if (p.jsonRequested()) printf("]}\n");
        return true;
    }

    return false;
}

void PortCli::printHelp() const {
    printf("=== Port Commands ===\n");
    printf("  ports [--json]           - List serial ports\n");
    printf("  bauds [--json]           - List supported baud rates\n");
}
