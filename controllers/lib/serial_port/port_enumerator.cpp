/*
 * Port Enumerator - Implementation
 */

#include "port_enumerator.h"
#include <grbl_protocol.h>

#include <dirent.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>

// Debug logging
#ifndef PORT_ENUMERATOR_DEBUG
#define PORT_ENUMERATOR_DEBUG 0
#endif

#if PORT_ENUMERATOR_DEBUG
#define LOG(fmt, ...) fprintf(stderr, "[Ports] " fmt "\n", ##__VA_ARGS__)
#else
#define LOG(fmt, ...) ((void)0)
#endif

// ============================================================================
// Helpers
// ============================================================================

static bool resolvePath(const std::string& path, std::string& out) {
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) == nullptr) {
        return false;
    }
    out = buf;
    return true;
}

static bool fileExists(const std::string& path) {
    return access(path.c_str(), F_OK) == 0;
}

static std::optional<std::string> readAttribute(const std::string& path) {
    FILE* f = fopen(path.c_str(), "r");
    if (!f) return std::nullopt;

    char buf[256];
    std::optional<std::string> value;
    if (fgets(buf, sizeof(buf), f)) {
        size_t len = strlen(buf);
        while (len > 0 && (buf[len - 1] == '\n' || buf[len - 1] == '\r' || buf[len - 1] == ' ')) {
            buf[--len] = '\0';
        }
        if (len > 0) {
            value = std::string(buf);
        }
    }
    fclose(f);
    return value;
}

static std::string baseName(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string parentDir(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
}

// ============================================================================
// PortEnumerator
// ============================================================================

PortEnumerator::PortEnumerator(const std::string& sysfsRoot, const std::string& devRoot)
    : _sysfsRoot(sysfsRoot), _devRoot(devRoot) {
}

std::vector<PortInfo> PortEnumerator::listPorts() const {
    std::vector<PortInfo> ports;

    DIR* dir = opendir(_sysfsRoot.c_str());
    if (!dir) {
        LOG("Cannot open %s", _sysfsRoot.c_str());
        return ports;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (entry->d_name[0] == '.') continue;

        PortInfo info;
        if (describePort(entry->d_name, info)) {
            LOG("Found %s (%s)", info.path.c_str(), info.portType.c_str());
            ports.push_back(info);
        }
    }
    closedir(dir);

    std::sort(ports.begin(), ports.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.path < b.path; });
    return ports;
}

bool PortEnumerator::describePort(const std::string& name, PortInfo& out) const {
    std::string classDir = _sysfsRoot + "/" + name;

    // Virtual terminals (tty0, ptmx, console) have no backing device
    std::string device;
    if (!resolvePath(classDir + "/device", device)) {
        return false;
    }

    std::string subsystem;
    if (resolvePath(device + "/subsystem", subsystem)) {
        subsystem = baseName(subsystem);
    }

    // Legacy 8250 placeholders exist whether or not a UART is fitted
    if (subsystem == "platform" || subsystem == "serial-base") {
        return false;
    }

    out.path = _devRoot + "/" + name;
    out.portType = "Unknown";

    if (name.compare(0, 6, "rfcomm") == 0) {
        out.portType = "Bluetooth";
        return true;
    }

    // Walk up to the USB device node (the directory carrying idVendor)
    std::string dirPath = device;
    while (dirPath.size() > 1) {
        if (fileExists(dirPath + "/idVendor")) {
            out.portType = "USB";
            out.manufacturer = readAttribute(dirPath + "/manufacturer");
            out.product = readAttribute(dirPath + "/product");
            out.serialNumber = readAttribute(dirPath + "/serial");
            return true;
        }
        dirPath = parentDir(dirPath);
    }

    if (subsystem == "pci" || device.find("/pci") != std::string::npos) {
        out.portType = "PCI";
    }
    return true;
}

std::vector<uint32_t> PortEnumerator::supportedBaudRates() {
    return std::vector<uint32_t>(GrblProtocol::SUPPORTED_BAUD_RATES,
                                 GrblProtocol::SUPPORTED_BAUD_RATES + GrblProtocol::SUPPORTED_BAUD_RATE_COUNT);
}
