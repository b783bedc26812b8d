/**
 * ConfigReader Implementation
 */

#include "config_reader.h"
#include "config_schema.h"
#include "../debug_config.h"

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <unistd.h>

#define LOG(fmt, ...) CONFIG_LOG(fmt, ##__VA_ARGS__)

// ============================================================================
//  VALUE HELPERS
// ============================================================================

bool ConfigReader::parseLaserMode(const char* value, LaserMode& out) {
    if (!value) return false;
    if (strcasecmp(value, "dynamic") == 0 || strcasecmp(value, "m4") == 0) {
        out = LaserMode::Dynamic;
    } else if (strcasecmp(value, "constant") == 0 || strcasecmp(value, "m3") == 0) {
        out = LaserMode::Constant;
    } else if (strcasecmp(value, "off") == 0) {
        out = LaserMode::Off;
    } else {
        return false;
    }
    return true;
}

bool ConfigReader::parseUnits(const char* value, Units& out) {
    if (!value) return false;
    if (strcasecmp(value, "mm") == 0 || strcasecmp(value, "metric") == 0) {
        out = Units::Millimeters;
    } else if (strcasecmp(value, "inch") == 0 || strcasecmp(value, "in") == 0) {
        out = Units::Inches;
    } else {
        return false;
    }
    return true;
}

const char* ConfigReader::laserModeName(LaserMode mode) {
    switch (mode) {
        case LaserMode::Dynamic:  return "dynamic";
        case LaserMode::Constant: return "constant";
        case LaserMode::Off:      return "off";
    }
    return "off";
}

const char* ConfigReader::unitsName(Units units) {
    return units == Units::Inches ? "inch" : "mm";
}

static bool isSupportedBaud(unsigned int baud) {
    for (size_t i = 0; i < GrblProtocol::SUPPORTED_BAUD_RATE_COUNT; i++) {
        if (GrblProtocol::SUPPORTED_BAUD_RATES[i] == baud) return true;
    }
    return false;
}

// Positive millisecond value, or keep the current one
static void applyTimeout(const unsigned int* value, uint32_t& target, const char* key) {
    if (!value) return;
    if (*value == 0) {
        fprintf(stderr, "[Config] %s must be > 0, keeping %u\n", key, (unsigned)target);
        return;
    }
    target = *value;
}

static void applyRetries(const unsigned int* value, uint8_t& target, const char* key) {
    if (!value) return;
    if (*value > 10) {
        fprintf(stderr, "[Config] %s must be 0..10, keeping %u\n", key, (unsigned)target);
        return;
    }
    target = (uint8_t)*value;
}

static void applyPositive(const double* value, double& target, const char* key) {
    if (!value) return;
    if (!(*value > 0.0)) {
        fprintf(stderr, "[Config] %s must be > 0, keeping %.1f\n", key, target);
        return;
    }
    target = *value;
}

// ============================================================================
//  LOADING
// ============================================================================

void ConfigReader::loadDefaults() {
    _settings = LaserFXSettings();
    LOG("Defaults loaded");
}

bool ConfigReader::load(const char* filename) {
    loadDefaults();
    _filename = filename ? filename : "";

    if (!filename || access(filename, R_OK) != 0) {
        LOG("%s not found, using defaults", filename ? filename : "(null)");
        return false;
    }

    LaserFXYaml* yaml = config_load(filename);
    if (!yaml) {
        fprintf(stderr, "[Config] %s is malformed, using defaults\n", filename);
        return false;
    }

    LaserFXSettings& s = _settings;

    // serial
    if (yaml->serial.port) {
        s.port = yaml->serial.port;
    }
    if (yaml->serial.baud) {
        if (isSupportedBaud(*yaml->serial.baud)) {
            s.baudRate = *yaml->serial.baud;
        } else {
            fprintf(stderr, "[Config] Unsupported baud %u, keeping %u\n",
                    *yaml->serial.baud, (unsigned)s.baudRate);
        }
    }
    if (yaml->serial.reset_on_connect) {
        s.controller.resetOnConnect = *yaml->serial.reset_on_connect;
    }

    // timing (homing follows the command policy unless set)
    applyTimeout(yaml->timing.command_timeout_ms, s.controller.command.timeoutMs, "command_timeout_ms");
    applyRetries(yaml->timing.command_retries, s.controller.command.retries, "command_retries");
    s.controller.homing = s.controller.command;
    applyTimeout(yaml->timing.homing_timeout_ms, s.controller.homing.timeoutMs, "homing_timeout_ms");
    applyRetries(yaml->timing.homing_retries, s.controller.homing.retries, "homing_retries");
    applyTimeout(yaml->timing.status_timeout_ms, s.controller.statusTimeoutMs, "status_timeout_ms");
    applyTimeout(yaml->timing.startup_timeout_ms, s.controller.startupTimeoutMs, "startup_timeout_ms");
    applyTimeout(yaml->timing.poll_interval_ms, s.controller.pollIntervalMs, "poll_interval_ms");

    // laser
    applyTimeout(yaml->laser.max_power, s.controller.maxLaserPower, "max_power");
    applyPositive(yaml->laser.frame_feed, s.frameFeed, "frame_feed");
    if (yaml->laser.frame_power) {
        s.framePower = *yaml->laser.frame_power;
    }
    if (yaml->laser.frame_mode && !parseLaserMode(yaml->laser.frame_mode, s.frameMode)) {
        fprintf(stderr, "[Config] Unknown frame_mode '%s', keeping %s\n",
                yaml->laser.frame_mode, laserModeName(s.frameMode));
    }
    if (yaml->laser.units && !parseUnits(yaml->laser.units, s.units)) {
        fprintf(stderr, "[Config] Unknown units '%s', keeping %s\n",
                yaml->laser.units, unitsName(s.units));
    }
    if (s.framePower > s.controller.maxLaserPower) {
        fprintf(stderr, "[Config] frame_power %u above max_power, clamped\n", (unsigned)s.framePower);
        s.framePower = s.controller.maxLaserPower;
    }

    // jog
    applyPositive(yaml->jog.feed, s.jogFeed, "jog.feed");
    applyPositive(yaml->jog.step, s.jogStep, "jog.step");

    config_free(yaml);

    s.loaded = true;
    LOG("Loaded %s", filename);
    return true;
}

// ============================================================================
//  DEBUG
// ============================================================================

void ConfigReader::print() const {
    const LaserFXSettings& s = _settings;
    const ControllerSettings& c = s.controller;

    printf("=== LaserFX Configuration ===\n");
    printf("Source: %s\n", s.loaded ? _filename.c_str() : "defaults");

    printf("Serial:\n");
    printf("  Port: %s\n", s.port.empty() ? "(not set)" : s.port.c_str());
    printf("  Baud: %u\n", (unsigned)s.baudRate);
    printf("  Reset on connect: %s\n", c.resetOnConnect ? "yes" : "no");

    printf("Timing:\n");
    printf("  Command: %u ms x %u retries\n", (unsigned)c.command.timeoutMs, (unsigned)c.command.retries);
    printf("  Homing: %u ms x %u retries\n", (unsigned)c.homing.timeoutMs, (unsigned)c.homing.retries);
    printf("  Status: %u ms, poll every %u ms\n", (unsigned)c.statusTimeoutMs, (unsigned)c.pollIntervalMs);
    printf("  Startup: %u ms\n", (unsigned)c.startupTimeoutMs);

    printf("Laser:\n");
    printf("  Max power: %u\n", (unsigned)c.maxLaserPower);
    printf("  Frame: feed=%.1f, power=%u, mode=%s, units=%s\n",
           s.frameFeed, (unsigned)s.framePower, laserModeName(s.frameMode), unitsName(s.units));

    printf("Jog:\n");
    printf("  Feed: %.1f, step: %.3f\n", s.jogFeed, s.jogStep);
    printf("=============================\n");
}
