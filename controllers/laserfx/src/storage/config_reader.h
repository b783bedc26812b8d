/**
 * ConfigReader - Configuration Loader
 *
 * Reads laserfx.yaml through libcyaml (config_schema.c) and maps it onto
 * the settings the controller and CLI use. Missing keys keep their
 * defaults; a missing or malformed file leaves every default in place.
 */

#ifndef CONFIG_READER_H
#define CONFIG_READER_H

#include <stdint.h>
#include <string>

#include <grbl_protocol.h>

#include "../controller/controller_types.h"

// ============================================================================
//  CONSTANTS
// ============================================================================

namespace ConfigReaderConfig {
    constexpr const char* DEFAULT_CONFIG_FILE = "laserfx.yaml";
    constexpr double DEFAULT_FRAME_FEED = 3000.0;
    constexpr uint32_t DEFAULT_FRAME_POWER = 10;
    constexpr double DEFAULT_JOG_FEED = 1000.0;
    constexpr double DEFAULT_JOG_STEP = 1.0;
}

// ============================================================================
//  LASER FX SETTINGS (combined output)
// ============================================================================

struct LaserFXSettings {
    // serial
    std::string port;                                   // empty: pass on the command line
    uint32_t baudRate = GrblProtocol::DEFAULT_BAUD_RATE;

    // timing, reset_on_connect, laser.max_power
    ControllerSettings controller;

    // laser
    double frameFeed = ConfigReaderConfig::DEFAULT_FRAME_FEED;
    uint32_t framePower = ConfigReaderConfig::DEFAULT_FRAME_POWER;
    LaserMode frameMode = LaserMode::Off;
    Units units = Units::Millimeters;

    // jog
    double jogFeed = ConfigReaderConfig::DEFAULT_JOG_FEED;
    double jogStep = ConfigReaderConfig::DEFAULT_JOG_STEP;

    bool loaded = false;
};

// ============================================================================
//  CONFIG READER CLASS
// ============================================================================

class ConfigReader {
public:
    ConfigReader() = default;
    ~ConfigReader() = default;

    // Non-copyable
    ConfigReader(const ConfigReader&) = delete;
    ConfigReader& operator=(const ConfigReader&) = delete;

    // ---- Loading ----

    /**
     * @brief Load configuration from YAML file
     * @param filename Path to YAML file
     * @return true if the file was read; on false all defaults are in effect
     */
    bool load(const char* filename);

    /**
     * @brief Load default configuration values
     */
    void loadDefaults();

    // ---- Accessors ----

    const LaserFXSettings& settings() const { return _settings; }
    const ControllerSettings& controllerSettings() const { return _settings.controller; }
    bool isLoaded() const { return _settings.loaded; }
    const std::string& filename() const { return _filename; }

    // ---- Debug ----
    void print() const;

    // ---- Value helpers ----
    static bool parseLaserMode(const char* value, LaserMode& out);
    static bool parseUnits(const char* value, Units& out);
    static const char* laserModeName(LaserMode mode);
    static const char* unitsName(Units units);

private:
    LaserFXSettings _settings;
    std::string _filename;
};

#endif // CONFIG_READER_H
