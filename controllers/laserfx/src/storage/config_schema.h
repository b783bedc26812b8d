#ifndef CONFIG_SCHEMA_H
#define CONFIG_SCHEMA_H

#include <stdbool.h>
#include <stdint.h>
#include <cyaml/cyaml.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Raw YAML image of laserfx.yaml. Every scalar is a pointer so an absent
 * key (NULL) can be told apart from an explicit zero.
 */

// serial:
typedef struct SerialYaml {
    char *port;
    unsigned int *baud;
    bool *reset_on_connect;
} SerialYaml;

// timing:
typedef struct TimingYaml {
    unsigned int *command_timeout_ms;   // Default: 500
    unsigned int *command_retries;      // Default: 2
    unsigned int *homing_timeout_ms;    // Default: command_timeout_ms
    unsigned int *homing_retries;       // Default: command_retries
    unsigned int *status_timeout_ms;    // Default: 300
    unsigned int *startup_timeout_ms;   // Default: 1000
    unsigned int *poll_interval_ms;     // Default: 250
} TimingYaml;

// laser:
typedef struct LaserYaml {
    unsigned int *max_power;            // Default: 1000 ($30)
    double *frame_feed;                 // Default: 3000 units/min
    unsigned int *frame_power;          // Default: 10
    char *frame_mode;                   // "dynamic", "constant", "off" (default: off)
    char *units;                        // "mm", "inch" (default: mm)
} LaserYaml;

// jog:
typedef struct JogYaml {
    double *feed;                       // Default: 1000 units/min
    double *step;                       // Default: 1.0
} JogYaml;

// Complete LaserFX configuration
typedef struct LaserFXYaml {
    SerialYaml serial;
    TimingYaml timing;
    LaserYaml laser;
    JogYaml jog;
} LaserFXYaml;

/**
 * Load and parse YAML configuration file using libcyaml
 * @param config_file Path to YAML configuration file
 * @return Pointer to loaded configuration, or NULL on error
 */
LaserFXYaml *config_load(const char *config_file);

/**
 * Free configuration memory (uses cyaml_free)
 * @param config Configuration to free (NULL allowed)
 */
void config_free(LaserFXYaml *config);

#ifdef __cplusplus
}
#endif

#endif // CONFIG_SCHEMA_H
