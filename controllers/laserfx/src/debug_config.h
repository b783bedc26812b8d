/**
 * LaserFX Debug Configuration
 *
 * Master compile-time debug flag control.
 * Set individual flags to 0 (or pass -D<FLAG>=0) to silence a module.
 * All log output goes to stderr; stdout carries command output only.
 */

#ifndef DEBUG_CONFIG_H
#define DEBUG_CONFIG_H

#include <stdio.h>

// ============================================================================
//  MASTER DEBUG CONTROL
// ============================================================================

/**
 * Set to 0 to disable ALL debug output.
 * Individual flags below can still override if needed.
 */
#ifndef DEBUG_ENABLED
#define DEBUG_ENABLED               1
#endif

// ============================================================================
//  MODULE DEBUG FLAGS
// ============================================================================

/**
 * Main/Startup Debug
 * Includes: Config load, controller startup/shutdown, alarm notifications
 */
#ifndef MAIN_DEBUG
#define MAIN_DEBUG                  DEBUG_ENABLED
#endif

/**
 * Serial Worker Debug
 * Includes: Lines sent/received, retries, timeouts, dropped lines, transport errors
 */
#ifndef WORKER_DEBUG
#define WORKER_DEBUG                DEBUG_ENABLED
#endif

/**
 * Status Sync Debug
 * Includes: Missed polls, alarm ids, poller start/stop
 */
#ifndef SYNC_DEBUG
#define SYNC_DEBUG                  DEBUG_ENABLED
#endif

/**
 * Connection / Controller Debug
 * Includes: State transitions, banner detection, operation rejections
 */
#ifndef CONTROLLER_DEBUG
#define CONTROLLER_DEBUG            DEBUG_ENABLED
#endif

/**
 * Config Reader Debug
 * Includes: YAML load result, defaults fallback
 */
#ifndef CONFIG_DEBUG
#define CONFIG_DEBUG                DEBUG_ENABLED
#endif

/**
 * CLI Debug
 * Includes: Unhandled commands, router dispatch
 */
#ifndef CLI_DEBUG
#define CLI_DEBUG                   DEBUG_ENABLED
#endif

// ============================================================================
//  DEBUG LOGGING MACROS
// ============================================================================

#if MAIN_DEBUG
#define MAIN_LOG(fmt, ...) fprintf(stderr, "[MAIN] " fmt "\n", ##__VA_ARGS__)
#else
#define MAIN_LOG(fmt, ...)
#endif

#if WORKER_DEBUG
#define WORKER_LOG(fmt, ...) fprintf(stderr, "[Worker] " fmt "\n", ##__VA_ARGS__)
#else
#define WORKER_LOG(fmt, ...)
#endif

#if SYNC_DEBUG
#define SYNC_LOG(fmt, ...) fprintf(stderr, "[Sync] " fmt "\n", ##__VA_ARGS__)
#else
#define SYNC_LOG(fmt, ...)
#endif

#if CONTROLLER_DEBUG
#define CONTROLLER_LOG(tag, fmt, ...) fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__)
#else
#define CONTROLLER_LOG(tag, fmt, ...)
#endif

#if CONFIG_DEBUG
#define CONFIG_LOG(fmt, ...) fprintf(stderr, "[Config] " fmt "\n", ##__VA_ARGS__)
#else
#define CONFIG_LOG(fmt, ...)
#endif

#if CLI_DEBUG
#define CLI_LOG(fmt, ...) fprintf(stderr, "[CLI] " fmt "\n", ##__VA_ARGS__)
#else
#define CLI_LOG(fmt, ...)
#endif

#endif // DEBUG_CONFIG_H
