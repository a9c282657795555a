/**
 * @file bridge_config.h
 * @brief Compile-time defaults and runtime configuration of the bridge
 *
 * Every SLR_* value can be overridden from the build flags, e.g.
 *   -DSLR_SEND_INTERVAL_MS=40
 * The values end up in a BridgeConfig that the front-end may adjust
 * before calling CarBridge::begin().
 */

#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

#include <stdint.h>

// ========================== Capacity ==========================
// One control unit per gamepad slot (Bluepad32 supports 4 gamepads)
#ifndef SLR_MAX_SLOTS
  #define SLR_MAX_SLOTS           4
#endif

// Max cars kept in one scan session
#ifndef SLR_MAX_DISCOVERED
  #define SLR_MAX_DISCOVERED      16
#endif

#define SLR_MAX_NAME_LENGTH       32

// ========================== Gamepad Settings ==========================
// Fraction of full stick travel treated as "no input"
#ifndef SLR_DEADZONE
  #define SLR_DEADZONE            0.05f
#endif

// Bluepad32 reports -512 to 511 for sticks, 0 to 1023 for triggers
#define SLR_AXIS_FULL_SCALE       512
#define SLR_TRIGGER_MAX           1023

// Trigger travel above which turbo is engaged (25%)
#ifndef SLR_TURBO_TRIGGER_LEVEL
  #define SLR_TURBO_TRIGGER_LEVEL 256
#endif

// ========================== Timing ==========================
// [ms] Command refresh period towards the car (20 Hz)
#ifndef SLR_SEND_INTERVAL_MS
  #define SLR_SEND_INTERVAL_MS    50
#endif

// [ms] Default scan window
#ifndef SLR_SCAN_WINDOW_MS
  #define SLR_SCAN_WINDOW_MS      3000
#endif

// [ms] Give up a connect + characteristic discovery after this long
#ifndef SLR_CONNECT_TIMEOUT_MS
  #define SLR_CONNECT_TIMEOUT_MS  45000
#endif

// Automatic reconnect after a link drop: 500ms, 1s, 2s, 4s, 8s
#ifndef SLR_RECONNECT_BACKOFF_MS
  #define SLR_RECONNECT_BACKOFF_MS      500
#endif
#ifndef SLR_RECONNECT_BACKOFF_MAX_MS
  #define SLR_RECONNECT_BACKOFF_MAX_MS  8000
#endif
#ifndef SLR_RECONNECT_MAX_ATTEMPTS
  #define SLR_RECONNECT_MAX_ATTEMPTS    5
#endif

// [ms] Telemetry report period per slot
#ifndef SLR_TELEMETRY_INTERVAL_MS
  #define SLR_TELEMETRY_INTERVAL_MS     1000
#endif

// ========================== Runtime Configuration ==========================
struct BridgeConfig {
    float    deadzone            = SLR_DEADZONE;
    uint32_t sendIntervalMs      = SLR_SEND_INTERVAL_MS;
    uint32_t scanWindowMs        = SLR_SCAN_WINDOW_MS;
    uint32_t connectTimeoutMs    = SLR_CONNECT_TIMEOUT_MS;
    uint32_t reconnectBackoffMs  = SLR_RECONNECT_BACKOFF_MS;
    uint32_t reconnectBackoffMaxMs = SLR_RECONNECT_BACKOFF_MAX_MS;
    uint8_t  reconnectMaxAttempts  = SLR_RECONNECT_MAX_ATTEMPTS;
    uint32_t telemetryIntervalMs = SLR_TELEMETRY_INTERVAL_MS;
};

#endif // BRIDGE_CONFIG_H
