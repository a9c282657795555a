/**
 * @file car_protocol.h
 * @brief Shell Racing Legends BLE command protocol
 *
 * Implements the command format accepted by the Shell Racing Legends cars.
 * Command:  8 bytes written (without response) to characteristic 0xFFF1
 *           mode | forward | reverse | left | right | lights | turbo | donut
 *           mode is 1 (normal) or 2 (sport), every other byte is 0 or 1.
 *           No checksum, the car does not acknowledge commands.
 * Status:   notifications on 0xFFF2, same 8-byte layout as the command,
 *           or a single battery percentage byte.
 * Battery:  standard Battery Service 0x180F / Battery Level 0x2A19
 *
 * The car only knows on/off directions. Analog steering and throttle
 * fractions are turned into direction bits at SLR_DIRECTION_THRESHOLD.
 */

#ifndef CAR_PROTOCOL_H
#define CAR_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include "bridge_types.h"

// ========================== GATT Layout ==========================
// 0000fff0-0000-1000-8000-00805f9b34fb etc. (Bluetooth base UUID)
#define SLR_SERVICE_UUID16          0xFFF0
#define SLR_COMMAND_CHAR_UUID16     0xFFF1
#define SLR_STATUS_CHAR_UUID16      0xFFF2
#define SLR_BATTERY_SERVICE_UUID16  0x180F
#define SLR_BATTERY_CHAR_UUID16     0x2A19

// ========================== Protocol Defines ==========================
#define SLR_MODE_NORMAL             1
#define SLR_MODE_SPORT              2

// |fraction| above this sets the direction bit
#define SLR_DIRECTION_THRESHOLD     0.5f

#define SLR_STATUS_RAW_MAX          20   // Bytes of an unknown notification kept for display

// ========================== Command Structure ==========================
// Sent TO the car
typedef struct __attribute__((packed)) {
    uint8_t mode;
    uint8_t forward;
    uint8_t reverse;
    uint8_t left;
    uint8_t right;
    uint8_t lights;
    uint8_t turbo;
    uint8_t donut;
} CommandFrame;

static_assert(sizeof(CommandFrame) == 8, "CommandFrame must be 8 bytes on the wire");

// ========================== Controller State ==========================
enum ControlFlag : uint8_t {
    FLAG_LIGHTS     = 1 << 0,
    FLAG_TURBO      = 1 << 1,
    FLAG_DONUT      = 1 << 2,
    FLAG_SPORT_MODE = 1 << 3,
};

const char* getFlagName(ControlFlag flag);

// Normalized input of one slot for one tick
struct ControllerState {
    float   steering = 0.0f;   // [-1, 1], negative = left
    float   throttle = 0.0f;   // [-1, 1], negative = reverse
    uint8_t flags    = 0;      // ControlFlag bits

    bool has(ControlFlag flag) const { return (flags & flag) != 0; }
};

// ========================== Status Structure ==========================
// Received FROM the car
enum StatusKind : uint8_t {
    STATUS_BATTERY = 0,   // 1 byte: battery percentage
    STATUS_CONTROL,       // 8 bytes: echo of the applied command
    STATUS_RAW,           // anything else
};

struct StatusReport {
    StatusKind   kind = STATUS_RAW;
    uint16_t     length = 0;
    uint8_t      batteryPct = 0;
    CommandFrame control = {};
    uint8_t      raw[SLR_STATUS_RAW_MAX] = {};
};

// ========================== Codec ==========================

/**
 * @brief Encode a normalized controller state into a command frame
 * @param state Steering/throttle already dead-zoned and clamped to [-1, 1]
 * @param out Frame to fill (left untouched on error)
 * @return BRIDGE_OK, or BRIDGE_ERR_INVALID_INPUT for NaN or |value| > 1
 */
BridgeError encodeCommand(const ControllerState& state, CommandFrame& out);

// All directions off, flags off. Used to stop the car.
CommandFrame neutralFrame(uint8_t mode = SLR_MODE_NORMAL);

bool framesEqual(const CommandFrame& a, const CommandFrame& b);

/**
 * @brief Decode a status or battery notification
 * @return false if the payload is empty
 */
bool decodeStatus(const uint8_t* data, uint16_t length, StatusReport& out);

/**
 * @brief Lowercase hex of the frame, e.g. "0101000000010000"
 * @param out Buffer of at least 17 bytes
 */
void formatFrameHex(const CommandFrame& frame, char* out, size_t outSize);

const char* throttleLabel(const CommandFrame& frame);   // Forward / Reverse / Stopped
const char* steeringLabel(const CommandFrame& frame);   // Left / Right / Straight

#endif // CAR_PROTOCOL_H
