/**
 * @file bridge_types.h
 * @brief Error codes, link states and addresses shared by all bridge modules
 */

#ifndef BRIDGE_TYPES_H
#define BRIDGE_TYPES_H

#include <stddef.h>
#include <stdint.h>

// ========================== Error Codes ==========================
enum BridgeError : uint8_t {
    BRIDGE_OK = 0,
    BRIDGE_ERR_CONTROLLER_UNAVAILABLE,  // Gamepad slot empty or unplugged (retry next tick)
    BRIDGE_ERR_SCAN_UNAVAILABLE,        // Radio off or scan refused
    BRIDGE_ERR_CONNECT_FAILED,          // Connect rejected, timed out or characteristic missing
    BRIDGE_ERR_NOT_CONNECTED,           // Write attempted outside Ready (frame dropped)
    BRIDGE_ERR_INVALID_INPUT,           // NaN or |value| > 1 reached the codec
    BRIDGE_ERR_INVALID_ARGUMENT,        // Bad slot / device index from the front-end
};

const char* getErrorName(BridgeError err);

// ========================== Link States ==========================
enum LinkStatus : uint8_t {
    LINK_IDLE = 0,      // No connection held (never connected or user cancelled)
    LINK_CONNECTING,    // Link-layer connect + characteristic discovery
    LINK_READY,         // Command characteristic known, writes accepted
    LINK_DISCONNECTED,  // Link dropped, reconnect pending
    LINK_FAILED,        // Gave up, waiting for the user to retry
};

const char* getLinkStatusName(LinkStatus status);

// ========================== BLE Address ==========================
struct BleAddress {
    uint8_t bytes[6] = {0, 0, 0, 0, 0, 0};
    uint8_t type = 0;   // bd_addr_type_t of the advertiser (public / random)

    bool operator==(const BleAddress& other) const;
    bool operator!=(const BleAddress& other) const { return !(*this == other); }
    bool isZero() const;
};

/**
 * @brief Format as "AA:BB:CC:DD:EE:FF"
 * @param out Buffer of at least 18 bytes
 */
void formatAddress(const BleAddress& addr, char* out, size_t outSize);

/**
 * @brief Parse "AA:BB:CC:DD:EE:FF" (either case)
 * @param out Filled on success, type is left at 0 (public)
 * @return false on any other format
 */
bool parseAddress(const char* text, BleAddress& out);

#endif // BRIDGE_TYPES_H
