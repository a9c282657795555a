#include "bridge_types.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

const char* getErrorName(BridgeError err) {
    switch (err) {
        case BRIDGE_OK:                         return "OK";
        case BRIDGE_ERR_CONTROLLER_UNAVAILABLE: return "ControllerUnavailable";
        case BRIDGE_ERR_SCAN_UNAVAILABLE:       return "ScanUnavailable";
        case BRIDGE_ERR_CONNECT_FAILED:         return "ConnectFailed";
        case BRIDGE_ERR_NOT_CONNECTED:          return "NotConnected";
        case BRIDGE_ERR_INVALID_INPUT:          return "InvalidInput";
        case BRIDGE_ERR_INVALID_ARGUMENT:       return "InvalidArgument";
        default:                                return "???";
    }
}

const char* getLinkStatusName(LinkStatus status) {
    switch (status) {
        case LINK_IDLE:         return "IDLE";
        case LINK_CONNECTING:   return "CONNECTING";
        case LINK_READY:        return "READY";
        case LINK_DISCONNECTED: return "DISCONNECTED";
        case LINK_FAILED:       return "FAILED";
        default:                return "???";
    }
}

bool BleAddress::operator==(const BleAddress& other) const {
    return type == other.type && memcmp(bytes, other.bytes, sizeof(bytes)) == 0;
}

bool BleAddress::isZero() const {
    for (size_t i = 0; i < sizeof(bytes); i++) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

void formatAddress(const BleAddress& addr, char* out, size_t outSize) {
    if (out == nullptr || outSize == 0) return;
    snprintf(out, outSize, "%02X:%02X:%02X:%02X:%02X:%02X",
             addr.bytes[0], addr.bytes[1], addr.bytes[2],
             addr.bytes[3], addr.bytes[4], addr.bytes[5]);
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool parseAddress(const char* text, BleAddress& out) {
    if (text == nullptr || strlen(text) != 17) return false;

    BleAddress addr;
    for (size_t i = 0; i < sizeof(addr.bytes); i++) {
        const char* p = text + i * 3;
        int hi = hexValue(p[0]);
        int lo = hexValue(p[1]);
        if (hi < 0 || lo < 0) return false;
        if (i < sizeof(addr.bytes) - 1 && p[2] != ':') return false;
        addr.bytes[i] = (uint8_t)((hi << 4) | lo);
    }
    out = addr;
    return true;
}
