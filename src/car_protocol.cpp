#include "car_protocol.h"

#include <math.h>
#include <stdio.h>
#include <string.h>

static bool isInContract(float value) {
    return !isnan(value) && fabsf(value) <= 1.0f;
}

const char* getFlagName(ControlFlag flag) {
    switch (flag) {
        case FLAG_LIGHTS:     return "Lights";
        case FLAG_TURBO:      return "Turbo";
        case FLAG_DONUT:      return "Donut";
        case FLAG_SPORT_MODE: return "Mode";
        default:              return "???";
    }
}

BridgeError encodeCommand(const ControllerState& state, CommandFrame& out) {
    if (!isInContract(state.steering) || !isInContract(state.throttle)) {
        return BRIDGE_ERR_INVALID_INPUT;
    }

    CommandFrame frame;
    frame.mode    = state.has(FLAG_SPORT_MODE) ? SLR_MODE_SPORT : SLR_MODE_NORMAL;
    frame.forward = state.throttle >  SLR_DIRECTION_THRESHOLD ? 1 : 0;
    frame.reverse = state.throttle < -SLR_DIRECTION_THRESHOLD ? 1 : 0;
    frame.left    = state.steering < -SLR_DIRECTION_THRESHOLD ? 1 : 0;
    frame.right   = state.steering >  SLR_DIRECTION_THRESHOLD ? 1 : 0;
    frame.lights  = state.has(FLAG_LIGHTS) ? 1 : 0;
    frame.turbo   = state.has(FLAG_TURBO) ? 1 : 0;
    frame.donut   = state.has(FLAG_DONUT) ? 1 : 0;

    out = frame;
    return BRIDGE_OK;
}

CommandFrame neutralFrame(uint8_t mode) {
    CommandFrame frame;
    memset(&frame, 0, sizeof(frame));
    frame.mode = mode;
    return frame;
}

bool framesEqual(const CommandFrame& a, const CommandFrame& b) {
    return memcmp(&a, &b, sizeof(CommandFrame)) == 0;
}

bool decodeStatus(const uint8_t* data, uint16_t length, StatusReport& out) {
    if (data == nullptr || length == 0) return false;

    StatusReport report;
    report.length = length;

    if (length == 1) {
        report.kind = STATUS_BATTERY;
        report.batteryPct = data[0];
    } else if (length == sizeof(CommandFrame)) {
        report.kind = STATUS_CONTROL;
        memcpy(&report.control, data, sizeof(CommandFrame));
    } else {
        report.kind = STATUS_RAW;
        memcpy(report.raw, data, length < SLR_STATUS_RAW_MAX ? length : SLR_STATUS_RAW_MAX);
    }

    out = report;
    return true;
}

void formatFrameHex(const CommandFrame& frame, char* out, size_t outSize) {
    if (out == nullptr || outSize == 0) return;
    out[0] = '\0';

    const uint8_t* p = (const uint8_t*)&frame;
    size_t pos = 0;
    for (size_t i = 0; i < sizeof(CommandFrame) && pos + 2 < outSize; i++) {
        snprintf(out + pos, outSize - pos, "%02x", p[i]);
        pos += 2;
    }
}

const char* throttleLabel(const CommandFrame& frame) {
    if (frame.forward) return "Forward";
    if (frame.reverse) return "Reverse";
    return "Stopped";
}

const char* steeringLabel(const CommandFrame& frame) {
    if (frame.left)  return "Left";
    if (frame.right) return "Right";
    return "Straight";
}
