#include "control_loop.h"

ControlLoop::ControlLoop(BleRadio& radio, InputSampler& sampler, const BridgeConfig& config)
    : _sampler(sampler), _config(config) {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        _links[i].attach(radio, i, config);
    }
}

void ControlLoop::setLinkListener(LinkListener* listener) {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        _links[i].setListener(listener);
    }
}

BridgeError ControlLoop::connect(uint8_t slot, const DiscoveredDevice& device, uint32_t nowMs) {
    if (slot >= SLR_MAX_SLOTS) return BRIDGE_ERR_INVALID_ARGUMENT;

    UnitState& unit = _units[slot];
    unit.active = true;
    unit.faulted = false;
    unit.lastTelemetryMs = nowMs;

    return _links[slot].connect(device, nowMs);
}

BridgeError ControlLoop::retry(uint8_t slot, uint32_t nowMs) {
    if (slot >= SLR_MAX_SLOTS) return BRIDGE_ERR_INVALID_ARGUMENT;

    BridgeError err = _links[slot].retry(nowMs);
    if (err == BRIDGE_ERR_INVALID_ARGUMENT) {
        return err;
    }

    UnitState& unit = _units[slot];
    unit.active = true;
    unit.faulted = false;
    unit.lastTelemetryMs = nowMs;
    return err;
}

BridgeError ControlLoop::disconnect(uint8_t slot) {
    if (slot >= SLR_MAX_SLOTS) return BRIDGE_ERR_INVALID_ARGUMENT;

    LinkManager& link = _links[slot];
    if (link.getStatus() == LINK_READY) {
        // Stop the car before letting go of it; the result does not matter
        BridgeError err = link.write(stopFrame(slot));
        (void)err;
    }
    link.disconnect();

    _units[slot].active = false;
    _units[slot].faulted = false;
    return BRIDGE_OK;
}

void ControlLoop::shutdown() {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_units[i].active) {
            disconnect(i);
        }
    }
}

void ControlLoop::tick(uint32_t nowMs) {
    // Timeouts and reconnect backoff run every call
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_units[i].active) {
            _links[i].tick(nowMs);
        }
    }

    if (!_hasSent || nowMs - _lastSendMs >= _config.sendIntervalMs) {
        _lastSendMs = nowMs;
        _hasSent = true;
        for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
            runUnit(i);
        }
    } else {
        // Between sends only catch button presses
        for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
            if (_units[i].active && !_units[i].faulted) {
                _sampler.pollButtons(i);
            }
        }
    }

    if (_listener == nullptr) return;
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        UnitState& unit = _units[i];
        if (!unit.active) continue;
        if (nowMs - unit.lastTelemetryMs >= _config.telemetryIntervalMs) {
            unit.lastTelemetryMs = nowMs;
            _listener->onTelemetry(getTelemetry(i));
        }
    }
}

void ControlLoop::runUnit(uint8_t slot) {
    UnitState& unit = _units[slot];
    if (!unit.active || unit.faulted) return;

    ControllerState state;
    BridgeError err = _sampler.sample(slot, state);
    unit.controllerPresent = (err == BRIDGE_OK);

    LinkManager& link = _links[slot];
    if (link.getStatus() != LINK_READY) return;

    if (err == BRIDGE_ERR_CONTROLLER_UNAVAILABLE) {
        err = link.write(stopFrame(slot));
        (void)err;   // NOT_CONNECTED is counted by the link
        return;
    }

    CommandFrame frame;
    err = encodeCommand(state, frame);
    if (err == BRIDGE_ERR_INVALID_INPUT) {
        BridgeError writeErr = link.write(stopFrame(slot));
        (void)writeErr;
        unit.faulted = true;
        if (_listener != nullptr) {
            _listener->onUnitFault(slot, err);
        }
        return;
    }

    err = link.write(frame);
    (void)err;
}

// Neutral frame that keeps the car in its current mode
CommandFrame ControlLoop::stopFrame(uint8_t slot) const {
    bool sport = (_sampler.getLatched(slot) & FLAG_SPORT_MODE) != 0;
    return neutralFrame(sport ? SLR_MODE_SPORT : SLR_MODE_NORMAL);
}

bool ControlLoop::isActive(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return false;
    return _units[slot].active;
}

bool ControlLoop::isFaulted(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return false;
    return _units[slot].faulted;
}

bool ControlLoop::anyReady() const {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_links[i].getStatus() == LINK_READY) return true;
    }
    return false;
}

LinkManager* ControlLoop::getLink(uint8_t slot) {
    if (slot >= SLR_MAX_SLOTS) return nullptr;
    return &_links[slot];
}

const LinkManager* ControlLoop::getLink(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return nullptr;
    return &_links[slot];
}

Telemetry ControlLoop::getTelemetry(uint8_t slot) const {
    Telemetry t;
    if (slot >= SLR_MAX_SLOTS) return t;

    const LinkManager& link = _links[slot];
    const UnitState& unit = _units[slot];

    t.slot = slot;
    t.status = link.getStatus();
    t.hasFrame = link.hasSentFrame();
    t.lastFrame = link.getLastFrame();
    t.controllerPresent = unit.controllerPresent;
    t.hasBattery = link.hasBattery();
    t.batteryPct = link.getBatteryPct();
    t.framesSent = link.getFramesSent();
    t.framesDropped = link.getFramesDropped();
    t.faulted = unit.faulted;
    return t;
}
