/**
 * @file control_loop.h
 * @brief Fixed-rate streaming of gamepad input to the connected cars
 *
 * One control unit per gamepad slot. Every send interval each active unit
 * samples its gamepad, encodes a command frame and writes it to its car:
 *
 *   READY + gamepad present  -> encoded frame
 *   READY + gamepad missing  -> neutral frame (car stops)
 *   not READY                -> nothing sent, the link manager recovers
 *
 * A unit that produces an out-of-range state sends one neutral frame and
 * stops streaming until connect() or retry() is called for its slot.
 * Units never share state, so one faulted or disconnected unit does not
 * affect the others.
 */

#ifndef CONTROL_LOOP_H
#define CONTROL_LOOP_H

#include <stdint.h>

#include "ble_radio.h"
#include "bridge_config.h"
#include "bridge_types.h"
#include "car_protocol.h"
#include "device_scanner.h"
#include "input_sampler.h"
#include "link_manager.h"

// ========================== Telemetry ==========================
struct Telemetry {
    uint8_t       slot = 0;
    LinkStatus    status = LINK_IDLE;
    bool          hasFrame = false;
    CommandFrame  lastFrame = {};
    bool          controllerPresent = false;
    bool          hasBattery = false;
    uint8_t       batteryPct = 0;
    unsigned long framesSent = 0;
    unsigned long framesDropped = 0;
    bool          faulted = false;
};

class ControlListener {
public:
    virtual ~ControlListener() {}
    virtual void onTelemetry(const Telemetry& telemetry) = 0;
    // Unit stopped streaming after a neutral frame
    virtual void onUnitFault(uint8_t slot, BridgeError err) = 0;
};

// ========================== ControlLoop Class ==========================
class ControlLoop {
public:
    ControlLoop(BleRadio& radio, InputSampler& sampler, const BridgeConfig& config);

    void setListener(ControlListener* listener) { _listener = listener; }
    void setLinkListener(LinkListener* listener);

    /**
     * @brief Bind a car to a slot and start connecting
     * @return BRIDGE_ERR_INVALID_ARGUMENT for a bad slot, otherwise the
     *         result of LinkManager::connect()
     */
    BridgeError connect(uint8_t slot, const DiscoveredDevice& device, uint32_t nowMs);
    BridgeError retry(uint8_t slot, uint32_t nowMs);

    // Neutral frame, then release the link (no reconnect)
    BridgeError disconnect(uint8_t slot);

    // disconnect() for every active slot
    void shutdown();

    // Call every loop iteration. Frames go out on the send interval.
    void tick(uint32_t nowMs);

    bool isActive(uint8_t slot) const;
    bool isFaulted(uint8_t slot) const;
    bool anyReady() const;

    LinkManager* getLink(uint8_t slot);
    const LinkManager* getLink(uint8_t slot) const;

    Telemetry getTelemetry(uint8_t slot) const;

private:
    struct UnitState {
        bool     active = false;
        bool     faulted = false;
        bool     controllerPresent = false;
        uint32_t lastTelemetryMs = 0;
    };

    void runUnit(uint8_t slot);
    CommandFrame stopFrame(uint8_t slot) const;

    InputSampler& _sampler;
    const BridgeConfig& _config;
    ControlListener* _listener = nullptr;

    LinkManager _links[SLR_MAX_SLOTS];
    UnitState _units[SLR_MAX_SLOTS];

    bool _hasSent = false;
    uint32_t _lastSendMs = 0;
};

#endif // CONTROL_LOOP_H
