/**
 * @file link_manager.h
 * @brief Owns the BLE connection to one car
 *
 * State machine:
 *
 *   IDLE --connect()--> CONNECTING --characteristic found--> READY
 *                           |                                  |
 *                           | rejected / timeout /             | link dropped /
 *                           | no command characteristic        | write failed
 *                           v                                  v
 *                        FAILED <--attempts exhausted-- DISCONNECTED
 *                           |                                  |
 *                        retry()                    backoff elapsed (tick)
 *                           |                                  |
 *                           +------------> CONNECTING <--------+
 *
 * The first connect after a user request is never retried automatically:
 * pairing with these cars is flaky and the user decides when to try again.
 * A link that was READY and dropped is reconnected with a growing backoff,
 * up to reconnectMaxAttempts. disconnect() returns to IDLE from any state.
 */

#ifndef LINK_MANAGER_H
#define LINK_MANAGER_H

#include <stdint.h>

#include "ble_radio.h"
#include "bridge_config.h"
#include "bridge_types.h"
#include "car_protocol.h"
#include "device_scanner.h"

struct Connection {
    DiscoveredDevice   device;
    uint16_t           connHandle = SLR_INVALID_CONN_HANDLE;
    CarCharacteristics chars;          // chars.commandHandle is the writable characteristic
    LinkStatus         status = LINK_IDLE;
    uint32_t           startedMs = 0;  // start of the current attempt
};

class LinkListener {
public:
    virtual ~LinkListener() {}
    virtual void onLinkStatus(uint8_t slot, LinkStatus status, BridgeError reason) = 0;
    virtual void onBattery(uint8_t slot, uint8_t percent) = 0;
    virtual void onCarStatus(uint8_t slot, const StatusReport& report) = 0;
};

class LinkManager {
public:
    LinkManager() {}
    LinkManager(BleRadio& radio, uint8_t slot, const BridgeConfig& config)
        : _radio(&radio), _slot(slot), _config(&config) {}

    // Bind a default-constructed manager, before any other call
    void attach(BleRadio& radio, uint8_t slot, const BridgeConfig& config) {
        _radio = &radio;
        _slot = slot;
        _config = &config;
    }

    void setListener(LinkListener* listener) { _listener = listener; }

    /**
     * @brief Connect to a scanned car (user request)
     *
     * Drops any connection this manager already holds.
     * @return BRIDGE_OK if an attempt was started, BRIDGE_ERR_CONNECT_FAILED
     *         if the radio refused it (status is then FAILED)
     */
    BridgeError connect(const DiscoveredDevice& device, uint32_t nowMs);

    /**
     * @brief Start a new attempt on the last device after FAILED or IDLE
     * @return BRIDGE_ERR_INVALID_ARGUMENT if no device was ever selected
     */
    BridgeError retry(uint32_t nowMs);

    // User cancel: releases the link, no reconnect
    void disconnect();

    // Connect timeout and reconnect backoff
    void tick(uint32_t nowMs);

    /**
     * @brief Send one command frame (fire-and-forget)
     * @return BRIDGE_ERR_NOT_CONNECTED unless READY; status is left unchanged.
     *         A busy transport drops the frame and returns BRIDGE_OK.
     */
    BridgeError write(const CommandFrame& frame);

    BridgeError requestBattery();

    // ========== Radio events (routed by CarBridge) ==========
    bool isWaitingFor(const BleAddress& address) const;
    bool ownsHandle(uint16_t connHandle) const;

    void handleConnected(uint16_t connHandle);
    void handleConnectFailed(uint8_t status);
    void handleCharacteristics(bool ok, const CarCharacteristics& chars);
    void handleDisconnected(uint8_t reason);
    void handleWriteFailed(uint8_t status);
    void handleBattery(uint8_t percent);
    void handleStatusNotification(const uint8_t* data, uint16_t length);

    // ========== Accessors ==========
    uint8_t getSlot() const { return _slot; }
    LinkStatus getStatus() const { return _conn.status; }
    const Connection& getConnection() const { return _conn; }
    bool hasDevice() const { return _hasDevice; }

    bool hasBattery() const { return _hasBattery; }
    uint8_t getBatteryPct() const { return _batteryPct; }

    uint8_t getReconnectAttempts() const { return _reconnectAttempts; }
    uint32_t getNextAttemptMs() const { return _nextAttemptMs; }

    unsigned long getFramesSent() const { return _framesSent; }
    unsigned long getFramesDropped() const { return _framesDropped; }
    bool hasSentFrame() const { return _framesSent > 0; }
    // Last frame the transport accepted
    const CommandFrame& getLastFrame() const { return _lastSent; }

private:
    void startAttempt();
    void attemptFailed();
    void linkLost();
    void releaseLink();
    void setStatus(LinkStatus status, BridgeError reason);
    uint32_t backoffFor(uint8_t attempt) const;

    BleRadio* _radio = nullptr;
    uint8_t _slot = 0;
    const BridgeConfig* _config = nullptr;
    LinkListener* _listener = nullptr;

    Connection _conn;
    bool _hasDevice = false;

    // Automatic reconnect bookkeeping
    bool _reconnecting = false;
    uint8_t _reconnectAttempts = 0;
    uint32_t _nextAttemptMs = 0;

    uint32_t _nowMs = 0;

    // Single outbound buffer, reused every tick
    CommandFrame _outbound = {};
    CommandFrame _lastSent = {};

    bool _hasBattery = false;
    uint8_t _batteryPct = 0;

    unsigned long _framesSent = 0;
    unsigned long _framesDropped = 0;
};

#endif // LINK_MANAGER_H
