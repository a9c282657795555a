#include "link_manager.h"

#include <string.h>

BridgeError LinkManager::connect(const DiscoveredDevice& device, uint32_t nowMs) {
    _nowMs = nowMs;

    // Switching cars: release whatever this slot holds first
    releaseLink();

    _conn = Connection();
    _conn.device = device;
    _hasDevice = true;
    _hasBattery = false;
    _batteryPct = 0;

    _reconnecting = false;
    _reconnectAttempts = 0;

    startAttempt();
    return _conn.status == LINK_CONNECTING ? BRIDGE_OK : BRIDGE_ERR_CONNECT_FAILED;
}

BridgeError LinkManager::retry(uint32_t nowMs) {
    if (!_hasDevice) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }
    _nowMs = nowMs;

    if (_conn.status == LINK_CONNECTING || _conn.status == LINK_READY) {
        return BRIDGE_OK;
    }

    _reconnecting = false;
    _reconnectAttempts = 0;

    startAttempt();
    return _conn.status == LINK_CONNECTING ? BRIDGE_OK : BRIDGE_ERR_CONNECT_FAILED;
}

void LinkManager::disconnect() {
    releaseLink();
    _reconnecting = false;
    _reconnectAttempts = 0;
    setStatus(LINK_IDLE, BRIDGE_OK);
}

void LinkManager::tick(uint32_t nowMs) {
    _nowMs = nowMs;

    switch (_conn.status) {
        case LINK_CONNECTING:
            if (nowMs - _conn.startedMs >= _config->connectTimeoutMs) {
                releaseLink();
                attemptFailed();
            }
            break;

        case LINK_DISCONNECTED:
            // Signed difference: wrap-safe "now >= next"
            if ((int32_t)(nowMs - _nextAttemptMs) >= 0) {
                _reconnectAttempts++;
                startAttempt();
            }
            break;

        default:
            break;
    }
}

BridgeError LinkManager::write(const CommandFrame& frame) {
    if (_conn.status != LINK_READY) {
        _framesDropped++;
        return BRIDGE_ERR_NOT_CONNECTED;
    }

    memcpy(&_outbound, &frame, sizeof(CommandFrame));

    RadioWriteResult result = _radio->writeCommand(_conn.connHandle, _conn.chars.commandHandle,
                                                  (const uint8_t*)&_outbound, sizeof(CommandFrame));
    switch (result) {
        case RADIO_WRITE_OK:
            _lastSent = _outbound;
            _framesSent++;
            return BRIDGE_OK;

        case RADIO_WRITE_BUSY:
            // Superseded by the next tick
            _framesDropped++;
            return BRIDGE_OK;

        case RADIO_WRITE_FAILED:
        default:
            _framesDropped++;
            linkLost();
            return BRIDGE_ERR_NOT_CONNECTED;
    }
}

BridgeError LinkManager::requestBattery() {
    if (_conn.status != LINK_READY) {
        return BRIDGE_ERR_NOT_CONNECTED;
    }
    if (_conn.chars.batteryHandle == 0) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }
    if (!_radio->readBattery(_conn.connHandle, _conn.chars.batteryHandle)) {
        return BRIDGE_ERR_NOT_CONNECTED;
    }
    return BRIDGE_OK;
}

// ============================================================================
// Radio events
// ============================================================================

bool LinkManager::isWaitingFor(const BleAddress& address) const {
    return _conn.status == LINK_CONNECTING &&
           _conn.connHandle == SLR_INVALID_CONN_HANDLE &&
           _conn.device.address == address;
}

bool LinkManager::ownsHandle(uint16_t connHandle) const {
    return connHandle != SLR_INVALID_CONN_HANDLE && _conn.connHandle == connHandle;
}

void LinkManager::handleConnected(uint16_t connHandle) {
    if (_conn.status != LINK_CONNECTING) {
        // Late completion of a cancelled attempt
        _radio->disconnect(connHandle);
        return;
    }

    _conn.connHandle = connHandle;

    if (!_radio->discoverCharacteristics(connHandle)) {
        releaseLink();
        attemptFailed();
    }
}

void LinkManager::handleConnectFailed(uint8_t status) {
    (void)status;
    if (_conn.status != LINK_CONNECTING) return;

    _conn.connHandle = SLR_INVALID_CONN_HANDLE;
    attemptFailed();
}

void LinkManager::handleCharacteristics(bool ok, const CarCharacteristics& chars) {
    if (_conn.status != LINK_CONNECTING) return;

    if (!ok || chars.commandHandle == 0) {
        releaseLink();
        attemptFailed();
        return;
    }

    // Resolved once per connection, reused for every write
    _conn.chars = chars;
    _reconnecting = false;
    _reconnectAttempts = 0;
    setStatus(LINK_READY, BRIDGE_OK);

    // Best effort, the link is usable without them
    if (_conn.chars.statusHandle != 0) {
        _radio->enableNotifications(_conn.connHandle, _conn.chars.statusHandle);
    }
    if (_conn.chars.batteryHandle != 0) {
        // Current level now, then every change the car reports
        _radio->readBattery(_conn.connHandle, _conn.chars.batteryHandle);
        _radio->enableNotifications(_conn.connHandle, _conn.chars.batteryHandle);
    }
}

void LinkManager::handleDisconnected(uint8_t reason) {
    (void)reason;
    _conn.connHandle = SLR_INVALID_CONN_HANDLE;

    if (_conn.status == LINK_CONNECTING) {
        attemptFailed();
    } else if (_conn.status == LINK_READY) {
        linkLost();
    }
}

void LinkManager::handleWriteFailed(uint8_t status) {
    (void)status;
    if (_conn.status != LINK_READY) return;
    linkLost();
}

void LinkManager::handleBattery(uint8_t percent) {
    if (percent > 100) percent = 100;
    _batteryPct = percent;
    _hasBattery = true;
    if (_listener != nullptr) {
        _listener->onBattery(_slot, percent);
    }
}

void LinkManager::handleStatusNotification(const uint8_t* data, uint16_t length) {
    StatusReport report;
    if (!decodeStatus(data, length, report)) return;

    if (report.kind == STATUS_BATTERY) {
        handleBattery(report.batteryPct);
        return;
    }
    if (_listener != nullptr) {
        _listener->onCarStatus(_slot, report);
    }
}

// ============================================================================
// Internals
// ============================================================================

void LinkManager::startAttempt() {
    _conn.connHandle = SLR_INVALID_CONN_HANDLE;
    _conn.chars = CarCharacteristics();
    _conn.startedMs = _nowMs;
    setStatus(LINK_CONNECTING, BRIDGE_OK);

    if (!_radio->connect(_conn.device.address)) {
        attemptFailed();
    }
}

void LinkManager::attemptFailed() {
    if (_reconnecting && _reconnectAttempts < _config->reconnectMaxAttempts) {
        _nextAttemptMs = _nowMs + backoffFor(_reconnectAttempts);
        setStatus(LINK_DISCONNECTED, BRIDGE_ERR_CONNECT_FAILED);
        return;
    }

    _reconnecting = false;
    setStatus(LINK_FAILED, BRIDGE_ERR_CONNECT_FAILED);
}

void LinkManager::linkLost() {
    releaseLink();
    _reconnecting = true;
    _reconnectAttempts = 0;
    _nextAttemptMs = _nowMs + backoffFor(0);
    setStatus(LINK_DISCONNECTED, BRIDGE_ERR_NOT_CONNECTED);
}

// Drop the radio side of the current connection, keep the device
void LinkManager::releaseLink() {
    if (_conn.status == LINK_CONNECTING && _conn.connHandle == SLR_INVALID_CONN_HANDLE) {
        _radio->cancelConnect(_conn.device.address);
    } else if (_conn.connHandle != SLR_INVALID_CONN_HANDLE) {
        _radio->disconnect(_conn.connHandle);
    }
    _conn.connHandle = SLR_INVALID_CONN_HANDLE;
}

void LinkManager::setStatus(LinkStatus status, BridgeError reason) {
    if (_conn.status == status) return;
    _conn.status = status;
    if (_listener != nullptr) {
        _listener->onLinkStatus(_slot, status, reason);
    }
}

uint32_t LinkManager::backoffFor(uint8_t attempt) const {
    uint32_t delay = _config->reconnectBackoffMs;
    for (uint8_t i = 0; i < attempt && delay < _config->reconnectBackoffMaxMs; i++) {
        delay *= 2;
    }
    if (delay > _config->reconnectBackoffMaxMs) {
        delay = _config->reconnectBackoffMaxMs;
    }
    return delay;
}
