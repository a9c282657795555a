#include "car_bridge.h"

#include <string.h>

CarBridge::CarBridge(BleRadio& radio, GamepadSource& gamepads, const BridgeConfig& config)
    : _radio(radio),
      _config(config),
      _sampler(gamepads, config.deadzone),
      _scanner(radio),
      _loop(radio, _sampler, _config) {}

bool CarBridge::begin(BridgeListener* listener) {
    _scanner.setListener(listener);
    _loop.setListener(listener);
    _loop.setLinkListener(listener);
    _radio.setListener(this);
    _running = true;
    return _radio.isPoweredOn();
}

void CarBridge::end() {
    if (!_running) return;
    shutdown();
    _radio.setListener(nullptr);
    _scanner.setListener(nullptr);
    _loop.setListener(nullptr);
    _loop.setLinkListener(nullptr);
    _running = false;
}

void CarBridge::update(uint32_t nowMs) {
    if (!_running) return;
    _radio.poll();
    _scanner.tick(nowMs);
    _loop.tick(nowMs);
}

const CarModel* CarBridge::listModels(size_t& count) const {
    count = getCarModelCount();
    return getCarModels();
}

BridgeError CarBridge::startScan(uint32_t nowMs) {
    return startScan(_config.scanWindowMs, nowMs);
}

BridgeError CarBridge::startScan(uint32_t durationMs, uint32_t nowMs) {
    return _scanner.begin(durationMs, nowMs);
}

void CarBridge::cancelScan() {
    _scanner.cancel();
}

BridgeError CarBridge::connect(uint8_t slot, uint8_t deviceIndex, uint32_t nowMs) {
    const DiscoveredDevice* device = _scanner.getDevice(deviceIndex);
    if (device == nullptr) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }
    return connect(slot, *device, nowMs);
}

BridgeError CarBridge::connect(uint8_t slot, const DiscoveredDevice& device, uint32_t nowMs) {
    if (slot >= SLR_MAX_SLOTS || device.model == nullptr) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }
    if (heldByOtherSlot(slot, device.address)) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }
    // Connecting while scanning is allowed but slows both down
    return _loop.connect(slot, device, nowMs);
}

BridgeError CarBridge::connect(uint8_t slot, const BleAddress& address, const CarModel* model,
                               uint32_t nowMs) {
    if (slot >= SLR_MAX_SLOTS) {
        return BRIDGE_ERR_INVALID_ARGUMENT;
    }

    DiscoveredDevice device;
    const DiscoveredDevice* scanned = findScanned(address);
    if (scanned != nullptr) {
        device = *scanned;
    } else {
        device.address = address;
    }
    if (model != nullptr) {
        device.model = model;
    }
    return connect(slot, device, nowMs);
}

BridgeError CarBridge::disconnect(uint8_t slot) {
    return _loop.disconnect(slot);
}

BridgeError CarBridge::retry(uint8_t slot, uint32_t nowMs) {
    return _loop.retry(slot, nowMs);
}

BridgeError CarBridge::requestBattery(uint8_t slot) {
    LinkManager* link = _loop.getLink(slot);
    if (link == nullptr) return BRIDGE_ERR_INVALID_ARGUMENT;
    return link->requestBattery();
}

BridgeError CarBridge::toggleFlag(uint8_t slot, ControlFlag flag) {
    if (slot >= SLR_MAX_SLOTS) return BRIDGE_ERR_INVALID_ARGUMENT;
    _sampler.toggleLatch(slot, flag);
    return BRIDGE_OK;
}

void CarBridge::shutdown() {
    _scanner.cancel();
    _loop.shutdown();
}

LinkStatus CarBridge::getStatus(uint8_t slot) const {
    const LinkManager* link = _loop.getLink(slot);
    if (link == nullptr) return LINK_IDLE;
    return link->getStatus();
}

// ============================================================================
// Radio event routing
// ============================================================================

void CarBridge::onAdvertisement(const BleAddress& address, const char* name, int8_t rssi) {
    _scanner.handleAdvertisement(address, name, rssi);
}

void CarBridge::onScanStopped() {
    _scanner.handleScanStopped();
}

void CarBridge::onConnected(const BleAddress& address, uint16_t connHandle) {
    LinkManager* link = linkWaitingFor(address);
    if (link == nullptr) {
        // Nobody asked for this link any more
        _radio.disconnect(connHandle);
        return;
    }
    link->handleConnected(connHandle);
}

void CarBridge::onConnectFailed(const BleAddress& address, uint8_t status) {
    LinkManager* link = linkWaitingFor(address);
    if (link != nullptr) {
        link->handleConnectFailed(status);
    }
}

void CarBridge::onCharacteristicsDiscovered(uint16_t connHandle, bool ok,
                                            const CarCharacteristics& chars) {
    LinkManager* link = linkForHandle(connHandle);
    if (link != nullptr) {
        link->handleCharacteristics(ok, chars);
    }
}

void CarBridge::onDisconnected(uint16_t connHandle, uint8_t reason) {
    LinkManager* link = linkForHandle(connHandle);
    if (link != nullptr) {
        link->handleDisconnected(reason);
    }
}

void CarBridge::onWriteFailed(uint16_t connHandle, uint8_t status) {
    LinkManager* link = linkForHandle(connHandle);
    if (link != nullptr) {
        link->handleWriteFailed(status);
    }
}

void CarBridge::onBatteryLevel(uint16_t connHandle, uint8_t percent) {
    LinkManager* link = linkForHandle(connHandle);
    if (link != nullptr) {
        link->handleBattery(percent);
    }
}

void CarBridge::onStatusNotification(uint16_t connHandle, const uint8_t* data, uint16_t length) {
    LinkManager* link = linkForHandle(connHandle);
    if (link != nullptr) {
        link->handleStatusNotification(data, length);
    }
}

LinkManager* CarBridge::linkForHandle(uint16_t connHandle) {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        LinkManager* link = _loop.getLink(i);
        if (link->ownsHandle(connHandle)) return link;
    }
    return nullptr;
}

LinkManager* CarBridge::linkWaitingFor(const BleAddress& address) {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        LinkManager* link = _loop.getLink(i);
        if (link->isWaitingFor(address)) return link;
    }
    return nullptr;
}

// Address type is not part of the match, a typed-in address has none
const DiscoveredDevice* CarBridge::findScanned(const BleAddress& address) const {
    for (uint8_t i = 0; i < _scanner.getDeviceCount(); i++) {
        const DiscoveredDevice* device = _scanner.getDevice(i);
        if (memcmp(device->address.bytes, address.bytes, sizeof(address.bytes)) == 0) {
            return device;
        }
    }
    return nullptr;
}

bool CarBridge::heldByOtherSlot(uint8_t slot, const BleAddress& address) const {
    for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
        if (i == slot || !_loop.isActive(i)) continue;
        const LinkManager* link = _loop.getLink(i);
        if (link->hasDevice() && link->getConnection().device.address == address) {
            return true;
        }
    }
    return false;
}
