#include "device_scanner.h"

#include <string.h>

const char* getScanStateName(ScanState state) {
    switch (state) {
        case SCAN_IDLE:      return "IDLE";
        case SCAN_RUNNING:   return "RUNNING";
        case SCAN_COMPLETE:  return "COMPLETE";
        case SCAN_CANCELLED: return "CANCELLED";
        case SCAN_FAILED:    return "FAILED";
        default:             return "???";
    }
}

BridgeError DeviceScanner::begin(uint32_t durationMs, uint32_t nowMs) {
    if (_state == SCAN_RUNNING) {
        _radio.stopScan();
    }

    _count = 0;
    _startMs = nowMs;
    _durationMs = durationMs;

    if (!_radio.isPoweredOn() || !_radio.startScan()) {
        finish(SCAN_FAILED);
        return BRIDGE_ERR_SCAN_UNAVAILABLE;
    }

    _state = SCAN_RUNNING;
    return BRIDGE_OK;
}

void DeviceScanner::tick(uint32_t nowMs) {
    if (_state != SCAN_RUNNING) return;

    if (nowMs - _startMs >= _durationMs) {
        _radio.stopScan();
        finish(SCAN_COMPLETE);
    }
}

void DeviceScanner::cancel() {
    if (_state != SCAN_RUNNING) return;
    _radio.stopScan();
    finish(SCAN_CANCELLED);
}

void DeviceScanner::handleAdvertisement(const BleAddress& address, const char* name, int8_t rssi) {
    if (_state != SCAN_RUNNING) return;

    const CarModel* model = matchAdvertisedName(name);
    if (model == nullptr) return;

    for (uint8_t i = 0; i < _count; i++) {
        if (_devices[i].address == address) {
            _devices[i].rssi = rssi;
            return;
        }
    }

    if (_count >= SLR_MAX_DISCOVERED) return;

    DiscoveredDevice& dev = _devices[_count];
    dev = DiscoveredDevice();
    dev.model = model;
    dev.address = address;
    dev.rssi = rssi;
    strncpy(dev.advertisedName, name, SLR_MAX_NAME_LENGTH - 1);
    dev.advertisedName[SLR_MAX_NAME_LENGTH - 1] = '\0';

    uint8_t index = _count++;
    if (_listener != nullptr) {
        _listener->onDeviceFound(dev, index);
    }
}

void DeviceScanner::handleScanStopped() {
    // Radio stopped the scan on its own (stack reset, controller busy)
    if (_state == SCAN_RUNNING) {
        finish(SCAN_COMPLETE);
    }
}

const DiscoveredDevice* DeviceScanner::getDevice(uint8_t index) const {
    if (index >= _count) return nullptr;
    return &_devices[index];
}

const DiscoveredDevice* DeviceScanner::findDevice(const BleAddress& address) const {
    for (uint8_t i = 0; i < _count; i++) {
        if (_devices[i].address == address) {
            return &_devices[i];
        }
    }
    return nullptr;
}

void DeviceScanner::finish(ScanState state) {
    _state = state;
    if (_listener != nullptr) {
        _listener->onScanFinished(state, _count);
    }
}
