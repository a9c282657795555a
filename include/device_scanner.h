/**
 * @file device_scanner.h
 * @brief Time-boxed BLE scan that keeps only known cars
 *
 * A scan session runs for a fixed window and can be cancelled or started
 * again at any time. Every advertisement is matched against the car
 * catalog; anything that is not a known, advertisable car is dropped.
 * Devices are kept in discovery order and deduplicated by address, so the
 * index shown to the user stays valid until the next session starts.
 */

#ifndef DEVICE_SCANNER_H
#define DEVICE_SCANNER_H

#include <stdint.h>

#include "ble_radio.h"
#include "bridge_config.h"
#include "bridge_types.h"
#include "car_catalog.h"

struct DiscoveredDevice {
    const CarModel* model = nullptr;
    char            advertisedName[SLR_MAX_NAME_LENGTH] = {};
    BleAddress      address;
    int8_t          rssi = 0;
};

enum ScanState : uint8_t {
    SCAN_IDLE = 0,
    SCAN_RUNNING,
    SCAN_COMPLETE,
    SCAN_CANCELLED,
    SCAN_FAILED,      // Radio off or scan refused
};

const char* getScanStateName(ScanState state);

class ScanListener {
public:
    virtual ~ScanListener() {}
    virtual void onDeviceFound(const DiscoveredDevice& device, uint8_t index) = 0;
    virtual void onScanFinished(ScanState state, uint8_t deviceCount) = 0;
};

class DeviceScanner {
public:
    explicit DeviceScanner(BleRadio& radio) : _radio(radio) {}

    void setListener(ScanListener* listener) { _listener = listener; }

    /**
     * @brief Start a new session (restarts a running one)
     * @return BRIDGE_OK or BRIDGE_ERR_SCAN_UNAVAILABLE
     */
    BridgeError begin(uint32_t durationMs, uint32_t nowMs);

    // Ends the session when the window has elapsed
    void tick(uint32_t nowMs);

    void cancel();

    // Radio events (routed by CarBridge)
    void handleAdvertisement(const BleAddress& address, const char* name, int8_t rssi);
    void handleScanStopped();

    ScanState getState() const { return _state; }
    bool isRunning() const { return _state == SCAN_RUNNING; }

    uint8_t getDeviceCount() const { return _count; }
    const DiscoveredDevice* getDevice(uint8_t index) const;
    const DiscoveredDevice* findDevice(const BleAddress& address) const;

private:
    void finish(ScanState state);

    BleRadio& _radio;
    ScanListener* _listener = nullptr;

    ScanState _state = SCAN_IDLE;
    uint32_t _startMs = 0;
    uint32_t _durationMs = 0;

    DiscoveredDevice _devices[SLR_MAX_DISCOVERED];
    uint8_t _count = 0;
};

#endif // DEVICE_SCANNER_H
