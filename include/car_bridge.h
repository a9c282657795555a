/**
 * @file car_bridge.h
 * @brief Front-end facade: car catalog, scanning, per-slot links, telemetry
 *
 * CarBridge owns the scanner and the control loop and is the single
 * BleRadioListener. Radio events are routed by address while a connect is
 * pending and by connection handle afterwards.
 *
 * Usage:
 *   CarBridge bridge(radio, gamepads);
 *   bridge.begin(&listener);
 *   loop: bridge.update(millis());
 */

#ifndef CAR_BRIDGE_H
#define CAR_BRIDGE_H

#include <stddef.h>
#include <stdint.h>

#include "ble_radio.h"
#include "bridge_config.h"
#include "bridge_types.h"
#include "car_catalog.h"
#include "control_loop.h"
#include "device_scanner.h"
#include "input_sampler.h"
#include "link_manager.h"

// Everything the front-end gets told
class BridgeListener : public ScanListener, public LinkListener, public ControlListener {
public:
    virtual ~BridgeListener() {}
};

// ========================== CarBridge Class ==========================
class CarBridge : public BleRadioListener {
public:
    CarBridge(BleRadio& radio, GamepadSource& gamepads, const BridgeConfig& config = BridgeConfig());

    /**
     * @brief Register with the radio and start routing events
     * @return false if the radio is not powered on (scanning will fail,
     *         begin() may be called again later)
     */
    bool begin(BridgeListener* listener);

    // Neutral frame to every car, release links, stop routing events
    void end();

    // Drain radio events, advance scan window, run the control loop
    void update(uint32_t nowMs);

    // ========== Catalog ==========
    const CarModel* listModels(size_t& count) const;

    // ========== Scanning ==========
    BridgeError startScan(uint32_t nowMs);
    BridgeError startScan(uint32_t durationMs, uint32_t nowMs);
    void cancelScan();
    bool isScanning() const { return _scanner.isRunning(); }
    uint8_t getDeviceCount() const { return _scanner.getDeviceCount(); }
    const DiscoveredDevice* getDevice(uint8_t index) const { return _scanner.getDevice(index); }

    // ========== Links ==========
    /**
     * @brief Connect a gamepad slot to a scanned car
     * @param deviceIndex Index in the current scan results
     * @return BRIDGE_ERR_INVALID_ARGUMENT for a bad slot or index, or when
     *         another slot already holds that car
     */
    BridgeError connect(uint8_t slot, uint8_t deviceIndex, uint32_t nowMs);
    BridgeError connect(uint8_t slot, const DiscoveredDevice& device, uint32_t nowMs);

    /**
     * @brief Connect a gamepad slot to a car by address, without scanning
     *
     * Cars seen in the last scan keep their address type and model, the
     * given model overrides it. Any other address is connected as a public
     * address and needs a model.
     * @return BRIDGE_ERR_INVALID_ARGUMENT for a bad slot, or an unscanned
     *         address without a model
     */
    BridgeError connect(uint8_t slot, const BleAddress& address, const CarModel* model, uint32_t nowMs);
    BridgeError disconnect(uint8_t slot);
    BridgeError retry(uint8_t slot, uint32_t nowMs);
    BridgeError requestBattery(uint8_t slot);

    // Flip a latched flag as if its gamepad button had been pressed
    BridgeError toggleFlag(uint8_t slot, ControlFlag flag);
    uint8_t getLatchedFlags(uint8_t slot) const { return _sampler.getLatched(slot); }

    void shutdown();

    LinkStatus getStatus(uint8_t slot) const;
    Telemetry getTelemetry(uint8_t slot) const { return _loop.getTelemetry(slot); }
    bool anyReady() const { return _loop.anyReady(); }
    bool isRadioOn() const { return _radio.isPoweredOn(); }

    const BridgeConfig& getConfig() const { return _config; }

    // ========== BleRadioListener ==========
    void onAdvertisement(const BleAddress& address, const char* name, int8_t rssi) override;
    void onScanStopped() override;
    void onConnected(const BleAddress& address, uint16_t connHandle) override;
    void onConnectFailed(const BleAddress& address, uint8_t status) override;
    void onCharacteristicsDiscovered(uint16_t connHandle, bool ok,
                                     const CarCharacteristics& chars) override;
    void onDisconnected(uint16_t connHandle, uint8_t reason) override;
    void onWriteFailed(uint16_t connHandle, uint8_t status) override;
    void onBatteryLevel(uint16_t connHandle, uint8_t percent) override;
    void onStatusNotification(uint16_t connHandle, const uint8_t* data, uint16_t length) override;

private:
    LinkManager* linkForHandle(uint16_t connHandle);
    LinkManager* linkWaitingFor(const BleAddress& address);
    const DiscoveredDevice* findScanned(const BleAddress& address) const;
    bool heldByOtherSlot(uint8_t slot, const BleAddress& address) const;

    BleRadio& _radio;
    BridgeConfig _config;
    InputSampler _sampler;
    DeviceScanner _scanner;
    ControlLoop _loop;
    bool _running = false;
};

#endif // CAR_BRIDGE_H
