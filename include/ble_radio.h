/**
 * @file ble_radio.h
 * @brief Platform BLE central interface used by the scanner and link managers
 *
 * Commands are asynchronous: a true return only means the request was
 * accepted. Results come back through BleRadioListener, always on the
 * task that calls BleRadio::poll().
 */

#ifndef BLE_RADIO_H
#define BLE_RADIO_H

#include <stdint.h>

#include "bridge_types.h"

#define SLR_INVALID_CONN_HANDLE  0xFFFF

// Value handles found on the car (0 = not found)
struct CarCharacteristics {
    uint16_t commandHandle = 0;
    uint16_t statusHandle = 0;
    uint16_t batteryHandle = 0;
};

enum RadioWriteResult : uint8_t {
    RADIO_WRITE_OK = 0,   // Handed to the transport (no acknowledgement from the car)
    RADIO_WRITE_BUSY,     // Transport buffers full, frame dropped
    RADIO_WRITE_FAILED,   // Link unusable
};

// ========================== Radio Events ==========================
class BleRadioListener {
public:
    virtual ~BleRadioListener() {}

    virtual void onAdvertisement(const BleAddress& address, const char* name, int8_t rssi) = 0;
    virtual void onScanStopped() = 0;

    virtual void onConnected(const BleAddress& address, uint16_t connHandle) = 0;
    virtual void onConnectFailed(const BleAddress& address, uint8_t status) = 0;

    /**
     * @brief Characteristic discovery finished
     * @param ok false if the query failed; commandHandle is 0 if the
     *           command characteristic is missing
     */
    virtual void onCharacteristicsDiscovered(uint16_t connHandle, bool ok,
                                             const CarCharacteristics& chars) = 0;

    virtual void onDisconnected(uint16_t connHandle, uint8_t reason) = 0;

    // Asynchronous transport failure of an accepted write
    virtual void onWriteFailed(uint16_t connHandle, uint8_t status) = 0;

    // Battery read result or Battery Level notification
    virtual void onBatteryLevel(uint16_t connHandle, uint8_t percent) = 0;
    virtual void onStatusNotification(uint16_t connHandle, const uint8_t* data, uint16_t length) = 0;
};

// ========================== Radio Commands ==========================
class BleRadio {
public:
    virtual ~BleRadio() {}

    virtual void setListener(BleRadioListener* listener) = 0;

    // false while the stack is not up or the radio is disabled
    virtual bool isPoweredOn() const = 0;

    virtual bool startScan() = 0;
    virtual void stopScan() = 0;

    virtual bool connect(const BleAddress& address) = 0;
    virtual void cancelConnect(const BleAddress& address) = 0;
    virtual void disconnect(uint16_t connHandle) = 0;

    // Looks up the car service and its command / status / battery characteristics
    virtual bool discoverCharacteristics(uint16_t connHandle) = 0;

    // Subscribe to a notifying characteristic (status or battery level)
    virtual bool enableNotifications(uint16_t connHandle, uint16_t valueHandle) = 0;
    virtual bool readBattery(uint16_t connHandle, uint16_t batteryHandle) = 0;

    /**
     * @brief Write without response
     *
     * A write accepted before disconnect() for the same connection reaches
     * the car before the link is released.
     * @param valueHandle Command characteristic value handle, resolved once per connection
     */
    virtual RadioWriteResult writeCommand(uint16_t connHandle, uint16_t valueHandle,
                                          const uint8_t* data, uint16_t length) = 0;

    // Deliver queued events to the listener (call from the control task)
    virtual void poll() = 0;
};

#endif // BLE_RADIO_H
