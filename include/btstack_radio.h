/**
 * @file btstack_radio.h
 * @brief BleRadio on top of the BTstack instance started by Bluepad32
 *
 * Bluepad32 owns BTstack and runs it on its own FreeRTOS task. The car
 * links use the same stack as a plain BLE central (GAP scan/connect plus
 * the GATT client), so two tasks are involved:
 *
 *   Arduino task:  BleRadio calls  -> command queue  -> BTstack task
 *   BTstack task:  HCI/GATT events -> event queue    -> poll() -> listener
 *
 * Outbound command frames do not go through the command queue. Each
 * connection has a one-slot mailbox (xQueueOverwrite): a frame that was not
 * sent yet is replaced by the newer one instead of piling up.
 *
 * Scanning for cars shares the radio with Bluepad32's own gamepad scan.
 * Stop new gamepad connections while a car scan is running
 * (BP32.enableNewBluetoothConnections(false)).
 */

#ifndef BTSTACK_RADIO_H
#define BTSTACK_RADIO_H

#include <Arduino.h>

#include "ble_radio.h"
#include "bridge_config.h"

// Queue depths
#ifndef SLR_RADIO_EVENT_QUEUE_LEN
  #define SLR_RADIO_EVENT_QUEUE_LEN    32
#endif
#ifndef SLR_RADIO_COMMAND_QUEUE_LEN
  #define SLR_RADIO_COMMAND_QUEUE_LEN  16
#endif

class BtstackRadio : public BleRadio {
public:
    BtstackRadio();

    /**
     * @brief Create the queues and register with BTstack
     *
     * Call after BP32.setup(). Registration happens on the BTstack task.
     * @return false if the queues could not be allocated
     */
    bool begin();

    void setListener(BleRadioListener* listener) override { _listener = listener; }
    bool isPoweredOn() const override;

    bool startScan() override;
    void stopScan() override;

    bool connect(const BleAddress& address) override;
    void cancelConnect(const BleAddress& address) override;
    void disconnect(uint16_t connHandle) override;

    bool discoverCharacteristics(uint16_t connHandle) override;
    bool enableNotifications(uint16_t connHandle, uint16_t valueHandle) override;
    bool readBattery(uint16_t connHandle, uint16_t batteryHandle) override;

    RadioWriteResult writeCommand(uint16_t connHandle, uint16_t valueHandle,
                                  const uint8_t* data, uint16_t length) override;

    void poll() override;

    // Events lost because the event queue was full
    unsigned long getDroppedEvents() const;

private:
    int mailboxFor(uint16_t connHandle) const;

    BleRadioListener* _listener = nullptr;
    bool _started = false;

    // Arduino-side view of which connection uses which mailbox
    uint16_t _mailboxHandles[SLR_MAX_SLOTS];

    unsigned long _reportedDrops = 0;
};

#endif // BTSTACK_RADIO_H
