#ifndef MOCK_RADIO_H
#define MOCK_RADIO_H

#include <string.h>

#include "ble_radio.h"
#include "car_protocol.h"

// Records every call. Radio events are injected by calling the listener
// (or the module under test) directly.
class MockRadio : public BleRadio {
public:
    static const int kMaxTracked = 8;

    // Behaviour knobs
    bool poweredOn = true;
    bool startScanResult = true;
    bool connectResult = true;
    bool discoverResult = true;
    RadioWriteResult writeResult = RADIO_WRITE_OK;

    // Call log
    BleRadioListener* listener = nullptr;
    int startScanCalls = 0;
    int stopScanCalls = 0;
    int connectCalls = 0;
    int cancelConnectCalls = 0;
    int disconnectCalls = 0;
    int discoverCalls = 0;
    int subscribeCalls = 0;
    int batteryReads = 0;
    int pollCalls = 0;
    int writeCalls = 0;

    // Order of calls, to check what reached the radio first
    int callSeq = 0;
    int lastWriteSeq = 0;
    int lastDisconnectSeq = 0;

    BleAddress lastConnectAddress;
    uint16_t lastDisconnectHandle = SLR_INVALID_CONN_HANDLE;
    uint16_t lastDiscoverHandle = SLR_INVALID_CONN_HANDLE;
    uint16_t lastSubscribeHandle = 0;
    uint16_t subscribed[kMaxTracked] = {};
    uint16_t lastBatteryHandle = 0;
    uint16_t lastWriteConn = SLR_INVALID_CONN_HANDLE;
    uint16_t lastWriteValueHandle = 0;
    uint16_t lastWriteLength = 0;
    CommandFrame lastWrite = {};

    void setListener(BleRadioListener* l) override { listener = l; }
    bool isPoweredOn() const override { return poweredOn; }

    bool startScan() override {
        startScanCalls++;
        return startScanResult;
    }

    void stopScan() override { stopScanCalls++; }

    bool connect(const BleAddress& address) override {
        connectCalls++;
        lastConnectAddress = address;
        return connectResult;
    }

    void cancelConnect(const BleAddress& address) override {
        (void)address;
        cancelConnectCalls++;
    }

    void disconnect(uint16_t connHandle) override {
        disconnectCalls++;
        lastDisconnectSeq = ++callSeq;
        lastDisconnectHandle = connHandle;
    }

    bool discoverCharacteristics(uint16_t connHandle) override {
        discoverCalls++;
        lastDiscoverHandle = connHandle;
        return discoverResult;
    }

    bool enableNotifications(uint16_t connHandle, uint16_t valueHandle) override {
        (void)connHandle;
        if (subscribeCalls < kMaxTracked) subscribed[subscribeCalls] = valueHandle;
        subscribeCalls++;
        lastSubscribeHandle = valueHandle;
        return true;
    }

    bool isSubscribed(uint16_t valueHandle) const {
        for (int i = 0; i < subscribeCalls && i < kMaxTracked; i++) {
            if (subscribed[i] == valueHandle) return true;
        }
        return false;
    }

    bool readBattery(uint16_t connHandle, uint16_t batteryHandle) override {
        (void)connHandle;
        batteryReads++;
        lastBatteryHandle = batteryHandle;
        return true;
    }

    RadioWriteResult writeCommand(uint16_t connHandle, uint16_t valueHandle,
                                  const uint8_t* data, uint16_t length) override {
        writeCalls++;
        lastWriteSeq = ++callSeq;
        lastWriteConn = connHandle;
        lastWriteValueHandle = valueHandle;
        lastWriteLength = length;

        int idx = track(connHandle);
        if (length == sizeof(CommandFrame)) {
            memcpy(&lastWrite, data, sizeof(CommandFrame));
            if (idx >= 0) memcpy(&_lastPerConn[idx], data, sizeof(CommandFrame));
        }
        if (idx >= 0) _writesPerConn[idx]++;
        return writeResult;
    }

    void poll() override { pollCalls++; }

    int writesFor(uint16_t connHandle) const {
        for (int i = 0; i < _trackedCount; i++) {
            if (_trackedHandles[i] == connHandle) return _writesPerConn[i];
        }
        return 0;
    }

    CommandFrame lastFrameFor(uint16_t connHandle) const {
        for (int i = 0; i < _trackedCount; i++) {
            if (_trackedHandles[i] == connHandle) return _lastPerConn[i];
        }
        CommandFrame none = {};
        return none;
    }

private:
    int track(uint16_t connHandle) {
        for (int i = 0; i < _trackedCount; i++) {
            if (_trackedHandles[i] == connHandle) return i;
        }
        if (_trackedCount >= kMaxTracked) return -1;
        _trackedHandles[_trackedCount] = connHandle;
        _writesPerConn[_trackedCount] = 0;
        return _trackedCount++;
    }

    uint16_t _trackedHandles[kMaxTracked] = {};
    int _writesPerConn[kMaxTracked] = {};
    CommandFrame _lastPerConn[kMaxTracked] = {};
    int _trackedCount = 0;
};

inline BleAddress makeAddress(uint8_t last) {
    BleAddress addr;
    addr.bytes[0] = 0xC0;
    addr.bytes[1] = 0x11;
    addr.bytes[2] = 0x22;
    addr.bytes[3] = 0x33;
    addr.bytes[4] = 0x44;
    addr.bytes[5] = last;
    addr.type = 1;
    return addr;
}

inline CarCharacteristics makeCarChars() {
    CarCharacteristics chars;
    chars.commandHandle = 0x0021;
    chars.statusHandle = 0x0023;
    chars.batteryHandle = 0x0031;
    return chars;
}

#endif // MOCK_RADIO_H
