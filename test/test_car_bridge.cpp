#include "car_bridge.h"

#include "mock_gamepads.h"
#include "mock_radio.h"

#include <cassert>
#include <cstring>
#include <iostream>

class RecordingBridgeListener : public BridgeListener
{
public:
    int devicesFound = 0;
    int scansFinished = 0;
    ScanState lastScanState = SCAN_IDLE;
    int statusEvents = 0;
    uint8_t lastStatusSlot = 0xFF;
    LinkStatus lastStatus = LINK_IDLE;
    int batteryEvents = 0;
    uint8_t lastBattery = 0;
    int carStatusEvents = 0;
    int telemetryEvents = 0;
    int faults = 0;

    void onDeviceFound(const DiscoveredDevice &device, uint8_t index) override
    {
        (void)device;
        (void)index;
        devicesFound++;
    }

    void onScanFinished(ScanState state, uint8_t deviceCount) override
    {
        (void)deviceCount;
        scansFinished++;
        lastScanState = state;
    }

    void onLinkStatus(uint8_t slot, LinkStatus status, BridgeError reason) override
    {
        (void)reason;
        statusEvents++;
        lastStatusSlot = slot;
        lastStatus = status;
    }

    void onBattery(uint8_t slot, uint8_t percent) override
    {
        (void)slot;
        batteryEvents++;
        lastBattery = percent;
    }

    void onCarStatus(uint8_t slot, const StatusReport &report) override
    {
        (void)slot;
        (void)report;
        carStatusEvents++;
    }

    void onTelemetry(const Telemetry &telemetry) override
    {
        (void)telemetry;
        telemetryEvents++;
    }

    void onUnitFault(uint8_t slot, BridgeError err) override
    {
        (void)slot;
        (void)err;
        faults++;
    }
};

// Scan and find SF-24 at makeAddress(1) and F1-75 at makeAddress(2)
static void scanTwoCars(CarBridge &bridge, MockRadio &radio, uint32_t nowMs)
{
    assert(bridge.startScan(nowMs) == BRIDGE_OK);
    radio.listener->onAdvertisement(makeAddress(1), "SL-SF-24", -55);
    radio.listener->onAdvertisement(makeAddress(9), "RandomDevice", -30);
    radio.listener->onAdvertisement(makeAddress(2), "SL-F1-75", -70);
    bridge.update(nowMs + bridge.getConfig().scanWindowMs);
    assert(!bridge.isScanning());
    assert(bridge.getDeviceCount() == 2);
}

static void testBeginAndScan()
{
    MockRadio radio;
    MockGamepads pads;
    CarBridge bridge(radio, pads);
    RecordingBridgeListener listener;

    radio.poweredOn = false;
    assert(!bridge.begin(&listener));
    assert(radio.listener == &bridge);
    assert(!bridge.isRadioOn());
    assert(bridge.startScan(0) == BRIDGE_ERR_SCAN_UNAVAILABLE);
    assert(listener.lastScanState == SCAN_FAILED);

    radio.poweredOn = true;
    assert(bridge.begin(&listener));

    size_t count = 0;
    const CarModel *models = bridge.listModels(count);
    assert(count == 20);
    assert(models != nullptr);

    assert(bridge.startScan(1000) == BRIDGE_OK);
    assert(bridge.isScanning());
    radio.listener->onAdvertisement(makeAddress(1), "SL-SF-24", -55);
    radio.listener->onAdvertisement(makeAddress(9), "RandomDevice", -30);
    assert(bridge.getDeviceCount() == 1);
    assert(listener.devicesFound == 1);
    assert(std::strcmp(bridge.getDevice(0)->model->internalName, "SF24") == 0);

    bridge.update(3999);
    assert(bridge.isScanning());
    assert(radio.pollCalls == 1);
    bridge.update(4000);
    assert(!bridge.isScanning());
    assert(listener.lastScanState == SCAN_COMPLETE);
    assert(radio.stopScanCalls == 1);

    // Explicit window and cancel
    assert(bridge.startScan(10000, 5000) == BRIDGE_OK);
    bridge.update(9000);
    assert(bridge.isScanning());
    bridge.cancelScan();
    assert(listener.lastScanState == SCAN_CANCELLED);

    // Radio stopped scanning by itself
    assert(bridge.startScan(20000) == BRIDGE_OK);
    radio.listener->onScanStopped();
    assert(!bridge.isScanning());
}

static void testConnectAndRoute()
{
    MockRadio radio;
    MockGamepads pads;
    CarBridge bridge(radio, pads);
    RecordingBridgeListener listener;
    assert(bridge.begin(&listener));
    scanTwoCars(bridge, radio, 0);

    // Bad arguments
    assert(bridge.connect(SLR_MAX_SLOTS, 0, 5000) == BRIDGE_ERR_INVALID_ARGUMENT);
    assert(bridge.connect(0, 7, 5000) == BRIDGE_ERR_INVALID_ARGUMENT);
    DiscoveredDevice unknown;
    assert(bridge.connect(0, unknown, 5000) == BRIDGE_ERR_INVALID_ARGUMENT);
    assert(radio.connectCalls == 0);

    assert(bridge.connect(0, 0, 5000) == BRIDGE_OK);
    assert(radio.lastConnectAddress == makeAddress(1));
    assert(bridge.getStatus(0) == LINK_CONNECTING);
    assert(listener.lastStatusSlot == 0);

    // One car, one slot
    assert(bridge.connect(1, 0, 5000) == BRIDGE_ERR_INVALID_ARGUMENT);

    assert(bridge.connect(1, 1, 5000) == BRIDGE_OK);
    assert(radio.lastConnectAddress == makeAddress(2));

    // Completions are routed by address
    radio.listener->onConnected(makeAddress(2), 0x41);
    assert(radio.lastDiscoverHandle == 0x41);
    radio.listener->onConnected(makeAddress(1), 0x40);
    assert(radio.lastDiscoverHandle == 0x40);

    // A connection nobody asked for is dropped
    radio.listener->onConnected(makeAddress(5), 0x55);
    assert(radio.disconnectCalls == 1);
    assert(radio.lastDisconnectHandle == 0x55);

    // Then by connection handle
    radio.listener->onCharacteristicsDiscovered(0x40, true, makeCarChars());
    assert(bridge.getStatus(0) == LINK_READY);
    assert(bridge.getStatus(1) == LINK_CONNECTING);
    assert(bridge.anyReady());

    radio.listener->onCharacteristicsDiscovered(0x77, true, makeCarChars());
    assert(bridge.getStatus(1) == LINK_CONNECTING);

    radio.listener->onBatteryLevel(0x40, 55);
    assert(listener.lastBattery == 55);
    assert(bridge.getTelemetry(0).batteryPct == 55);

    const uint8_t echo[] = {1, 0, 0, 0, 0, 0, 0, 0};
    radio.listener->onStatusNotification(0x40, echo, sizeof(echo));
    assert(listener.carStatusEvents == 1);
    radio.listener->onStatusNotification(0x99, echo, sizeof(echo));
    assert(listener.carStatusEvents == 1);

    assert(bridge.requestBattery(0) == BRIDGE_OK);
    assert(bridge.requestBattery(1) == BRIDGE_ERR_NOT_CONNECTED);
    assert(bridge.requestBattery(SLR_MAX_SLOTS) == BRIDGE_ERR_INVALID_ARGUMENT);

    // Failure for slot 1 does not touch slot 0
    radio.listener->onDisconnected(0x41, 0x3E);
    assert(bridge.getStatus(1) == LINK_FAILED);
    assert(bridge.getStatus(0) == LINK_READY);
    assert(listener.lastStatus == LINK_FAILED);
}

static void testConnectByAddress()
{
    MockRadio radio;
    MockGamepads pads;
    CarBridge bridge(radio, pads);
    RecordingBridgeListener listener;
    assert(bridge.begin(&listener));

    // Never scanned: a model is required
    BleAddress typed;
    assert(parseAddress("C0:11:22:33:44:03", typed));
    assert(bridge.connect(0, typed, nullptr, 0) == BRIDGE_ERR_INVALID_ARGUMENT);
    assert(bridge.connect(SLR_MAX_SLOTS, typed, findCarModel("330P"), 0) == BRIDGE_ERR_INVALID_ARGUMENT);
    assert(radio.connectCalls == 0);

    // Models that never advertise can still be driven
    assert(bridge.connect(0, typed, findCarModel("330P"), 0) == BRIDGE_OK);
    assert(radio.connectCalls == 1);
    assert(radio.lastConnectAddress == typed);
    assert(radio.lastConnectAddress.type == 0);
    assert(bridge.getStatus(0) == LINK_CONNECTING);
    radio.listener->onConnected(typed, 0x50);
    radio.listener->onCharacteristicsDiscovered(0x50, true, makeCarChars());
    assert(bridge.getStatus(0) == LINK_READY);

    // A scanned car keeps its address type and model
    scanTwoCars(bridge, radio, 100);
    BleAddress second;
    assert(parseAddress("C0:11:22:33:44:02", second));
    assert(bridge.connect(1, second, nullptr, 3200) == BRIDGE_OK);
    assert(radio.lastConnectAddress == makeAddress(2));
    assert(bridge.getStatus(1) == LINK_CONNECTING);

    // Still one car per slot
    assert(bridge.connect(2, second, findCarModel("F175"), 3200) == BRIDGE_ERR_INVALID_ARGUMENT);
    assert(radio.connectCalls == 2);
}

static void testDrivingAndRecovery()
{
    MockRadio radio;
    MockGamepads pads;
    CarBridge bridge(radio, pads);
    RecordingBridgeListener listener;
    assert(bridge.begin(&listener));
    scanTwoCars(bridge, radio, 0);

    assert(bridge.connect(0, 0, 3000) == BRIDGE_OK);
    radio.listener->onConnected(makeAddress(1), 0x40);
    radio.listener->onCharacteristicsDiscovered(0x40, true, makeCarChars());

    pads.plug(0);
    pads.pads[0].axisX = -512;
    pads.pads[0].buttons = PAD_BUTTON_A;
    bridge.update(3050);
    assert(radio.writesFor(0x40) == 1);
    CommandFrame frame = radio.lastFrameFor(0x40);
    assert(frame.forward == 1);
    assert(frame.left == 1);
    assert(frame.lights == 0);

    // Console toggle shows up in the next frame
    assert(bridge.toggleFlag(0, FLAG_LIGHTS) == BRIDGE_OK);
    assert(bridge.getLatchedFlags(0) & FLAG_LIGHTS);
    assert(bridge.toggleFlag(SLR_MAX_SLOTS, FLAG_LIGHTS) == BRIDGE_ERR_INVALID_ARGUMENT);
    bridge.update(3100);
    assert(radio.lastFrameFor(0x40).lights == 1);

    // Write failure reported by the radio
    radio.listener->onWriteFailed(0x40, 0x57);
    assert(bridge.getStatus(0) == LINK_DISCONNECTED);
    bridge.update(3599);
    assert(bridge.getStatus(0) == LINK_DISCONNECTED);
    bridge.update(3600);
    assert(bridge.getStatus(0) == LINK_CONNECTING);
    assert(radio.connectCalls == 2);

    // Reconnect uses a new handle
    radio.listener->onConnected(makeAddress(1), 0x48);
    radio.listener->onCharacteristicsDiscovered(0x48, true, makeCarChars());
    assert(bridge.getStatus(0) == LINK_READY);
    bridge.update(3650);
    assert(radio.writesFor(0x48) == 1);

    // Old handle is gone
    radio.listener->onDisconnected(0x40, 0x08);
    assert(bridge.getStatus(0) == LINK_READY);

    assert(bridge.disconnect(0) == BRIDGE_OK);
    assert(bridge.getStatus(0) == LINK_IDLE);
    assert(framesEqual(radio.lastFrameFor(0x48), neutralFrame()));

    // Slot can be driven again after the user retries
    assert(bridge.retry(0, 4000) == BRIDGE_OK);
    assert(bridge.getStatus(0) == LINK_CONNECTING);
    assert(bridge.retry(SLR_MAX_SLOTS, 4000) == BRIDGE_ERR_INVALID_ARGUMENT);
}

static void testShutdown()
{
    MockRadio radio;
    MockGamepads pads;
    CarBridge bridge(radio, pads);
    RecordingBridgeListener listener;
    assert(bridge.begin(&listener));
    scanTwoCars(bridge, radio, 0);

    assert(bridge.connect(0, 0, 3000) == BRIDGE_OK);
    assert(bridge.connect(1, 1, 3000) == BRIDGE_OK);
    radio.listener->onConnected(makeAddress(1), 0x40);
    radio.listener->onCharacteristicsDiscovered(0x40, true, makeCarChars());
    radio.listener->onConnected(makeAddress(2), 0x41);
    radio.listener->onCharacteristicsDiscovered(0x41, true, makeCarChars());

    assert(bridge.startScan(3000) == BRIDGE_OK);
    bridge.end();
    assert(!bridge.isScanning());
    assert(framesEqual(radio.lastFrameFor(0x40), neutralFrame()));
    assert(framesEqual(radio.lastFrameFor(0x41), neutralFrame()));
    assert(bridge.getStatus(0) == LINK_IDLE);
    assert(bridge.getStatus(1) == LINK_IDLE);
    assert(radio.listener == nullptr);

    // Not running any more
    int polls = radio.pollCalls;
    bridge.update(10000);
    assert(radio.pollCalls == polls);
}

int main()
{
    testBeginAndScan();
    testConnectAndRoute();
    testConnectByAddress();
    testDrivingAndRecovery();
    testShutdown();

    std::cout << "All tests passed\n";
    return 0;
}
