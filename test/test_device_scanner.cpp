#include "device_scanner.h"

#include "mock_radio.h"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <iostream>

class RecordingScanListener : public ScanListener
{
public:
    int found = 0;
    int finished = 0;
    ScanState lastState = SCAN_IDLE;
    uint8_t lastCount = 0;
    uint8_t lastIndex = 0xFF;

    void onDeviceFound(const DiscoveredDevice &device, uint8_t index) override
    {
        (void)device;
        found++;
        lastIndex = index;
    }

    void onScanFinished(ScanState state, uint8_t deviceCount) override
    {
        finished++;
        lastState = state;
        lastCount = deviceCount;
    }
};

static void testRadioOff()
{
    MockRadio radio;
    DeviceScanner scanner(radio);
    RecordingScanListener listener;
    scanner.setListener(&listener);

    radio.poweredOn = false;
    assert(scanner.begin(3000, 0) == BRIDGE_ERR_SCAN_UNAVAILABLE);
    assert(scanner.getState() == SCAN_FAILED);
    assert(radio.startScanCalls == 0);
    assert(listener.finished == 1);
    assert(listener.lastState == SCAN_FAILED);

    // Radio refuses the scan
    radio.poweredOn = true;
    radio.startScanResult = false;
    assert(scanner.begin(3000, 0) == BRIDGE_ERR_SCAN_UNAVAILABLE);
    assert(scanner.getState() == SCAN_FAILED);
    assert(radio.startScanCalls == 1);
    assert(listener.finished == 2);
}

static void testFiltersAndDeduplicates()
{
    MockRadio radio;
    DeviceScanner scanner(radio);
    RecordingScanListener listener;
    scanner.setListener(&listener);

    assert(scanner.begin(3000, 1000) == BRIDGE_OK);
    assert(scanner.isRunning());
    assert(radio.startScanCalls == 1);

    scanner.handleAdvertisement(makeAddress(1), "SL-SF-24", -60);
    scanner.handleAdvertisement(makeAddress(2), "RandomDevice", -40);
    scanner.handleAdvertisement(makeAddress(3), "---", -40);
    scanner.handleAdvertisement(makeAddress(4), "", -40);

    assert(scanner.getDeviceCount() == 1);
    assert(listener.found == 1);
    assert(listener.lastIndex == 0);
    const DiscoveredDevice *dev = scanner.getDevice(0);
    assert(dev != nullptr);
    assert(std::strcmp(dev->model->internalName, "SF24") == 0);
    assert(std::strcmp(dev->advertisedName, "SL-SF-24") == 0);
    assert(dev->address == makeAddress(1));
    assert(dev->rssi == -60);

    // Same car again: rssi refreshed, no new entry
    scanner.handleAdvertisement(makeAddress(1), "SL-SF-24", -52);
    assert(scanner.getDeviceCount() == 1);
    assert(listener.found == 1);
    assert(scanner.getDevice(0)->rssi == -52);

    // Same address, other address type is another device
    BleAddress publicAddr = makeAddress(1);
    publicAddr.type = 0;
    scanner.handleAdvertisement(publicAddr, "SL-SF-24", -70);
    assert(scanner.getDeviceCount() == 2);

    scanner.handleAdvertisement(makeAddress(5), "SL-SF90 Spider N", -70);
    assert(scanner.getDeviceCount() == 3);
    assert(std::strcmp(scanner.getDevice(2)->model->internalName, "SF90SPIDER(BLACK)") == 0);
    assert(scanner.findDevice(makeAddress(5)) == scanner.getDevice(2));
    assert(scanner.findDevice(makeAddress(9)) == nullptr);
    assert(scanner.getDevice(3) == nullptr);

    // No catalog entry without a Bluetooth name ever shows up
    for (uint8_t i = 0; i < scanner.getDeviceCount(); i++) {
        assert(isAdvertisable(*scanner.getDevice(i)->model));
    }
}

static void testWindow()
{
    MockRadio radio;
    DeviceScanner scanner(radio);
    RecordingScanListener listener;
    scanner.setListener(&listener);

    assert(scanner.begin(3000, 1000) == BRIDGE_OK);
    scanner.handleAdvertisement(makeAddress(1), "SL-F1-75", -60);

    scanner.tick(3999);
    assert(scanner.isRunning());
    assert(radio.stopScanCalls == 0);

    scanner.tick(4000);
    assert(scanner.getState() == SCAN_COMPLETE);
    assert(radio.stopScanCalls == 1);
    assert(listener.finished == 1);
    assert(listener.lastState == SCAN_COMPLETE);
    assert(listener.lastCount == 1);

    // Late advertisements are ignored, results stay available
    scanner.handleAdvertisement(makeAddress(2), "SL-SF-23", -60);
    assert(scanner.getDeviceCount() == 1);
    scanner.tick(9000);
    assert(listener.finished == 1);

    // New session starts empty
    assert(scanner.begin(3000, 10000) == BRIDGE_OK);
    assert(scanner.getDeviceCount() == 0);
    assert(scanner.getDevice(0) == nullptr);
}

static void testCancelAndRestart()
{
    MockRadio radio;
    DeviceScanner scanner(radio);
    RecordingScanListener listener;
    scanner.setListener(&listener);

    // Cancel without a session does nothing
    scanner.cancel();
    assert(radio.stopScanCalls == 0);
    assert(listener.finished == 0);

    assert(scanner.begin(3000, 0) == BRIDGE_OK);
    scanner.handleAdvertisement(makeAddress(1), "SL-Purosangue", -60);
    scanner.cancel();
    assert(scanner.getState() == SCAN_CANCELLED);
    assert(radio.stopScanCalls == 1);
    assert(listener.lastState == SCAN_CANCELLED);
    assert(scanner.getDeviceCount() == 1);

    // Restarting a running scan stops the old one first
    assert(scanner.begin(3000, 100) == BRIDGE_OK);
    assert(scanner.begin(5000, 200) == BRIDGE_OK);
    assert(radio.stopScanCalls == 2);
    assert(radio.startScanCalls == 3);
    scanner.tick(5100);
    assert(scanner.isRunning());
    scanner.tick(5200);
    assert(scanner.getState() == SCAN_COMPLETE);

    // Stack stopped the scan on its own
    assert(scanner.begin(3000, 6000) == BRIDGE_OK);
    scanner.handleScanStopped();
    assert(scanner.getState() == SCAN_COMPLETE);
    scanner.handleScanStopped();
    assert(scanner.getState() == SCAN_COMPLETE);
}

static void testCapacity()
{
    MockRadio radio;
    DeviceScanner scanner(radio);
    assert(scanner.begin(3000, 0) == BRIDGE_OK);

    for (int i = 0; i < SLR_MAX_DISCOVERED + 4; i++) {
        scanner.handleAdvertisement(makeAddress((uint8_t)i), "SL-Shell Car", -60);
    }
    assert(scanner.getDeviceCount() == SLR_MAX_DISCOVERED);

    // Long names are truncated, not overflowed
    char longName[64];
    std::snprintf(longName, sizeof(longName), "SL-Daytona SP3 %s", "with a very long suffix added");
    assert(scanner.begin(3000, 10) == BRIDGE_OK);
    scanner.handleAdvertisement(makeAddress(1), longName, -60);
    assert(scanner.getDeviceCount() == 1);
    assert(std::strlen(scanner.getDevice(0)->advertisedName) == SLR_MAX_NAME_LENGTH - 1);
}

int main()
{
    testRadioOff();
    testFiltersAndDeduplicates();
    testWindow();
    testCancelAndRestart();
    testCapacity();

    std::cout << "All tests passed\n";
    return 0;
}
