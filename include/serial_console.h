/**
 * @file serial_console.h
 * @brief Serial Monitor front-end for the car bridge
 *
 * Reads commands from Serial (non-blocking, one line per process() call)
 * and prints scan results, link status and telemetry reported by the
 * bridge. Type 'help' for the command list.
 */

#ifndef SERIAL_CONSOLE_H
#define SERIAL_CONSOLE_H

#include <Arduino.h>

#include "car_bridge.h"
#include "console_command.h"

class SerialConsole : public BridgeListener {
public:
    void begin(CarBridge* bridge);

    // Handle at most one complete line from Serial
    void process();

    void setTelemetryEnabled(bool enable) { _telemetryEnabled = enable; }

    // ========== BridgeListener ==========
    void onDeviceFound(const DiscoveredDevice& device, uint8_t index) override;
    void onScanFinished(ScanState state, uint8_t deviceCount) override;
    void onLinkStatus(uint8_t slot, LinkStatus status, BridgeError reason) override;
    void onBattery(uint8_t slot, uint8_t percent) override;
    void onCarStatus(uint8_t slot, const StatusReport& report) override;
    void onTelemetry(const Telemetry& telemetry) override;
    void onUnitFault(uint8_t slot, BridgeError err) override;

private:
    bool readLine(char* buffer, size_t bufferSize);
    void execute(const ConsoleCommand& cmd);
    void startScan(uint32_t durationMs);

    void printHelp();
    void printModels();
    void printDevices();
    void printStatus();
    void printDevice(const DiscoveredDevice& device, uint8_t index);
    void printResult(const char* what, uint8_t slot, BridgeError err);

    CarBridge* _bridge = nullptr;
    bool _telemetryEnabled = true;

    char _lineBuffer[SLR_CONSOLE_LINE_MAX];
    size_t _lineBufferPos = 0;
};

#endif // SERIAL_CONSOLE_H
