#include "serial_console.h"

#include <Bluepad32.h>
#include <string.h>

void SerialConsole::begin(CarBridge* bridge) {
    _bridge = bridge;
    _lineBufferPos = 0;

    Serial.println("[CON] Console ready, type 'help' for commands");
}

void SerialConsole::process() {
    char buffer[SLR_CONSOLE_LINE_MAX];
    if (readLine(buffer, sizeof(buffer))) {
        execute(parseConsoleLine(buffer));
    }
}

bool SerialConsole::readLine(char* buffer, size_t bufferSize) {
    while (Serial.available() > 0) {
        char c = Serial.read();

        if (c == '\n' || c == '\r') {
            if (_lineBufferPos > 0) {
                _lineBuffer[_lineBufferPos] = '\0';
                strncpy(buffer, _lineBuffer, bufferSize - 1);
                buffer[bufferSize - 1] = '\0';
                _lineBufferPos = 0;
                return true;
            }
        } else if (_lineBufferPos < SLR_CONSOLE_LINE_MAX - 1) {
            _lineBuffer[_lineBufferPos++] = c;
        }
    }
    return false;
}

void SerialConsole::execute(const ConsoleCommand& cmd) {
    if (_bridge == nullptr) return;
    uint32_t now = millis();

    switch (cmd.type) {
        case CONSOLE_EMPTY:
            break;

        case CONSOLE_HELP:
            printHelp();
            break;

        case CONSOLE_MODELS:
            printModels();
            break;

        case CONSOLE_SCAN:
            startScan(cmd.durationMs);
            break;

        case CONSOLE_STOP:
            _bridge->cancelScan();
            break;

        case CONSOLE_LIST:
            printDevices();
            break;

        case CONSOLE_CONNECT: {
            BridgeError err = cmd.byAddress
                ? _bridge->connect(cmd.slot, cmd.address, cmd.model, now)
                : _bridge->connect(cmd.slot, cmd.device, now);
            printResult("connect", cmd.slot, err);
            break;
        }

        case CONSOLE_DISCONNECT:
            printResult("disconnect", cmd.slot, _bridge->disconnect(cmd.slot));
            break;

        case CONSOLE_RETRY:
            printResult("retry", cmd.slot, _bridge->retry(cmd.slot, now));
            break;

        case CONSOLE_BATTERY:
            printResult("battery", cmd.slot, _bridge->requestBattery(cmd.slot));
            break;

        case CONSOLE_TOGGLE: {
            BridgeError err = _bridge->toggleFlag(cmd.slot, cmd.flag);
            if (err == BRIDGE_OK) {
                bool on = (_bridge->getLatchedFlags(cmd.slot) & cmd.flag) != 0;
                Serial.printf("[CON] Slot %u %s %s\n", cmd.slot, getFlagName(cmd.flag), on ? "ON" : "OFF");
            } else {
                printResult(getFlagName(cmd.flag), cmd.slot, err);
            }
            break;
        }

        case CONSOLE_STATUS:
            printStatus();
            break;

        case CONSOLE_QUIT:
            _bridge->shutdown();
            Serial.println("[CON] All cars stopped and released");
            break;

        case CONSOLE_BAD_ARGUMENTS:
            Serial.println("[CON] Missing or invalid number, type 'help'");
            break;

        case CONSOLE_UNKNOWN:
        default:
            Serial.println("[CON] Unknown command, type 'help'");
            break;
    }
}

void SerialConsole::startScan(uint32_t durationMs) {
    // Bluepad32 stops its own scan while new gamepad connections are off
    BP32.enableNewBluetoothConnections(false);

    uint32_t window = durationMs > 0 ? durationMs : _bridge->getConfig().scanWindowMs;
    BridgeError err = _bridge->startScan(window, millis());
    if (err == BRIDGE_OK) {
        Serial.printf("[SCAN] Scanning for %lu ms...\n", (unsigned long)window);
    }
    // Failure is reported through onScanFinished()
}

void SerialConsole::printHelp() {
    Serial.println("=== Available Commands ===");
    Serial.println("  help                - Show this help");
    Serial.println("  models              - List supported car models");
    Serial.println("  scan [ms]           - Scan for cars");
    Serial.println("  stop                - Cancel the running scan");
    Serial.println("  list                - Show cars found by the last scan");
    Serial.println("  connect <slot> <n>  - Drive car n with gamepad slot");
    Serial.println("  connect <slot> <addr> [model]");
    Serial.println("                      - Drive a car by address, no scan needed");
    Serial.println("  disconnect <slot>   - Stop and release the car of a slot");
    Serial.println("  retry <slot>        - Reconnect a failed slot");
    Serial.println("  battery <slot>      - Read the car battery");
    Serial.println("  lights <slot>       - Toggle lights");
    Serial.println("  turbo <slot>        - Toggle turbo");
    Serial.println("  donut <slot>        - Toggle donut");
    Serial.println("  mode <slot>         - Toggle sport mode");
    Serial.println("  status              - Show all slots");
    Serial.println("  quit                - Stop and release all cars");
    Serial.println("==========================");
}

void SerialConsole::printModels() {
    size_t count = 0;
    const CarModel* models = _bridge->listModels(count);

    Serial.println("=== Car Models ===");
    for (size_t i = 0; i < count; i++) {
        Serial.printf("  %-18s %-28s %s\n",
                      models[i].internalName,
                      getCarLabel(models[i]),
                      isAdvertisable(models[i]) ? models[i].bluetoothName : "(not advertised)");
    }
}

void SerialConsole::printDevice(const DiscoveredDevice& device, uint8_t index) {
    char addr[18];
    formatAddress(device.address, addr, sizeof(addr));
    Serial.printf("  [%u] %-28s %-20s %s RSSI:%d\n",
                  index, getCarLabel(*device.model), device.advertisedName, addr, device.rssi);
}

void SerialConsole::printDevices() {
    uint8_t count = _bridge->getDeviceCount();
    if (count == 0) {
        Serial.println("[SCAN] No cars found, run 'scan'");
        return;
    }
    Serial.println("=== Cars Found ===");
    for (uint8_t i = 0; i < count; i++) {
        const DiscoveredDevice* device = _bridge->getDevice(i);
        if (device != nullptr) {
            printDevice(*device, i);
        }
    }
}

void SerialConsole::printStatus() {
    Serial.printf("=== Bridge Status === radio=%s scanning=%s\n",
                  _bridge->isRadioOn() ? "on" : "off",
                  _bridge->isScanning() ? "yes" : "no");
    for (uint8_t slot = 0; slot < SLR_MAX_SLOTS; slot++) {
        Telemetry t = _bridge->getTelemetry(slot);
        uint8_t flags = _bridge->getLatchedFlags(slot);
        Serial.printf("  slot %u: %-12s pad=%s lights=%d donut=%d sport=%d",
                      slot, getLinkStatusName(t.status), t.controllerPresent ? "yes" : "no",
                      (flags & FLAG_LIGHTS) ? 1 : 0, (flags & FLAG_DONUT) ? 1 : 0,
                      (flags & FLAG_SPORT_MODE) ? 1 : 0);
        if (t.hasBattery) {
            Serial.printf(" bat=%u%%", t.batteryPct);
        }
        Serial.println();
    }
}

void SerialConsole::printResult(const char* what, uint8_t slot, BridgeError err) {
    if (err == BRIDGE_OK) return;
    Serial.printf("[CON] %s slot %u: %s\n", what, slot, getErrorName(err));
}

// ============================================================================
// Bridge events
// ============================================================================

void SerialConsole::onDeviceFound(const DiscoveredDevice& device, uint8_t index) {
    Serial.print("[SCAN] Found");
    printDevice(device, index);
}

void SerialConsole::onScanFinished(ScanState state, uint8_t deviceCount) {
    Serial.printf("[SCAN] %s, %u car(s) found\n", getScanStateName(state), deviceCount);
    if (state == SCAN_FAILED) {
        Serial.println("[SCAN] Bluetooth is not ready, try again in a moment");
    }
    // Let more gamepads pair again
    BP32.enableNewBluetoothConnections(true);
}

void SerialConsole::onLinkStatus(uint8_t slot, LinkStatus status, BridgeError reason) {
    if (reason == BRIDGE_OK) {
        Serial.printf("[LINK] Slot %u -> %s\n", slot, getLinkStatusName(status));
    } else {
        Serial.printf("[LINK] Slot %u -> %s (%s)\n", slot, getLinkStatusName(status), getErrorName(reason));
    }
    if (status == LINK_FAILED) {
        Serial.printf("[LINK] Slot %u gave up, use 'retry %u'\n", slot, slot);
    }
}

void SerialConsole::onBattery(uint8_t slot, uint8_t percent) {
    Serial.printf("[LINK] Slot %u battery %u%%\n", slot, percent);
}

void SerialConsole::onCarStatus(uint8_t slot, const StatusReport& report) {
    if (report.kind == STATUS_CONTROL) {
        char hex[17];
        formatFrameHex(report.control, hex, sizeof(hex));
        Serial.printf("[LINK] Slot %u car state %s\n", slot, hex);
        return;
    }
    Serial.printf("[LINK] Slot %u status (%u bytes):", slot, report.length);
    for (uint16_t i = 0; i < report.length && i < SLR_STATUS_RAW_MAX; i++) {
        Serial.printf(" %02X", report.raw[i]);
    }
    Serial.println();
}

void SerialConsole::onTelemetry(const Telemetry& t) {
    if (!_telemetryEnabled || t.status != LINK_READY) return;

    char hex[17] = "-";
    if (t.hasFrame) {
        formatFrameHex(t.lastFrame, hex, sizeof(hex));
    }
    Serial.printf("[CMD] slot=%u %s %s/%s pad=%d sent=%lu dropped=%lu",
                  t.slot, hex,
                  t.hasFrame ? throttleLabel(t.lastFrame) : "-",
                  t.hasFrame ? steeringLabel(t.lastFrame) : "-",
                  t.controllerPresent, t.framesSent, t.framesDropped);
    if (t.hasBattery) {
        Serial.printf(" bat=%u%%", t.batteryPct);
    }
    Serial.println();
}

void SerialConsole::onUnitFault(uint8_t slot, BridgeError err) {
    Serial.printf("[SAFETY] Slot %u stopped: %s, use 'retry %u'\n", slot, getErrorName(err), slot);
}
