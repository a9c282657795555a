/**
 * @file main.cpp
 * @brief ESP32 Bluetooth Gamepad Bridge for Shell Racing Legends cars
 *
 * Receives input from up to four Bluetooth gamepads via Bluepad32 and
 * drives Shell Racing Legends RC cars over BLE. Each gamepad slot gets its
 * own car; commands are refreshed every 50 ms.
 *
 * Setup:
 *   1. Flash, open the Serial Monitor at 115200 baud
 *   2. Pair a gamepad (LED blinks while no gamepad is connected)
 *   3. Switch the car on, type 'scan', then 'connect 0 <n>'
 *   4. LED is solid while at least one car link is ready
 *
 * Control Mapping:
 *   Left Joystick X-axis   -> Steering (left/right)
 *   Right Joystick Y-axis  -> Throttle (forward/backward)
 *   Button A / Button B    -> Full forward / full reverse
 *   D-Pad                  -> Full throttle / steering
 *   L2, R2 or R1           -> Turbo while held
 *   Select (Back)          -> Toggle lights
 *   Button Y               -> Toggle donut
 *   Button X               -> Toggle sport mode
 *
 * Safety:
 *   A car whose gamepad disconnects receives neutral frames (stops).
 *   A dropped car link reconnects automatically a few times, then gives up
 *   and waits for 'retry <slot>'.
 */

#include <Arduino.h>
#include <Bluepad32.h>

#include "bluepad32_source.h"
#include "bridge_config.h"
#include "btstack_radio.h"
#include "car_bridge.h"
#include "serial_console.h"

// Access Bluepad32 internals for the connection details print
extern "C" {
    #include "uni_hid_device.h"
    #include "uni_bt.h"
}

// ========================== PIN Configuration ==========================
// Status LED
#ifndef LED_PIN
  #ifdef CONFIG_IDF_TARGET_ESP32S3
    #define LED_PIN       48    // ESP32-S3 DevKit built-in RGB LED (WS2812) or use 2
  #else
    #define LED_PIN       2     // ESP32 DevKit built-in LED
  #endif
#endif

// ========================== Timing ==========================
#define LED_BLINK_MS            300    // Blink period while no gamepad is connected
#define LED_ERROR_BLINK_MS      100    // Fast blink: radio could not be started
#define STALE_CONTROLLER_MS     3000   // Force-disconnect a controller sending nothing
#define DEBUG_PRINT_MS          2000

// ========================== Global Variables ==========================
Bluepad32Source gamepads;
BtstackRadio radio;
CarBridge bridge(radio, gamepads);
SerialConsole console;

bool radioReady = false;
bool gamepadConnected = false;

// Connection stability: track controller health
unsigned long lastControllerDataTime = 0;

// LED blink state
unsigned long lastLedToggle = 0;
bool ledState = false;

// ========================== Bluepad32 Callbacks ==========================

void onConnectedController(ControllerPtr ctl) {
    int slot = gamepads.attach(ctl);
    if (slot < 0) {
        Serial.println("[BP32] No empty slot for controller");
        return;
    }
    // Keep callback light, details are printed from loop()
    Serial.printf("[BP32] Controller connected, slot=%d\n", slot);

    gamepadConnected = true;
    lastControllerDataTime = millis();
}

void onDisconnectedController(ControllerPtr ctl) {
    int slot = gamepads.detach(ctl);
    if (slot >= 0) {
        // Its car gets neutral frames from the control loop from now on
        Serial.printf("[BP32] Controller disconnected, slot=%d\n", slot);
    }

    gamepadConnected = gamepads.getConnectedCount() > 0;
    if (!gamepadConnected) {
        Serial.println("[SAFETY] All controllers disconnected - cars stopped");
    }
}

/**
 * @brief Print detailed controller info (called from loop after connection, not callback)
 */
void printControllerInfo(int idx, ControllerPtr ctl) {
    if (ctl == nullptr) return;

    ControllerProperties properties = ctl->getProperties();
    Serial.printf("[BP32] Slot %d model: %s, VID=0x%04x, PID=0x%04x\n",
                  idx,
                  ctl->getModelName().c_str(),
                  properties.vendor_id,
                  properties.product_id);

    uni_hid_device_t* dev = uni_hid_device_get_instance_for_idx(idx);
    if (dev != nullptr) {
        const char* btProto = "Unknown";
        switch (dev->conn.protocol) {
            case UNI_BT_CONN_PROTOCOL_BR_EDR: btProto = "BR/EDR (Classic BT)"; break;
            case UNI_BT_CONN_PROTOCOL_BLE:    btProto = "BLE (Bluetooth Low Energy)"; break;
            default: break;
        }
        Serial.printf("[BP32] BT Protocol: %s\n", btProto);
    }
}

// ========================== Status LED ==========================

void updateLed(unsigned long now) {
    if (!radioReady) {
        // Fatal: no car can ever connect
        if (now - lastLedToggle > LED_ERROR_BLINK_MS) {
            lastLedToggle = now;
            ledState = !ledState;
            digitalWrite(LED_PIN, ledState);
        }
        return;
    }

    if (bridge.anyReady()) {
        digitalWrite(LED_PIN, HIGH);
        return;
    }

    if (!gamepadConnected) {
        if (now - lastLedToggle > LED_BLINK_MS) {  // Blink at ~1.7Hz
            lastLedToggle = now;
            ledState = !ledState;
            digitalWrite(LED_PIN, ledState);
        }
        return;
    }

    digitalWrite(LED_PIN, LOW);
}

// ========================== SETUP ==========================

void setup() {
    // Initialize debug serial
    Serial.begin(115200);
    delay(500);  // Brief pause for BTstack init on Core 0
    Serial.println();
    Serial.println("============================================");
    Serial.println("  ESP32 Gamepad -> Shell Racing Legends");
    Serial.println("============================================");

    // LED setup
    pinMode(LED_PIN, OUTPUT);
    digitalWrite(LED_PIN, LOW);

    // Initialize Bluepad32, it owns BTstack
    BP32.setup(&onConnectedController, &onDisconnectedController);
    Serial.println("[BP32] Ready! Waiting for gamepad...");
    Serial.println("[BP32] LED blinks = no gamepad, LED solid = car ready");

    // Car links share the same stack
    radioReady = radio.begin();
    if (!radioReady) {
        Serial.println("[BLE] Radio init failed - cars cannot be connected");
    }

    BridgeConfig config = bridge.getConfig();
    Serial.printf("[CFG] deadzone=%.2f send=%lums scan=%lums timeout=%lums reconnect=%ux from %lums\n",
                  config.deadzone,
                  (unsigned long)config.sendIntervalMs,
                  (unsigned long)config.scanWindowMs,
                  (unsigned long)config.connectTimeoutMs,
                  config.reconnectMaxAttempts,
                  (unsigned long)config.reconnectBackoffMs);

    if (!bridge.begin(&console)) {
        Serial.println("[BLE] Bluetooth not up yet, scan will work once it is");
    }
    console.begin(&bridge);
}

// ========================== LOOP ==========================

// One-shot flag to print controller info after connection (deferred from callback)
static bool pendingControllerInfo = false;

void loop() {
    // Must call this to process Bluepad32 events
    BP32.update();

    unsigned long now = millis();

    // === Deferred controller info print (outside callback context) ===
    if (gamepadConnected && !pendingControllerInfo) {
        pendingControllerInfo = true;
        for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
            ControllerPtr ctl = gamepads.getController(i);
            if (ctl != nullptr) {
                printControllerInfo(i, ctl);
            }
        }
    }
    if (!gamepadConnected) {
        pendingControllerInfo = false;
    }

    // === Connection health watchdog ===
    // Detect stale controllers that appear connected but send no data
    if (gamepadConnected) {
        bool gotInput = false;
        for (uint8_t i = 0; i < SLR_MAX_SLOTS; i++) {
            ControllerPtr ctl = gamepads.getController(i);
            if (ctl != nullptr && ctl->isConnected()) {
                gotInput = true;
            }
        }
        if (gotInput) {
            lastControllerDataTime = now;
        } else if (now - lastControllerDataTime > STALE_CONTROLLER_MS) {
            Serial.println("[BP32] Stale controller detected - clearing slots");
            gamepads.clear();
            gamepadConnected = false;
            lastControllerDataTime = now;
        }
    }

    // === Console, radio events, scan window, control loop ===
    console.process();
    bridge.update((uint32_t)now);

    updateLed(now);

    // Debug output (every 2s)
    static unsigned long lastDebugPrint = 0;
    if (now - lastDebugPrint > DEBUG_PRINT_MS) {
        lastDebugPrint = now;
        Serial.printf("[BP32] gamepads=%u radio=%s scanning=%s events_dropped=%lu\n",
                      gamepads.getConnectedCount(),
                      bridge.isRadioOn() ? "on" : "off",
                      bridge.isScanning() ? "yes" : "no",
                      radio.getDroppedEvents());
    }

    // Yield to RTOS to prevent WDT timeout on IDLE1 task
    // 1 tick = 10ms at 100Hz tick rate
    vTaskDelay(1);
}
