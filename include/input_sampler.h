/**
 * @file input_sampler.h
 * @brief Polls gamepad slots and normalizes them into ControllerState
 *
 * Sampling is a plain poll of the last report the gamepad driver holds for
 * a slot. It does not depend on any window or input focus.
 *
 * Control Mapping:
 *   Left Joystick X-axis   -> Steering (left/right)
 *   Right Joystick Y-axis  -> Throttle (up = forward)
 *   Button A / Button B    -> Full forward / full reverse (overrides stick)
 *   D-Pad                  -> Full throttle / steering in that direction
 *   L2 / R2 trigger, R1    -> Turbo while held
 *   Select (Back)          -> Toggle lights
 *   Button Y               -> Toggle donut
 *   Button X               -> Toggle sport mode
 */

#ifndef INPUT_SAMPLER_H
#define INPUT_SAMPLER_H

#include <stdint.h>

#include "bridge_config.h"
#include "bridge_types.h"
#include "car_protocol.h"

// ========================== Raw Gamepad Report ==========================
// Bit layout follows Bluepad32 (BUTTON_*, MISC_BUTTON_*, DPAD_*)
enum PadButton : uint16_t {
    PAD_BUTTON_A          = 1 << 0,
    PAD_BUTTON_B          = 1 << 1,
    PAD_BUTTON_X          = 1 << 2,
    PAD_BUTTON_Y          = 1 << 3,
    PAD_BUTTON_SHOULDER_L = 1 << 4,
    PAD_BUTTON_SHOULDER_R = 1 << 5,
    PAD_BUTTON_TRIGGER_L  = 1 << 6,
    PAD_BUTTON_TRIGGER_R  = 1 << 7,
    PAD_BUTTON_THUMB_L    = 1 << 8,
    PAD_BUTTON_THUMB_R    = 1 << 9,
};

enum PadMiscButton : uint16_t {
    PAD_MISC_SYSTEM = 1 << 0,
    PAD_MISC_SELECT = 1 << 1,
    PAD_MISC_START  = 1 << 2,
};

enum PadDpad : uint8_t {
    PAD_DPAD_UP    = 1 << 0,
    PAD_DPAD_DOWN  = 1 << 1,
    PAD_DPAD_RIGHT = 1 << 2,
    PAD_DPAD_LEFT  = 1 << 3,
};

struct RawGamepad {
    int32_t  axisX = 0;       // Left stick  [-512, 511]
    int32_t  axisY = 0;
    int32_t  axisRX = 0;      // Right stick [-512, 511]
    int32_t  axisRY = 0;
    int32_t  brake = 0;       // L2 [0, 1023]
    int32_t  throttle = 0;    // R2 [0, 1023]
    uint16_t buttons = 0;     // PadButton bits
    uint16_t miscButtons = 0; // PadMiscButton bits
    uint8_t  dpad = 0;        // PadDpad bits
};

// ========================== Gamepad Source ==========================
// Platform controller-input API (Bluepad32 on the board, a mock in tests)
class GamepadSource {
public:
    virtual ~GamepadSource() {}

    virtual uint8_t getSlotCount() const = 0;

    /**
     * @brief Copy the latest report of a slot
     * @return false if no gamepad is bound to the slot or it is disconnected
     */
    virtual bool read(uint8_t slot, RawGamepad& out) = 0;
};

/**
 * @brief Apply deadzone and map an axis fraction to [-1, 1]
 * @param raw Axis as a fraction of full scale (may exceed +/-1)
 * @param deadzone Magnitudes below this become exactly 0
 * @return Rescaled and clamped value. NaN is passed through unchanged.
 */
float normalizeAxis(float raw, float deadzone);

// ========================== InputSampler Class ==========================
class InputSampler {
public:
    explicit InputSampler(GamepadSource& source, float deadzone = SLR_DEADZONE)
        : _source(source), _deadzone(deadzone) {}

    void setDeadzone(float deadzone) { _deadzone = deadzone; }
    float getDeadzone() const { return _deadzone; }

    /**
     * @brief Sample one slot
     * @param slot Gamepad slot [0, SLR_MAX_SLOTS)
     * @param out Normalized state (untouched on error)
     * @return BRIDGE_OK or BRIDGE_ERR_CONTROLLER_UNAVAILABLE
     */
    BridgeError sample(uint8_t slot, ControllerState& out);

    /**
     * @brief Update toggle latches only, without building a state
     *
     * Call more often than sample() so that a tap shorter than the send
     * interval still flips its latch.
     */
    void pollButtons(uint8_t slot);

    // Latched flags can also be flipped from the front-end
    void toggleLatch(uint8_t slot, ControlFlag flag);
    void setLatch(uint8_t slot, ControlFlag flag, bool on);
    uint8_t getLatched(uint8_t slot) const;

    bool isPresent(uint8_t slot) const;

    // Forget latches and button history of a slot
    void resetSlot(uint8_t slot);

private:
    struct SlotState {
        uint8_t  latched = 0;
        uint16_t prevButtons = 0;
        uint16_t prevMisc = 0;
        bool     present = false;
    };

    bool risingEdge(uint16_t now, uint16_t prev, uint16_t mask) const {
        return (now & mask) && !(prev & mask);
    }

    void updateLatches(SlotState& st, const RawGamepad& raw);

    GamepadSource& _source;
    float _deadzone;
    SlotState _slots[SLR_MAX_SLOTS];
};

#endif // INPUT_SAMPLER_H
