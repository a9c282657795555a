#include "input_sampler.h"

#include <math.h>

float normalizeAxis(float raw, float deadzone) {
    if (isnan(raw)) return raw;
    if (deadzone < 0.0f) deadzone = 0.0f;
    if (deadzone >= 1.0f) return 0.0f;

    float magnitude = fabsf(raw);
    if (magnitude < deadzone) {
        return 0.0f;
    }

    // Remove deadzone offset, then clamp
    float scaled = (magnitude - deadzone) / (1.0f - deadzone);
    if (scaled > 1.0f) scaled = 1.0f;

    return raw < 0.0f ? -scaled : scaled;
}

BridgeError InputSampler::sample(uint8_t slot, ControllerState& out) {
    if (slot >= SLR_MAX_SLOTS) {
        return BRIDGE_ERR_CONTROLLER_UNAVAILABLE;
    }
    SlotState& st = _slots[slot];

    RawGamepad raw;
    if (!_source.read(slot, raw)) {
        st.present = false;
        return BRIDGE_ERR_CONTROLLER_UNAVAILABLE;
    }

    updateLatches(st, raw);

    ControllerState state;
    state.steering = normalizeAxis((float)raw.axisX / SLR_AXIS_FULL_SCALE, _deadzone);
    // Y-axis: forward is negative on most gamepads, so invert
    state.throttle = normalizeAxis(-(float)raw.axisRY / SLR_AXIS_FULL_SCALE, _deadzone);

    // Button-based throttle fallback
    if (raw.buttons & PAD_BUTTON_B) {
        state.throttle = -1.0f;
    } else if (raw.buttons & PAD_BUTTON_A) {
        state.throttle = 1.0f;
    }

    // D-Pad overrides the sticks
    if (raw.dpad & PAD_DPAD_UP)    state.throttle = 1.0f;
    if (raw.dpad & PAD_DPAD_DOWN)  state.throttle = -1.0f;
    if (raw.dpad & PAD_DPAD_LEFT)  state.steering = -1.0f;
    if (raw.dpad & PAD_DPAD_RIGHT) state.steering = 1.0f;

    bool turboHeld = raw.brake > SLR_TURBO_TRIGGER_LEVEL ||
                     raw.throttle > SLR_TURBO_TRIGGER_LEVEL ||
                     (raw.buttons & PAD_BUTTON_SHOULDER_R) != 0;

    state.flags = st.latched;
    if (turboHeld) {
        state.flags |= FLAG_TURBO;
    }

    out = state;
    return BRIDGE_OK;
}

void InputSampler::pollButtons(uint8_t slot) {
    if (slot >= SLR_MAX_SLOTS) return;
    SlotState& st = _slots[slot];

    RawGamepad raw;
    if (!_source.read(slot, raw)) {
        st.present = false;
        return;
    }
    updateLatches(st, raw);
}

void InputSampler::updateLatches(SlotState& st, const RawGamepad& raw) {
    // First report after (re)connect: no edges from buttons already held
    if (!st.present) {
        st.prevButtons = raw.buttons;
        st.prevMisc = raw.miscButtons;
        st.present = true;
    }

    // Toggles fire on press, not hold
    if (risingEdge(raw.miscButtons, st.prevMisc, PAD_MISC_SELECT)) {
        st.latched ^= FLAG_LIGHTS;
    }
    if (risingEdge(raw.buttons, st.prevButtons, PAD_BUTTON_Y)) {
        st.latched ^= FLAG_DONUT;
    }
    if (risingEdge(raw.buttons, st.prevButtons, PAD_BUTTON_X)) {
        st.latched ^= FLAG_SPORT_MODE;
    }
    st.prevButtons = raw.buttons;
    st.prevMisc = raw.miscButtons;
}

void InputSampler::toggleLatch(uint8_t slot, ControlFlag flag) {
    if (slot >= SLR_MAX_SLOTS) return;
    _slots[slot].latched ^= flag;
}

void InputSampler::setLatch(uint8_t slot, ControlFlag flag, bool on) {
    if (slot >= SLR_MAX_SLOTS) return;
    if (on) {
        _slots[slot].latched |= flag;
    } else {
        _slots[slot].latched &= (uint8_t)~flag;
    }
}

uint8_t InputSampler::getLatched(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return 0;
    return _slots[slot].latched;
}

bool InputSampler::isPresent(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return false;
    return _slots[slot].present;
}

void InputSampler::resetSlot(uint8_t slot) {
    if (slot >= SLR_MAX_SLOTS) return;
    _slots[slot] = SlotState();
}
