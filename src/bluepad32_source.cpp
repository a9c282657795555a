#include "bluepad32_source.h"

Bluepad32Source::Bluepad32Source() {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        _controllers[i] = nullptr;
    }
}

int Bluepad32Source::attach(ControllerPtr ctl) {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_controllers[i] == nullptr) {
            _controllers[i] = ctl;
            return i;
        }
    }
    return -1;
}

int Bluepad32Source::detach(ControllerPtr ctl) {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_controllers[i] == ctl) {
            _controllers[i] = nullptr;
            return i;
        }
    }
    return -1;
}

ControllerPtr Bluepad32Source::getController(uint8_t slot) const {
    if (slot >= SLR_MAX_SLOTS) return nullptr;
    return _controllers[slot];
}

uint8_t Bluepad32Source::getConnectedCount() const {
    uint8_t count = 0;
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_controllers[i] != nullptr && _controllers[i]->isConnected()) {
            count++;
        }
    }
    return count;
}

void Bluepad32Source::clear() {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_controllers[i] != nullptr) {
            _controllers[i]->disconnect();
            _controllers[i] = nullptr;
        }
    }
}

bool Bluepad32Source::read(uint8_t slot, RawGamepad& out) {
    if (slot >= SLR_MAX_SLOTS) return false;

    ControllerPtr ctl = _controllers[slot];
    if (ctl == nullptr || !ctl->isConnected()) {
        return false;
    }

    // Bluepad32: axisX/axisY = left stick, axisRX/axisRY = right stick
    out.axisX    = ctl->axisX();
    out.axisY    = ctl->axisY();
    out.axisRX   = ctl->axisRX();
    out.axisRY   = ctl->axisRY();
    out.brake    = ctl->brake();
    out.throttle = ctl->throttle();

    // Translate bit by bit, the core does not depend on Bluepad32's values
    uint16_t buttons = ctl->buttons();
    out.buttons = 0;
    if (buttons & BUTTON_A)          out.buttons |= PAD_BUTTON_A;
    if (buttons & BUTTON_B)          out.buttons |= PAD_BUTTON_B;
    if (buttons & BUTTON_X)          out.buttons |= PAD_BUTTON_X;
    if (buttons & BUTTON_Y)          out.buttons |= PAD_BUTTON_Y;
    if (buttons & BUTTON_SHOULDER_L) out.buttons |= PAD_BUTTON_SHOULDER_L;
    if (buttons & BUTTON_SHOULDER_R) out.buttons |= PAD_BUTTON_SHOULDER_R;
    if (buttons & BUTTON_TRIGGER_L)  out.buttons |= PAD_BUTTON_TRIGGER_L;
    if (buttons & BUTTON_TRIGGER_R)  out.buttons |= PAD_BUTTON_TRIGGER_R;
    if (buttons & BUTTON_THUMB_L)    out.buttons |= PAD_BUTTON_THUMB_L;
    if (buttons & BUTTON_THUMB_R)    out.buttons |= PAD_BUTTON_THUMB_R;

    uint16_t misc = ctl->miscButtons();
    out.miscButtons = 0;
    if (misc & MISC_BUTTON_SYSTEM) out.miscButtons |= PAD_MISC_SYSTEM;
    if (misc & MISC_BUTTON_SELECT) out.miscButtons |= PAD_MISC_SELECT;
    if (misc & MISC_BUTTON_START)  out.miscButtons |= PAD_MISC_START;

    uint8_t dpad = ctl->dpad();
    out.dpad = 0;
    if (dpad & DPAD_UP)    out.dpad |= PAD_DPAD_UP;
    if (dpad & DPAD_DOWN)  out.dpad |= PAD_DPAD_DOWN;
    if (dpad & DPAD_RIGHT) out.dpad |= PAD_DPAD_RIGHT;
    if (dpad & DPAD_LEFT)  out.dpad |= PAD_DPAD_LEFT;

    return true;
}
