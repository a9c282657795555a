#ifndef MOCK_GAMEPADS_H
#define MOCK_GAMEPADS_H

#include "bridge_config.h"
#include "input_sampler.h"

// Gamepad slots whose reports are set directly by the test
class MockGamepads : public GamepadSource {
public:
    RawGamepad pads[SLR_MAX_SLOTS];
    bool connected[SLR_MAX_SLOTS] = {};
    int reads = 0;

    uint8_t getSlotCount() const override { return SLR_MAX_SLOTS; }

    bool read(uint8_t slot, RawGamepad& out) override {
        reads++;
        if (slot >= SLR_MAX_SLOTS || !connected[slot]) return false;
        out = pads[slot];
        return true;
    }

    // Connected, sticks centered, nothing pressed
    void plug(uint8_t slot) {
        pads[slot] = RawGamepad();
        connected[slot] = true;
    }

    void unplug(uint8_t slot) { connected[slot] = false; }
};

#endif // MOCK_GAMEPADS_H
