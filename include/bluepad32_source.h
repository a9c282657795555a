/**
 * @file bluepad32_source.h
 * @brief GamepadSource backed by Bluepad32 controllers
 *
 * Bluepad32 hands out ControllerPtr objects in its connect callback. This
 * class keeps them in fixed slots so that a gamepad keeps its slot (and
 * thereby its car) for as long as it stays connected.
 */

#ifndef BLUEPAD32_SOURCE_H
#define BLUEPAD32_SOURCE_H

#include <Bluepad32.h>

#include "bridge_config.h"
#include "input_sampler.h"

class Bluepad32Source : public GamepadSource {
public:
    Bluepad32Source();

    /**
     * @brief Bind a newly connected controller to the first free slot
     * @return Slot index, or -1 if all slots are taken
     */
    int attach(ControllerPtr ctl);

    // @return Slot the controller was bound to, or -1
    int detach(ControllerPtr ctl);

    ControllerPtr getController(uint8_t slot) const;
    uint8_t getConnectedCount() const;

    // Disconnect and forget every controller
    void clear();

    uint8_t getSlotCount() const override { return SLR_MAX_SLOTS; }
    bool read(uint8_t slot, RawGamepad& out) override;

private:
    ControllerPtr _controllers[SLR_MAX_SLOTS];
};

#endif // BLUEPAD32_SOURCE_H
