/*
 * Pin_Bus factory - Linux host build
 * Hardware resolves to sysfs GPIO + spidev
 */

#include "drivers/pin_bus.hpp"
#include "drivers/sim_pin_bus.hpp"
#include "drivers/sysfs_pin_bus.hpp"

#include <memory>

std::unique_ptr<Pin_Bus> make_pin_bus(PinBusKind kind, uint16_t width, uint16_t height,
                                      Log_Interface &log) {
    if (kind == PinBusKind::Simulation) {
        return std::make_unique<Sim_Pin_Bus>(width, height, log);
    }
    return std::make_unique<Sysfs_Pin_Bus>(log);
}
