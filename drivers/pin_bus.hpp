/*
 * Pin_Bus - Abstract GPIO + SPI transport for the e-paper panel
 * Decouples the panel protocol from the transport (Pico, Linux sysfs/spidev,
 * in-memory simulation). One instance is owned by one panel session.
 */

#ifndef PIN_BUS_HPP
#define PIN_BUS_HPP

#include "types.h"
#include "utils/log_interface.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

/* Logical pin identities; each backend maps them to its own numbering */
enum class PinId : uint8_t {
    Reset,
    DataCommand,   /* Low = command byte, high = data bytes */
    ChipSelect,    /* Active low */
    Busy,          /* Input */
    Power
};

class Pin_Bus {
public:
    virtual ~Pin_Bus() = default;

    /* Acquire OS/hardware resources and power the panel. Idempotent. */
    virtual EpdStatus init() = 0;

    virtual EpdStatus digital_write(PinId pin, bool level) = 0;
    virtual EpdStatus digital_read(PinId pin, bool *level) = 0;

    /*
     * Full-duplex transfer of len bytes. rx may be null when the caller
     * does not need the returned bytes.
     */
    virtual EpdStatus spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) = 0;

    virtual void delay_ms(uint32_t ms) = 0;
    virtual void delay_us(uint32_t us) = 0;

    /* Monotonic milliseconds, used for busy-wait deadlines */
    virtual uint32_t millis() = 0;

    /* Release resources and drop the control lines. Safe to call twice. */
    virtual EpdStatus teardown() = 0;
};

enum class PinBusKind : uint8_t { Hardware, Simulation };

/*
 * Construct the backend for kind. "Hardware" resolves to the transport the
 * build targets (Linux sysfs/spidev on the host, pico-sdk on firmware).
 */
std::unique_ptr<Pin_Bus> make_pin_bus(PinBusKind kind, uint16_t width, uint16_t height,
                                      Log_Interface &log);

#endif // PIN_BUS_HPP
