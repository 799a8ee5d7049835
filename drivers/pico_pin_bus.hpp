/*
 * Pico_Pin_Bus - pico-sdk transport for the e-paper panel
 * SPI peripheral for data, GPIO-controlled chip-select and control lines
 */

#ifndef PICO_PIN_BUS_HPP
#define PICO_PIN_BUS_HPP

#include "config.h"
#include "drivers/pin_bus.hpp"

#include "hardware/spi.h"

#include <cstddef>
#include <cstdint>

class Pico_Pin_Bus final : public Pin_Bus {
public:
    explicit Pico_Pin_Bus(Log_Interface &log);
    ~Pico_Pin_Bus() override;

    EpdStatus init() override;
    EpdStatus digital_write(PinId pin, bool level) override;
    EpdStatus digital_read(PinId pin, bool *level) override;
    EpdStatus spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) override;
    void delay_ms(uint32_t ms) override;
    void delay_us(uint32_t us) override;
    uint32_t millis() override;
    EpdStatus teardown() override;

private:
    spi_inst_t *spi_ = EPD_PICO_SPI_INSTANCE;
    Log_Interface &log_;
    bool initialized_ = false;

    static uint gpio_for(PinId pin);
};

#endif // PICO_PIN_BUS_HPP
