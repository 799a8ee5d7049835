/*
 * Pico_Pin_Bus Implementation - pico-sdk SPI + GPIO
 */

#include "drivers/pico_pin_bus.hpp"

#include "pico/stdlib.h"
#include "hardware/gpio.h"

#include <cstdio>

Pico_Pin_Bus::Pico_Pin_Bus(Log_Interface &log) : log_(log) {}

Pico_Pin_Bus::~Pico_Pin_Bus() {
    if (teardown() != EpdStatus::Ok) {
        log_.error("SPI", "Teardown incomplete in destructor", LogSeverity::Warning);
    }
}

uint Pico_Pin_Bus::gpio_for(PinId pin) {
    switch (pin) {
        case PinId::Reset:       return EPD_PICO_RST_PIN;
        case PinId::DataCommand: return EPD_PICO_DC_PIN;
        case PinId::ChipSelect:  return EPD_PICO_CS_PIN;
        case PinId::Busy:        return EPD_PICO_BUSY_PIN;
        case PinId::Power:       return EPD_PICO_PWR_PIN;
    }
    return EPD_PICO_RST_PIN;
}

EpdStatus Pico_Pin_Bus::init() {
    if (initialized_) {
        return EpdStatus::Ok;
    }

    uint baud = spi_init(spi_, EPD_SPI_SPEED_HZ);
    if (baud == 0U) {
        log_.error("SPI", "spi_init failed", LogSeverity::Error);
        return EpdStatus::HardwareError;
    }
    spi_set_format(spi_, 8, SPI_CPOL_0, SPI_CPHA_0, SPI_MSB_FIRST);
    gpio_set_function(EPD_PICO_SCK_PIN, GPIO_FUNC_SPI);
    gpio_set_function(EPD_PICO_MOSI_PIN, GPIO_FUNC_SPI);
    gpio_set_function(EPD_PICO_MISO_PIN, GPIO_FUNC_SPI);

    /* CS - active low, idle deselected */
    gpio_init(EPD_PICO_CS_PIN);
    gpio_set_dir(EPD_PICO_CS_PIN, GPIO_OUT);
    gpio_put(EPD_PICO_CS_PIN, 1);

    gpio_init(EPD_PICO_DC_PIN);
    gpio_set_dir(EPD_PICO_DC_PIN, GPIO_OUT);

    gpio_init(EPD_PICO_RST_PIN);
    gpio_set_dir(EPD_PICO_RST_PIN, GPIO_OUT);
    gpio_put(EPD_PICO_RST_PIN, 1);

    gpio_init(EPD_PICO_BUSY_PIN);
    gpio_set_dir(EPD_PICO_BUSY_PIN, GPIO_IN);

    /* Panel supply */
    gpio_init(EPD_PICO_PWR_PIN);
    gpio_set_dir(EPD_PICO_PWR_PIN, GPIO_OUT);
    gpio_put(EPD_PICO_PWR_PIN, 1);

    initialized_ = true;

    char buf[64];
    snprintf(buf, sizeof(buf), "SPI ready at %u Hz", baud);
    log_.info("SPI", buf);
    return EpdStatus::Ok;
}

EpdStatus Pico_Pin_Bus::digital_write(PinId pin, bool level) {
    if (!initialized_ || pin == PinId::Busy) {
        return EpdStatus::HardwareError;
    }
    gpio_put(gpio_for(pin), level);
    return EpdStatus::Ok;
}

EpdStatus Pico_Pin_Bus::digital_read(PinId pin, bool *level) {
    if (!initialized_) {
        return EpdStatus::HardwareError;
    }
    *level = gpio_get(gpio_for(pin));
    return EpdStatus::Ok;
}

EpdStatus Pico_Pin_Bus::spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) {
    if (!initialized_) {
        return EpdStatus::HardwareError;
    }

    int n;
    if (rx != nullptr) {
        n = spi_write_read_blocking(spi_, tx, rx, len);
    } else {
        n = spi_write_blocking(spi_, tx, len);
    }
    if (n < 0 || static_cast<size_t>(n) != len) {
        log_.error("SPI", "Short transfer", LogSeverity::Error);
        return EpdStatus::HardwareError;
    }
    return EpdStatus::Ok;
}

void Pico_Pin_Bus::delay_ms(uint32_t ms) {
    sleep_ms(ms);
}

void Pico_Pin_Bus::delay_us(uint32_t us) {
    sleep_us(us);
}

uint32_t Pico_Pin_Bus::millis() {
    return to_ms_since_boot(get_absolute_time());
}

EpdStatus Pico_Pin_Bus::teardown() {
    if (!initialized_) {
        return EpdStatus::Ok;
    }

    /* Leave the panel unpowered and held in reset */
    gpio_put(EPD_PICO_RST_PIN, 0);
    gpio_put(EPD_PICO_DC_PIN, 0);
    gpio_put(EPD_PICO_PWR_PIN, 0);
    spi_deinit(spi_);
    initialized_ = false;

    log_.info("SPI", "Transport released");
    return EpdStatus::Ok;
}
