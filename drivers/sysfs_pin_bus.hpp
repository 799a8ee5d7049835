/*
 * Sysfs_Pin_Bus - Linux transport: sysfs GPIO lines + spidev
 * Raspberry Pi header wiring from config.h (BCM numbering)
 */

#ifndef SYSFS_PIN_BUS_HPP
#define SYSFS_PIN_BUS_HPP

#include "config.h"
#include "drivers/pin_bus.hpp"

#include <cstddef>
#include <cstdint>

class Sysfs_Pin_Bus final : public Pin_Bus {
public:
    explicit Sysfs_Pin_Bus(Log_Interface &log);
    ~Sysfs_Pin_Bus() override;

    /* Owns file descriptors and exported lines */
    Sysfs_Pin_Bus(const Sysfs_Pin_Bus &) = delete;
    Sysfs_Pin_Bus &operator=(const Sysfs_Pin_Bus &) = delete;
    Sysfs_Pin_Bus(Sysfs_Pin_Bus &&) = delete;
    Sysfs_Pin_Bus &operator=(Sysfs_Pin_Bus &&) = delete;

    /**
     * @brief Export GPIO lines, set directions, power the panel, open spidev.
     * An already-exported line (EBUSY) is reused. On any failure every
     * resource acquired so far is released again.
     * @return Ok, or HardwareError
     */
    EpdStatus init() override;

    EpdStatus digital_write(PinId pin, bool level) override;
    EpdStatus digital_read(PinId pin, bool *level) override;

    /**
     * @brief Full-duplex spidev transfer.
     * Split into EPD_SPI_CHUNK_BYTES messages; chip-select is a GPIO held
     * by the caller, so the split is invisible to the panel.
     */
    EpdStatus spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) override;

    void delay_ms(uint32_t ms) override;
    void delay_us(uint32_t us) override;
    uint32_t millis() override;

    /**
     * @brief Close spidev, drive RST/DC/PWR low, close and unexport lines.
     */
    EpdStatus teardown() override;

private:
    static constexpr size_t PIN_COUNT = 5U;

    Log_Interface &log_;
    int spi_fd_ = -1;
    int value_fd_[PIN_COUNT] = {-1, -1, -1, -1, -1};
    bool exported_[PIN_COUNT] = {};
    bool initialized_ = false;

    static unsigned gpio_number(PinId pin);
    static bool is_output(PinId pin);

    bool setup_line(PinId pin);
    bool open_spi();
    void release();
    bool write_file(const char *path, const char *value, int *err_out);
    void log_errno(const char *what, int err);
};

#endif // SYSFS_PIN_BUS_HPP
