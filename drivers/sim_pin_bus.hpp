/*
 * Sim_Pin_Bus - In-memory panel simulator behind the Pin_Bus interface
 * Decodes the command/data stream into panel RAM and composes a virtual
 * canvas on every refresh. Time is virtual: delays advance a counter.
 */

#ifndef SIM_PIN_BUS_HPP
#define SIM_PIN_BUS_HPP

#include "drivers/pin_bus.hpp"
#include "logic/partial_window.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

enum class SimPixel : uint8_t { White, Black, Red };

struct SimStats {
    uint32_t transfers;          /* spi_transfer calls */
    uint32_t bytes;              /* Bytes clocked out */
    uint32_t commands;           /* Command bytes seen */
    uint32_t full_refreshes;
    uint32_t partial_refreshes;
    uint32_t resets;             /* Reset line falling edges */
    uint32_t busy_polls;         /* digital_read(Busy) calls */
};

class Sim_Pin_Bus final : public Pin_Bus {
public:
    Sim_Pin_Bus(uint16_t width, uint16_t height, Log_Interface &log);

    EpdStatus init() override;
    EpdStatus digital_write(PinId pin, bool level) override;
    EpdStatus digital_read(PinId pin, bool *level) override;
    EpdStatus spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) override;
    void delay_ms(uint32_t ms) override;
    void delay_us(uint32_t us) override;
    uint32_t millis() override { return now_ms_; }
    EpdStatus teardown() override;

    /* Virtual panel */
    SimPixel pixel_at(uint16_t x, uint16_t y) const;
    uint16_t width() const { return width_; }
    uint16_t height() const { return height_; }
    const std::vector<uint8_t> &black_ram() const { return black_ram_; }
    const std::vector<uint8_t> &red_ram() const { return red_ram_; }
    bool save_ppm(const char *path) const;

    /* Panel registers as last written */
    bool powered() const { return powered_; }
    bool deep_sleep() const { return deep_sleep_; }
    bool partial_mode() const { return partial_mode_; }
    uint16_t resolution_width() const { return res_width_; }
    uint16_t resolution_height() const { return res_height_; }
    const Rect &partial_window() const { return window_; }

    /* Most recent command bytes, oldest first. Holds at most COMMAND_LOG_MAX. */
    const std::vector<uint8_t> &command_log() const { return command_log_; }
    void clear_command_log() { command_log_.clear(); }
    static constexpr size_t COMMAND_LOG_MAX = 4096U;
    const SimStats &stats() const { return stats_; }

    /* Busy behaviour after power-on, refresh and power-off */
    void set_busy_polls(uint32_t polls) { busy_polls_ = polls; }
    void set_stuck_busy(bool stuck) { stuck_busy_ = stuck; }

    /* Fail the transfer after `after` more successful ones */
    void inject_transfer_failure(uint32_t after);

private:
    static constexpr size_t PIN_COUNT = 5U;

    uint16_t width_;
    uint16_t height_;
    uint16_t bytes_per_row_;
    Log_Interface &log_;

    bool initialized_ = false;
    bool levels_[PIN_COUNT] = {};
    bool powered_ = false;
    bool deep_sleep_ = false;
    bool partial_mode_ = false;

    std::vector<uint8_t> black_ram_;   /* 0x10 target, raster polarity (1 = white) */
    std::vector<uint8_t> red_ram_;     /* 0x13 target (1 = red, 1 = black in partial) */
    std::vector<uint8_t> canvas_;      /* SimPixel per pixel */

    uint8_t command_ = 0;
    size_t data_index_ = 0;
    uint8_t param_buf_[PARTIAL_WINDOW_LEN] = {};
    Rect window_;
    uint16_t res_width_ = 0;
    uint16_t res_height_ = 0;
    std::vector<uint8_t> command_log_;

    uint32_t now_ms_ = 0;
    uint32_t now_us_frac_ = 0;
    uint32_t busy_polls_ = 0;
    uint32_t busy_remaining_ = 0;
    bool stuck_busy_ = false;

    bool fail_armed_ = false;
    uint32_t fail_countdown_ = 0;

    SimStats stats_ = {};

    void on_command(uint8_t cmd);
    void on_data(uint8_t byte);
    void write_ram(std::vector<uint8_t> &ram, uint8_t byte);
    void refresh();
    void start_busy();
};

#endif // SIM_PIN_BUS_HPP
