/*
 * Sim_Pin_Bus Implementation - virtual 7.5" black/red panel
 */

#include "drivers/sim_pin_bus.hpp"
#include "drivers/epd_commands.hpp"
#include "config.h"

#include <cstdio>

static inline size_t pin_index(PinId pin) {
    return static_cast<size_t>(pin);
}

static inline bool bit_at(const std::vector<uint8_t> &ram, uint16_t bpr,
                          uint16_t x, uint16_t y) {
    return (ram[static_cast<size_t>(y) * bpr + x / 8U] & (0x80U >> (x % 8U))) != 0U;
}

Sim_Pin_Bus::Sim_Pin_Bus(uint16_t width, uint16_t height, Log_Interface &log)
    : width_(width), height_(height),
      bytes_per_row_(static_cast<uint16_t>((width + 7U) / 8U)), log_(log),
      black_ram_(static_cast<size_t>(bytes_per_row_) * height, 0xFFU),
      red_ram_(static_cast<size_t>(bytes_per_row_) * height, 0x00U),
      canvas_(static_cast<size_t>(width) * height,
              static_cast<uint8_t>(SimPixel::White)) {}

EpdStatus Sim_Pin_Bus::init() {
    if (initialized_) {
        return EpdStatus::Ok;
    }
    initialized_ = true;

    /* Idle levels: chip deselected, reset released, supply on */
    levels_[pin_index(PinId::ChipSelect)] = true;
    levels_[pin_index(PinId::Reset)] = true;
    levels_[pin_index(PinId::Power)] = true;
    powered_ = true;
    return EpdStatus::Ok;
}

EpdStatus Sim_Pin_Bus::digital_write(PinId pin, bool level) {
    if (!initialized_ || pin == PinId::Busy) {
        return EpdStatus::HardwareError;
    }

    const size_t idx = pin_index(pin);
    const bool prev = levels_[idx];
    levels_[idx] = level;

    if (pin == PinId::Reset && prev && !level) {
        /* Hardware reset wakes the controller and drops partial mode */
        stats_.resets++;
        deep_sleep_ = false;
        partial_mode_ = false;
        busy_remaining_ = 0;
    } else if (pin == PinId::Power) {
        powered_ = level;
    }
    return EpdStatus::Ok;
}

EpdStatus Sim_Pin_Bus::digital_read(PinId pin, bool *level) {
    if (!initialized_) {
        return EpdStatus::HardwareError;
    }

    if (pin != PinId::Busy) {
        *level = levels_[pin_index(pin)];
        return EpdStatus::Ok;
    }

    stats_.busy_polls++;
    bool ready = !stuck_busy_ && busy_remaining_ == 0U;
    if (!ready && !stuck_busy_) {
        busy_remaining_--;
    }
    *level = ready ? (EPD_BUSY_READY_LEVEL != 0U) : (EPD_BUSY_READY_LEVEL == 0U);
    return EpdStatus::Ok;
}

EpdStatus Sim_Pin_Bus::spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) {
    if (!initialized_) {
        return EpdStatus::HardwareError;
    }

    if (fail_armed_) {
        if (fail_countdown_ == 0U) {
            fail_armed_ = false;
            return EpdStatus::HardwareError;
        }
        fail_countdown_--;
    }

    stats_.transfers++;
    stats_.bytes += static_cast<uint32_t>(len);

    /* Write-only panel: MISO floats low */
    if (rx != nullptr) {
        for (size_t i = 0; i < len; i++) {
            rx[i] = 0x00U;
        }
    }

    /* Not selected, or asleep: the controller ignores the clock */
    if (levels_[pin_index(PinId::ChipSelect)] || deep_sleep_) {
        return EpdStatus::Ok;
    }

    const bool is_data = levels_[pin_index(PinId::DataCommand)];
    for (size_t i = 0; i < len; i++) {
        if (is_data) {
            on_data(tx[i]);
        } else {
            on_command(tx[i]);
        }
    }
    return EpdStatus::Ok;
}

void Sim_Pin_Bus::delay_ms(uint32_t ms) {
    now_ms_ += ms;
}

void Sim_Pin_Bus::delay_us(uint32_t us) {
    now_us_frac_ += us;
    now_ms_ += now_us_frac_ / 1000U;
    now_us_frac_ %= 1000U;
}

EpdStatus Sim_Pin_Bus::teardown() {
    if (!initialized_) {
        return EpdStatus::Ok;
    }
    for (size_t i = 0; i < PIN_COUNT; i++) {
        levels_[i] = false;
    }
    powered_ = false;
    initialized_ = false;
    return EpdStatus::Ok;
}

void Sim_Pin_Bus::inject_transfer_failure(uint32_t after) {
    fail_armed_ = true;
    fail_countdown_ = after;
}

void Sim_Pin_Bus::on_command(uint8_t cmd) {
    command_ = cmd;
    data_index_ = 0;
    if (command_log_.size() >= COMMAND_LOG_MAX) {
        /* Full: keep the newer half */
        command_log_.erase(command_log_.begin(),
                           command_log_.begin() + COMMAND_LOG_MAX / 2U);
    }
    command_log_.push_back(cmd);
    stats_.commands++;

    switch (cmd) {
        case EPD_CMD_POWER_ON:
        case EPD_CMD_POWER_OFF:
            start_busy();
            break;
        case EPD_CMD_DISPLAY_REFRESH:
            refresh();
            start_busy();
            break;
        case EPD_CMD_PARTIAL_IN:
            partial_mode_ = true;
            break;
        case EPD_CMD_PARTIAL_OUT:
            partial_mode_ = false;
            break;
        default:
            break;
    }
}

void Sim_Pin_Bus::on_data(uint8_t byte) {
    switch (command_) {
        case EPD_CMD_RESOLUTION:
            if (data_index_ < 4U) {
                param_buf_[data_index_] = byte;
            }
            if (data_index_ == 3U) {
                res_width_ = static_cast<uint16_t>((param_buf_[0] << 8U) | param_buf_[1]);
                res_height_ = static_cast<uint16_t>((param_buf_[2] << 8U) | param_buf_[3]);
            }
            break;

        case EPD_CMD_PARTIAL_WINDOW:
            if (data_index_ < PARTIAL_WINDOW_LEN) {
                param_buf_[data_index_] = byte;
            }
            if (data_index_ == 7U) {
                window_.x_start = static_cast<uint16_t>((param_buf_[0] << 8U) | param_buf_[1]);
                window_.x_end = static_cast<uint16_t>(((param_buf_[2] << 8U) | param_buf_[3]) + 1U);
                window_.y_start = static_cast<uint16_t>((param_buf_[4] << 8U) | param_buf_[5]);
                window_.y_end = static_cast<uint16_t>(((param_buf_[6] << 8U) | param_buf_[7]) + 1U);
            }
            break;

        case EPD_CMD_DATA_START_1:
            write_ram(black_ram_, byte);
            break;

        case EPD_CMD_DATA_START_2:
            write_ram(red_ram_, byte);
            break;

        case EPD_CMD_DEEP_SLEEP:
            if (byte == EPD_DEEP_SLEEP_CHECK_CODE) {
                deep_sleep_ = true;
            }
            break;

        default:
            break;
    }
    data_index_++;
}

void Sim_Pin_Bus::write_ram(std::vector<uint8_t> &ram, uint8_t byte) {
    if (!partial_mode_) {
        if (data_index_ < ram.size()) {
            ram[data_index_] = byte;
        }
        return;
    }

    /* Partial mode: the address counter walks the 0x90 window */
    const uint16_t window_bpr = static_cast<uint16_t>(window_.width() / 8U);
    if (window_bpr == 0U) {
        return;
    }
    const size_t row = window_.y_start + data_index_ / window_bpr;
    const size_t col = window_.x_start / 8U + data_index_ % window_bpr;
    if (row < height_ && col < bytes_per_row_) {
        ram[row * bytes_per_row_ + col] = byte;
    }
}

void Sim_Pin_Bus::refresh() {
    if (partial_mode_) {
        const uint16_t x_end = window_.x_end < width_ ? window_.x_end : width_;
        const uint16_t y_end = window_.y_end < height_ ? window_.y_end : height_;
        for (uint16_t y = window_.y_start; y < y_end; y++) {
            for (uint16_t x = window_.x_start; x < x_end; x++) {
                bool black = bit_at(red_ram_, bytes_per_row_, x, y);
                canvas_[static_cast<size_t>(y) * width_ + x] = static_cast<uint8_t>(
                    black ? SimPixel::Black : SimPixel::White);
            }
        }
        stats_.partial_refreshes++;
        return;
    }

    for (uint16_t y = 0; y < height_; y++) {
        for (uint16_t x = 0; x < width_; x++) {
            SimPixel px = SimPixel::White;
            if (bit_at(red_ram_, bytes_per_row_, x, y)) {
                px = SimPixel::Red;
            } else if (!bit_at(black_ram_, bytes_per_row_, x, y)) {
                px = SimPixel::Black;
            }
            canvas_[static_cast<size_t>(y) * width_ + x] = static_cast<uint8_t>(px);
        }
    }
    stats_.full_refreshes++;
}

void Sim_Pin_Bus::start_busy() {
    busy_remaining_ = busy_polls_;
}

SimPixel Sim_Pin_Bus::pixel_at(uint16_t x, uint16_t y) const {
    if (x >= width_ || y >= height_) {
        return SimPixel::White;
    }
    return static_cast<SimPixel>(canvas_[static_cast<size_t>(y) * width_ + x]);
}

bool Sim_Pin_Bus::save_ppm(const char *path) const {
    FILE *f = fopen(path, "wb");
    if (f == nullptr) {
        log_.error("SIM", "Cannot open canvas file for writing", LogSeverity::Error);
        return false;
    }

    fprintf(f, "P6\n%u %u\n255\n", static_cast<unsigned>(width_),
            static_cast<unsigned>(height_));

    std::vector<uint8_t> row(static_cast<size_t>(width_) * 3U);
    bool ok = true;
    for (uint16_t y = 0; y < height_ && ok; y++) {
        for (uint16_t x = 0; x < width_; x++) {
            uint8_t r = 255U;
            uint8_t g = 255U;
            uint8_t b = 255U;
            switch (pixel_at(x, y)) {
                case SimPixel::Black: r = 0U;   g = 0U; b = 0U; break;
                case SimPixel::Red:   r = 255U; g = 0U; b = 0U; break;
                case SimPixel::White: break;
            }
            row[x * 3U] = r;
            row[x * 3U + 1U] = g;
            row[x * 3U + 2U] = b;
        }
        ok = fwrite(row.data(), 1, row.size(), f) == row.size();
    }

    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        log_.error("SIM", "Short write on canvas file", LogSeverity::Error);
        return false;
    }

    char buf[96];
    snprintf(buf, sizeof(buf), "Canvas saved to %s", path);
    log_.info("SIM", buf);
    return true;
}
