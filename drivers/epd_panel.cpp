/*
 * Epd_Panel Implementation - command sequences and busy handshake
 */

#include "drivers/epd_panel.hpp"
#include "drivers/epd_commands.hpp"
#include "logic/buffer_codec.hpp"
#include "logic/partial_window.hpp"
#include "config.h"

#include <cstdio>
#include <utility>

/*============================================================================
 * Init parameter tables
 *============================================================================*/
static const uint8_t FULL_POWER_SETTING[] = {0x07, 0x07, 0x3F, 0x3F};   /* VGH/VGL, VDH/VDL 15V */
static const uint8_t FULL_BOOSTER[] = {0x17, 0x17, 0x28, 0x17};
static const uint8_t FULL_PANEL_SETTING[] = {0x0F};                     /* KWR mode, LUT from OTP */
static const uint8_t FULL_DUAL_SPI[] = {0x00};
static const uint8_t FULL_VCOM_INTERVAL[] = {0x11, 0x07};
static const uint8_t FULL_TCON[] = {0x22};

static const uint8_t FAST_PANEL_SETTING[] = {0x0F};
static const uint8_t FAST_BOOSTER[] = {0x27, 0x27, 0x18, 0x17};
static const uint8_t FAST_CASCADE[] = {0x02};
static const uint8_t FAST_TEMPERATURE[] = {0x5A};
static const uint8_t FAST_VCOM_INTERVAL[] = {0x11, 0x07};

static const uint8_t PART_PANEL_SETTING[] = {0x1F};                     /* KW mode */
static const uint8_t PART_CASCADE[] = {0x02};
static const uint8_t PART_TEMPERATURE[] = {0x6E};
static const uint8_t PART_VCOM_INTERVAL[] = {0xA9, 0x07};

static const uint8_t SLEEP_CHECK_CODE[] = {EPD_DEEP_SLEEP_CHECK_CODE};

Epd_Panel::Epd_Panel(std::unique_ptr<Pin_Bus> bus, const PanelConfig &config,
                     Log_Interface &log)
    : bus_(std::move(bus)), config_(config), log_(log) {}

Epd_Panel::~Epd_Panel() {
    if (bus_ && bus_->teardown() != EpdStatus::Ok) {
        log_.error("EPD", "Transport teardown failed", LogSeverity::Warning);
    }
}

size_t Epd_Panel::frame_bytes() const {
    return static_cast<size_t>((config_.width + 7U) / 8U) * config_.height;
}

/*============================================================================
 * Framing
 *============================================================================*/

EpdStatus Epd_Panel::send_command(uint8_t cmd) {
    EpdStatus st = bus_->digital_write(PinId::DataCommand, false);
    if (st != EpdStatus::Ok) {
        return st;
    }
    st = bus_->digital_write(PinId::ChipSelect, false);
    if (st != EpdStatus::Ok) {
        return st;
    }
    return end_frame(bus_->spi_transfer(&cmd, nullptr, 1));
}

EpdStatus Epd_Panel::begin_data() {
    EpdStatus st = bus_->digital_write(PinId::DataCommand, true);
    if (st != EpdStatus::Ok) {
        return st;
    }
    return bus_->digital_write(PinId::ChipSelect, false);
}

EpdStatus Epd_Panel::end_frame(EpdStatus st) {
    /* Deselect even after a failed transfer */
    EpdStatus cs = bus_->digital_write(PinId::ChipSelect, true);
    return (st != EpdStatus::Ok) ? st : cs;
}

EpdStatus Epd_Panel::send_data(const uint8_t *data, size_t len) {
    EpdStatus st = begin_data();
    if (st != EpdStatus::Ok) {
        return st;
    }
    return end_frame(bus_->spi_transfer(data, nullptr, len));
}

EpdStatus Epd_Panel::send(uint8_t cmd, const uint8_t *data, size_t len) {
    EpdStatus st = send_command(cmd);
    if (st != EpdStatus::Ok || len == 0U) {
        return st;
    }
    return send_data(data, len);
}

EpdStatus Epd_Panel::send_inverted(uint8_t cmd, const uint8_t *data, size_t len) {
    EpdStatus st = send_command(cmd);
    if (st == EpdStatus::Ok) {
        st = begin_data();
    }
    if (st != EpdStatus::Ok) {
        return st;
    }

    uint8_t chunk[STREAM_CHUNK_BYTES];
    size_t offset = 0;
    while (offset < len && st == EpdStatus::Ok) {
        size_t n = len - offset;
        if (n > STREAM_CHUNK_BYTES) {
            n = STREAM_CHUNK_BYTES;
        }
        codec_invert_bytes(data + offset, chunk, n);
        st = bus_->spi_transfer(chunk, nullptr, n);
        offset += n;
    }
    return end_frame(st);
}

EpdStatus Epd_Panel::send_fill(uint8_t cmd, uint8_t value, size_t len) {
    EpdStatus st = send_command(cmd);
    if (st == EpdStatus::Ok) {
        st = begin_data();
    }
    if (st != EpdStatus::Ok) {
        return st;
    }

    uint8_t chunk[STREAM_CHUNK_BYTES];
    for (size_t i = 0; i < STREAM_CHUNK_BYTES; i++) {
        chunk[i] = value;
    }

    size_t remaining = len;
    while (remaining > 0U && st == EpdStatus::Ok) {
        size_t n = (remaining > STREAM_CHUNK_BYTES) ? STREAM_CHUNK_BYTES : remaining;
        st = bus_->spi_transfer(chunk, nullptr, n);
        remaining -= n;
    }
    return end_frame(st);
}

/*============================================================================
 * Timing primitives
 *============================================================================*/

EpdStatus Epd_Panel::reset() {
    EpdStatus st = bus_->digital_write(PinId::Reset, true);
    if (st != EpdStatus::Ok) {
        return st;
    }
    bus_->delay_ms(EPD_RESET_HIGH_MS);

    st = bus_->digital_write(PinId::Reset, false);
    if (st != EpdStatus::Ok) {
        return st;
    }
    bus_->delay_ms(EPD_RESET_LOW_MS);

    st = bus_->digital_write(PinId::Reset, true);
    if (st != EpdStatus::Ok) {
        return st;
    }
    bus_->delay_ms(EPD_RESET_HIGH_MS);
    return EpdStatus::Ok;
}

/*
 * Poll 0x71 + BUSY until the panel reports ready, then settle.
 * The deadline and cancel flag are checked once per iteration, never
 * in the middle of a framed transfer.
 */
EpdStatus Epd_Panel::read_busy() {
    const uint32_t start = bus_->millis();
    const bool ready_level = (EPD_BUSY_READY_LEVEL != 0U);

    for (;;) {
        if (config_.busy.cancel != nullptr && *config_.busy.cancel) {
            return EpdStatus::Cancelled;
        }

        EpdStatus st = send_command(EPD_CMD_GET_STATUS);
        if (st != EpdStatus::Ok) {
            return st;
        }

        bool level = !ready_level;
        st = bus_->digital_read(PinId::Busy, &level);
        if (st != EpdStatus::Ok) {
            return st;
        }
        if (level == ready_level) {
            break;
        }

        if (config_.busy.timeout_ms != 0U &&
            bus_->millis() - start >= config_.busy.timeout_ms) {
            return EpdStatus::BusyTimeout;
        }
        bus_->delay_ms(EPD_BUSY_POLL_MS);
    }

    char buf[48];
    snprintf(buf, sizeof(buf), "Busy released after %lu ms",
             static_cast<unsigned long>(bus_->millis() - start));
    log_.info("EPD", buf);

    bus_->delay_ms(EPD_BUSY_SETTLE_MS);
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::power_on() {
    EpdStatus st = send_command(EPD_CMD_POWER_ON);
    if (st != EpdStatus::Ok) {
        return st;
    }
    bus_->delay_ms(EPD_CMD_SETTLE_MS);
    return read_busy();
}

EpdStatus Epd_Panel::refresh() {
    EpdStatus st = send_command(EPD_CMD_DISPLAY_REFRESH);
    if (st != EpdStatus::Ok) {
        return st;
    }
    bus_->delay_ms(EPD_CMD_SETTLE_MS);
    return read_busy();
}

/*============================================================================
 * Init variants
 *============================================================================*/

EpdStatus Epd_Panel::init_sequence_full() {
    const uint8_t resolution[] = {
        static_cast<uint8_t>(config_.width >> 8U), static_cast<uint8_t>(config_.width & 0xFFU),
        static_cast<uint8_t>(config_.height >> 8U), static_cast<uint8_t>(config_.height & 0xFFU)};

    EpdStatus st = send(EPD_CMD_POWER_SETTING, FULL_POWER_SETTING, sizeof(FULL_POWER_SETTING));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_BOOSTER_SOFT_START, FULL_BOOSTER, sizeof(FULL_BOOSTER));
    if (st == EpdStatus::Ok) st = power_on();
    if (st == EpdStatus::Ok) st = send(EPD_CMD_PANEL_SETTING, FULL_PANEL_SETTING, sizeof(FULL_PANEL_SETTING));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_RESOLUTION, resolution, sizeof(resolution));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_DUAL_SPI, FULL_DUAL_SPI, sizeof(FULL_DUAL_SPI));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_VCOM_DATA_INTERVAL, FULL_VCOM_INTERVAL, sizeof(FULL_VCOM_INTERVAL));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_TCON_SETTING, FULL_TCON, sizeof(FULL_TCON));
    return st;
}

EpdStatus Epd_Panel::init_sequence_fast() {
    EpdStatus st = send(EPD_CMD_PANEL_SETTING, FAST_PANEL_SETTING, sizeof(FAST_PANEL_SETTING));
    if (st == EpdStatus::Ok) st = power_on();
    if (st == EpdStatus::Ok) st = send(EPD_CMD_BOOSTER_SOFT_START, FAST_BOOSTER, sizeof(FAST_BOOSTER));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_CASCADE_SETTING, FAST_CASCADE, sizeof(FAST_CASCADE));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_FORCE_TEMPERATURE, FAST_TEMPERATURE, sizeof(FAST_TEMPERATURE));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_VCOM_DATA_INTERVAL, FAST_VCOM_INTERVAL, sizeof(FAST_VCOM_INTERVAL));
    return st;
}

EpdStatus Epd_Panel::init_sequence_part() {
    EpdStatus st = send(EPD_CMD_PANEL_SETTING, PART_PANEL_SETTING, sizeof(PART_PANEL_SETTING));
    if (st == EpdStatus::Ok) st = power_on();
    if (st == EpdStatus::Ok) st = send(EPD_CMD_CASCADE_SETTING, PART_CASCADE, sizeof(PART_CASCADE));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_FORCE_TEMPERATURE, PART_TEMPERATURE, sizeof(PART_TEMPERATURE));
    if (st == EpdStatus::Ok) st = send(EPD_CMD_VCOM_DATA_INTERVAL, PART_VCOM_INTERVAL, sizeof(PART_VCOM_INTERVAL));
    return st;
}

EpdStatus Epd_Panel::run_init(PanelMode mode) {
    char buf[64];
    snprintf(buf, sizeof(buf), "Init %s", panel_mode_label(mode));
    log_.info("EPD", buf);

    EpdStatus st = bus_->init();
    if (st == EpdStatus::Ok) {
        st = reset();
    }
    if (st == EpdStatus::Ok) {
        switch (mode) {
            case PanelMode::Full:    st = init_sequence_full(); break;
            case PanelMode::Fast:    st = init_sequence_fast(); break;
            case PanelMode::Partial: st = init_sequence_part(); break;
        }
    }
    if (st != EpdStatus::Ok) {
        return fail("init", st);
    }

    session_on_init(session_, mode);
    log_.info("EPD", "Panel ready");
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::init() {
    return run_init(PanelMode::Full);
}

EpdStatus Epd_Panel::init_fast() {
    return run_init(PanelMode::Fast);
}

EpdStatus Epd_Panel::init_part() {
    return run_init(PanelMode::Partial);
}

/*============================================================================
 * Refresh operations
 *============================================================================*/

bool Epd_Panel::plane_fits(const Plane &plane) const {
    return plane.width == config_.width && plane.height == config_.height &&
           plane.size() == frame_bytes();
}

EpdStatus Epd_Panel::display(const Plane &black, const Plane &red) {
    EpdStatus st = session_check(session_, SessionOp::Display);
    if (st != EpdStatus::Ok) {
        return reject("display", st);
    }
    if (!plane_fits(black) || !plane_fits(red)) {
        return reject("display", EpdStatus::InvalidArgument);
    }

    /* 0x10 expects raw polarity: undo the codec inversion exactly once */
    st = send_inverted(EPD_CMD_DATA_START_1, black.bytes.data(), black.size());
    if (st == EpdStatus::Ok) {
        st = send(EPD_CMD_DATA_START_2, red.bytes.data(), red.size());
    }
    if (st == EpdStatus::Ok) {
        st = refresh();
    }
    if (st != EpdStatus::Ok) {
        return fail("display", st);
    }
    log_.info("EPD", "Full refresh done");
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::display(const Plane &black) {
    return display(black, Plane(config_.width, config_.height, 0x00U));
}

EpdStatus Epd_Panel::clear() {
    EpdStatus st = session_check(session_, SessionOp::Clear);
    if (st != EpdStatus::Ok) {
        return reject("clear", st);
    }

    st = send_fill(EPD_CMD_DATA_START_1, 0xFFU, frame_bytes());
    if (st == EpdStatus::Ok) {
        st = send_fill(EPD_CMD_DATA_START_2, 0x00U, frame_bytes());
    }
    if (st == EpdStatus::Ok) {
        st = refresh();
    }
    if (st != EpdStatus::Ok) {
        return fail("clear", st);
    }
    log_.info("EPD", "Cleared");
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::display_base_color(uint8_t color) {
    EpdStatus st = session_check(session_, SessionOp::BaseColor);
    if (st != EpdStatus::Ok) {
        return reject("base color", st);
    }

    st = send_fill(EPD_CMD_DATA_START_1, color, frame_bytes());
    if (st == EpdStatus::Ok) {
        st = send_fill(EPD_CMD_DATA_START_2, static_cast<uint8_t>(~color), frame_bytes());
    }
    if (st == EpdStatus::Ok) {
        st = refresh();
    }
    if (st != EpdStatus::Ok) {
        return fail("base color", st);
    }
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::display_partial(const Plane &plane, const Rect &rect) {
    EpdStatus st = session_check(session_, SessionOp::DisplayPartial);
    if (st != EpdStatus::Ok) {
        return reject("partial", st);
    }
    if (!partial_rect_valid(rect, config_.width, config_.height)) {
        return reject("partial", EpdStatus::InvalidArgument);
    }

    const AlignedRect aligned = partial_align_rect(rect);
    const size_t window_bytes = partial_plane_size(aligned);
    if (!partial_aligned_fits(aligned, config_.width) || !partial_plane_fits(plane, aligned)) {
        return reject("partial", EpdStatus::InvalidArgument);
    }

    uint8_t window[PARTIAL_WINDOW_LEN];
    partial_window_bytes(aligned, window);

    st = send_command(EPD_CMD_PARTIAL_IN);
    if (st == EpdStatus::Ok) {
        st = send(EPD_CMD_PARTIAL_WINDOW, window, sizeof(window));
    }
    if (st == EpdStatus::Ok && partial_needs_seed(session_)) {
        st = send_fill(EPD_CMD_DATA_START_1, EPD_PARTIAL_SEED_BYTE, window_bytes);
        if (st == EpdStatus::Ok) {
            partial_mark_seeded(session_);
        }
    }
    if (st == EpdStatus::Ok) {
        st = send(EPD_CMD_DATA_START_2, plane.bytes.data(), window_bytes);
    }
    if (st == EpdStatus::Ok) {
        st = refresh();
    }
    if (st != EpdStatus::Ok) {
        return fail("partial", st);
    }

    char buf[80];
    snprintf(buf, sizeof(buf), "Partial refresh x=%u..%u y=%u..%u",
             static_cast<unsigned>(aligned.rect.x_start), static_cast<unsigned>(aligned.rect.x_end),
             static_cast<unsigned>(aligned.rect.y_start), static_cast<unsigned>(aligned.rect.y_end));
    log_.info("EPD", buf);
    return EpdStatus::Ok;
}

EpdStatus Epd_Panel::sleep() {
    EpdStatus st = session_check(session_, SessionOp::Sleep);
    if (st != EpdStatus::Ok) {
        return reject("sleep", st);
    }

    st = send_command(EPD_CMD_POWER_OFF);
    if (st == EpdStatus::Ok) {
        st = read_busy();
    }
    if (st == EpdStatus::Ok) {
        st = send(EPD_CMD_DEEP_SLEEP, SLEEP_CHECK_CODE, sizeof(SLEEP_CHECK_CODE));
    }
    if (st == EpdStatus::Ok) {
        bus_->delay_ms(EPD_SLEEP_SETTLE_MS);
        st = bus_->teardown();
    }
    if (st != EpdStatus::Ok) {
        return fail("sleep", st);
    }

    session_on_sleep(session_);
    log_.info("EPD", "Deep sleep");
    return EpdStatus::Ok;
}

/*============================================================================
 * Failure reporting
 *============================================================================*/

/* Contract violation: nothing was sent, state unchanged */
EpdStatus Epd_Panel::reject(const char *op, EpdStatus st) {
    char buf[96];
    snprintf(buf, sizeof(buf), "%s rejected: %s (state %s)", op, epd_status_label(st),
             session_state_label(session_.state));
    log_.error("EPD", buf, LogSeverity::Warning);
    return st;
}

/* Transport or busy failure mid-sequence: panel state is unknown */
EpdStatus Epd_Panel::fail(const char *op, EpdStatus st) {
    session_on_fault(session_);
    char buf[96];
    snprintf(buf, sizeof(buf), "%s failed: %s", op, epd_status_label(st));
    log_.error("EPD", buf, LogSeverity::Error);
    return st;
}
