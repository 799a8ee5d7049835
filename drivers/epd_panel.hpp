/*
 * Epd_Panel - Command/state protocol of the 7.5" black/red e-paper panel
 * Owns the Pin_Bus. Sequences reset, the three init variants, full and
 * partial refresh, base-color fill and deep sleep, with a bounded
 * busy-wait handshake.
 *
 * Not thread-safe: one caller per physical panel.
 */

#ifndef EPD_PANEL_HPP
#define EPD_PANEL_HPP

#include "types.h"
#include "drivers/pin_bus.hpp"
#include "logic/panel_session.hpp"
#include "utils/log_interface.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

class Epd_Panel {
public:
    Epd_Panel(std::unique_ptr<Pin_Bus> bus, const PanelConfig &config, Log_Interface &log);
    ~Epd_Panel();

    Epd_Panel(const Epd_Panel &) = delete;
    Epd_Panel &operator=(const Epd_Panel &) = delete;

    /* Init variants. Valid from every state; each starts with a hardware reset. */
    EpdStatus init();
    EpdStatus init_fast();
    EpdStatus init_part();

    /**
     * @brief Full refresh from two panel-polarity planes.
     * The black plane goes out on 0x10 XORed back to raw form, the red
     * plane on 0x13 unmodified.
     * @return Ok, ProtocolStateError, InvalidArgument (plane geometry),
     *         HardwareError, BusyTimeout or Cancelled
     */
    EpdStatus display(const Plane &black, const Plane &red);

    /* Full refresh with a blank red plane */
    EpdStatus display(const Plane &black);

    /* Full white frame */
    EpdStatus clear();

    /* 0x10 filled with color, 0x13 with ~color, then refresh */
    EpdStatus display_base_color(uint8_t color);

    /**
     * @brief Partial refresh of rect. Requires init_part().
     *
     * rect is widened to byte columns with partial_align_rect(); plane must
     * hold exactly partial_plane_size() bytes for that window, panel
     * polarity (1 = black). The first call after init_part() seeds the
     * old-data RAM with an all-white window first.
     */
    EpdStatus display_partial(const Plane &plane, const Rect &rect);

    /* Power off, deep sleep, release the transport */
    EpdStatus sleep();

    const PanelSession &session() const { return session_; }
    const PanelConfig &config() const { return config_; }
    void set_busy_deadline(const BusyDeadline &deadline) { config_.busy = deadline; }

    /* Bytes in one full-frame plane */
    size_t frame_bytes() const;

private:
    static constexpr size_t STREAM_CHUNK_BYTES = 256U;

    std::unique_ptr<Pin_Bus> bus_;
    PanelConfig config_;
    Log_Interface &log_;
    PanelSession session_;

    EpdStatus run_init(PanelMode mode);
    EpdStatus init_sequence_full();
    EpdStatus init_sequence_fast();
    EpdStatus init_sequence_part();

    EpdStatus reset();
    EpdStatus power_on();
    EpdStatus refresh();
    EpdStatus read_busy();

    EpdStatus send_command(uint8_t cmd);
    EpdStatus send_data(const uint8_t *data, size_t len);
    EpdStatus send(uint8_t cmd, const uint8_t *data, size_t len);
    EpdStatus send_inverted(uint8_t cmd, const uint8_t *data, size_t len);
    EpdStatus send_fill(uint8_t cmd, uint8_t value, size_t len);

    EpdStatus begin_data();
    EpdStatus end_frame(EpdStatus st);

    bool plane_fits(const Plane &plane) const;
    EpdStatus reject(const char *op, EpdStatus st);
    EpdStatus fail(const char *op, EpdStatus st);
};

#endif // EPD_PANEL_HPP
