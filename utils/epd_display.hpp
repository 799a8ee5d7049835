/*
 * Epd_Display - Public surface of the 7.5" black/red e-paper driver
 * Composes the codec, the panel protocol and a Pin_Bus backend chosen at
 * construction. Geometry is fixed for the life of the object.
 */

#ifndef EPD_DISPLAY_HPP
#define EPD_DISPLAY_HPP

#include "types.h"
#include "drivers/epd_panel.hpp"
#include "drivers/pin_bus.hpp"
#include "utils/log_interface.hpp"

#include <cstdint>
#include <memory>

class Epd_Display {
public:
    /* Backend by kind, default 800x480 geometry, unbounded busy-wait */
    Epd_Display(PinBusKind kind, Log_Interface &log);
    Epd_Display(PinBusKind kind, const PanelConfig &config, Log_Interface &log);

    /* Caller-built backend (tests, custom wiring) */
    Epd_Display(std::unique_ptr<Pin_Bus> bus, const PanelConfig &config, Log_Interface &log);

    EpdStatus init() { return panel_.init(); }
    EpdStatus init_fast() { return panel_.init_fast(); }
    EpdStatus init_part() { return panel_.init_part(); }
    EpdStatus clear() { return panel_.clear(); }
    EpdStatus display(const Plane &black, const Plane &red) { return panel_.display(black, red); }
    EpdStatus display(const Plane &black) { return panel_.display(black); }
    EpdStatus display_base_color(uint8_t color) { return panel_.display_base_color(color); }
    EpdStatus display_partial(const Plane &plane, const Rect &rect) {
        return panel_.display_partial(plane, rect);
    }
    EpdStatus sleep() { return panel_.sleep(); }

    /**
     * @brief Encode a raster for this panel's geometry.
     * @return Ok, DimensionMismatch (out is a blank plane) or InvalidArgument
     */
    EpdStatus encode(const RasterImage &image, Plane *out);

    /* Inverse of encode for a full-frame or window plane */
    void decode(const Plane &plane, GrayImage *out) const;

    /**
     * @brief Encode and show one or two rasters in a full refresh.
     * red may be null for a black-only frame. A mismatched raster is shown
     * as a blank layer and DimensionMismatch is returned after a
     * successful refresh.
     */
    EpdStatus display_image(const RasterImage &black, const RasterImage *red);

    void set_busy_deadline(const BusyDeadline &deadline) { panel_.set_busy_deadline(deadline); }
    const PanelSession &session() const { return panel_.session(); }
    uint16_t width() const { return panel_.config().width; }
    uint16_t height() const { return panel_.config().height; }

private:
    Log_Interface &log_;
    Epd_Panel panel_;

    static PanelConfig default_config();
};

#endif // EPD_DISPLAY_HPP
