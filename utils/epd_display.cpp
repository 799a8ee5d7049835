/*
 * Epd_Display Implementation - facade over codec + protocol
 */

#include "utils/epd_display.hpp"
#include "logic/buffer_codec.hpp"
#include "config.h"

#include <cstdio>
#include <utility>

PanelConfig Epd_Display::default_config() {
    PanelConfig cfg;
    cfg.width = EPD_WIDTH;
    cfg.height = EPD_HEIGHT;
    cfg.busy = BusyDeadline();
    return cfg;
}

Epd_Display::Epd_Display(PinBusKind kind, Log_Interface &log)
    : Epd_Display(kind, default_config(), log) {}

Epd_Display::Epd_Display(PinBusKind kind, const PanelConfig &config, Log_Interface &log)
    : Epd_Display(make_pin_bus(kind, config.width, config.height, log), config, log) {}

Epd_Display::Epd_Display(std::unique_ptr<Pin_Bus> bus, const PanelConfig &config,
                         Log_Interface &log)
    : log_(log), panel_(std::move(bus), config, log) {}

EpdStatus Epd_Display::encode(const RasterImage &image, Plane *out) {
    EpdStatus st = codec_encode(image, width(), height(), out);
    if (st == EpdStatus::DimensionMismatch) {
        char buf[96];
        snprintf(buf, sizeof(buf), "Image %ux%u does not fit %ux%u, using blank plane",
                 static_cast<unsigned>(image.width), static_cast<unsigned>(image.height),
                 static_cast<unsigned>(width()), static_cast<unsigned>(height()));
        log_.error("CODEC", buf, LogSeverity::Warning);
    } else if (st != EpdStatus::Ok) {
        log_.error("CODEC", "Unsupported raster", LogSeverity::Error);
    }
    return st;
}

void Epd_Display::decode(const Plane &plane, GrayImage *out) const {
    codec_decode(plane, out);
}

EpdStatus Epd_Display::display_image(const RasterImage &black, const RasterImage *red) {
    Plane black_plane;
    EpdStatus black_st = encode(black, &black_plane);
    if (black_st == EpdStatus::InvalidArgument) {
        return black_st;
    }

    Plane red_plane(width(), height(), 0x00U);
    EpdStatus red_st = EpdStatus::Ok;
    if (red != nullptr) {
        red_st = encode(*red, &red_plane);
        if (red_st == EpdStatus::InvalidArgument) {
            return red_st;
        }
    }

    EpdStatus st = panel_.display(black_plane, red_plane);
    if (st != EpdStatus::Ok) {
        return st;
    }
    return (black_st != EpdStatus::Ok) ? black_st : red_st;
}
