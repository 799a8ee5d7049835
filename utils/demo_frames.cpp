/*
 * Demo_Frames Implementation
 */

#include "utils/demo_frames.hpp"
#include "logic/partial_window.hpp"

#include <cstdio>

static inline void set_ink(Plane *p, uint16_t x, uint16_t y) {
    p->bytes[static_cast<size_t>(y) * p->bytes_per_row() + x / 8U] |=
        static_cast<uint8_t>(0x80U >> (x % 8U));
}

void demo_black_plane(uint16_t width, uint16_t height, Plane *out) {
    *out = Plane(width, height, 0x00U);

    for (uint16_t y = 0; y < height; y++) {
        for (uint16_t x = 0; x < width; x++) {
            bool border = x < DEMO_BORDER_PX || y < DEMO_BORDER_PX ||
                          x + DEMO_BORDER_PX >= width || y + DEMO_BORDER_PX >= height;
            uint32_t diag = static_cast<uint32_t>(x) * height / width;
            bool on_diag = (diag == y) || (diag + 1U == y);
            if (border || on_diag) {
                set_ink(out, x, y);
            }
        }
    }
}

void demo_red_plane(uint16_t width, uint16_t height, Plane *out) {
    *out = Plane(width, height, 0x00U);

    for (uint16_t y = height / 3U; y < 2U * height / 3U; y++) {
        for (uint16_t x = width / 3U; x < 2U * width / 3U; x++) {
            set_ink(out, x, y);
        }
    }
}

void demo_checker_plane(uint16_t width, uint16_t height, uint16_t cell, Plane *out) {
    *out = Plane(width, height, 0x00U);
    if (cell == 0U) {
        return;
    }

    for (uint16_t y = 0; y < height; y++) {
        for (uint16_t x = 0; x < width; x++) {
            if (((x / cell) + (y / cell)) % 2U == 0U) {
                set_ink(out, x, y);
            }
        }
    }
}

/* Checker sized to the byte-aligned window the panel will address */
static EpdStatus demo_patch(Epd_Display &display, const Rect &rect, uint16_t cell) {
    const AlignedRect aligned = partial_align_rect(rect);
    Plane plane;
    demo_checker_plane(aligned.rect.width(), aligned.rect.height(), cell, &plane);
    return display.display_partial(plane, rect);
}

static EpdStatus demo_step(Log_Interface &log, const char *name, EpdStatus st) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%s: %s", name, epd_status_label(st));
    if (st == EpdStatus::Ok) {
        log.info("DEMO", buf);
    } else {
        log.error("DEMO", buf, LogSeverity::Error);
    }
    return st;
}

EpdStatus demo_run(Epd_Display &display, Log_Interface &log) {
    EpdStatus st = demo_step(log, "init", display.init());
    if (st != EpdStatus::Ok) {
        return st;
    }
    st = demo_step(log, "clear", display.clear());
    if (st != EpdStatus::Ok) {
        return st;
    }

    {
        Plane black;
        Plane red;
        demo_black_plane(display.width(), display.height(), &black);
        demo_red_plane(display.width(), display.height(), &red);
        st = demo_step(log, "pattern", display.display(black, red));
    }
    if (st != EpdStatus::Ok) {
        return st;
    }

    st = demo_step(log, "init_part", display.init_part());
    if (st != EpdStatus::Ok) {
        return st;
    }

    const Rect first = {64U, 64U, 192U, 128U};
    st = demo_step(log, "partial 1", demo_patch(display, first, 16U));
    if (st != EpdStatus::Ok) {
        return st;
    }
    const Rect second = {300U, 200U, 437U, 260U};
    st = demo_step(log, "partial 2", demo_patch(display, second, 8U));
    if (st != EpdStatus::Ok) {
        return st;
    }

    return demo_step(log, "sleep", display.sleep());
}
