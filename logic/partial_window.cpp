/*
 * Partial Window Implementation
 */

#include "logic/partial_window.hpp"
#include "config.h"

static inline uint32_t floor8(uint32_t v) {
    return v & ~7U;
}

static inline uint32_t ceil8(uint32_t v) {
    return (v + 7U) & ~7U;
}

AlignedRect partial_align_rect(const Rect &r) {
    const uint32_t xs = r.x_start;
    const uint32_t xe = r.x_end;

    uint32_t aligned_start = floor8(xs);
    uint32_t aligned_end;
    if (((xe - xs) % 8U) == 0U) {
        /* Already byte-wide: shift the window down to the byte boundary */
        aligned_end = floor8(xe);
    } else {
        aligned_end = ceil8(xe);
    }

    AlignedRect a;
    a.rect.x_start = static_cast<uint16_t>(aligned_start);
    a.rect.x_end = static_cast<uint16_t>(aligned_end);
    a.rect.y_start = r.y_start;
    a.rect.y_end = r.y_end;
    a.bytes_per_row = static_cast<uint16_t>((aligned_end - aligned_start) / 8U);
    return a;
}

bool partial_rect_valid(const Rect &r, uint16_t width, uint16_t height) {
    return r.x_start < r.x_end && r.x_end <= width &&
           r.y_start < r.y_end && r.y_end <= height;
}

bool partial_aligned_fits(const AlignedRect &a, uint16_t width) {
    return a.bytes_per_row > 0U && a.rect.x_end <= ceil8(width);
}

size_t partial_plane_size(const AlignedRect &a) {
    return static_cast<size_t>(a.bytes_per_row) * a.rect.height();
}

bool partial_plane_fits(const Plane &plane, const AlignedRect &a) {
    return plane.width == a.rect.width() && plane.height == a.rect.height() &&
           plane.size() == partial_plane_size(a);
}

void partial_window_bytes(const AlignedRect &a, uint8_t out[PARTIAL_WINDOW_LEN]) {
    const uint16_t x_last = static_cast<uint16_t>(a.rect.x_end - 1U);
    const uint16_t y_last = static_cast<uint16_t>(a.rect.y_end - 1U);

    out[0] = static_cast<uint8_t>(a.rect.x_start >> 8U);
    out[1] = static_cast<uint8_t>(a.rect.x_start & 0xFFU);
    out[2] = static_cast<uint8_t>(x_last >> 8U);
    out[3] = static_cast<uint8_t>(x_last & 0xFFU);
    out[4] = static_cast<uint8_t>(a.rect.y_start >> 8U);
    out[5] = static_cast<uint8_t>(a.rect.y_start & 0xFFU);
    out[6] = static_cast<uint8_t>(y_last >> 8U);
    out[7] = static_cast<uint8_t>(y_last & 0xFFU);
    out[8] = EPD_PARTIAL_SCAN_FLAG;
}

bool partial_needs_seed(const PanelSession &session) {
    return !session.partial_seeded;
}

void partial_mark_seeded(PanelSession &session) {
    session.partial_seeded = true;
}
