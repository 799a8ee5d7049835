/*
 * Partial Window - Byte alignment and baseline tracking for partial refresh
 * Pure logic, no hardware dependencies, testable on host
 */

#ifndef PARTIAL_WINDOW_HPP
#define PARTIAL_WINDOW_HPP

#include "types.h"
#include "logic/panel_session.hpp"
#include <cstddef>
#include <cstdint>

/* 0x90 payload: x_start, x_end-1, y_start, y_end-1 (big-endian u16) + scan flag */
static constexpr size_t PARTIAL_WINDOW_LEN = 9U;

/*============================================================================
 * Aligned Rectangle
 *============================================================================
 * SPI-addressable window derived from a caller rectangle. Columns are
 * addressed in whole bytes, so rect.x_start and rect.width() are
 * multiples of 8. Rows are not constrained.
 */
struct AlignedRect {
    Rect rect;
    uint16_t bytes_per_row;   /* rect.width() / 8 */
};

/*
 * Align a pixel rectangle to byte boundaries.
 *
 *   width % 8 == 0:  x_start and x_end are each floored to a multiple of 8
 *                    (the window keeps its width and is anchored at the floor)
 *   otherwise:       x_start floors, x_end rounds up to the next multiple of 8
 *
 * y is copied unchanged. Idempotent on its own output.
 */
AlignedRect partial_align_rect(const Rect &r);

/*
 * True if r is non-empty and lies inside a panel of width x height
 * (x_start < x_end <= width, y_start < y_end <= height).
 */
bool partial_rect_valid(const Rect &r, uint16_t width, uint16_t height);

/* True if the aligned window still addresses RAM columns of the panel */
bool partial_aligned_fits(const AlignedRect &a, uint16_t width);

/* Bytes the panel expects for one plane of the aligned window */
size_t partial_plane_size(const AlignedRect &a);

/*
 * True if plane is laid out for the aligned window: same width and height
 * and exactly partial_plane_size() bytes. A plane with the right byte count
 * but another shape would be scanned out scrambled.
 */
bool partial_plane_fits(const Plane &plane, const AlignedRect &a);

/* Serialize the 0x90 window payload */
void partial_window_bytes(const AlignedRect &a, uint8_t out[PARTIAL_WINDOW_LEN]);

/*
 * Baseline tracking. The first partial refresh after init_part must seed
 * the old-data RAM (0x10) with an all-white frame for the window.
 */
bool partial_needs_seed(const PanelSession &session);
void partial_mark_seeded(PanelSession &session);

#endif // PARTIAL_WINDOW_HPP
