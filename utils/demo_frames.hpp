/*
 * Demo_Frames - Test pattern planes and the demo refresh sequence
 * Shared by the host demo and the firmware image. Patterns are drawn
 * straight into panel-polarity planes (bit 1 = ink) so the firmware never
 * holds a full 8-bit raster.
 */

#ifndef DEMO_FRAMES_HPP
#define DEMO_FRAMES_HPP

#include "types.h"
#include "utils/epd_display.hpp"
#include "utils/log_interface.hpp"

#include <cstdint>

static constexpr uint16_t DEMO_BORDER_PX = 8U;

/* Black border and one 2px diagonal on white */
void demo_black_plane(uint16_t width, uint16_t height, Plane *out);

/* Accent block over the middle third */
void demo_red_plane(uint16_t width, uint16_t height, Plane *out);

/* Checkerboard of square cells, ink on even cells */
void demo_checker_plane(uint16_t width, uint16_t height, uint16_t cell, Plane *out);

/*
 * init -> clear -> framed pattern -> init_part -> two partial patches -> sleep.
 * Stops at the first failing step and returns its status.
 */
EpdStatus demo_run(Epd_Display &display, Log_Interface &log);

#endif /* DEMO_FRAMES_HPP */
