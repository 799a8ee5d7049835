/*
 * Buffer Codec - Raster image <-> packed 1bpp panel plane
 * Pure logic, no hardware dependencies, testable on host
 */

#ifndef BUFFER_CODEC_HPP
#define BUFFER_CODEC_HPP

#include "types.h"
#include <cstddef>
#include <cstdint>

/*============================================================================
 * Polarity
 *============================================================================
 * Raster convention: bit 1 = light/unset (white).
 * Panel convention:  bit 1 = pixel energized (black on the black plane,
 *                    red on the red plane).
 * encode() converts raster -> panel with exactly one XOR 0xFF pass;
 * codec_invert_bytes() is that same pass and is its own inverse.
 */
static constexpr uint8_t CODEC_INVERT_MASK = 0xFFU;
static constexpr uint16_t CODEC_WHITE_SUM_MIN = 3U * 128U;   /* (r+g+b)/3 >= 128 */

/*
 * Rotation applied when the input is the transpose of the target size:
 * 90 degrees clockwise. Target pixel (x, y) takes source pixel
 * (y, src_height - 1 - x). Not caller-selectable.
 */

/*
 * Encode a raster into a panel-polarity plane of width x height.
 *
 * Accepts the image as-is when its size matches, or rotated when it is the
 * transpose. Any other size yields an all-white (all 0x00) plane and
 * DimensionMismatch. A null pixel pointer or unsupported channel count
 * yields the same blank plane and InvalidArgument.
 *
 * Returns Ok on success. *out is always resized to the target geometry.
 */
EpdStatus codec_encode(const RasterImage &image, uint16_t width, uint16_t height,
                       Plane *out);

/*
 * Decode a panel-polarity plane back into an 8-bit grayscale raster
 * (0 = black, 255 = white) in canonical orientation. Row padding bits
 * are ignored; a short byte buffer decodes as all white.
 */
void codec_decode(const Plane &plane, GrayImage *out);

/*
 * Raw form of a panel-polarity plane: the contents the old-data RAM (0x10)
 * holds after a full refresh of that plane. Same geometry, every byte XORed
 * once. Epd_Panel inverts while streaming and does not call this; it is the
 * reference for checking panel RAM against a frame.
 */
void codec_to_raw_plane(const Plane &plane, Plane *out);

/* XOR every byte with 0xFF. src and dst may alias. */
void codec_invert_bytes(const uint8_t *src, uint8_t *dst, size_t len);

/* Thresholded raster sample: true if the pixel is logical white */
bool codec_is_white(const RasterImage &image, uint16_t x, uint16_t y);

#endif // BUFFER_CODEC_HPP
