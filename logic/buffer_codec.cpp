/*
 * Buffer Codec Implementation - threshold, rotate, pack, invert
 */

#include "logic/buffer_codec.hpp"

static bool channels_supported(uint8_t channels) {
    return channels == 1U || channels == 3U || channels == 4U;
}

bool codec_is_white(const RasterImage &image, uint16_t x, uint16_t y) {
    const size_t idx = (static_cast<size_t>(y) * image.width + x) * image.channels;
    const uint8_t *px = image.pixels + idx;

    if (image.channels == 1U) {
        return px[0] >= 128U;
    }

    /* Unweighted average; alpha (channel 3) is ignored */
    uint16_t sum = static_cast<uint16_t>(px[0]) + px[1] + px[2];
    return sum >= CODEC_WHITE_SUM_MIN;
}

void codec_invert_bytes(const uint8_t *src, uint8_t *dst, size_t len) {
    for (size_t i = 0; i < len; i++) {
        dst[i] = static_cast<uint8_t>(src[i] ^ CODEC_INVERT_MASK);
    }
}

void codec_to_raw_plane(const Plane &plane, Plane *out) {
    out->width = plane.width;
    out->height = plane.height;
    out->bytes.resize(plane.bytes.size());
    codec_invert_bytes(plane.bytes.data(), out->bytes.data(), plane.bytes.size());
}

EpdStatus codec_encode(const RasterImage &image, uint16_t width, uint16_t height,
                       Plane *out) {
    /* Blank (logical white) plane is the fallback for every rejected input */
    *out = Plane(width, height, 0x00U);

    if (image.pixels == nullptr || !channels_supported(image.channels)) {
        return EpdStatus::InvalidArgument;
    }

    const bool direct = (image.width == width) && (image.height == height);
    const bool transposed = (image.width == height) && (image.height == width);
    if (!direct && !transposed) {
        return EpdStatus::DimensionMismatch;
    }

    /* Raster convention first: white pixels set their bit */
    const uint16_t bpr = out->bytes_per_row();
    for (uint16_t y = 0; y < height; y++) {
        uint8_t *row = out->bytes.data() + static_cast<size_t>(y) * bpr;
        for (uint16_t x = 0; x < width; x++) {
            uint16_t sx = x;
            uint16_t sy = y;
            if (!direct) {
                sx = y;
                sy = static_cast<uint16_t>(image.height - 1U - x);
            }
            if (codec_is_white(image, sx, sy)) {
                row[x / 8U] |= static_cast<uint8_t>(0x80U >> (x % 8U));
            }
        }
    }

    /* Single inversion into panel convention */
    codec_invert_bytes(out->bytes.data(), out->bytes.data(), out->bytes.size());

    return EpdStatus::Ok;
}

void codec_decode(const Plane &plane, GrayImage *out) {
    out->width = plane.width;
    out->height = plane.height;
    out->pixels.assign(static_cast<size_t>(plane.width) * plane.height, 255U);

    const uint16_t bpr = plane.bytes_per_row();
    if (plane.bytes.size() < static_cast<size_t>(bpr) * plane.height) {
        return;
    }

    for (uint16_t y = 0; y < plane.height; y++) {
        const uint8_t *row = plane.bytes.data() + static_cast<size_t>(y) * bpr;
        for (uint16_t x = 0; x < plane.width; x++) {
            /* Panel bit 1 = energized = black */
            bool energized = (row[x / 8U] & (0x80U >> (x % 8U))) != 0U;
            if (energized) {
                out->pixels[static_cast<size_t>(y) * plane.width + x] = 0U;
            }
        }
    }
}
