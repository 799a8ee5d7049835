/*
 * Core Type Definitions for the bi-color e-Paper driver
 * Shared by the pure logic modules, the backends and the protocol layer
 */

#ifndef EPD_TYPES_H
#define EPD_TYPES_H

#include <cstddef>
#include <cstdint>
#include <vector>

/*============================================================================
 * Status Codes
 *============================================================================
 *
 * Every fallible operation returns one of these. Ok is the only success
 * value; the rest map onto the error taxonomy:
 *
 *   DimensionMismatch   codec substituted a blank plane (recoverable)
 *   HardwareError       GPIO/SPI transport failure (session -> Faulted)
 *   ProtocolStateError  operation not valid in the current session state
 *   BusyTimeout         busy-wait deadline expired (session -> Faulted)
 *   Cancelled           busy-wait observed the cancel flag (session -> Faulted)
 *   InvalidArgument     plane/rectangle does not fit the panel geometry
 */
enum class EpdStatus : uint8_t {
    Ok,
    DimensionMismatch,
    HardwareError,
    ProtocolStateError,
    BusyTimeout,
    Cancelled,
    InvalidArgument
};

inline const char *epd_status_label(EpdStatus status) {
    switch (status) {
        case EpdStatus::Ok:                 return "OK";
        case EpdStatus::DimensionMismatch:  return "DIMENSION_MISMATCH";
        case EpdStatus::HardwareError:      return "HARDWARE_ERROR";
        case EpdStatus::ProtocolStateError: return "PROTOCOL_STATE_ERROR";
        case EpdStatus::BusyTimeout:        return "BUSY_TIMEOUT";
        case EpdStatus::Cancelled:          return "CANCELLED";
        case EpdStatus::InvalidArgument:    return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

/*============================================================================
 * Plane
 *============================================================================
 * One packed 1bpp layer. MSB-first within a byte, row-major, rows padded
 * to whole bytes only at the row end: bytes.size() == ceil(width/8)*height.
 */
struct Plane {
    uint16_t width = 0;
    uint16_t height = 0;
    std::vector<uint8_t> bytes;

    Plane() = default;
    Plane(uint16_t w, uint16_t h, uint8_t fill)
        : width(w), height(h),
          bytes(static_cast<size_t>((w + 7U) / 8U) * h, fill) {}

    uint16_t bytes_per_row() const { return static_cast<uint16_t>((width + 7U) / 8U); }
    size_t size() const { return bytes.size(); }
};

/*============================================================================
 * Rectangle (pixel coordinates, half-open on the end edges)
 *============================================================================*/
struct Rect {
    uint16_t x_start = 0;
    uint16_t y_start = 0;
    uint16_t x_end = 0;
    uint16_t y_end = 0;

    uint16_t width() const { return static_cast<uint16_t>(x_end - x_start); }
    uint16_t height() const { return static_cast<uint16_t>(y_end - y_start); }

    bool operator==(const Rect &o) const {
        return x_start == o.x_start && y_start == o.y_start &&
               x_end == o.x_end && y_end == o.y_end;
    }
    bool operator!=(const Rect &o) const { return !(*this == o); }
};

/*============================================================================
 * Raster Image (non-owning view)
 *============================================================================
 * channels: 1 = grayscale, 3 = RGB, 4 = RGBA (alpha ignored).
 * Pixels are row-major and tightly packed.
 */
struct RasterImage {
    uint16_t width = 0;
    uint16_t height = 0;
    uint8_t channels = 1;
    const uint8_t *pixels = nullptr;
};

/* Owned 8-bit grayscale raster, produced by decode() */
struct GrayImage {
    uint16_t width = 0;
    uint16_t height = 0;
    std::vector<uint8_t> pixels;

    RasterImage view() const { return {width, height, 1, pixels.data()}; }
};

/*============================================================================
 * Panel Session
 *============================================================================*/
enum class PanelMode : uint8_t { Full, Fast, Partial };

enum class SessionState : uint8_t {
    Uninitialized,
    Initialized,
    Sleeping,
    Faulted        /* Transport failure or busy deadline: re-init required */
};

/*============================================================================
 * Busy Deadline
 *============================================================================
 * timeout_ms == 0 means the busy-wait may block indefinitely.
 * cancel, when set, is polled once per busy-wait iteration.
 */
struct BusyDeadline {
    uint32_t timeout_ms = 0;
    const volatile bool *cancel = nullptr;
};

/* Runtime configuration fixed at construction */
struct PanelConfig {
    uint16_t width;
    uint16_t height;
    BusyDeadline busy;
};

#endif /* EPD_TYPES_H */
