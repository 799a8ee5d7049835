/*
 * e-Paper Firmware - Main Entry Point
 * Brings up USB stdio, runs the demo sequence on the panel, then idles
 */

#include "config.h"
#include "types.h"

#include "utils/demo_frames.hpp"
#include "utils/epd_display.hpp"
#include "utils/stdio_log.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"

#include <cstdio>

static constexpr uint32_t FW_BUSY_TIMEOUT_MS = 30000U;

int main() {
    stdio_init_all();

    // Wait for USB host serial connection (up to 5s), then proceed regardless.
    for (int i = 0; i < 50 && !stdio_usb_connected(); i++) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("7.5\" Black/Red e-Paper Firmware\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("========================================\n\n");
    stdio_flush();

    static Stdio_Log log;
    PanelConfig cfg;
    cfg.width = EPD_WIDTH;
    cfg.height = EPD_HEIGHT;
    cfg.busy.timeout_ms = FW_BUSY_TIMEOUT_MS;

    static Epd_Display display(PinBusKind::Hardware, cfg, log);
    EpdStatus st = demo_run(display, log);
    printf("[INFO]  MAIN: demo finished: %s\n", epd_status_label(st));
    stdio_flush();

    while (true) {
        sleep_ms(1000);
    }
}
