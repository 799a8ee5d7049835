/*
 * Hardware Configuration for the 7.5" Black/Red e-Paper Driver
 * Panel: 800x480 bi-color (black/red/white), command/data SPI + GPIO control
 */

#ifndef EPD_CONFIG_H
#define EPD_CONFIG_H

/*============================================================================
 * Panel Geometry
 *============================================================================*/
#define EPD_WIDTH               800U
#define EPD_HEIGHT              480U

/*============================================================================
 * Raspberry Pi Header Wiring (BCM numbering, Linux sysfs backend)
 *============================================================================*/
#define EPD_RST_PIN             17U
#define EPD_DC_PIN              25U      /* Low = command, high = data */
#define EPD_CS_PIN              8U       /* Active low, driven as plain GPIO */
#define EPD_BUSY_PIN            24U      /* Input */
#define EPD_PWR_PIN             18U      /* Panel supply enable */

/*============================================================================
 * Linux SPI (spidev)
 *============================================================================*/
#define EPD_SPI_DEVICE_PATH     "/dev/spidev0.0"
#define EPD_SPI_MODE            0U
#define EPD_SPI_SPEED_HZ        4000000U  /* 4MHz */
#define EPD_SPI_BITS_PER_WORD   8U
#define EPD_SPI_CHUNK_BYTES     4096U     /* Default spidev bufsiz */
#define EPD_SYSFS_GPIO_ROOT     "/sys/class/gpio"
#define EPD_SYSFS_EXPORT_MS     200U      /* udev needs time to chmod new lines */

/*============================================================================
 * Pico Wiring (SPI1, GPIO-controlled chip-select)
 *============================================================================*/
#define EPD_PICO_SPI_INSTANCE   spi1
#define EPD_PICO_SCK_PIN        10U
#define EPD_PICO_MOSI_PIN       11U
#define EPD_PICO_MISO_PIN       12U
#define EPD_PICO_CS_PIN         9U
#define EPD_PICO_DC_PIN         8U
#define EPD_PICO_RST_PIN        13U
#define EPD_PICO_BUSY_PIN       14U
#define EPD_PICO_PWR_PIN        15U

/*============================================================================
 * Protocol Timing
 *============================================================================*/
#define EPD_RESET_HIGH_MS       200U     /* Reset pulse: high, low, high */
#define EPD_RESET_LOW_MS        4U
#define EPD_CMD_SETTLE_MS       100U     /* After power-on (0x04) and refresh (0x12) */
#define EPD_BUSY_POLL_MS        20U      /* Between 0x71 status polls */
#define EPD_BUSY_SETTLE_MS      200U     /* After BUSY reports ready */
#define EPD_SLEEP_SETTLE_MS     2000U    /* After deep-sleep (0x07 0xA5) */

/*============================================================================
 * Busy Line
 *============================================================================*/
#define EPD_BUSY_READY_LEVEL    1U       /* BUSY is active-low: reads 1 when idle */

/*============================================================================
 * Partial Refresh
 *============================================================================*/
#define EPD_PARTIAL_SCAN_FLAG   0x01U    /* Trailing byte of the 0x90 window */
#define EPD_PARTIAL_SEED_BYTE   0xFFU    /* Raw all-white baseline */

#endif /* EPD_CONFIG_H */
