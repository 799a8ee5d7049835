/*
 * Command set of the 7.5" black/red panel controller
 */

#ifndef EPD_COMMANDS_HPP
#define EPD_COMMANDS_HPP

// Power and panel configuration
#define EPD_CMD_PANEL_SETTING       0x00  // PSR
#define EPD_CMD_POWER_SETTING       0x01  // PWR
#define EPD_CMD_POWER_OFF           0x02  // POF
#define EPD_CMD_POWER_ON            0x04  // PON
#define EPD_CMD_BOOSTER_SOFT_START  0x06  // BTST
#define EPD_CMD_DEEP_SLEEP          0x07  // DSLP, followed by check code
#define EPD_CMD_DUAL_SPI            0x15  // DUSPI
#define EPD_CMD_VCOM_DATA_INTERVAL  0x50  // CDI
#define EPD_CMD_TCON_SETTING        0x60  // TCON
#define EPD_CMD_RESOLUTION          0x61  // TRES
#define EPD_CMD_CASCADE_SETTING     0xE0  // CCSET
#define EPD_CMD_FORCE_TEMPERATURE   0xE5  // TSSET

// RAM and refresh
#define EPD_CMD_DATA_START_1        0x10  // DTM1: black/white (old data in partial)
#define EPD_CMD_DISPLAY_REFRESH     0x12  // DRF
#define EPD_CMD_DATA_START_2        0x13  // DTM2: red (new data in partial)
#define EPD_CMD_GET_STATUS          0x71  // FLG

// Partial window
#define EPD_CMD_PARTIAL_WINDOW      0x90  // PTL
#define EPD_CMD_PARTIAL_IN          0x91  // PTIN
#define EPD_CMD_PARTIAL_OUT         0x92  // PTOUT

#define EPD_DEEP_SLEEP_CHECK_CODE   0xA5

#endif // EPD_COMMANDS_HPP
