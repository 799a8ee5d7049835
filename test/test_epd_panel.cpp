/*
 * Unit tests for the panel protocol (drivers/epd_panel) against a recording bus
 */

#include <gtest/gtest.h>

#include "drivers/epd_panel.hpp"
#include "drivers/epd_commands.hpp"
#include "mock_pin_bus.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Fixture
// ============================================================================

class EpdPanelTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto bus = std::make_unique<Mock_Pin_Bus>();
        bus_ = bus.get();
        PanelConfig cfg;
        cfg.width = 800;
        cfg.height = 480;
        panel_ = std::make_unique<Epd_Panel>(std::move(bus), cfg, log_);
    }

    /* Command bytes and payloads of everything sent since the last clear_log() */
    std::vector<Exchange> sent() const { return bus_->exchanges(); }

    Recording_Log log_;
    Mock_Pin_Bus *bus_ = nullptr;   /* Owned by panel_ */
    std::unique_ptr<Epd_Panel> panel_;
};

static void expect_exchange(const Exchange &e, uint8_t cmd, const Bytes &data) {
    EXPECT_EQ(e.cmd, cmd);
    EXPECT_EQ(e.data, data) << "command 0x" << std::hex << static_cast<int>(cmd);
}

static bool all_equal(const Bytes &data, uint8_t value) {
    for (uint8_t b : data) {
        if (b != value) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// EpdPanelTest: Init
// ============================================================================

TEST_F(EpdPanelTest, InitFullSendsReferenceSequence) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 8u);
    expect_exchange(ex[0], EPD_CMD_POWER_SETTING, {0x07, 0x07, 0x3F, 0x3F});
    expect_exchange(ex[1], EPD_CMD_BOOSTER_SOFT_START, {0x17, 0x17, 0x28, 0x17});
    expect_exchange(ex[2], EPD_CMD_POWER_ON, {});
    expect_exchange(ex[3], EPD_CMD_PANEL_SETTING, {0x0F});
    expect_exchange(ex[4], EPD_CMD_RESOLUTION, {0x03, 0x20, 0x01, 0xE0});
    expect_exchange(ex[5], EPD_CMD_DUAL_SPI, {0x00});
    expect_exchange(ex[6], EPD_CMD_VCOM_DATA_INTERVAL, {0x11, 0x07});
    expect_exchange(ex[7], EPD_CMD_TCON_SETTING, {0x22});

    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
    EXPECT_EQ(panel_->session().mode, PanelMode::Full);
}

TEST_F(EpdPanelTest, InitFastSendsReferenceSequence) {
    ASSERT_EQ(panel_->init_fast(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 6u);
    expect_exchange(ex[0], EPD_CMD_PANEL_SETTING, {0x0F});
    expect_exchange(ex[1], EPD_CMD_POWER_ON, {});
    expect_exchange(ex[2], EPD_CMD_BOOSTER_SOFT_START, {0x27, 0x27, 0x18, 0x17});
    expect_exchange(ex[3], EPD_CMD_CASCADE_SETTING, {0x02});
    expect_exchange(ex[4], EPD_CMD_FORCE_TEMPERATURE, {0x5A});
    expect_exchange(ex[5], EPD_CMD_VCOM_DATA_INTERVAL, {0x11, 0x07});

    EXPECT_EQ(panel_->session().mode, PanelMode::Fast);
}

TEST_F(EpdPanelTest, InitPartSendsReferenceSequence) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 5u);
    expect_exchange(ex[0], EPD_CMD_PANEL_SETTING, {0x1F});
    expect_exchange(ex[1], EPD_CMD_POWER_ON, {});
    expect_exchange(ex[2], EPD_CMD_CASCADE_SETTING, {0x02});
    expect_exchange(ex[3], EPD_CMD_FORCE_TEMPERATURE, {0x6E});
    expect_exchange(ex[4], EPD_CMD_VCOM_DATA_INTERVAL, {0xA9, 0x07});

    EXPECT_EQ(panel_->session().mode, PanelMode::Partial);
    EXPECT_FALSE(panel_->session().partial_seeded);
}

TEST_F(EpdPanelTest, InitStartsWithResetPulse) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);

    std::vector<bool> reset_levels;
    for (const auto &c : bus_->calls) {
        if (c.type == BusCallType::Write && c.pin == PinId::Reset) {
            reset_levels.push_back(c.level);
        }
    }
    ASSERT_EQ(reset_levels.size(), 3u);
    EXPECT_TRUE(reset_levels[0]);
    EXPECT_FALSE(reset_levels[1]);
    EXPECT_TRUE(reset_levels[2]);

    /* Reset 200/4/200, power-on settle, post-busy settle */
    std::vector<uint32_t> d = bus_->delays();
    ASSERT_GE(d.size(), 5u);
    EXPECT_EQ(d[0], 200u);
    EXPECT_EQ(d[1], 4u);
    EXPECT_EQ(d[2], 200u);
    EXPECT_EQ(d[3], 100u);
    EXPECT_EQ(d[4], 200u);
}

TEST_F(EpdPanelTest, InitAcquiresBusFirst) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    ASSERT_FALSE(bus_->calls.empty());
    EXPECT_EQ(bus_->calls[0].type, BusCallType::Init);
}

TEST_F(EpdPanelTest, InitBusFailureFaults) {
    bus_->fail_init = true;
    EXPECT_EQ(panel_->init(), EpdStatus::HardwareError);
    EXPECT_EQ(panel_->session().state, SessionState::Faulted);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
}

// ============================================================================
// EpdPanelTest: Framing
// ============================================================================

TEST_F(EpdPanelTest, CommandsAndDataAreFramedByChipSelect) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);

    EXPECT_EQ(bus_->stray_transfers, 0u);
    EXPECT_TRUE(bus_->level(PinId::ChipSelect));
    for (const auto &f : bus_->frames) {
        if (!f.is_data) {
            EXPECT_EQ(f.bytes.size(), 1u);
        }
    }
}

TEST_F(EpdPanelTest, LargePayloadIsOneChipSelectAssertion) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();
    ASSERT_EQ(panel_->clear(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_GE(ex.size(), 2u);
    EXPECT_EQ(ex[0].data_frames, 1u);
    EXPECT_EQ(ex[1].data_frames, 1u);
}

// ============================================================================
// EpdPanelTest: Display
// ============================================================================

TEST_F(EpdPanelTest, DisplayReinvertsBlackPlaneOnly) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    Plane black(800, 480, 0x00);
    black.bytes[0] = 0xF0;
    black.bytes[47999] = 0x01;
    Plane red(800, 480, 0x00);
    red.bytes[5] = 0x3C;

    ASSERT_EQ(panel_->display(black, red), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 3u);

    EXPECT_EQ(ex[0].cmd, EPD_CMD_DATA_START_1);
    ASSERT_EQ(ex[0].data.size(), 48000u);
    EXPECT_EQ(ex[0].data[0], 0x0F);
    EXPECT_EQ(ex[0].data[1], 0xFF);
    EXPECT_EQ(ex[0].data[47999], 0xFE);

    EXPECT_EQ(ex[1].cmd, EPD_CMD_DATA_START_2);
    ASSERT_EQ(ex[1].data.size(), 48000u);
    EXPECT_EQ(ex[1].data[0], 0x00);
    EXPECT_EQ(ex[1].data[5], 0x3C);
    EXPECT_EQ(ex[1].data, red.bytes);

    expect_exchange(ex[2], EPD_CMD_DISPLAY_REFRESH, {});
}

TEST_F(EpdPanelTest, DisplayRefreshSettlesThenWaits) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->display(Plane(800, 480, 0x00), Plane(800, 480, 0x00)), EpdStatus::Ok);

    std::vector<uint32_t> d = bus_->delays();
    ASSERT_EQ(d.size(), 2u);
    EXPECT_EQ(d[0], 100u);
    EXPECT_EQ(d[1], 200u);

    /* Status poll follows the refresh command */
    std::vector<uint8_t> cmds = bus_->command_bytes(false);
    ASSERT_GE(cmds.size(), 2u);
    EXPECT_EQ(cmds[cmds.size() - 2], EPD_CMD_DISPLAY_REFRESH);
    EXPECT_EQ(cmds.back(), EPD_CMD_GET_STATUS);
}

TEST_F(EpdPanelTest, DisplayBlackOnlySendsBlankRed) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->display(Plane(800, 480, 0xFF)), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 3u);
    EXPECT_TRUE(all_equal(ex[0].data, 0x00));
    ASSERT_EQ(ex[1].data.size(), 48000u);
    EXPECT_TRUE(all_equal(ex[1].data, 0x00));
}

TEST_F(EpdPanelTest, DisplayValidInFastMode) {
    ASSERT_EQ(panel_->init_fast(), EpdStatus::Ok);
    EXPECT_EQ(panel_->display(Plane(800, 480, 0x00)), EpdStatus::Ok);
}

TEST_F(EpdPanelTest, DisplayWrongPlaneSizeIsRejectedWithoutTraffic) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    EXPECT_EQ(panel_->display(Plane(800, 479, 0x00), Plane(800, 480, 0x00)),
              EpdStatus::InvalidArgument);
    EXPECT_EQ(panel_->display(Plane(800, 480, 0x00), Plane()), EpdStatus::InvalidArgument);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
}

TEST_F(EpdPanelTest, DisplayBeforeInitIsStateError) {
    EXPECT_EQ(panel_->display(Plane(800, 480, 0x00)), EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
    EXPECT_EQ(panel_->session().state, SessionState::Uninitialized);
    EXPECT_TRUE(log_.contains("PROTOCOL_STATE_ERROR"));
}

// ============================================================================
// EpdPanelTest: Clear
// ============================================================================

TEST_F(EpdPanelTest, ClearSendsWhiteFrame) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->clear(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 3u);
    EXPECT_EQ(ex[0].cmd, EPD_CMD_DATA_START_1);
    ASSERT_EQ(ex[0].data.size(), 48000u);
    EXPECT_TRUE(all_equal(ex[0].data, 0xFF));
    EXPECT_EQ(ex[1].cmd, EPD_CMD_DATA_START_2);
    ASSERT_EQ(ex[1].data.size(), 48000u);
    EXPECT_TRUE(all_equal(ex[1].data, 0x00));
    EXPECT_EQ(ex[2].cmd, EPD_CMD_DISPLAY_REFRESH);
}

TEST_F(EpdPanelTest, ClearMatchesDisplayOfBlankPlanes) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();
    ASSERT_EQ(panel_->clear(), EpdStatus::Ok);
    std::vector<Exchange> cleared = sent();

    bus_->clear_log();
    ASSERT_EQ(panel_->display(Plane(800, 480, 0x00)), EpdStatus::Ok);
    std::vector<Exchange> displayed = sent();

    ASSERT_EQ(cleared.size(), displayed.size());
    for (size_t i = 0; i < cleared.size(); i++) {
        EXPECT_EQ(cleared[i].cmd, displayed[i].cmd);
        EXPECT_EQ(cleared[i].data, displayed[i].data);
    }
}

TEST_F(EpdPanelTest, BaseColorFillsBothPlanes) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->display_base_color(0x0F), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 3u);
    EXPECT_EQ(ex[0].cmd, EPD_CMD_DATA_START_1);
    EXPECT_EQ(ex[0].data.size(), 48000u);
    EXPECT_TRUE(all_equal(ex[0].data, 0x0F));
    EXPECT_EQ(ex[1].cmd, EPD_CMD_DATA_START_2);
    EXPECT_TRUE(all_equal(ex[1].data, 0xF0));
    EXPECT_EQ(ex[2].cmd, EPD_CMD_DISPLAY_REFRESH);
}

// ============================================================================
// EpdPanelTest: Partial
// ============================================================================

TEST_F(EpdPanelTest, PartialBeforeInitPartDoesNoHardwareWrites) {
    EXPECT_EQ(panel_->display_partial(Plane(80, 50, 0x00), {10, 0, 90, 50}),
              EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
    EXPECT_EQ(bus_->count(BusCallType::Transfer), 0u);
}

TEST_F(EpdPanelTest, PartialInFullModeIsStateError) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    EXPECT_EQ(panel_->display_partial(Plane(80, 50, 0x00), {10, 0, 90, 50}),
              EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->count(BusCallType::Transfer), 0u);
    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
}

TEST_F(EpdPanelTest, FirstPartialSeedsWindowBeforeNewData) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    Plane patch(80, 50, 0xA5);
    ASSERT_EQ(panel_->display_partial(patch, {10, 0, 90, 50}), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 5u);
    expect_exchange(ex[0], EPD_CMD_PARTIAL_IN, {});
    expect_exchange(ex[1], EPD_CMD_PARTIAL_WINDOW,
                    {0x00, 0x08, 0x00, 0x57, 0x00, 0x00, 0x00, 0x31, 0x01});
    EXPECT_EQ(ex[2].cmd, EPD_CMD_DATA_START_1);
    ASSERT_EQ(ex[2].data.size(), 500u);
    EXPECT_TRUE(all_equal(ex[2].data, 0xFF));
    EXPECT_EQ(ex[3].cmd, EPD_CMD_DATA_START_2);
    EXPECT_EQ(ex[3].data, patch.bytes);
    expect_exchange(ex[4], EPD_CMD_DISPLAY_REFRESH, {});

    EXPECT_TRUE(panel_->session().partial_seeded);
}

TEST_F(EpdPanelTest, SecondPartialSkipsSeed) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    Plane patch(80, 50, 0x00);
    ASSERT_EQ(panel_->display_partial(patch, {10, 0, 90, 50}), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->display_partial(patch, {10, 0, 90, 50}), EpdStatus::Ok);

    std::vector<uint8_t> cmds = bus_->command_bytes();
    const std::vector<uint8_t> expected = {EPD_CMD_PARTIAL_IN, EPD_CMD_PARTIAL_WINDOW,
                                           EPD_CMD_DATA_START_2, EPD_CMD_DISPLAY_REFRESH};
    EXPECT_EQ(cmds, expected);
}

TEST_F(EpdPanelTest, ReinitPartSeedsAgain) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    Plane patch(80, 50, 0x00);
    ASSERT_EQ(panel_->display_partial(patch, {10, 0, 90, 50}), EpdStatus::Ok);

    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();
    ASSERT_EQ(panel_->display_partial(patch, {10, 0, 90, 50}), EpdStatus::Ok);

    std::vector<uint8_t> cmds = bus_->command_bytes();
    ASSERT_GE(cmds.size(), 3u);
    EXPECT_EQ(cmds[2], EPD_CMD_DATA_START_1);
}

TEST_F(EpdPanelTest, PartialUnalignedRectWidensWindow) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    /* 13..30 widens to 8..32: three bytes per row, four rows */
    Plane patch(24, 4, 0xFF);
    ASSERT_EQ(panel_->display_partial(patch, {13, 5, 30, 9}), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_GE(ex.size(), 4u);
    expect_exchange(ex[1], EPD_CMD_PARTIAL_WINDOW,
                    {0x00, 0x08, 0x00, 0x1F, 0x00, 0x05, 0x00, 0x08, 0x01});
    EXPECT_EQ(ex[2].data.size(), 12u);
    EXPECT_EQ(ex[3].data.size(), 12u);
}

TEST_F(EpdPanelTest, PartialWrongPlaneSizeKeepsSessionUntouched) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    EXPECT_EQ(panel_->display_partial(Plane(80, 49, 0x00), {10, 0, 90, 50}),
              EpdStatus::InvalidArgument);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
    EXPECT_FALSE(panel_->session().partial_seeded);
}

TEST_F(EpdPanelTest, PartialPlaneWithWrongShapeIsRejected) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    /* 40 x 100 carries the same 500 bytes as the 80 x 50 window */
    Plane tall(40, 100, 0xFF);
    ASSERT_EQ(tall.size(), 500u);
    EXPECT_EQ(panel_->display_partial(tall, {10, 0, 90, 50}), EpdStatus::InvalidArgument);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
    EXPECT_FALSE(panel_->session().partial_seeded);
}

TEST_F(EpdPanelTest, PartialRectOutsidePanelRejected) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->clear_log();

    EXPECT_EQ(panel_->display_partial(Plane(104, 10, 0x00), {700, 0, 801, 10}),
              EpdStatus::InvalidArgument);
    EXPECT_EQ(panel_->display_partial(Plane(8, 0, 0x00), {0, 5, 8, 5}),
              EpdStatus::InvalidArgument);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
}

// ============================================================================
// EpdPanelTest: Busy
// ============================================================================

TEST_F(EpdPanelTest, BusyPollsStatusUntilReady) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();
    bus_->busy_pending = 3;

    ASSERT_EQ(panel_->clear(), EpdStatus::Ok);

    size_t polls = 0;
    for (uint8_t c : bus_->command_bytes(false)) {
        if (c == EPD_CMD_GET_STATUS) {
            polls++;
        }
    }
    EXPECT_EQ(polls, 4u);
    EXPECT_EQ(bus_->count(BusCallType::Read), 4u);

    std::vector<uint32_t> d = bus_->delays();
    const std::vector<uint32_t> expected = {100, 20, 20, 20, 200};
    EXPECT_EQ(d, expected);
}

TEST_F(EpdPanelTest, BusyDeadlineExpiryFaultsSession) {
    BusyDeadline deadline;
    deadline.timeout_ms = 1000;
    panel_->set_busy_deadline(deadline);
    bus_->stuck_busy = true;

    EXPECT_EQ(panel_->init(), EpdStatus::BusyTimeout);
    EXPECT_EQ(panel_->session().state, SessionState::Faulted);
    EXPECT_GE(bus_->millis(), 1000u);
    EXPECT_TRUE(log_.contains("BUSY_TIMEOUT"));

    /* Faulted: refresh rejected until a new init */
    bus_->clear_log();
    EXPECT_EQ(panel_->clear(), EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);

    bus_->stuck_busy = false;
    EXPECT_EQ(panel_->init(), EpdStatus::Ok);
    EXPECT_EQ(panel_->session().state, SessionState::Initialized);
}

TEST_F(EpdPanelTest, UnboundedBusyWaitOutlastsLongBusy) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->busy_pending = 500;   /* 10 s of polling */
    EXPECT_EQ(panel_->clear(), EpdStatus::Ok);
}

TEST_F(EpdPanelTest, CancelFlagStopsBusyWait) {
    volatile bool cancel = false;
    BusyDeadline deadline;
    deadline.cancel = &cancel;
    panel_->set_busy_deadline(deadline);

    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    cancel = true;

    EXPECT_EQ(panel_->clear(), EpdStatus::Cancelled);
    EXPECT_EQ(panel_->session().state, SessionState::Faulted);

    /* Cancelled between steps, never inside a frame */
    EXPECT_TRUE(bus_->level(PinId::ChipSelect));
}

// ============================================================================
// EpdPanelTest: Faults
// ============================================================================

TEST_F(EpdPanelTest, TransferFailurePropagatesAndDeselects) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();
    bus_->fail_after = 3;   /* Inside the 0x10 payload */

    EXPECT_EQ(panel_->clear(), EpdStatus::HardwareError);
    EXPECT_EQ(panel_->session().state, SessionState::Faulted);
    EXPECT_TRUE(bus_->level(PinId::ChipSelect));
    EXPECT_TRUE(log_.contains("HARDWARE_ERROR"));
}

TEST_F(EpdPanelTest, NoRetryAfterFailure) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();
    bus_->fail_after = 0;

    EXPECT_EQ(panel_->clear(), EpdStatus::HardwareError);
    /* Exactly the failed command transfer, nothing afterwards */
    EXPECT_EQ(bus_->count(BusCallType::Transfer), 1u);
}

TEST_F(EpdPanelTest, FaultedSessionRecoversWithInit) {
    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    bus_->fail_after = 0;
    EXPECT_EQ(panel_->display_partial(Plane(80, 50, 0x00), {10, 0, 90, 50}),
              EpdStatus::HardwareError);
    EXPECT_EQ(panel_->display_partial(Plane(80, 50, 0x00), {10, 0, 90, 50}),
              EpdStatus::ProtocolStateError);

    ASSERT_EQ(panel_->init_part(), EpdStatus::Ok);
    EXPECT_EQ(panel_->display_partial(Plane(80, 50, 0x00), {10, 0, 90, 50}), EpdStatus::Ok);
}

// ============================================================================
// EpdPanelTest: Sleep
// ============================================================================

TEST_F(EpdPanelTest, SleepPowersOffThenDeepSleeps) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->clear_log();

    ASSERT_EQ(panel_->sleep(), EpdStatus::Ok);

    std::vector<Exchange> ex = sent();
    ASSERT_EQ(ex.size(), 2u);
    expect_exchange(ex[0], EPD_CMD_POWER_OFF, {});
    expect_exchange(ex[1], EPD_CMD_DEEP_SLEEP, {0xA5});

    /* Power-off is followed by a status poll */
    std::vector<uint8_t> all = bus_->command_bytes(false);
    ASSERT_GE(all.size(), 2u);
    EXPECT_EQ(all[1], EPD_CMD_GET_STATUS);

    /* 2 s settle happens before the transport is released */
    int settle_at = -1;
    int teardown_at = -1;
    for (size_t i = 0; i < bus_->calls.size(); i++) {
        const BusCall &c = bus_->calls[i];
        if (c.type == BusCallType::DelayMs && c.value == 2000u) {
            settle_at = static_cast<int>(i);
        }
        if (c.type == BusCallType::Teardown) {
            teardown_at = static_cast<int>(i);
        }
    }
    ASSERT_GE(settle_at, 0);
    ASSERT_GE(teardown_at, 0);
    EXPECT_LT(settle_at, teardown_at);

    EXPECT_EQ(panel_->session().state, SessionState::Sleeping);
}

TEST_F(EpdPanelTest, SleepingRejectsUntilReinit) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    ASSERT_EQ(panel_->sleep(), EpdStatus::Ok);
    bus_->clear_log();

    EXPECT_EQ(panel_->clear(), EpdStatus::ProtocolStateError);
    EXPECT_EQ(panel_->sleep(), EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);

    ASSERT_EQ(panel_->init_fast(), EpdStatus::Ok);
    EXPECT_EQ(bus_->count(BusCallType::Init), 1u);
    EXPECT_EQ(panel_->clear(), EpdStatus::Ok);
}

TEST_F(EpdPanelTest, SleepBeforeInitIsStateError) {
    EXPECT_EQ(panel_->sleep(), EpdStatus::ProtocolStateError);
    EXPECT_EQ(bus_->hardware_traffic(), 0u);
}

TEST_F(EpdPanelTest, TeardownFailureDuringSleepFaults) {
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);
    bus_->fail_teardown = true;

    EXPECT_EQ(panel_->sleep(), EpdStatus::HardwareError);
    EXPECT_EQ(panel_->session().state, SessionState::Faulted);
    bus_->fail_teardown = false;
}

TEST_F(EpdPanelTest, DestructorReleasesTransport) {
    int teardowns = 0;
    bus_->teardown_sink = &teardowns;
    ASSERT_EQ(panel_->init(), EpdStatus::Ok);

    panel_.reset();
    bus_ = nullptr;
    EXPECT_EQ(teardowns, 1);
}
