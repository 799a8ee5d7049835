/*
 * Sysfs_Pin_Bus Implementation - sysfs GPIO + spidev on Linux
 */

#include "drivers/sysfs_pin_bus.hpp"

#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

static constexpr PinId ALL_PINS[] = {PinId::Reset, PinId::DataCommand, PinId::ChipSelect,
                                     PinId::Busy, PinId::Power};

static inline size_t pin_index(PinId pin) {
    return static_cast<size_t>(pin);
}

Sysfs_Pin_Bus::Sysfs_Pin_Bus(Log_Interface &log) : log_(log) {}

Sysfs_Pin_Bus::~Sysfs_Pin_Bus() {
    if (teardown() != EpdStatus::Ok) {
        log_.error("GPIO", "Teardown incomplete in destructor", LogSeverity::Warning);
    }
}

unsigned Sysfs_Pin_Bus::gpio_number(PinId pin) {
    switch (pin) {
        case PinId::Reset:       return EPD_RST_PIN;
        case PinId::DataCommand: return EPD_DC_PIN;
        case PinId::ChipSelect:  return EPD_CS_PIN;
        case PinId::Busy:        return EPD_BUSY_PIN;
        case PinId::Power:       return EPD_PWR_PIN;
    }
    return 0U;
}

bool Sysfs_Pin_Bus::is_output(PinId pin) {
    return pin != PinId::Busy;
}

void Sysfs_Pin_Bus::log_errno(const char *what, int err) {
    char buf[128];
    snprintf(buf, sizeof(buf), "%s: %s", what, strerror(err));
    log_.error("GPIO", buf, LogSeverity::Error);
}

bool Sysfs_Pin_Bus::write_file(const char *path, const char *value, int *err_out) {
    int fd = open(path, O_WRONLY);
    if (fd < 0) {
        *err_out = errno;
        return false;
    }
    const size_t len = strlen(value);
    ssize_t n = write(fd, value, len);
    int err = errno;
    close(fd);
    if (n != static_cast<ssize_t>(len)) {
        *err_out = (n < 0) ? err : EIO;
        return false;
    }
    *err_out = 0;
    return true;
}

bool Sysfs_Pin_Bus::setup_line(PinId pin) {
    const unsigned gpio = gpio_number(pin);
    const size_t idx = pin_index(pin);
    char path[64];
    char num[8];
    int err = 0;

    snprintf(num, sizeof(num), "%u", gpio);
    if (write_file(EPD_SYSFS_GPIO_ROOT "/export", num, &err)) {
        exported_[idx] = true;
        delay_ms(EPD_SYSFS_EXPORT_MS);
    } else if (err == EBUSY) {
        /* Exported by a previous run; reuse it */
        char buf[48];
        snprintf(buf, sizeof(buf), "GPIO %u already exported", gpio);
        log_.info("GPIO", buf);
    } else {
        log_errno("export", err);
        return false;
    }

    snprintf(path, sizeof(path), EPD_SYSFS_GPIO_ROOT "/gpio%u/direction", gpio);
    if (!write_file(path, is_output(pin) ? "out" : "in", &err)) {
        log_errno(path, err);
        return false;
    }

    snprintf(path, sizeof(path), EPD_SYSFS_GPIO_ROOT "/gpio%u/value", gpio);
    value_fd_[idx] = open(path, is_output(pin) ? O_RDWR : O_RDONLY);
    if (value_fd_[idx] < 0) {
        log_errno(path, errno);
        return false;
    }
    return true;
}

bool Sysfs_Pin_Bus::open_spi() {
    spi_fd_ = open(EPD_SPI_DEVICE_PATH, O_RDWR);
    if (spi_fd_ < 0) {
        log_errno(EPD_SPI_DEVICE_PATH, errno);
        return false;
    }

    uint8_t mode = EPD_SPI_MODE;
    uint8_t bits = EPD_SPI_BITS_PER_WORD;
    uint32_t speed = EPD_SPI_SPEED_HZ;
    if (ioctl(spi_fd_, SPI_IOC_WR_MODE, &mode) < 0 ||
        ioctl(spi_fd_, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
        ioctl(spi_fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        log_errno("spidev configure", errno);
        return false;
    }
    return true;
}

EpdStatus Sysfs_Pin_Bus::init() {
    if (initialized_) {
        return EpdStatus::Ok;
    }

    log_.info("GPIO", "Initializing e-paper transport (sysfs GPIO + spidev)");

    for (PinId pin : ALL_PINS) {
        if (!setup_line(pin)) {
            release();
            return EpdStatus::HardwareError;
        }
    }
    initialized_ = true;

    if (digital_write(PinId::Power, true) != EpdStatus::Ok || !open_spi()) {
        release();
        return EpdStatus::HardwareError;
    }

    log_.info("GPIO", "Transport ready");
    return EpdStatus::Ok;
}

EpdStatus Sysfs_Pin_Bus::digital_write(PinId pin, bool level) {
    const int fd = value_fd_[pin_index(pin)];
    if (!initialized_ || !is_output(pin) || fd < 0) {
        return EpdStatus::HardwareError;
    }

    const char c = level ? '1' : '0';
    if (pwrite(fd, &c, 1, 0) != 1) {
        log_errno("gpio write", errno);
        return EpdStatus::HardwareError;
    }
    return EpdStatus::Ok;
}

EpdStatus Sysfs_Pin_Bus::digital_read(PinId pin, bool *level) {
    const int fd = value_fd_[pin_index(pin)];
    if (!initialized_ || fd < 0) {
        return EpdStatus::HardwareError;
    }

    char c = 0;
    if (pread(fd, &c, 1, 0) != 1) {
        log_errno("gpio read", errno);
        return EpdStatus::HardwareError;
    }
    *level = (c == '1');
    return EpdStatus::Ok;
}

EpdStatus Sysfs_Pin_Bus::spi_transfer(const uint8_t *tx, uint8_t *rx, size_t len) {
    if (!initialized_ || spi_fd_ < 0) {
        return EpdStatus::HardwareError;
    }

    size_t offset = 0;
    while (offset < len) {
        size_t chunk = len - offset;
        if (chunk > EPD_SPI_CHUNK_BYTES) {
            chunk = EPD_SPI_CHUNK_BYTES;
        }

        struct spi_ioc_transfer tr;
        memset(&tr, 0, sizeof(tr));
        tr.tx_buf = reinterpret_cast<uintptr_t>(tx + offset);
        tr.rx_buf = (rx != nullptr) ? reinterpret_cast<uintptr_t>(rx + offset) : 0U;
        tr.len = static_cast<uint32_t>(chunk);
        tr.speed_hz = EPD_SPI_SPEED_HZ;
        tr.bits_per_word = EPD_SPI_BITS_PER_WORD;

        if (ioctl(spi_fd_, SPI_IOC_MESSAGE(1), &tr) < 0) {
            log_errno("spi transfer", errno);
            return EpdStatus::HardwareError;
        }
        offset += chunk;
    }
    return EpdStatus::Ok;
}

void Sysfs_Pin_Bus::delay_ms(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

void Sysfs_Pin_Bus::delay_us(uint32_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

uint32_t Sysfs_Pin_Bus::millis() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

void Sysfs_Pin_Bus::release() {
    if (spi_fd_ >= 0) {
        close(spi_fd_);
        spi_fd_ = -1;
    }

    for (PinId pin : ALL_PINS) {
        const size_t idx = pin_index(pin);
        if (value_fd_[idx] >= 0) {
            close(value_fd_[idx]);
            value_fd_[idx] = -1;
        }
        if (exported_[idx]) {
            char num[8];
            int err = 0;
            snprintf(num, sizeof(num), "%u", gpio_number(pin));
            if (!write_file(EPD_SYSFS_GPIO_ROOT "/unexport", num, &err)) {
                log_errno("unexport", err);
            }
            exported_[idx] = false;
        }
    }
    initialized_ = false;
}

EpdStatus Sysfs_Pin_Bus::teardown() {
    if (!initialized_) {
        return EpdStatus::Ok;
    }

    log_.info("GPIO", "Releasing e-paper transport");

    if (spi_fd_ >= 0) {
        close(spi_fd_);
        spi_fd_ = -1;
    }

    /* Leave the panel unpowered and held in reset */
    EpdStatus st = EpdStatus::Ok;
    const PinId drop[] = {PinId::Reset, PinId::DataCommand, PinId::Power};
    for (PinId pin : drop) {
        if (digital_write(pin, false) != EpdStatus::Ok) {
            st = EpdStatus::HardwareError;
        }
    }

    release();
    return st;
}
