/*
 * Stdio_Log - stdio stream log sink
 * Writes tagged lines to a FILE stream, stdout by default (USB CDC on the
 * firmware build). Lines below the threshold are dropped; Error and Fatal
 * lines are flushed so they reach the host before the next busy-wait.
 */

#ifndef STDIO_LOG_HPP
#define STDIO_LOG_HPP

#include "log_interface.hpp"

#include <cstdint>
#include <cstdio>

class Stdio_Log final : public Log_Interface {
public:
    explicit Stdio_Log(FILE *out = stdout, LogSeverity threshold = LogSeverity::Info);

    void info(const char *tag, const char *msg) override;
    void error(const char *tag, const char *msg, LogSeverity sev) override;

    void set_threshold(LogSeverity threshold) { threshold_ = threshold; }
    LogSeverity threshold() const { return threshold_; }

    /* Lines written at Error or above since construction */
    uint32_t faults_logged() const { return faults_logged_; }

private:
    FILE *out_;
    LogSeverity threshold_;
    uint32_t faults_logged_ = 0;

    bool passes(LogSeverity sev) const;
};

/* Fixed-width label: "INFO", "WARN", "ERROR", "FATAL" */
const char *log_severity_label(LogSeverity sev);

#endif // STDIO_LOG_HPP
