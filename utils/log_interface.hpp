/*
 * Log_Interface - Abstract diagnostic sink
 * Decouples the panel driver from where its messages end up (stdio/USB CDC/tests)
 */

#ifndef LOG_INTERFACE_HPP
#define LOG_INTERFACE_HPP

#include <cstdint>

enum class LogSeverity : uint8_t { Info, Warning, Error, Fatal };

class Log_Interface {
public:
    virtual ~Log_Interface() = default;
    virtual void info(const char *tag, const char *msg) = 0;
    virtual void error(const char *tag, const char *msg, LogSeverity sev) = 0;
};

/* Sink used when nothing is attached */
class Null_Log final : public Log_Interface {
public:
    void info(const char *, const char *) override {}
    void error(const char *, const char *, LogSeverity) override {}
};

#endif // LOG_INTERFACE_HPP
