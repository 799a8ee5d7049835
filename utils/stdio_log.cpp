/*
 * Stdio_Log Implementation
 */

#include "utils/stdio_log.hpp"

const char *log_severity_label(LogSeverity sev) {
    switch (sev) {
        case LogSeverity::Info:    return "INFO";
        case LogSeverity::Warning: return "WARN";
        case LogSeverity::Error:   return "ERROR";
        case LogSeverity::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

Stdio_Log::Stdio_Log(FILE *out, LogSeverity threshold)
    : out_(out != nullptr ? out : stdout), threshold_(threshold) {}

bool Stdio_Log::passes(LogSeverity sev) const {
    return static_cast<uint8_t>(sev) >= static_cast<uint8_t>(threshold_);
}

void Stdio_Log::info(const char *tag, const char *msg) {
    if (!passes(LogSeverity::Info)) {
        return;
    }
    /* Padded to line up with "[ERROR]" */
    fprintf(out_, "[INFO]  %s: %s\n", tag, msg);
}

void Stdio_Log::error(const char *tag, const char *msg, LogSeverity sev) {
    if (!passes(sev)) {
        return;
    }
    fprintf(out_, "[%s] %s: %s\n", log_severity_label(sev), tag, msg);

    if (sev == LogSeverity::Error || sev == LogSeverity::Fatal) {
        faults_logged_++;
        fflush(out_);
    }
}
