#pragma once

#include <iosfwd>
#include <string>

namespace scaffkit {

// ─── Console Style ────────────────────────────────────────────
// ANSI colouring for CLI output. Disabled styles return text as-is,
// so rendering code never branches on colour support.

class Style {
public:
    explicit Style(bool enabled = false) : enabled_(enabled) {}

    /// Enabled when stdout is a terminal and NO_COLOR is unset.
    static Style detect(bool allow_color);

    bool enabled() const { return enabled_; }

    std::string red(const std::string& text) const { return wrap("\033[0;31m", text); }
    std::string green(const std::string& text) const { return wrap("\033[0;32m", text); }
    std::string yellow(const std::string& text) const { return wrap("\033[1;33m", text); }
    std::string blue(const std::string& text) const { return wrap("\033[0;34m", text); }
    std::string cyan(const std::string& text) const { return wrap("\033[0;36m", text); }

private:
    bool enabled_;

    std::string wrap(const char* code, const std::string& text) const {
        if (!enabled_) return text;
        return std::string(code) + text + "\033[0m";
    }
};

// ─── Diagnostics ──────────────────────────────────────────────
// Tagged stderr lines: "[scaffold] warning: ...". Results go to stdout.

void logInfo(const std::string& tag, const std::string& message);
void logWarning(const std::string& tag, const std::string& message);
void logError(const std::string& tag, const std::string& message);

/// Stream used by the log functions. Tests redirect it.
std::ostream& logStream();
void setLogStream(std::ostream* stream);

} // namespace scaffkit
