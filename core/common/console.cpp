#include "common/console.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#define SCAFFKIT_ISATTY _isatty
#define SCAFFKIT_FILENO _fileno
#else
#include <unistd.h>
#define SCAFFKIT_ISATTY isatty
#define SCAFFKIT_FILENO fileno
#endif

namespace scaffkit {

namespace {
std::ostream* g_log_stream = nullptr;

void emit(const std::string& tag, const char* level, const std::string& message) {
    std::ostream& out = logStream();
    out << "[" << tag << "] ";
    if (level) out << level << ": ";
    out << message << "\n";
}
} // namespace

Style Style::detect(bool allow_color) {
    if (!allow_color) return Style(false);
    if (std::getenv("NO_COLOR") != nullptr) return Style(false);
    return Style(SCAFFKIT_ISATTY(SCAFFKIT_FILENO(stdout)) != 0);
}

std::ostream& logStream() {
    return g_log_stream ? *g_log_stream : std::cerr;
}

void setLogStream(std::ostream* stream) {
    g_log_stream = stream;
}

void logInfo(const std::string& tag, const std::string& message) {
    emit(tag, nullptr, message);
}

void logWarning(const std::string& tag, const std::string& message) {
    emit(tag, "warning", message);
}

void logError(const std::string& tag, const std::string& message) {
    emit(tag, "error", message);
}

} // namespace scaffkit
