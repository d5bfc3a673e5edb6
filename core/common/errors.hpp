#pragma once

#include <stdexcept>
#include <string>

namespace scaffkit {

// ─── Error Taxonomy ───────────────────────────────────────────
// ValidationError: bad input detected before any file I/O.
// IoError: a path that could not be read, created or written.
// Unrecognized report lines are not errors and never throw.

class ToolkitError : public std::runtime_error {
public:
    explicit ToolkitError(const std::string& message)
        : std::runtime_error(message) {}
};

class ValidationError : public ToolkitError {
public:
    explicit ValidationError(const std::string& message)
        : ToolkitError(message) {}
};

/// Requested scaffold variant has no registered manifest.
class UnknownVariantError : public ValidationError {
public:
    explicit UnknownVariantError(const std::string& variant)
        : ValidationError("UnknownVariant: no scaffold manifest named '" + variant + "'"),
          variant_(variant) {}

    const std::string& variant() const { return variant_; }

private:
    std::string variant_;
};

/// Two manifest entries resolved to the same output path in one run.
class OutputCollisionError : public ValidationError {
public:
    explicit OutputCollisionError(const std::string& path)
        : ValidationError("Output path produced twice in one run: " + path),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class IoError : public ToolkitError {
public:
    IoError(const std::string& path, const std::string& what)
        : ToolkitError(what + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace scaffkit
