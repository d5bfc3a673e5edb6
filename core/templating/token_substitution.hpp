#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace scaffkit {

// ─── Token Map ────────────────────────────────────────────────
// Token name → replacement text. Names are bound without the
// {{ }} delimiters. Binding a name twice replaces its value.

class TokenMap {
public:
    TokenMap() = default;
    TokenMap(std::initializer_list<std::pair<std::string, std::string>> bindings);

    void bind(const std::string& name, const std::string& value);

    /// True if `name` has a replacement.
    bool contains(const std::string& name) const;

    /// Replacement for `name`, or nullptr when unbound.
    const std::string* lookup(const std::string& name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// Bindings ordered by marker length, longest first.
    const std::vector<std::pair<std::string, std::string>>& markers() const { return markers_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;  // name → value, bind order
    std::vector<std::pair<std::string, std::string>> markers_;  // "{{name}}" → value

    void rebuildMarkers();
};

// ─── Substitution ─────────────────────────────────────────────
// Single left-to-right pass over `text`. At each position the
// longest bound marker that matches is replaced; replaced text is
// never rescanned. Unbound {{TOKENS}} are copied unchanged.
// Text without bound markers is returned byte-for-byte.

std::string substitute(const std::string& text, const TokenMap& tokens);

/// Names of every {{TOKEN}} in `text` that `tokens` does not bind,
/// in order of first appearance.
std::vector<std::string> unresolvedTokens(const std::string& text, const TokenMap& tokens);

} // namespace scaffkit
