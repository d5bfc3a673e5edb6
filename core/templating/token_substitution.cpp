#include "templating/token_substitution.hpp"
#include <algorithm>

namespace scaffkit {

namespace {
const std::string kOpen = "{{";
const std::string kClose = "}}";
} // namespace

TokenMap::TokenMap(std::initializer_list<std::pair<std::string, std::string>> bindings) {
    for (const auto& [name, value] : bindings) {
        bind(name, value);
    }
}

void TokenMap::bind(const std::string& name, const std::string& value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = value;
            rebuildMarkers();
            return;
        }
    }
    entries_.emplace_back(name, value);
    rebuildMarkers();
}

bool TokenMap::contains(const std::string& name) const {
    return lookup(name) != nullptr;
}

const std::string* TokenMap::lookup(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

void TokenMap::rebuildMarkers() {
    markers_.clear();
    for (const auto& [name, value] : entries_) {
        markers_.emplace_back(kOpen + name + kClose, value);
    }
    // Longest first; equal lengths keep bind order.
    std::stable_sort(markers_.begin(), markers_.end(),
        [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

std::string substitute(const std::string& text, const TokenMap& tokens) {
    if (tokens.empty()) return text;

    const auto& markers = tokens.markers();
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(kOpen, pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);

        const std::pair<std::string, std::string>* hit = nullptr;
        for (const auto& marker : markers) {
            if (text.compare(open, marker.first.size(), marker.first) == 0) {
                hit = &marker;
                break;
            }
        }

        if (hit) {
            out += hit->second;
            pos = open + hit->first.size();
        } else {
            // Not a bound marker: emit one brace and resume, so "{{{A}}"
            // still finds "{{A}}" at the next offset.
            out += text[open];
            pos = open + 1;
        }
    }
    return out;
}

std::vector<std::string> unresolvedTokens(const std::string& text, const TokenMap& tokens) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (true) {
        size_t open = text.find(kOpen, pos);
        if (open == std::string::npos) break;
        size_t close = text.find(kClose, open + kOpen.size());
        if (close == std::string::npos) break;

        std::string name = text.substr(open + kOpen.size(), close - open - kOpen.size());
        bool well_formed = !name.empty() &&
            std::all_of(name.begin(), name.end(), [](char c) {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '_';
            });

        if (well_formed && !tokens.contains(name) &&
            std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
        pos = well_formed ? close + kClose.size() : open + 1;
    }
    return names;
}

} // namespace scaffkit
