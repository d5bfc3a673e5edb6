#include "naming/case_deriver.hpp"
#include "common/errors.hpp"
#include <cctype>

namespace scaffkit {

namespace {

bool isNameChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_';
}

std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string toUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

std::string join(const std::vector<std::string>& words, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) out += sep;
        out += words[i];
    }
    return out;
}

} // namespace

std::vector<std::string> splitWords(const std::string& name) {
    if (name.empty()) {
        throw ValidationError("Feature name is required");
    }
    for (char c : name) {
        if (!isNameChar(c)) {
            throw ValidationError("Feature name '" + name +
                "' contains '" + std::string(1, c) + "'; only [A-Za-z0-9_] is allowed");
        }
    }

    std::vector<std::string> words;
    std::string current;
    for (size_t i = 0; i < name.size(); i++) {
        char c = name[i];
        if (c == '_') {
            if (!current.empty()) words.push_back(current);
            current.clear();
            continue;
        }
        if (i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
            std::islower(static_cast<unsigned char>(name[i - 1])) && !current.empty()) {
            words.push_back(current);
            current.clear();
        }
        current += c;
    }
    if (!current.empty()) words.push_back(current);

    if (words.empty()) {
        throw ValidationError("Feature name '" + name + "' has no letters or digits");
    }
    return words;
}

NameContext deriveNames(const std::string& name) {
    std::vector<std::string> words = splitWords(name);

    NameContext ctx;
    ctx.original = name;

    std::vector<std::string> lowered;
    std::vector<std::string> uppered;
    for (const auto& w : words) {
        ctx.pascal += capitalize(w);
        lowered.push_back(toLower(w));
        uppered.push_back(toUpper(w));
    }

    ctx.camel = ctx.pascal;
    ctx.camel[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(ctx.camel[0])));
    ctx.lower = join(lowered, "");
    ctx.upper = join(uppered, "_");
    ctx.snake = join(lowered, "_");
    return ctx;
}

} // namespace scaffkit
