#pragma once

#include <string>
#include <vector>

namespace scaffkit {

// ─── Name Context ─────────────────────────────────────────────
// Casing variants of one feature name, derived once per scaffold
// run and embedded into every generated file.
//
// Word boundaries: every '_' (dropped) and every lower→upper
// transition. "userProfile", "UserProfile" and "user_profile" all
// split into {user, profile}. Other mixed inputs follow the same
// two rules; no further heuristics are applied.

struct NameContext {
    std::string original;  // as typed
    std::string pascal;    // UserProfile
    std::string camel;     // userProfile
    std::string lower;     // userprofile
    std::string upper;     // USER_PROFILE
    std::string snake;     // user_profile

    bool operator==(const NameContext& other) const {
        return original == other.original && pascal == other.pascal &&
               camel == other.camel && lower == other.lower &&
               upper == other.upper && snake == other.snake;
    }
    bool operator!=(const NameContext& other) const { return !(*this == other); }
};

/// Split a name into words using the boundary rules above.
/// Throws ValidationError if the name is empty, contains a character
/// outside [A-Za-z0-9_], or consists only of underscores.
std::vector<std::string> splitWords(const std::string& name);

/// Derive every casing variant of `name`. Throws ValidationError
/// under the same conditions as splitWords().
NameContext deriveNames(const std::string& name);

} // namespace scaffkit
