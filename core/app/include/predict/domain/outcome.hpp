#pragma once

#include <optional>
#include <string_view>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// Outcome — the two sides of a binary market
// -----------------------------------------------------------------------------
// A position, a trade, and a market resolution all name one of these.
// -----------------------------------------------------------------------------
enum class Outcome { Yes, No };

inline const char* outcomeToString(Outcome side) {
  switch (side) {
    case Outcome::Yes: return "YES";
    case Outcome::No:  return "NO";
  }
  return "UNKNOWN";
}

// Accepts "YES"/"NO" in any letter case.
inline std::optional<Outcome> parseOutcome(std::string_view text) {
  auto equalsIgnoreCase = [text](std::string_view word) {
    if (text.size() != word.size()) {
      return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      }
      if (c != word[i]) {
        return false;
      }
    }
    return true;
  };

  if (equalsIgnoreCase("YES")) {
    return Outcome::Yes;
  }
  if (equalsIgnoreCase("NO")) {
    return Outcome::No;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace predict
