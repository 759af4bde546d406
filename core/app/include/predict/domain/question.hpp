#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace predict {
namespace domain {

enum class QuestionStatus { Active, Resolved, Cancelled };

inline const char* questionStatusToString(QuestionStatus s) {
  switch (s) {
    case QuestionStatus::Active:    return "active";
    case QuestionStatus::Resolved:  return "resolved";
    case QuestionStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

// A question published by the content side of the platform. The first trade
// against an active question materialises its market.
struct Question {
  std::string id;
  std::int64_t number{0};                       // Human-facing question number
  std::string text;
  QuestionStatus status{QuestionStatus::Active};
  std::optional<std::int64_t> resolution_time_ms;  // Becomes the market end
};

}  // namespace domain
}  // namespace predict
