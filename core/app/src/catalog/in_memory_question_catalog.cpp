#include "predict/catalog/in_memory_question_catalog.hpp"

#include <charconv>
#include <mutex>
#include <stdexcept>

namespace predict {

namespace {

std::optional<std::int64_t> parseNumber(const std::string& text) {
  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

InMemoryQuestionCatalog::InMemoryQuestionCatalog(
    const std::vector<domain::Question>& questions) {
  for (const auto& q : questions) {
    upsert(q);
  }
}

void InMemoryQuestionCatalog::upsert(const domain::Question& question) {
  if (question.id.empty()) {
    throw std::invalid_argument("InMemoryQuestionCatalog: empty question id");
  }

  std::unique_lock lock(mutex_);
  if (question.number > 0) {
    auto it = id_by_number_.find(question.number);
    if (it != id_by_number_.end() && it->second != question.id) {
      throw std::invalid_argument(
          "InMemoryQuestionCatalog: question number " +
          std::to_string(question.number) + " already used by " + it->second);
    }
  }

  if (auto old = by_id_.find(question.id);
      old != by_id_.end() && old->second.number > 0) {
    id_by_number_.erase(old->second.number);
  }
  by_id_[question.id] = question;
  if (question.number > 0) {
    id_by_number_[question.number] = question.id;
  }
}

bool InMemoryQuestionCatalog::setStatus(const std::string& question_id,
                                        domain::QuestionStatus status) {
  std::unique_lock lock(mutex_);
  auto it = by_id_.find(question_id);
  if (it == by_id_.end()) {
    return false;
  }
  it->second.status = status;
  return true;
}

std::optional<domain::Question> InMemoryQuestionCatalog::find(
    const std::string& id_or_number) const {
  std::shared_lock lock(mutex_);
  if (auto it = by_id_.find(id_or_number); it != by_id_.end()) {
    return it->second;
  }
  if (auto number = parseNumber(id_or_number)) {
    if (auto n = id_by_number_.find(*number); n != id_by_number_.end()) {
      return by_id_.at(n->second);
    }
  }
  return std::nullopt;
}

std::size_t InMemoryQuestionCatalog::size() const {
  std::shared_lock lock(mutex_);
  return by_id_.size();
}

}  // namespace predict
