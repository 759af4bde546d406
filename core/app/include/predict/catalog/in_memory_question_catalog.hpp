#pragma once

#include "predict/catalog/i_question_catalog.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace predict {

// Question catalog backed by two maps (id and number). Bootstrapped from
// EngineConfig::questions at startup; tests add questions directly.
class InMemoryQuestionCatalog final : public IQuestionCatalog {
 public:
  InMemoryQuestionCatalog() = default;
  explicit InMemoryQuestionCatalog(const std::vector<domain::Question>& questions);

  InMemoryQuestionCatalog(const InMemoryQuestionCatalog&) = delete;
  InMemoryQuestionCatalog& operator=(const InMemoryQuestionCatalog&) = delete;

  // Inserts or replaces by id. Throws std::invalid_argument when the id is
  // empty or the number already belongs to a different question.
  void upsert(const domain::Question& question);

  // Returns false when the id is unknown.
  bool setStatus(const std::string& question_id, domain::QuestionStatus status);

  std::optional<domain::Question> find(
      const std::string& id_or_number) const override;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Question> by_id_;
  std::map<std::int64_t, std::string> id_by_number_;
};

}  // namespace predict
