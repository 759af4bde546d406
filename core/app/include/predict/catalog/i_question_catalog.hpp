#pragma once

#include "predict/domain/question.hpp"

#include <optional>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// IQuestionCatalog — read access to the questions markets are created from
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the content side of the platform. MarketLedger consults
//         it when a trade names a market that has no row yet.
//
// @details
// find() accepts either the question id or its decimal question number
// ("q-42" or "42"). Implementations must be safe to call concurrently from
// worker threads.
// -----------------------------------------------------------------------------
class IQuestionCatalog {
 public:
  virtual ~IQuestionCatalog() = default;

  virtual std::optional<domain::Question> find(
      const std::string& id_or_number) const = 0;
};

}  // namespace predict
