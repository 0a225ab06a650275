#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::db {

// Runs `fn` (which opens and commits its own transaction) again after a
// TransactionConflict, at most `retry_limit` extra times. The last
// conflict surfaces as PersistenceFailure.
template <typename Fn>
auto WithWriteRetry(std::uint32_t retry_limit, std::string_view what, Fn&& fn) -> decltype(fn()) {
  for (std::uint32_t attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const util::TransactionConflict& e) {
      if (attempt >= retry_limit) {
        throw util::PersistenceFailure(std::string(what) + " failed after " + std::to_string(attempt + 1) + " attempts: " + e.what());
      }
      SHOPFLOOR_LOG_WARN("write conflict, retrying",
                         {observability::StringField("op", what), observability::IntField("attempt", static_cast<std::int64_t>(attempt + 1))});
    }
  }
}

} // namespace shopfloor::db
