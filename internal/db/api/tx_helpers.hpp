#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace datahub::db {

/*
  Translate a portable DB result into the service error taxonomy.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (result.Retryable()) {
    throw util::TransactionConflict(message);
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs fn(tx) and commits. A TransactionConflict from fn or from Commit()
  restarts the unit on a fresh transaction, up to max_attempts.
*/
template <typename Fn>
auto RunInTransaction(Repository& repo, Fn&& fn, int max_attempts = 8) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Transaction&>>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) throw;
    }
  }
}

} // namespace datahub::db
