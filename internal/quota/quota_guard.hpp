#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace datahub::quota {

struct QuotaOptions {
  datahub::runtime::config::QuotaWindow window = datahub::runtime::config::QUOTA_WINDOW_ROLLING_24H;

  std::string default_tier = "free";

  // Config-declared caps, consulted when the tiers table has no row.
  std::unordered_map<std::string, uint64_t> tier_caps;

  // Cap for a tier known to neither the store nor the config.
  uint64_t fallback_cap = 10;
};

QuotaOptions OptionsFromConfig(const datahub::runtime::config::QuotaConfig& config);

struct Admission {
  bool        allowed = false;
  std::string tier;
  uint64_t    cap  = 0;
  uint64_t    used = 0; // ingestions + open sessions inside the window
};

/*
  Per-tier ingestion admission.

  Runs inside the caller's session-creation transaction so the count and
  the session insert commit together. Never consulted per part.
*/
class QuotaGuard {
 public:
  QuotaGuard(std::shared_ptr<db::Repository> repo, QuotaOptions options, util::ClockFn clock = util::Now);

  Admission Check(db::Transaction& tx, const std::string& uid);

  // Throws util::TierLimitError when Check() denies.
  void Admit(db::Transaction& tx, const std::string& uid);

  // Creates the user with the default tier on first sight.
  db::model::UserRecord EnsureUser(db::Transaction& tx, const std::string& uid);

  uint64_t CapForTier(db::Transaction& tx, const std::string& tier);

  util::TimePoint WindowStart(util::TimePoint now) const;

  // Writes the config-declared tiers into the store.
  void SeedTiers();

  const QuotaOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repo_;
  QuotaOptions                    options_;
  util::ClockFn                   clock_;
};

} // namespace datahub::quota
