#include "quota_guard.hpp"

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datahub::quota {

using datahub::runtime::config::QuotaWindow;

QuotaOptions OptionsFromConfig(const datahub::runtime::config::QuotaConfig& config) {
  QuotaOptions options;
  if (config.window() != datahub::runtime::config::QUOTA_WINDOW_UNSPECIFIED) {
    options.window = config.window();
  }
  if (!config.default_tier().empty()) {
    options.default_tier = config.default_tier();
  }
  for (const auto& tier : config.tiers()) {
    options.tier_caps[tier.name()] = tier.datasets_upload_per_day();
  }
  return options;
}

QuotaGuard::QuotaGuard(std::shared_ptr<db::Repository> repo, QuotaOptions options, util::ClockFn clock)
    : repo_(std::move(repo)), options_(std::move(options)), clock_(std::move(clock)) {
}

util::TimePoint QuotaGuard::WindowStart(util::TimePoint now) const {
  if (options_.window == datahub::runtime::config::QUOTA_WINDOW_CALENDAR_DAY_UTC) {
    return util::StartOfUtcDay(now);
  }
  return now - std::chrono::hours(24);
}

db::model::UserRecord QuotaGuard::EnsureUser(db::Transaction& tx, const std::string& uid) {
  if (auto user = repo_->GetUser(tx, uid)) {
    return *user;
  }

  db::model::UserRecord user;
  user.uid           = uid;
  user.tier          = options_.default_tier;
  user.created_at_ms = util::ToUnixMillis(clock_());
  db::ThrowIfDbError(repo_->InsertUser(tx, user), "insert user");

  DATAHUB_LOG_INFO("user provisioned", {observability::StringField("uid", uid), observability::StringField("tier", user.tier)});
  return user;
}

uint64_t QuotaGuard::CapForTier(db::Transaction& tx, const std::string& tier) {
  if (auto stored = repo_->GetTier(tx, tier)) {
    return stored->datasets_upload_per_day;
  }
  if (auto it = options_.tier_caps.find(tier); it != options_.tier_caps.end()) {
    return it->second;
  }
  return options_.fallback_cap;
}

Admission QuotaGuard::Check(db::Transaction& tx, const std::string& uid) {
  const auto user  = EnsureUser(tx, uid);
  const auto since = util::ToUnixMillis(WindowStart(clock_()));

  Admission admission;
  admission.tier = user.tier;
  admission.cap  = CapForTier(tx, user.tier);
  admission.used = repo_->CountUsageSince(tx, uid, db::model::kUsageDatasetIngested, since) +
                   repo_->CountActiveUploadSessionsSince(tx, uid, since);
  admission.allowed = admission.used + 1 < admission.cap;
  return admission;
}

void QuotaGuard::Admit(db::Transaction& tx, const std::string& uid) {
  const auto admission = Check(tx, uid);
  if (admission.allowed) {
    return;
  }

  DATAHUB_LOG_INFO("ingestion denied by quota", {observability::StringField("uid", uid),
                                                  observability::StringField("tier", admission.tier),
                                                  observability::UintField("cap", admission.cap),
                                                  observability::UintField("used", admission.used)});
  throw util::TierLimitError(admission.cap);
}

void QuotaGuard::SeedTiers() {
  if (options_.tier_caps.empty()) {
    return;
  }
  db::RunInTransaction(*repo_, [&](db::Transaction& tx) {
    for (const auto& [name, cap] : options_.tier_caps) {
      db::ThrowIfDbError(repo_->UpsertTier(tx, db::model::TierRecord{name, cap}), "upsert tier " + name);
    }
  });
}

} // namespace datahub::quota
