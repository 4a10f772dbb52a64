#include "session_reaper.hpp"

#include "internal/ingest/upload_session_manager.hpp"
#include "internal/observability/logging.hpp"

namespace datahub::runtime {

using datahub::observability::StringField;
using datahub::observability::UintField;

SessionReaper::SessionReaper(std::shared_ptr<datahub::ingest::UploadSessionManager> sessions, std::chrono::seconds interval)
    : sessions_(std::move(sessions)), interval_(interval) {}

SessionReaper::~SessionReaper() {
  Stop();
}

void SessionReaper::Start() {
  running_ = true;
  thread_  = std::thread(&SessionReaper::Run, this);
}

void SessionReaper::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void SessionReaper::RunOnce() {
  const auto stats = sessions_->ReapExpired();
  if (stats.aborted > 0 || stats.purged > 0) {
    DATAHUB_LOG_INFO("session reaper pass", {UintField("aborted", stats.aborted), UintField("purged", stats.purged)});
  }
}

void SessionReaper::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
    if (!running_)
      break;

    try {
      RunOnce();
    } catch (const std::exception& e) {
      DATAHUB_LOG_ERROR("session reaper pass failed", {StringField("error", e.what())});
    }
  }
}

} // namespace datahub::runtime
