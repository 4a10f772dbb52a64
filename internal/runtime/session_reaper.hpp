#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace datahub::ingest {
class UploadSessionManager;
}

namespace datahub::runtime {

/*
  Background worker that drops idle upload sessions.

  Runs UploadSessionManager::ReapExpired once per interval. Stop()
  wakes the worker immediately.
*/
class SessionReaper {
 public:
  SessionReaper(std::shared_ptr<datahub::ingest::UploadSessionManager> sessions, std::chrono::seconds interval);
  ~SessionReaper();

  void Start();
  void Stop();

  // One pass on the caller's thread.
  void RunOnce();

 private:
  void Run();

  std::shared_ptr<datahub::ingest::UploadSessionManager> sessions_;
  std::chrono::seconds                                   interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace datahub::runtime
