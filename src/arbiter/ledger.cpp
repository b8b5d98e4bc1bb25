#include <arbiter/platform.h>

#include <spdlog/spdlog.h>

bool CreditSettler::Settle(const std::string& job_id, bool success) {
  {
    std::lock_guard lck(mtx_);
    if (!settled_.insert(job_id).second) {
      spdlog::debug("Credit hold of {} already settled", job_id);
      return false;
    }
  }
  try {
    if (success) {
      ledger_.ConsumeHold(job_id);
    } else {
      ledger_.ReleaseHold(job_id);
    }
  } catch (const std::exception& err) {
    // the hold stays settled; the platform reconciles stale holds
    spdlog::warn("Failed to {} credit hold of {}: {}", success ? "consume" : "release", job_id, err.what());
    return false;
  }
  spdlog::info("Credit hold of {} {}", job_id, success ? "consumed" : "released");
  return true;
}

bool CreditSettler::Settled(const std::string& job_id) {
  std::lock_guard lck(mtx_);
  return settled_.count(job_id);
}

void CreditSettler::Forget(const std::string& job_id) {
  std::lock_guard lck(mtx_);
  settled_.erase(job_id);
}

size_t CreditSettler::Tracked() {
  std::lock_guard lck(mtx_);
  return settled_.size();
}
