#include "scan_store.h"
#include <utility>

std::shared_ptr<const FilteredScan> ScanStore::publish(FilteredScan scan) {
  auto next = std::make_shared<const FilteredScan>(std::move(scan));
  std::shared_ptr<const FilteredScan> previous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    previous = std::exchange(latest_, next);
    ++publish_count_;
  }
  // previous is released here, outside the lock
  return next;
}

std::shared_ptr<const FilteredScan> ScanStore::get() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_;
}

std::optional<AgedScan> ScanStore::getAged(clock_mono::time_point now) const {
  std::shared_ptr<const FilteredScan> current;
  std::chrono::milliseconds stale_after;
  {
    std::lock_guard<std::mutex> lock(mu_);
    current = latest_;
    stale_after = stale_after_;
  }
  if (!current) return std::nullopt;

  const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());
  const auto t_ns = std::chrono::nanoseconds(static_cast<int64_t>(current->t_ns));

  AgedScan out;
  out.scan = std::move(current);
  out.age = now_ns > t_ns ? now_ns - t_ns : std::chrono::nanoseconds(0);
  out.stale = stale_after.count() > 0 && out.age > stale_after;
  return out;
}

void ScanStore::setStaleAfter(std::chrono::milliseconds d) {
  std::lock_guard<std::mutex> lock(mu_);
  stale_after_ = d;
}

uint64_t ScanStore::publishCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return publish_count_;
}
