#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include "core/scan.h"

struct AgedScan {
  std::shared_ptr<const FilteredScan> scan;
  std::chrono::nanoseconds age{0};
  bool stale{false};
};

/**
 * Single-slot holder of the latest FilteredScan.
 *
 * One writer (the acquisition loop), any number of readers. The slot holds an
 * immutable scan behind a shared_ptr; publish() builds the new scan outside the
 * lock and only the pointer swap happens under it, so readers see either the
 * old or the new scan in full. A reader keeps its snapshot alive for as long as
 * it holds the pointer, regardless of later publishes.
 */
class ScanStore {
public:
  using clock_mono = std::chrono::steady_clock;

  explicit ScanStore(std::chrono::milliseconds stale_after = std::chrono::milliseconds(0))
    : stale_after_(stale_after) {}

  // Returns the snapshot now held by the slot.
  std::shared_ptr<const FilteredScan> publish(FilteredScan scan);

  // nullptr until the first publish
  std::shared_ptr<const FilteredScan> get() const;

  // Age is measured against the scan's receipt timestamp (steady clock).
  std::optional<AgedScan> getAged(clock_mono::time_point now = clock_mono::now()) const;

  void setStaleAfter(std::chrono::milliseconds d);
  uint64_t publishCount() const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<const FilteredScan> latest_;
  uint64_t publish_count_{0};
  std::chrono::milliseconds stale_after_;
};
