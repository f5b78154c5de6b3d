#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "config/config.h"
#include "core/backoff.h"
#include "core/scan.h"
#include "core/scan_store.h"
#include "sensors/ITransport.h"
#include "sensors/TransportFactory.h"
#include "sensors/sick/telegram_decoder.h"

/**
 * Acquisition worker state machine:
 *
 *   Idle --start()--> Connecting --ok--> Running --read failure--> Backoff
 *                         ^  |                                        |
 *                         |  +--connect failure--> Backoff            |
 *                         +------------------ delay elapsed ----------+
 *
 *   stop() from any state: Stopping (transport closed) -> Idle
 *
 * Decode failures never leave Running: the frame is dropped and the store keeps
 * the previous scan. Only transport failures trigger reconnection.
 */
enum class LoopState {
  Idle,
  Connecting,
  Running,
  Backoff,
  Stopping,
};

enum class LoopEventKind {
  StateChanged,
  ConnectFailed,
  ReadFailed,
  DecodeFailed,
  BackoffScheduled,
  PersistentFailure,
  Recovered,
};

const char* to_string(LoopState s);
const char* to_string(LoopEventKind k);

struct LoopEvent {
  LoopEventKind kind{LoopEventKind::StateChanged};
  LoopState state{LoopState::Idle};
  TransportError transport_error{TransportError::Ok};
  DecodeError decode_error{DecodeError::None};
  std::chrono::milliseconds delay{0};  // BackoffScheduled only
  std::string detail;
};

struct LoopStatus {
  LoopState state{LoopState::Idle};
  uint64_t connect_attempts{0};
  uint64_t connect_failures{0};
  uint64_t read_failures{0};
  uint64_t reconnects{0};
  uint64_t frames_decoded{0};
  uint64_t frames_ignored{0};
  uint64_t decode_malformed{0};
  uint64_t decode_checksum{0};
  uint64_t decode_status{0};
  uint64_t scans_published{0};
  uint32_t consecutive_failures{0};
  bool persistent_failure{false};
  std::chrono::milliseconds last_backoff{0};
  std::string last_error;
};

class AcquisitionLoop {
public:
  using ScanCallback  = std::function<void(const std::shared_ptr<const FilteredScan>&)>;
  using EventCallback = std::function<void(const LoopEvent&)>;

  explicit AcquisitionLoop(TransportFactory factory = create_transport);
  ~AcquisitionLoop();

  AcquisitionLoop(const AcquisitionLoop&) = delete;
  AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;

  // Validates cfg and spawns the worker. Throws ConfigError; the worker is
  // never started in that case. No-op while already running.
  void start(const AppConfig& cfg);

  // Cancels any blocking transport call, joins the worker, returns to Idle.
  void stop();

  bool isRunning() const { return running_.load(); }

  std::shared_ptr<const FilteredScan> get() const { return store_.get(); }
  std::optional<AgedScan> getAged(ScanStore::clock_mono::time_point now = ScanStore::clock_mono::now()) const {
    return store_.getAged(now);
  }

  LoopStatus status() const;

  // Callbacks run on the worker thread.
  void onScan(ScanCallback cb);
  void onEvent(EventCallback cb);

private:
  using clock_mono = std::chrono::steady_clock;

  void run();
  // true once the transport was connected; false on failure or stop
  bool connectOnce();
  // returns when the link fails or stop is requested
  void readUntilFailure();
  void markLinkHealthy();
  void handleDecodeFailure(DecodeError e, const std::string& detail);
  void recordLinkFailure(LoopEventKind kind, TransportError e, const std::string& detail);
  // false if stop was requested during the wait
  bool waitBackoff();
  bool sleepInterruptible(std::chrono::milliseconds d);

  void setState(LoopState s);
  void emit(const LoopEvent& ev);
  bool stopRequested() const { return stop_requested_.load(); }

  TransportFactory factory_;
  AppConfig cfg_{};
  std::unique_ptr<ITransport> transport_;
  std::unique_ptr<BackoffPolicy> backoff_;
  ScanStore store_;
  uint32_t next_seq_{0};

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::thread th_;
  std::mutex wait_mu_;
  std::condition_variable wait_cv_;

  clock_mono::time_point outage_since_{};

  mutable std::mutex status_mu_;
  LoopStatus status_{};

  std::mutex cb_mu_;
  ScanCallback scan_cb_{};
  EventCallback event_cb_{};
};
