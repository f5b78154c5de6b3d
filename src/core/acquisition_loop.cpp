#include "acquisition_loop.h"
#include <iostream>
#include <utility>

#include "core/scan_filter.h"

namespace {

  // First occurrence, then every Nth, so a noisy link does not flood the log.
  constexpr uint64_t kDecodeLogEvery = 100;

}

const char* to_string(LoopState s) {
  switch (s) {
    case LoopState::Idle:       return "idle";
    case LoopState::Connecting: return "connecting";
    case LoopState::Running:    return "running";
    case LoopState::Backoff:    return "backoff";
    case LoopState::Stopping:   return "stopping";
  }
  return "unknown";
}

const char* to_string(LoopEventKind k) {
  switch (k) {
    case LoopEventKind::StateChanged:      return "state_changed";
    case LoopEventKind::ConnectFailed:     return "connect_failed";
    case LoopEventKind::ReadFailed:        return "read_failed";
    case LoopEventKind::DecodeFailed:      return "decode_failed";
    case LoopEventKind::BackoffScheduled:  return "backoff_scheduled";
    case LoopEventKind::PersistentFailure: return "persistent_failure";
    case LoopEventKind::Recovered:         return "recovered";
  }
  return "unknown";
}

AcquisitionLoop::AcquisitionLoop(TransportFactory factory)
  : factory_(std::move(factory)) {}

AcquisitionLoop::~AcquisitionLoop() {
  stop();
}

void AcquisitionLoop::onScan(ScanCallback cb) {
  std::lock_guard<std::mutex> lk(cb_mu_);
  scan_cb_ = std::move(cb);
}

void AcquisitionLoop::onEvent(EventCallback cb) {
  std::lock_guard<std::mutex> lk(cb_mu_);
  event_cb_ = std::move(cb);
}

LoopStatus AcquisitionLoop::status() const {
  std::lock_guard<std::mutex> lk(status_mu_);
  return status_;
}

void AcquisitionLoop::start(const AppConfig& cfg) {
  if (running_) {
    std::cerr << "[AcquisitionLoop] already running.\n";
    return;
  }

  validate_app_config(cfg);

  auto transport = factory_ ? factory_(cfg.sensor) : nullptr;
  if (!transport) {
    throw ConfigError("sensor.type: no driver for '" + cfg.sensor.type + "'");
  }

  cfg_ = cfg;
  transport_ = std::move(transport);
  backoff_ = std::make_unique<BackoffPolicy>(cfg_.backoff);
  store_.setStaleAfter(std::chrono::milliseconds(cfg_.store.stale_after_ms));
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    status_ = LoopStatus{};
  }

  stop_requested_ = false;
  running_ = true;
  std::cout << "[AcquisitionLoop] starting sensor id=" << cfg_.sensor.id
            << " endpoint=" << cfg_.sensor.host << ":" << cfg_.sensor.port << std::endl;
  th_ = std::thread([this] { run(); });
}

void AcquisitionLoop::stop() {
  {
    std::lock_guard<std::mutex> lk(wait_mu_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
  if (transport_) transport_->cancel();

  if (th_.joinable()) th_.join();
  transport_.reset();
  if (running_.exchange(false)) {
    std::cout << "[AcquisitionLoop] stopped" << std::endl;
  }
}

void AcquisitionLoop::setState(LoopState s) {
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    if (status_.state == s) return;
    status_.state = s;
  }
  LoopEvent ev;
  ev.kind = LoopEventKind::StateChanged;
  ev.state = s;
  emit(ev);
}

void AcquisitionLoop::emit(const LoopEvent& ev) {
  EventCallback cb_copy;
  {
    std::lock_guard<std::mutex> lk(cb_mu_);
    cb_copy = event_cb_;
  }
  if (!cb_copy) return;
  try {
    cb_copy(ev);
  } catch (const std::exception& e) {
    std::cerr << "[AcquisitionLoop] event callback threw: " << e.what() << std::endl;
  }
}

bool AcquisitionLoop::sleepInterruptible(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(wait_mu_);
  return !wait_cv_.wait_for(lk, d, [this] { return stop_requested_.load(); });
}

void AcquisitionLoop::run() {
  outage_since_ = clock_mono::now();

  // The sensor needs a few seconds after power-up before it accepts clients.
  if (cfg_.sensor.startup_delay_ms > 0 &&
      !sleepInterruptible(std::chrono::milliseconds(cfg_.sensor.startup_delay_ms))) {
    setState(LoopState::Stopping);
    setState(LoopState::Idle);
    return;
  }

  while (!stopRequested()) {
    if (!connectOnce()) {
      if (stopRequested() || !waitBackoff()) break;
      continue;
    }

    readUntilFailure();
    if (stopRequested()) break;

    transport_->close();
    {
      std::lock_guard<std::mutex> lk(status_mu_);
      ++status_.reconnects;
    }
    if (!waitBackoff()) break;
  }

  setState(LoopState::Stopping);
  transport_->close();
  setState(LoopState::Idle);
}

bool AcquisitionLoop::connectOnce() {
  setState(LoopState::Connecting);
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    ++status_.connect_attempts;
  }

  const TransportError e = transport_->connect(cfg_.sensor);
  if (e == TransportError::Cancelled) return false;
  if (e != TransportError::Ok) {
    {
      std::lock_guard<std::mutex> lk(status_mu_);
      ++status_.connect_failures;
    }
    recordLinkFailure(LoopEventKind::ConnectFailed, e, transport_->lastError());
    return false;
  }

  backoff_->reset();
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    status_.consecutive_failures = 0;
  }
  setState(LoopState::Running);
  return true;
}

void AcquisitionLoop::markLinkHealthy() {
  bool recovered = false;
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    recovered = std::exchange(status_.persistent_failure, false);
  }
  if (recovered) {
    std::cout << "[AcquisitionLoop] sensor link recovered" << std::endl;
    LoopEvent ev;
    ev.kind = LoopEventKind::Recovered;
    ev.state = LoopState::Running;
    emit(ev);
  }
}

void AcquisitionLoop::readUntilFailure() {
  // A connection that never delivers a telegram does not end the outage.
  bool got_frame = false;
  while (!stopRequested()) {
    RawFrame raw;
    const TransportError e = transport_->readFrame(raw);
    if (e == TransportError::Cancelled) return;
    if (e != TransportError::Ok) {
      if (got_frame) outage_since_ = clock_mono::now();
      {
        std::lock_guard<std::mutex> lk(status_mu_);
        ++status_.read_failures;
      }
      recordLinkFailure(LoopEventKind::ReadFailed, e, transport_->lastError());
      return;
    }

    if (!got_frame) {
      got_frame = true;
      markLinkHealthy();
    }

    ScanFrame frame;
    std::string detail;
    const DecodeError d = decode_telegram(raw, cfg_.decoder, cfg_.sector, frame, &detail);
    if (d == DecodeError::UnexpectedCommand) {
      // acknowledgements and other replies share the stream
      std::lock_guard<std::mutex> lk(status_mu_);
      ++status_.frames_ignored;
      continue;
    }
    if (d != DecodeError::None) {
      handleDecodeFailure(d, detail);
      continue;
    }

    FilteredScan scan = filter_scan(frame, cfg_.filter);
    scan.seq = next_seq_++;
    auto published = store_.publish(std::move(scan));
    {
      std::lock_guard<std::mutex> lk(status_mu_);
      ++status_.frames_decoded;
      ++status_.scans_published;
    }

    ScanCallback cb_copy;
    {
      std::lock_guard<std::mutex> lk(cb_mu_);
      cb_copy = scan_cb_;
    }
    if (cb_copy) {
      try {
        cb_copy(published);
      } catch (const std::exception& ex) {
        std::cerr << "[AcquisitionLoop] scan callback threw: " << ex.what() << std::endl;
      }
    }
  }
}

void AcquisitionLoop::handleDecodeFailure(DecodeError e, const std::string& detail) {
  uint64_t total = 0;
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    switch (e) {
      case DecodeError::ChecksumMismatch:  ++status_.decode_checksum; break;
      case DecodeError::UnsupportedStatus: ++status_.decode_status;   break;
      default:                             ++status_.decode_malformed; break;
    }
    total = status_.decode_malformed + status_.decode_checksum + status_.decode_status;
  }
  if (total == 1 || total % kDecodeLogEvery == 0) {
    std::cerr << "[AcquisitionLoop] dropped telegram (" << to_string(e) << "): " << detail
              << " [" << total << " dropped so far]" << std::endl;
  }

  LoopEvent ev;
  ev.kind = LoopEventKind::DecodeFailed;
  ev.state = LoopState::Running;
  ev.decode_error = e;
  ev.detail = detail;
  emit(ev);
}

void AcquisitionLoop::recordLinkFailure(LoopEventKind kind, TransportError e, const std::string& detail) {
  const auto now = clock_mono::now();
  const auto outage = std::chrono::duration_cast<std::chrono::milliseconds>(now - outage_since_);
  const int threshold = cfg_.backoff.persistent_failure_after_ms;

  bool became_persistent = false;
  uint32_t consecutive = 0;
  LoopState state{LoopState::Idle};
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    consecutive = ++status_.consecutive_failures;
    status_.last_error = std::string(to_string(e)) + ": " + detail;
    state = status_.state;
    if (threshold > 0 && !status_.persistent_failure && outage.count() >= threshold) {
      status_.persistent_failure = true;
      became_persistent = true;
    }
  }

  std::cerr << "[AcquisitionLoop] " << to_string(kind) << " (" << to_string(e) << "): " << detail
            << " [consecutive=" << consecutive << "]" << std::endl;

  LoopEvent ev;
  ev.kind = kind;
  ev.state = state;
  ev.transport_error = e;
  ev.detail = detail;
  emit(ev);

  if (became_persistent) {
    std::cerr << "[AcquisitionLoop] sensor unreachable for " << outage.count()
              << " ms; still retrying" << std::endl;
    LoopEvent pf;
    pf.kind = LoopEventKind::PersistentFailure;
    pf.state = state;
    pf.transport_error = e;
    pf.detail = "no sensor link for " + std::to_string(outage.count()) + " ms";
    emit(pf);
  }
}

bool AcquisitionLoop::waitBackoff() {
  const auto delay = backoff_->next();
  {
    std::lock_guard<std::mutex> lk(status_mu_);
    status_.last_backoff = delay;
  }
  setState(LoopState::Backoff);

  LoopEvent ev;
  ev.kind = LoopEventKind::BackoffScheduled;
  ev.state = LoopState::Backoff;
  ev.delay = delay;
  emit(ev);

  return sleepInterruptible(delay);
}
