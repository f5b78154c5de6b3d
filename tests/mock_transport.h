#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "sensors/ITransport.h"
#include "sensors/TransportFactory.h"

// Shared script driving ScriptedTransport from the test thread.
struct TransportScript {
  struct Read {
    TransportError error{TransportError::Ok};
    std::string payload;
  };

  std::mutex mu;
  std::condition_variable cv;
  std::deque<TransportError> connects;
  TransportError default_connect{TransportError::Ok};
  std::deque<Read> reads;
  bool cancelled{false};
  int created{0};

  void pushConnect(TransportError e) {
    std::lock_guard<std::mutex> lk(mu);
    connects.push_back(e);
  }
  void setDefaultConnect(TransportError e) {
    std::lock_guard<std::mutex> lk(mu);
    default_connect = e;
  }
  void pushFrame(std::string payload) {
    {
      std::lock_guard<std::mutex> lk(mu);
      reads.push_back(Read{TransportError::Ok, std::move(payload)});
    }
    cv.notify_all();
  }
  void pushError(TransportError e) {
    {
      std::lock_guard<std::mutex> lk(mu);
      reads.push_back(Read{e, {}});
    }
    cv.notify_all();
  }
};

// ITransport whose outcomes come from a TransportScript. readFrame blocks
// until a read is scripted or cancel() is called.
class ScriptedTransport final : public ITransport {
public:
  explicit ScriptedTransport(std::shared_ptr<TransportScript> script) : script_(std::move(script)) {}

  TransportError connect(const SensorConfig&) override {
    std::lock_guard<std::mutex> lk(script_->mu);
    if (script_->cancelled) return TransportError::Cancelled;
    TransportError e = script_->default_connect;
    if (!script_->connects.empty()) {
      e = script_->connects.front();
      script_->connects.pop_front();
    }
    state_ = e == TransportError::Ok ? ConnectionState::Connected : ConnectionState::Failed;
    last_error_ = e == TransportError::Ok ? "" : std::string("scripted ") + to_string(e);
    return e;
  }

  TransportError readFrame(RawFrame& out) override {
    std::unique_lock<std::mutex> lk(script_->mu);
    script_->cv.wait(lk, [this] { return script_->cancelled || !script_->reads.empty(); });
    if (script_->cancelled) return TransportError::Cancelled;

    TransportScript::Read r = std::move(script_->reads.front());
    script_->reads.pop_front();
    if (r.error != TransportError::Ok) {
      state_ = ConnectionState::Failed;
      last_error_ = std::string("scripted ") + to_string(r.error);
      return r.error;
    }
    out.payload = std::move(r.payload);
    out.monotonic_ts_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::steady_clock::now().time_since_epoch()).count();
    return TransportError::Ok;
  }

  void cancel() override {
    {
      std::lock_guard<std::mutex> lk(script_->mu);
      script_->cancelled = true;
    }
    script_->cv.notify_all();
  }

  void close() override { state_ = ConnectionState::Disconnected; }
  ConnectionState state() const override { return state_.load(); }

  std::string lastError() const override {
    std::lock_guard<std::mutex> lk(script_->mu);
    return last_error_;
  }

private:
  std::shared_ptr<TransportScript> script_;
  std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
  std::string last_error_;
};

inline TransportFactory scripted_factory(std::shared_ptr<TransportScript> script) {
  return [script](const SensorConfig&) -> std::unique_ptr<ITransport> {
    {
      std::lock_guard<std::mutex> lk(script->mu);
      script->cancelled = false;
      ++script->created;
    }
    return std::make_unique<ScriptedTransport>(script);
  };
}
