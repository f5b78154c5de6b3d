#include "nng_bus.h"
#ifdef USE_NNG
#include <nng/nng.h>
#include <nng/protocol/pubsub0/pub.h>
#endif
#include "io/scan_json.h"
#include <cstring>
#include <iostream>

NngBus::NngBus() : enabled_(false), rate_limit_(0) {
#ifdef USE_NNG
  socket_initialized_ = false;
#endif
}

NngBus::~NngBus() {
  stop();
}

bool NngBus::startPublisher(const SinkConfig& config) {
  if (!config.isNng()) return false;

  url_ = config.nng().url;
  rate_limit_ = config.rate_limit;
  enabled_ = !url_.empty();

#ifdef USE_NNG
  if (!enabled_) return false;

  int rv = nng_pub0_open(&socket_);
  if (rv != 0) {
    std::cerr << "[NngBus] Failed to open pub socket: " << nng_strerror(rv) << std::endl;
    enabled_ = false;
    return false;
  }
  socket_initialized_ = true;

  rv = nng_listen(socket_, url_.c_str(), nullptr, 0);
  if (rv != 0) {
    std::cerr << "[NngBus] Failed to listen on " << url_ << ": " << nng_strerror(rv) << std::endl;
    nng_close(socket_);
    socket_initialized_ = false;
    enabled_ = false;
    return false;
  }

  std::cout << "[NngBus] Publisher started on " << url_ << " with rate_limit=" << rate_limit_ << "Hz" << std::endl;
  return true;
#else
  std::cout << "[NngBus] NNG support not compiled, publisher disabled" << std::endl;
  enabled_ = false;
  return false;
#endif
}

void NngBus::stop() {
#ifdef USE_NNG
  if (socket_initialized_) {
    nng_close(socket_);
    socket_initialized_ = false;
  }
#endif
  enabled_ = false;
}

bool NngBus::shouldPublish(std::chrono::steady_clock::time_point now) {
  if (rate_limit_ <= 0) return true;

  std::lock_guard<std::mutex> lk(mu_);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_publish_).count();
  auto min_interval = 1000 / rate_limit_; // ms

  if (elapsed >= min_interval) {
    last_publish_ = now;
    return true;
  }

  return false;
}

void NngBus::publishScan(const FilteredScan& scan) {
  if (!enabled_ || !shouldPublish(std::chrono::steady_clock::now())) return;

#ifdef USE_NNG
  const std::string data = writeCompact(scanToJson(scan));
  if (data.empty()) return;

  nng_msg* msg;
  int rv = nng_msg_alloc(&msg, data.size());
  if (rv != 0) {
    std::cerr << "[NngBus] Failed to allocate message: " << nng_strerror(rv) << std::endl;
    return;
  }

  memcpy(nng_msg_body(msg), data.data(), data.size());

  rv = nng_sendmsg(socket_, msg, NNG_FLAG_NONBLOCK);
  if (rv != 0) {
    std::cerr << "[NngBus] Failed to send message: " << nng_strerror(rv) << std::endl;
    nng_msg_free(msg);
  }
#else
  (void)scan;
#endif
}
