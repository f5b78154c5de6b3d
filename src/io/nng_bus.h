#pragma once
#include <string>
#include <chrono>
#include <mutex>
#include "core/scan.h"
#include "config/config.h"
#ifdef USE_NNG
#include <nng/nng.h>
#endif

// pub0 socket publishing every accepted FilteredScan as one JSON message.
class NngBus {
  std::string url_;
  bool enabled_{false};
  int rate_limit_{0};
  std::chrono::steady_clock::time_point last_publish_{};
  std::mutex mu_;

#ifdef USE_NNG
  nng_socket socket_;
  bool socket_initialized_{false};
#endif

public:
  NngBus();
  ~NngBus();

  bool startPublisher(const SinkConfig& config);
  void publishScan(const FilteredScan& scan);
  void stop();

  bool isEnabled() const { return enabled_; }
  const std::string& url() const { return url_; }

  // Rate limiting in isolation, for a given clock reading.
  bool shouldPublish(std::chrono::steady_clock::time_point now);
};
