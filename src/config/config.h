#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Raised for configuration that can never produce a working pipeline.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct SensorConfig {
  std::string id{"tim561"};
  std::string type{"sick_tim_tcp"};
  std::string host{"192.168.0.1"};
  int port{2112};

  int connect_timeout_ms{10000};
  int read_timeout_ms{1000};    // liveness deadline for one complete telegram
  int poll_interval_ms{100};    // granularity of cancel checks inside blocking calls
  int max_frame_bytes{65536};
  bool subscribe{true};         // send "sEN LMDscandata 1" after connect
  int startup_delay_ms{0};
};

enum class StatusPolicy {
  Strict,          // any non-OK device status is rejected
  AcceptWarnings,  // contamination warnings pass through
};

struct DecoderConfig {
  int expected_points{811};       // 0 = accept any count
  double angle_offset_deg{-90.0}; // sensor frame (-45..225) -> forward zero (-135..135)
  double expected_step_deg{0.3333}; // 0 = accept any step
  uint32_t invalid_value{0};      // raw "no return" sentinel
  bool verify_checksum{false};
  StatusPolicy status_policy{StatusPolicy::Strict};
};

struct ScanSector {
  double min_deg{-135.0};
  double max_deg{ 135.0};
};

struct FilterConfig {
  double min_distance_mm{100.0};
  double max_distance_mm{3000.0};
  double min_angle_deg{-90.0};
  double max_angle_deg{ 90.0};
};

struct BackoffConfig {
  int initial_delay_ms{200};
  double multiplier{2.0};
  int max_delay_ms{5000};
  int persistent_failure_after_ms{30000}; // 0 = never report
};

struct StoreConfig {
  int stale_after_ms{500}; // 0 = never stale
};

struct UiConfig {
  std::string listen{"0.0.0.0:8080"};
};

struct NngConfig {
  std::string url{"tcp://0.0.0.0:5555"};
};

struct SinkConfig {
  std::string topic{"scan"};
  int         rate_limit{0};

  std::variant<NngConfig> cfg{NngConfig{}};

  bool isNng() const { return std::holds_alternative<NngConfig>(cfg); }
  NngConfig& nng() { return std::get<NngConfig>(cfg); }
  const NngConfig& nng() const { return std::get<NngConfig>(cfg); }
};

struct AppConfig {
  SensorConfig sensor{};
  DecoderConfig decoder{};
  ScanSector sector{};
  FilterConfig filter{};
  BackoffConfig backoff{};
  StoreConfig store{};
  UiConfig ui{};
  std::vector<SinkConfig> sinks;
};

AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const std::string& yaml_text);
std::string dump_app_config(const AppConfig& cfg);

// Throws ConfigError describing the first violation found.
void validate_app_config(const AppConfig& cfg);
void validate_filter_config(const FilterConfig& f, const ScanSector& sector);

bool parse_endpoint(const std::string& endpoint, std::string& host, int& port);
const char* to_string(StatusPolicy p);
bool parse_status_policy(const std::string& s, StatusPolicy& out);
