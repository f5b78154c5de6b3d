#pragma once
#include <cstdint>
#include <vector>

enum class ScanStatus : uint8_t {
  Ok,
  ContaminationWarning,
  ContaminationError,
  DeviceError,
};

const char* to_string(ScanStatus s);

struct ScanPoint {
  double angle_deg{0.0};    // forward = 0, positive CCW
  double distance_mm{0.0};
  bool valid{true};         // false when the sensor reported "no return"
};

// One decoded sweep. Point count and spacing are fixed by the sensor.
struct ScanFrame {
  uint64_t t_ns{0};                   // steady clock, assigned at receipt
  uint32_t telegram_counter{0};
  uint32_t scan_counter{0};
  uint32_t time_since_startup_us{0};
  double scan_frequency_hz{0.0};
  ScanStatus status{ScanStatus::Ok};
  double start_angle_deg{0.0};
  double angle_step_deg{0.0};
  std::vector<ScanPoint> points;
};

// Subset of one ScanFrame that passed the filter; immutable once published.
struct FilteredScan {
  uint64_t t_ns{0};
  uint32_t seq{0};
  uint32_t scan_counter{0};
  ScanStatus status{ScanStatus::Ok};
  std::vector<ScanPoint> points;
};

inline bool operator==(const ScanPoint& a, const ScanPoint& b) {
  return a.angle_deg == b.angle_deg && a.distance_mm == b.distance_mm && a.valid == b.valid;
}

inline bool operator==(const FilteredScan& a, const FilteredScan& b) {
  return a.t_ns == b.t_ns && a.seq == b.seq && a.scan_counter == b.scan_counter &&
         a.status == b.status && a.points == b.points;
}
