#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

// Builds CoLa-A LMDscandata telegram bodies (no STX/ETX) for tests.
struct TelegramFields {
  std::string type{"sSN"};
  uint32_t status_hi{0};
  uint32_t status_lo{0};
  uint32_t telegram_counter{0x343};
  uint32_t scan_counter{0x347};
  uint32_t scan_frequency{0x5DC};        // 15 Hz in 1/100 Hz
  std::vector<uint32_t> encoders;        // (position, speed) pairs flattened
  std::string content{"DIST1"};
  std::string scale{"3F800000"};         // 1.0f
  std::string offset{"00000000"};        // 0.0f
  int32_t start_angle{-450000};          // -45 deg in 1/10000 deg
  uint32_t step{3333};                   // 0.3333 deg
  std::vector<uint32_t> values;
  int count_override{-1};                // announce a different count than values.size()
};

inline std::string hex(uint32_t v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%X", v);
  return buf;
}

inline std::string make_telegram(const TelegramFields& s) {
  std::string t = s.type + " LMDscandata 1 1 89A27F ";
  t += hex(s.status_hi) + " " + hex(s.status_lo) + " ";
  t += hex(s.telegram_counter) + " " + hex(s.scan_counter) + " ";
  t += "2802D6A 2803BFE 0 0 0 0 0 ";
  t += hex(s.scan_frequency) + " A2 ";
  t += hex(static_cast<uint32_t>(s.encoders.size() / 2));
  for (uint32_t e : s.encoders) t += " " + hex(e);
  t += " 1 " + s.content + " " + s.scale + " " + s.offset + " ";
  t += hex(static_cast<uint32_t>(s.start_angle)) + " " + hex(s.step) + " ";
  const uint32_t count = s.count_override >= 0 ? static_cast<uint32_t>(s.count_override)
                                               : static_cast<uint32_t>(s.values.size());
  t += hex(count);
  for (uint32_t v : s.values) t += " " + hex(v);
  // no RSSI, no position, no name, no comment, no timestamp, no event
  t += " 0 0 0 0 0 0";
  return t;
}

// 811 ramping distances, every 10th one reported as "no return".
inline std::vector<uint32_t> tim561_values() {
  std::vector<uint32_t> v(811);
  for (size_t i = 0; i < v.size(); ++i) v[i] = (i % 10 == 0) ? 0 : static_cast<uint32_t>(500 + i);
  return v;
}

inline std::string tim561_telegram(uint32_t scan_counter = 0x347) {
  TelegramFields s;
  s.scan_counter = scan_counter;
  s.values = tim561_values();
  return make_telegram(s);
}
