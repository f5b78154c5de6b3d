#include "telegram_decoder.h"
#include <charconv>
#include <cmath>
#include <cstring>

namespace {

  constexpr size_t kIdxType          = 0;
  constexpr size_t kIdxCommand       = 1;
  constexpr size_t kIdxStatusHi      = 5;
  constexpr size_t kIdxStatusLo      = 6;
  constexpr size_t kIdxTelegramCtr   = 7;
  constexpr size_t kIdxScanCtr       = 8;
  constexpr size_t kIdxTimeSinceBoot = 9;
  constexpr size_t kIdxScanFreq      = 16;
  constexpr size_t kIdxEncoderCount  = 18;
  constexpr size_t kChannelHeader    = 6;  // content, scale, offset, start, step, count
  constexpr double kAngleTolerance   = 0.5e-4; // half the 1/10000 deg wire resolution

  // Device status (low byte) as reported by the TiM5xx family.
  constexpr int64_t kStatusOk                  = 0;
  constexpr int64_t kStatusError               = 1;
  constexpr int64_t kStatusContaminationWarn   = 2;
  constexpr int64_t kStatusContaminationError  = 4;

  DecodeError reject(DecodeError e, std::string* detail, const std::string& why) {
    if (detail) *detail = why;
    return e;
  }

  bool split_fields(std::string_view s, std::vector<std::string_view>& out) {
    out.clear();
    size_t pos = 0;
    while (pos <= s.size()) {
      const size_t sp = s.find(' ', pos);
      const size_t end = (sp == std::string_view::npos) ? s.size() : sp;
      if (end == pos) return false; // empty field: doubled or trailing separator
      out.push_back(s.substr(pos, end - pos));
      if (sp == std::string_view::npos) break;
      pos = sp + 1;
    }
    return !out.empty();
  }

  bool parse_hex_u32(std::string_view token, uint32_t& out) {
    if (token.empty() || token.size() > 8) return false;
    const auto* first = token.data();
    const auto* last  = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, out, 16);
    return ec == std::errc() && ptr == last;
  }

  bool parse_hex_float(std::string_view token, float& out) {
    uint32_t bits = 0;
    if (!parse_hex_u32(token, bits)) return false;
    static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 single expected");
    std::memcpy(&out, &bits, sizeof(out));
    return out == out; // reject NaN
  }

  ScanStatus map_status(int64_t hi, int64_t lo) {
    if (hi != 0) return ScanStatus::DeviceError;
    switch (lo) {
      case kStatusOk:                 return ScanStatus::Ok;
      case kStatusContaminationWarn:  return ScanStatus::ContaminationWarning;
      case kStatusContaminationError: return ScanStatus::ContaminationError;
      case kStatusError:
      default:                        return ScanStatus::DeviceError;
    }
  }

  // Read/write/method/event requests and replies, plus the device error reply.
  bool is_cola_command_type(std::string_view t) {
    static constexpr std::string_view kTypes[] = {
      "sRN", "sRA", "sWN", "sWA", "sMN", "sAN", "sEN", "sEA", "sSN", "sFA",
    };
    for (auto k : kTypes) {
      if (t == k) return true;
    }
    return false;
  }

  bool status_accepted(ScanStatus s, StatusPolicy policy) {
    if (s == ScanStatus::Ok) return true;
    return policy == StatusPolicy::AcceptWarnings && s == ScanStatus::ContaminationWarning;
  }

}

const char* to_string(DecodeError e) {
  switch (e) {
    case DecodeError::None:              return "none";
    case DecodeError::Malformed:         return "malformed";
    case DecodeError::ChecksumMismatch:  return "checksum_mismatch";
    case DecodeError::UnsupportedStatus: return "unsupported_status";
    case DecodeError::UnexpectedCommand: return "unexpected_command";
  }
  return "unknown";
}

uint8_t telegram_checksum(std::string_view bytes) {
  uint8_t x = 0;
  for (char c : bytes) x ^= static_cast<uint8_t>(c);
  return x;
}

bool parse_telegram_number(std::string_view token, int64_t& out) {
  if (token.empty()) return false;
  if (token[0] == '+' || token[0] == '-') {
    const bool neg = token[0] == '-';
    std::string_view digits = token.substr(1);
    if (digits.empty()) return false;
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v, 10);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) return false;
    out = neg ? -v : v;
    return true;
  }
  uint32_t v = 0;
  if (!parse_hex_u32(token, v)) return false;
  out = v;
  return true;
}

DecodeError decode_telegram(const RawFrame& raw, const DecoderConfig& cfg, const ScanSector& sector,
                            ScanFrame& out, std::string* detail) {
  std::string_view body(raw.payload);

  if (cfg.verify_checksum) {
    const size_t sp = body.rfind(' ');
    if (sp == std::string_view::npos) {
      return reject(DecodeError::Malformed, detail, "missing checksum trailer");
    }
    uint32_t expected = 0;
    const std::string_view trailer = body.substr(sp + 1);
    if (trailer.size() != 2 || !parse_hex_u32(trailer, expected)) {
      return reject(DecodeError::Malformed, detail, "bad checksum trailer '" + std::string(trailer) + "'");
    }
    body = body.substr(0, sp);
    const uint8_t actual = telegram_checksum(body);
    if (actual != expected) {
      return reject(DecodeError::ChecksumMismatch, detail,
                    "checksum " + std::to_string(actual) + " != " + std::to_string(expected));
    }
  }

  std::vector<std::string_view> f;
  f.reserve(1024);
  if (!split_fields(body, f)) {
    return reject(DecodeError::Malformed, detail, "empty or badly separated telegram");
  }
  if (f.size() < 2) {
    return reject(DecodeError::Malformed, detail, "telegram has no command");
  }
  if (!is_cola_command_type(f[kIdxType])) {
    return reject(DecodeError::Malformed, detail, "unknown command type '" + std::string(f[kIdxType]) + "'");
  }
  if ((f[kIdxType] != "sSN" && f[kIdxType] != "sRA") || f[kIdxCommand] != "LMDscandata") {
    return reject(DecodeError::UnexpectedCommand, detail,
                  std::string(f[kIdxType]) + " " + std::string(f[kIdxCommand]));
  }
  if (f.size() <= kIdxEncoderCount) {
    return reject(DecodeError::Malformed, detail,
                  "header truncated (" + std::to_string(f.size()) + " fields)");
  }

  auto num = [&](size_t idx, int64_t& v) -> bool { return parse_telegram_number(f[idx], v); };

  int64_t status_hi = 0, status_lo = 0, telegram_ctr = 0, scan_ctr = 0, since_boot = 0, scan_freq = 0;
  if (!num(kIdxStatusHi, status_hi) || !num(kIdxStatusLo, status_lo) ||
      !num(kIdxTelegramCtr, telegram_ctr) || !num(kIdxScanCtr, scan_ctr) ||
      !num(kIdxTimeSinceBoot, since_boot) || !num(kIdxScanFreq, scan_freq)) {
    return reject(DecodeError::Malformed, detail, "non-numeric header field");
  }

  const ScanStatus status = map_status(status_hi, status_lo);
  if (!status_accepted(status, cfg.status_policy)) {
    return reject(DecodeError::UnsupportedStatus, detail,
                  std::string("device status ") + to_string(status));
  }

  int64_t encoders = 0;
  if (!num(kIdxEncoderCount, encoders) || encoders < 0 || encoders > 16) {
    return reject(DecodeError::Malformed, detail, "bad encoder count");
  }
  size_t idx = kIdxEncoderCount + 1 + static_cast<size_t>(encoders) * 2;

  int64_t channels = 0;
  if (idx >= f.size() || !num(idx, channels) || channels < 1) {
    return reject(DecodeError::Malformed, detail, "no 16-bit distance channel");
  }
  ++idx;

  if (idx + kChannelHeader > f.size()) {
    return reject(DecodeError::Malformed, detail, "channel header truncated");
  }
  const std::string_view content = f[idx];
  if (content.substr(0, 4) != "DIST") {
    return reject(DecodeError::Malformed, detail, "first channel is '" + std::string(content) + "', not DIST");
  }

  float scale = 0.0f, offset = 0.0f;
  uint32_t start_raw = 0, step_raw = 0;
  int64_t count = 0;
  if (!parse_hex_float(f[idx + 1], scale) || !parse_hex_float(f[idx + 2], offset) ||
      !parse_hex_u32(f[idx + 3], start_raw) || !parse_hex_u32(f[idx + 4], step_raw) ||
      !num(idx + 5, count)) {
    return reject(DecodeError::Malformed, detail, "bad channel header");
  }
  if (step_raw == 0 || static_cast<int32_t>(step_raw) < 0) {
    return reject(DecodeError::Malformed, detail, "non-positive angular step");
  }
  if (count <= 0 || static_cast<size_t>(count) > f.size() - (idx + kChannelHeader)) {
    return reject(DecodeError::Malformed, detail,
                  "value count " + std::to_string(count) + " exceeds telegram");
  }
  if (cfg.expected_points > 0 && count != cfg.expected_points) {
    return reject(DecodeError::Malformed, detail,
                  "expected " + std::to_string(cfg.expected_points) + " points, got " + std::to_string(count));
  }

  const double start_deg = static_cast<int32_t>(start_raw) / 10000.0 + cfg.angle_offset_deg;
  const double step_deg  = step_raw / 10000.0;
  const double last_deg  = start_deg + static_cast<double>(count - 1) * step_deg;

  if (cfg.expected_step_deg > 0.0 && std::fabs(step_deg - cfg.expected_step_deg) > kAngleTolerance) {
    return reject(DecodeError::Malformed, detail,
                  "angular step " + std::to_string(step_deg) + " deg, expected " +
                  std::to_string(cfg.expected_step_deg));
  }
  if (start_deg < sector.min_deg - kAngleTolerance || last_deg > sector.max_deg + kAngleTolerance) {
    return reject(DecodeError::Malformed, detail,
                  "sweep [" + std::to_string(start_deg) + ", " + std::to_string(last_deg) +
                  "] deg outside scan sector [" + std::to_string(sector.min_deg) + ", " +
                  std::to_string(sector.max_deg) + "]");
  }

  out = ScanFrame{};
  out.t_ns = raw.monotonic_ts_ns;
  out.telegram_counter = static_cast<uint32_t>(telegram_ctr);
  out.scan_counter = static_cast<uint32_t>(scan_ctr);
  out.time_since_startup_us = static_cast<uint32_t>(since_boot);
  out.scan_frequency_hz = scan_freq / 100.0;
  out.status = status;
  out.start_angle_deg = start_deg;
  out.angle_step_deg = step_deg;
  out.points.resize(static_cast<size_t>(count));

  const size_t first = idx + kChannelHeader;
  for (size_t i = 0; i < out.points.size(); ++i) {
    int64_t v = 0;
    if (!parse_telegram_number(f[first + i], v) || v < 0) {
      return reject(DecodeError::Malformed, detail,
                    "bad distance value '" + std::string(f[first + i]) + "' at index " + std::to_string(i));
    }
    ScanPoint& p = out.points[i];
    p.angle_deg = out.start_angle_deg + static_cast<double>(i) * step_deg;
    p.valid = static_cast<uint32_t>(v) != cfg.invalid_value;
    p.distance_mm = p.valid ? static_cast<double>(v) * scale + offset : 0.0;
  }

  return DecodeError::None;
}
