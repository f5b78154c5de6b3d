#include <gtest/gtest.h>
#include <cstdio>

#include "sensors/sick/telegram_decoder.h"
#include "telegram_fixtures.h"

namespace {

const ScanSector kSector;

RawFrame frame_of(const std::string& payload, uint64_t t_ns = 42) {
  RawFrame raw;
  raw.monotonic_ts_ns = t_ns;
  raw.payload = payload;
  return raw;
}

std::string with_checksum(const std::string& body, uint8_t cs) {
  char buf[4];
  std::snprintf(buf, sizeof(buf), "%02X", cs);
  return body + " " + buf;
}

}

TEST(TelegramDecoder, DecodesFullTim561Sweep) {
  DecoderConfig cfg;
  ScanFrame out;
  std::string detail;
  ASSERT_EQ(decode_telegram(frame_of(tim561_telegram(0x347), 1234), cfg, kSector, out, &detail), DecodeError::None) << detail;

  ASSERT_EQ(out.points.size(), 811u);
  EXPECT_EQ(out.t_ns, 1234u);
  EXPECT_EQ(out.scan_counter, 0x347u);
  EXPECT_EQ(out.telegram_counter, 0x343u);
  EXPECT_EQ(out.status, ScanStatus::Ok);
  EXPECT_DOUBLE_EQ(out.scan_frequency_hz, 15.0);
  EXPECT_NEAR(out.angle_step_deg, 0.3333, 1e-9);
  EXPECT_NEAR(out.points.front().angle_deg, -135.0, 1e-9);
  EXPECT_NEAR(out.points.back().angle_deg, -135.0 + 810 * 0.3333, 1e-6);

  for (size_t i = 1; i < out.points.size(); ++i) {
    EXPECT_NEAR(out.points[i].angle_deg - out.points[i - 1].angle_deg, 0.3333, 1e-9);
  }
  EXPECT_DOUBLE_EQ(out.points[1].distance_mm, 501.0);
  EXPECT_TRUE(out.points[1].valid);
}

TEST(TelegramDecoder, NoReturnSentinelMarksPointInvalid) {
  DecoderConfig cfg;
  ScanFrame out;
  ASSERT_EQ(decode_telegram(frame_of(tim561_telegram()), cfg, kSector, out), DecodeError::None);
  EXPECT_FALSE(out.points[0].valid);
  EXPECT_FALSE(out.points[10].valid);
  EXPECT_DOUBLE_EQ(out.points[10].distance_mm, 0.0);
  EXPECT_TRUE(out.points[11].valid);
}

TEST(TelegramDecoder, AppliesScaleFactor) {
  TelegramFields s;
  s.scale = "40000000"; // 2.0f
  s.values = tim561_values();
  DecoderConfig cfg;
  ScanFrame out;
  ASSERT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::None);
  EXPECT_DOUBLE_EQ(out.points[5].distance_mm, 2.0 * 505);
}

TEST(TelegramDecoder, SkipsEncoderBlock) {
  TelegramFields s;
  s.encoders = {0x1234, 0x10};
  s.values = tim561_values();
  DecoderConfig cfg;
  ScanFrame out;
  std::string detail;
  ASSERT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out, &detail), DecodeError::None) << detail;
  EXPECT_EQ(out.points.size(), 811u);
  EXPECT_DOUBLE_EQ(out.points[3].distance_mm, 503.0);
}

TEST(TelegramDecoder, ZeroOffsetKeepsSensorFrame) {
  DecoderConfig cfg;
  cfg.angle_offset_deg = 0.0;
  ScanSector sensor_frame;
  sensor_frame.min_deg = -45.0;
  sensor_frame.max_deg = 225.0;
  ScanFrame out;
  ASSERT_EQ(decode_telegram(frame_of(tim561_telegram()), cfg, sensor_frame, out), DecodeError::None);
  EXPECT_NEAR(out.points.front().angle_deg, -45.0, 1e-9);

  // the same sweep leaves the forward-zero sector
  EXPECT_EQ(decode_telegram(frame_of(tim561_telegram()), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, RejectsSweepStartingPastSector) {
  TelegramFields s;
  s.values = tim561_values();
  s.start_angle = 900000; // +90 deg raw, 0 deg after offset; the sweep ends near 270
  DecoderConfig cfg;
  ScanFrame out;
  std::string detail;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out, &detail), DecodeError::Malformed);
  EXPECT_NE(detail.find("sector"), std::string::npos);
}

TEST(TelegramDecoder, RejectsSweepStartingBeforeSector) {
  TelegramFields s;
  s.values.assign(100, 1000);
  s.start_angle = -500000; // -140 deg after offset
  DecoderConfig cfg;
  cfg.expected_points = 0;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::Malformed);

  s.start_angle = -450000;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::None);
}

TEST(TelegramDecoder, RejectsUnexpectedAngularStep) {
  TelegramFields s;
  s.values.assign(100, 1000);
  s.step = 5000; // 0.5 deg; 100 points still fit the sector
  DecoderConfig cfg;
  cfg.expected_points = 0;
  ScanFrame out;
  std::string detail;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out, &detail), DecodeError::Malformed);
  EXPECT_NE(detail.find("step"), std::string::npos);

  cfg.expected_step_deg = 0.0;
  ASSERT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::None);
  EXPECT_DOUBLE_EQ(out.angle_step_deg, 0.5);
}

TEST(TelegramDecoder, RejectsTruncatedTelegram) {
  const std::string t = tim561_telegram();
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(t.substr(0, t.size() / 2)), cfg, kSector, out), DecodeError::Malformed);
  EXPECT_EQ(decode_telegram(frame_of("sSN LMDscandata 1 1"), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, RejectsDoubledSeparator) {
  std::string t = tim561_telegram();
  t.insert(t.find("LMDscandata") + 11, " ");
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(t), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, RejectsNonNumericField) {
  std::string t = tim561_telegram();
  t.replace(t.find("2802D6A"), 7, "ZZZZZZZ");
  DecoderConfig cfg;
  ScanFrame out;
  std::string detail;
  EXPECT_EQ(decode_telegram(frame_of(t), cfg, kSector, out, &detail), DecodeError::Malformed);
  EXPECT_FALSE(detail.empty());
}

TEST(TelegramDecoder, RejectsBadDistanceValue) {
  std::string t = tim561_telegram();
  // first data value follows the announced count 0x32B
  const auto pos = t.find(" 32B ") + 5;
  t.replace(pos, 1, "Q");
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(t), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, PointCountMustMatchSensorModel) {
  TelegramFields s;
  s.values.assign(400, 1000);
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::Malformed);

  cfg.expected_points = 0;
  ASSERT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::None);
  EXPECT_EQ(out.points.size(), 400u);
}

TEST(TelegramDecoder, AnnouncedCountBeyondPayloadIsMalformed) {
  TelegramFields s;
  s.values.assign(100, 1000);
  s.count_override = 811;
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(make_telegram(s)), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, ChecksumVerification) {
  const std::string body = tim561_telegram();
  const uint8_t cs = telegram_checksum(body);

  DecoderConfig cfg;
  cfg.verify_checksum = true;
  ScanFrame out;

  EXPECT_EQ(decode_telegram(frame_of(with_checksum(body, cs)), cfg, kSector, out), DecodeError::None);
  EXPECT_EQ(out.points.size(), 811u);
  EXPECT_EQ(decode_telegram(frame_of(with_checksum(body, static_cast<uint8_t>(cs ^ 0x5A))), cfg, kSector, out),
            DecodeError::ChecksumMismatch);
  EXPECT_EQ(decode_telegram(frame_of(body + " XYZ"), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramDecoder, ChecksumOfKnownBytes) {
  EXPECT_EQ(telegram_checksum(""), 0);
  EXPECT_EQ(telegram_checksum("A"), 0x41);
  EXPECT_EQ(telegram_checksum("AB"), 0x41 ^ 0x42);
}

TEST(TelegramDecoder, StatusPolicy) {
  TelegramFields s;
  s.values = tim561_values();
  s.status_lo = 2; // contamination warning
  const std::string warn = make_telegram(s);
  s.status_lo = 4; // contamination error
  const std::string err = make_telegram(s);
  s.status_lo = 0;
  s.status_hi = 1;
  const std::string dev = make_telegram(s);

  DecoderConfig strict;
  DecoderConfig lenient;
  lenient.status_policy = StatusPolicy::AcceptWarnings;
  ScanFrame out;

  EXPECT_EQ(decode_telegram(frame_of(warn), strict, kSector, out), DecodeError::UnsupportedStatus);
  ASSERT_EQ(decode_telegram(frame_of(warn), lenient, kSector, out), DecodeError::None);
  EXPECT_EQ(out.status, ScanStatus::ContaminationWarning);

  EXPECT_EQ(decode_telegram(frame_of(err), lenient, kSector, out), DecodeError::UnsupportedStatus);
  EXPECT_EQ(decode_telegram(frame_of(dev), lenient, kSector, out), DecodeError::UnsupportedStatus);
}

TEST(TelegramDecoder, AcknowledgementIsUnexpectedCommand) {
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of("sEA LMDscandata 1"), cfg, kSector, out), DecodeError::UnexpectedCommand);
  EXPECT_EQ(decode_telegram(frame_of("sRA DeviceIdent 8 TiM561"), cfg, kSector, out), DecodeError::UnexpectedCommand);
}

TEST(TelegramDecoder, CorruptedCommandTypeIsMalformed) {
  std::string t = tim561_telegram();
  t.replace(0, 3, "sS#");
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(t), cfg, kSector, out), DecodeError::Malformed);
  EXPECT_EQ(decode_telegram(frame_of("xyz LMDscandata 1"), cfg, kSector, out), DecodeError::Malformed);
  EXPECT_EQ(decode_telegram(frame_of("sFA 5"), cfg, kSector, out), DecodeError::UnexpectedCommand);
  EXPECT_EQ(decode_telegram(frame_of("sAN SetAccessMode 1"), cfg, kSector, out), DecodeError::UnexpectedCommand);
}

TEST(TelegramDecoder, EmptyPayloadIsMalformed) {
  DecoderConfig cfg;
  ScanFrame out;
  EXPECT_EQ(decode_telegram(frame_of(""), cfg, kSector, out), DecodeError::Malformed);
}

TEST(TelegramNumber, SignedIsDecimalUnsignedIsHex) {
  int64_t v = 0;
  ASSERT_TRUE(parse_telegram_number("+10", v));
  EXPECT_EQ(v, 10);
  ASSERT_TRUE(parse_telegram_number("-45", v));
  EXPECT_EQ(v, -45);
  ASSERT_TRUE(parse_telegram_number("10", v));
  EXPECT_EQ(v, 16);
  ASSERT_TRUE(parse_telegram_number("FFF92230", v));
  EXPECT_EQ(static_cast<int32_t>(static_cast<uint32_t>(v)), -450000);
  EXPECT_FALSE(parse_telegram_number("", v));
  EXPECT_FALSE(parse_telegram_number("-", v));
  EXPECT_FALSE(parse_telegram_number("G1", v));
}
