#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "config/config.h"
#include "core/scan.h"
#include "sensors/ITransport.h"

/**
 * CoLa-A LMDscandata decoding.
 *
 * Telegram fields (space separated, STX/ETX already stripped):
 *   0  command type        sSN (stream) / sRA (poll reply)
 *   1  command             LMDscandata
 *   2  version             3 device number        4 serial number
 *   5  device status hi    6 device status lo
 *   7  telegram counter    8 scan counter
 *   9  time since startup [us]                     10 time of transmission [us]
 *   11,12 input status     13,14 output status     15 reserved
 *   16 scan frequency [1/100 Hz]                   17 measurement frequency
 *   18 encoder count N, followed by 2*N encoder fields
 *   then: 16-bit channel count, and per channel
 *         content ("DIST1"), scale (hex IEEE-754), offset (hex IEEE-754),
 *         start angle [1/10000 deg, signed], step [1/10000 deg], count, values
 *
 * Numbers with a leading sign are decimal, everything else is hexadecimal.
 */

enum class DecodeError {
  None,
  Malformed,
  ChecksumMismatch,
  UnsupportedStatus,
  UnexpectedCommand,  // valid telegram that is not scan data, e.g. "sEA LMDscandata 1"
};

const char* to_string(DecodeError e);

// Never throws. On failure `out` is unspecified and `detail` (if given)
// describes the first problem found. A sweep whose angles (after the
// configured offset) leave `sector`, or whose step differs from the
// configured one, is Malformed.
DecodeError decode_telegram(const RawFrame& raw, const DecoderConfig& cfg, const ScanSector& sector,
                            ScanFrame& out, std::string* detail = nullptr);

// XOR of all bytes, the checksum carried by the optional trailer token.
uint8_t telegram_checksum(std::string_view bytes);

bool parse_telegram_number(std::string_view token, int64_t& out);
