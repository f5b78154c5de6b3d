#include "scan_json.h"

Json::Value scanToJson(const FilteredScan& scan) {
  Json::Value root;
  root["v"] = 1;
  root["seq"] = scan.seq;
  root["t_ns"] = Json::UInt64(scan.t_ns);
  root["scan_counter"] = scan.scan_counter;
  root["status"] = to_string(scan.status);

  // [[angle_deg, distance_mm], ...] in angular order
  Json::Value points(Json::arrayValue);
  for (const auto& p : scan.points) {
    Json::Value pt(Json::arrayValue);
    pt.append(p.angle_deg);
    pt.append(p.distance_mm);
    points.append(pt);
  }
  root["points"] = points;
  return root;
}

Json::Value agedScanToJson(const AgedScan& aged) {
  Json::Value root = aged.scan ? scanToJson(*aged.scan) : Json::Value(Json::objectValue);
  root["age_ms"] = static_cast<double>(aged.age.count()) / 1e6;
  root["stale"] = aged.stale;
  return root;
}

Json::Value statusToJson(const LoopStatus& s) {
  Json::Value j;
  j["state"] = to_string(s.state);
  j["persistent_failure"] = s.persistent_failure;
  j["consecutive_failures"] = s.consecutive_failures;
  j["last_error"] = s.last_error;
  j["last_backoff_ms"] = static_cast<Json::Int64>(s.last_backoff.count());

  Json::Value c;
  c["connect_attempts"] = Json::UInt64(s.connect_attempts);
  c["connect_failures"] = Json::UInt64(s.connect_failures);
  c["read_failures"]    = Json::UInt64(s.read_failures);
  c["reconnects"]       = Json::UInt64(s.reconnects);
  c["frames_decoded"]   = Json::UInt64(s.frames_decoded);
  c["frames_ignored"]   = Json::UInt64(s.frames_ignored);
  c["scans_published"]  = Json::UInt64(s.scans_published);
  c["decode_malformed"] = Json::UInt64(s.decode_malformed);
  c["decode_checksum"]  = Json::UInt64(s.decode_checksum);
  c["decode_status"]    = Json::UInt64(s.decode_status);
  j["counters"] = c;
  return j;
}

std::string writeCompact(const Json::Value& v) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}
