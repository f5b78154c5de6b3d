#include "config.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

AppConfig from_yaml(const YAML::Node& y) {
  AppConfig cfg;

  if (auto s = y["sensor"]) {
    SensorConfig& c = cfg.sensor;
    if (s["id"])   c.id   = s["id"].as<std::string>(c.id);
    if (s["type"]) c.type = s["type"].as<std::string>(c.type);
    if (s["endpoint"]) {
      // "host:port"; a bare host keeps the default port
      const std::string endpoint = s["endpoint"].as<std::string>("");
      if (!parse_endpoint(endpoint, c.host, c.port)) {
        throw ConfigError("sensor.endpoint: cannot parse '" + endpoint + "'");
      }
    }
    if (s["connect_timeout_ms"]) c.connect_timeout_ms = s["connect_timeout_ms"].as<int>(c.connect_timeout_ms);
    if (s["read_timeout_ms"])    c.read_timeout_ms    = s["read_timeout_ms"].as<int>(c.read_timeout_ms);
    if (s["poll_interval_ms"])   c.poll_interval_ms   = s["poll_interval_ms"].as<int>(c.poll_interval_ms);
    if (s["max_frame_bytes"])    c.max_frame_bytes    = s["max_frame_bytes"].as<int>(c.max_frame_bytes);
    if (s["subscribe"])          c.subscribe          = s["subscribe"].as<bool>(c.subscribe);
    if (s["startup_delay_ms"])   c.startup_delay_ms   = std::max(0, s["startup_delay_ms"].as<int>(c.startup_delay_ms));
  }

  if (auto d = y["decoder"]) {
    DecoderConfig& c = cfg.decoder;
    if (d["expected_points"])  c.expected_points  = std::max(0, d["expected_points"].as<int>(c.expected_points));
    if (d["angle_offset_deg"]) c.angle_offset_deg = d["angle_offset_deg"].as<double>(c.angle_offset_deg);
    if (d["expected_step_deg"]) c.expected_step_deg = d["expected_step_deg"].as<double>(c.expected_step_deg);
    if (d["invalid_value"])    c.invalid_value    = d["invalid_value"].as<uint32_t>(c.invalid_value);
    if (d["verify_checksum"])  c.verify_checksum  = d["verify_checksum"].as<bool>(c.verify_checksum);
    if (d["status_policy"]) {
      const std::string p = d["status_policy"].as<std::string>("");
      if (!parse_status_policy(p, c.status_policy)) {
        throw ConfigError("decoder.status_policy: unknown policy '" + p + "'");
      }
    }
  }

  if (auto s = y["sector"]) {
    if (s["min_deg"]) cfg.sector.min_deg = s["min_deg"].as<double>(cfg.sector.min_deg);
    if (s["max_deg"]) cfg.sector.max_deg = s["max_deg"].as<double>(cfg.sector.max_deg);
  }

  // Bounds are taken as written; validate_app_config rejects inverted ranges.
  if (auto f = y["filter"]) {
    FilterConfig& c = cfg.filter;
    if (f["min_distance_mm"]) c.min_distance_mm = f["min_distance_mm"].as<double>(c.min_distance_mm);
    if (f["max_distance_mm"]) c.max_distance_mm = f["max_distance_mm"].as<double>(c.max_distance_mm);
    if (f["min_angle_deg"])   c.min_angle_deg   = f["min_angle_deg"].as<double>(c.min_angle_deg);
    if (f["max_angle_deg"])   c.max_angle_deg   = f["max_angle_deg"].as<double>(c.max_angle_deg);
  }

  if (auto b = y["backoff"]) {
    BackoffConfig& c = cfg.backoff;
    if (b["initial_delay_ms"]) c.initial_delay_ms = b["initial_delay_ms"].as<int>(c.initial_delay_ms);
    if (b["multiplier"])       c.multiplier       = b["multiplier"].as<double>(c.multiplier);
    if (b["max_delay_ms"])     c.max_delay_ms     = b["max_delay_ms"].as<int>(c.max_delay_ms);
    if (b["persistent_failure_after_ms"])
      c.persistent_failure_after_ms = std::max(0, b["persistent_failure_after_ms"].as<int>(c.persistent_failure_after_ms));
  }

  if (auto s = y["store"]) {
    if (s["stale_after_ms"]) cfg.store.stale_after_ms = std::max(0, s["stale_after_ms"].as<int>(cfg.store.stale_after_ms));
  }

  if (auto u = y["ui"]) {
    if (u["listen"]) cfg.ui.listen = u["listen"].as<std::string>(cfg.ui.listen);
  }

  if (y["sinks"] && y["sinks"].IsSequence()) {
    for (const auto& sn : y["sinks"]) {
      SinkConfig sc;

      std::string type = sn["type"].as<std::string>("");
      if (sn["topic"])      sc.topic      = sn["topic"].as<std::string>(sc.topic);
      if (sn["rate_limit"]) sc.rate_limit = std::max(0, sn["rate_limit"].as<int>(0));

      if (type == "nng") {
        sc.cfg = NngConfig{};
        if (sn["url"]) sc.nng().url = sn["url"].as<std::string>("");
      } else {
        std::cerr << "[Config] ignoring sink of unknown type '" << type << "'" << std::endl;
        continue;
      }

      cfg.sinks.push_back(std::move(sc));
    }
  }

  return cfg;
}

} // namespace

bool parse_endpoint(const std::string& endpoint, std::string& host, int& port) {
  if (endpoint.empty()) return false;
  auto colon_pos = endpoint.rfind(':');
  if (colon_pos == std::string::npos) {
    host = endpoint;
    return true;
  }
  const std::string h = endpoint.substr(0, colon_pos);
  const std::string p = endpoint.substr(colon_pos + 1);
  if (h.empty() || p.empty()) return false;
  try {
    size_t used = 0;
    int v = std::stoi(p, &used);
    if (used != p.size() || v <= 0 || v > 65535) return false;
    host = h;
    port = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

const char* to_string(StatusPolicy p) {
  switch (p) {
    case StatusPolicy::Strict:         return "strict";
    case StatusPolicy::AcceptWarnings: return "accept_warnings";
  }
  return "strict";
}

bool parse_status_policy(const std::string& s, StatusPolicy& out) {
  if (s == "strict")          { out = StatusPolicy::Strict; return true; }
  if (s == "accept_warnings") { out = StatusPolicy::AcceptWarnings; return true; }
  return false;
}

AppConfig load_app_config(const std::string& path) {
  return from_yaml(YAML::LoadFile(path));
}

AppConfig parse_app_config(const std::string& yaml_text) {
  return from_yaml(YAML::Load(yaml_text));
}

void validate_filter_config(const FilterConfig& f, const ScanSector& sector) {
  std::ostringstream err;
  if (f.min_distance_mm < 0.0) {
    err << "filter.min_distance_mm must be >= 0 (got " << f.min_distance_mm << ")";
  } else if (f.min_distance_mm > f.max_distance_mm) {
    err << "filter distance bounds inverted: " << f.min_distance_mm << " > " << f.max_distance_mm;
  } else if (f.min_angle_deg > f.max_angle_deg) {
    err << "filter angle bounds inverted: " << f.min_angle_deg << " > " << f.max_angle_deg;
  } else if (f.min_angle_deg < sector.min_deg || f.max_angle_deg > sector.max_deg) {
    err << "filter angles [" << f.min_angle_deg << ", " << f.max_angle_deg
        << "] outside scan sector [" << sector.min_deg << ", " << sector.max_deg << "]";
  }
  const std::string msg = err.str();
  if (!msg.empty()) throw ConfigError(msg);
}

void validate_app_config(const AppConfig& cfg) {
  const auto& s = cfg.sensor;
  if (s.type != "sick_tim_tcp") throw ConfigError("sensor.type: no driver for '" + s.type + "'");
  if (s.host.empty())           throw ConfigError("sensor.endpoint: empty host");
  if (s.port <= 0 || s.port > 65535) throw ConfigError("sensor.endpoint: port out of range");
  if (s.connect_timeout_ms <= 0) throw ConfigError("sensor.connect_timeout_ms must be > 0");
  if (s.read_timeout_ms <= 0)    throw ConfigError("sensor.read_timeout_ms must be > 0");
  if (s.poll_interval_ms <= 0)   throw ConfigError("sensor.poll_interval_ms must be > 0");
  if (s.max_frame_bytes < 64)    throw ConfigError("sensor.max_frame_bytes must be >= 64");

  if (cfg.decoder.expected_step_deg < 0.0) throw ConfigError("decoder.expected_step_deg must be >= 0");
  if (cfg.sector.min_deg >= cfg.sector.max_deg) throw ConfigError("sector: min_deg must be < max_deg");
  validate_filter_config(cfg.filter, cfg.sector);

  const auto& b = cfg.backoff;
  if (b.initial_delay_ms <= 0)            throw ConfigError("backoff.initial_delay_ms must be > 0");
  if (b.multiplier < 1.0)                 throw ConfigError("backoff.multiplier must be >= 1");
  if (b.max_delay_ms < b.initial_delay_ms) throw ConfigError("backoff.max_delay_ms must be >= initial_delay_ms");
}

std::string dump_app_config(const AppConfig& cfg) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "sensor" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << cfg.sensor.id;
  out << YAML::Key << "type" << YAML::Value << cfg.sensor.type;
  out << YAML::Key << "endpoint" << YAML::Value << (cfg.sensor.host + ":" + std::to_string(cfg.sensor.port));
  out << YAML::Key << "connect_timeout_ms" << YAML::Value << cfg.sensor.connect_timeout_ms;
  out << YAML::Key << "read_timeout_ms" << YAML::Value << cfg.sensor.read_timeout_ms;
  out << YAML::Key << "poll_interval_ms" << YAML::Value << cfg.sensor.poll_interval_ms;
  out << YAML::Key << "max_frame_bytes" << YAML::Value << cfg.sensor.max_frame_bytes;
  out << YAML::Key << "subscribe" << YAML::Value << cfg.sensor.subscribe;
  out << YAML::Key << "startup_delay_ms" << YAML::Value << cfg.sensor.startup_delay_ms;
  out << YAML::EndMap;

  out << YAML::Key << "decoder" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "expected_points" << YAML::Value << cfg.decoder.expected_points;
  out << YAML::Key << "angle_offset_deg" << YAML::Value << cfg.decoder.angle_offset_deg;
  out << YAML::Key << "expected_step_deg" << YAML::Value << cfg.decoder.expected_step_deg;
  out << YAML::Key << "invalid_value" << YAML::Value << cfg.decoder.invalid_value;
  out << YAML::Key << "verify_checksum" << YAML::Value << cfg.decoder.verify_checksum;
  out << YAML::Key << "status_policy" << YAML::Value << to_string(cfg.decoder.status_policy);
  out << YAML::EndMap;

  out << YAML::Key << "sector" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "min_deg" << YAML::Value << cfg.sector.min_deg;
  out << YAML::Key << "max_deg" << YAML::Value << cfg.sector.max_deg;
  out << YAML::EndMap;

  out << YAML::Key << "filter" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "min_distance_mm" << YAML::Value << cfg.filter.min_distance_mm;
  out << YAML::Key << "max_distance_mm" << YAML::Value << cfg.filter.max_distance_mm;
  out << YAML::Key << "min_angle_deg" << YAML::Value << cfg.filter.min_angle_deg;
  out << YAML::Key << "max_angle_deg" << YAML::Value << cfg.filter.max_angle_deg;
  out << YAML::EndMap;

  out << YAML::Key << "backoff" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "initial_delay_ms" << YAML::Value << cfg.backoff.initial_delay_ms;
  out << YAML::Key << "multiplier" << YAML::Value << cfg.backoff.multiplier;
  out << YAML::Key << "max_delay_ms" << YAML::Value << cfg.backoff.max_delay_ms;
  out << YAML::Key << "persistent_failure_after_ms" << YAML::Value << cfg.backoff.persistent_failure_after_ms;
  out << YAML::EndMap;

  out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "stale_after_ms" << YAML::Value << cfg.store.stale_after_ms;
  out << YAML::EndMap;

  out << YAML::Key << "ui" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "listen" << YAML::Value << cfg.ui.listen;
  out << YAML::EndMap;

  out << YAML::Key << "sinks" << YAML::Value << YAML::BeginSeq;
  for (const auto& sink : cfg.sinks) {
    out << YAML::BeginMap;
    if (sink.isNng()) {
      out << YAML::Key << "type" << YAML::Value << "nng";
      out << YAML::Key << "url" << YAML::Value << sink.nng().url;
    }
    out << YAML::Key << "topic" << YAML::Value << sink.topic;
    out << YAML::Key << "rate_limit" << YAML::Value << sink.rate_limit;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return std::string(out.c_str());
}
