#include "rest_handlers.h"
#include "io/scan_json.h"

void RestApi::registerRoutes(crow::SimpleApp& app) {
  CROW_ROUTE(app, "/api/v1/scan").methods("GET"_method)([this]() {
    return getScan();
  });

  CROW_ROUTE(app, "/api/v1/status").methods("GET"_method)([this]() {
    return getStatus();
  });

  CROW_ROUTE(app, "/api/v1/config").methods("GET"_method)([this]() {
    return getConfig();
  });
}

crow::response RestApi::jsonResponse(int code, const Json::Value& body) {
  crow::response resp(code, body.toStyledString());
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response RestApi::errorResponse(int code, const std::string& error, const std::string& message) {
  Json::Value j;
  j["error"] = error;
  j["message"] = message;
  return jsonResponse(code, j);
}

crow::response RestApi::getScan() {
  try {
    auto aged = loop_.getAged();
    if (!aged) {
      return errorResponse(404, "not_found", "No scan published yet");
    }
    return jsonResponse(200, agedScanToJson(*aged));
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::getStatus() {
  try {
    Json::Value j = statusToJson(loop_.status());
    j["sensor"]["id"] = config_.sensor.id;
    j["sensor"]["endpoint"] = config_.sensor.host + ":" + std::to_string(config_.sensor.port);
    return jsonResponse(200, j);
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}

crow::response RestApi::getConfig() {
  try {
    Json::Value j;
    j["yaml"] = dump_app_config(config_);
    return jsonResponse(200, j);
  } catch (const std::exception& e) {
    return errorResponse(500, "internal_error", e.what());
  }
}
