#pragma once
#include <crow.h>
#include <json/json.h>
#include "core/acquisition_loop.h"
#include "config/config.h"

// Read-only HTTP view of the acquisition pipeline.
class RestApi {
   AcquisitionLoop& loop_;
   const AppConfig& config_;

  public:
    RestApi(AcquisitionLoop& loop, const AppConfig& cfg) : loop_(loop), config_(cfg) {}

    // Register all routes with the Crow app
    void registerRoutes(crow::SimpleApp& app);

    crow::response getScan();
    crow::response getStatus();
    crow::response getConfig();

  private:
    static crow::response jsonResponse(int code, const Json::Value& body);
    static crow::response errorResponse(int code, const std::string& error, const std::string& message);
};
