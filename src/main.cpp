#include <crow.h>
#include <iostream>
#include <memory>
#include <vector>
#include "config/config.h"
#include "core/acquisition_loop.h"
#include "io/nng_bus.h"
#include "io/rest_handlers.h"

int main(int argc, char** argv) {
  std::string cfgPath = "./config/default.yaml";
  std::string httpListen = "";

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if(a=="--config" && i+1<argc) cfgPath = argv[++i];
    else if(a=="--listen" && i+1<argc) httpListen = argv[++i];
  }

  AppConfig appcfg;
  try {
    appcfg = load_app_config(cfgPath);
  } catch (const std::exception& e) {
    std::cerr << "[App] Failed to load " << cfgPath << ": " << e.what() << std::endl;
    return 1;
  }

  // One bus per configured sink
  std::vector<std::unique_ptr<NngBus>> buses;
  for (const auto& sink : appcfg.sinks) {
    auto bus = std::make_unique<NngBus>();
    if (bus->startPublisher(sink)) buses.push_back(std::move(bus));
  }

  AcquisitionLoop lidar;
  lidar.onScan([&buses](const std::shared_ptr<const FilteredScan>& scan) {
    for (auto& bus : buses) bus->publishScan(*scan);
  });
  lidar.onEvent([](const LoopEvent& ev) {
    if (ev.kind == LoopEventKind::StateChanged) {
      std::cout << "[App] acquisition " << to_string(ev.state) << std::endl;
    }
  });

  try {
    lidar.start(appcfg);
  } catch (const ConfigError& e) {
    std::cerr << "[App] Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  crow::SimpleApp app;
  RestApi rest(lidar, appcfg);
  rest.registerRoutes(app);

  // Configure HTTP listen address and port
  std::string host = "0.0.0.0";
  uint16_t port = 8080;

  auto parseListenAddress = [&](const std::string& url) {
    std::string h;
    int p = port;
    if (parse_endpoint(url, h, p)) {
      host = h;
      port = static_cast<uint16_t>(p);
    } else {
      std::cerr << "[App] ignoring bad listen address '" << url << "'" << std::endl;
    }
  };

  if (!httpListen.empty()) {
    parseListenAddress(httpListen);
  }
  else if (!appcfg.ui.listen.empty()) {
    parseListenAddress(appcfg.ui.listen);
  }

  std::cout << "[App] Starting HTTP server on host:" << host << " port:" << port << std::endl;
  app.bindaddr(host).port(port);

  // Blocks until SIGINT/SIGTERM
  app.run();

  lidar.stop();
  for (auto& bus : buses) bus->stop();
  return 0;
}
