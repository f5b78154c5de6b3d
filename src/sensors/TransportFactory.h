#pragma once
#include "sensors/ITransport.h"
#include "config/config.h"
#include <functional>
#include <memory>

using TransportFactory = std::function<std::unique_ptr<ITransport>(const SensorConfig&)>;

std::unique_ptr<ITransport> create_transport(const SensorConfig& cfg);
