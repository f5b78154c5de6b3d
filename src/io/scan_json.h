#pragma once
#include <json/json.h>
#include <string>
#include "core/scan.h"
#include "core/scan_store.h"
#include "core/acquisition_loop.h"

Json::Value scanToJson(const FilteredScan& scan);
Json::Value agedScanToJson(const AgedScan& aged);
Json::Value statusToJson(const LoopStatus& status);

// Compact single-line form for the bus.
std::string writeCompact(const Json::Value& v);
