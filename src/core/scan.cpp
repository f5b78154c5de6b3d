#include "scan.h"

const char* to_string(ScanStatus s) {
  switch (s) {
    case ScanStatus::Ok:                   return "ok";
    case ScanStatus::ContaminationWarning: return "contamination_warning";
    case ScanStatus::ContaminationError:   return "contamination_error";
    case ScanStatus::DeviceError:          return "device_error";
  }
  return "device_error";
}
