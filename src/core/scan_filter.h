#pragma once

#include <cstddef>
#include "config/config.h"
#include "core/scan.h"

// Counts for before/after comparison
struct ScanFilterStats {
    size_t input_points{0};
    size_t output_points{0};
    size_t removed_invalid{0};
    size_t removed_by_distance{0};
    size_t removed_by_angle{0};

    size_t total_removed() const {
        return removed_invalid + removed_by_distance + removed_by_angle;
    }
};

// Inclusive bounds; invalid points never pass.
inline bool pass_filter(const ScanPoint& p, const FilterConfig& f) {
    return p.valid &&
           (f.min_distance_mm <= p.distance_mm && p.distance_mm <= f.max_distance_mm) &&
           (f.min_angle_deg <= p.angle_deg && p.angle_deg <= f.max_angle_deg);
}

// Keeps the points of `frame` inside the configured distance range and field
// of view, in their original angular order. An empty result is legal.
FilteredScan filter_scan(const ScanFrame& frame, const FilterConfig& cfg,
                         ScanFilterStats* stats = nullptr);

// Re-filtering an already filtered scan with the same config is a no-op.
FilteredScan filter_scan(const FilteredScan& scan, const FilterConfig& cfg,
                         ScanFilterStats* stats = nullptr);
