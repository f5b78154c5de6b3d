#include "scan_filter.h"

namespace {

std::vector<ScanPoint> keep_passing(const std::vector<ScanPoint>& in, const FilterConfig& cfg,
                                    ScanFilterStats* stats) {
    std::vector<ScanPoint> out;
    out.reserve(in.size());

    ScanFilterStats st;
    st.input_points = in.size();

    for (const auto& p : in) {
        if (pass_filter(p, cfg)) {
            out.push_back(p);
            continue;
        }
        // attribute each rejection to the first failing criterion
        if (!p.valid) {
            ++st.removed_invalid;
        } else if (p.distance_mm < cfg.min_distance_mm || p.distance_mm > cfg.max_distance_mm) {
            ++st.removed_by_distance;
        } else {
            ++st.removed_by_angle;
        }
    }

    st.output_points = out.size();
    if (stats) *stats = st;
    return out;
}

}

FilteredScan filter_scan(const ScanFrame& frame, const FilterConfig& cfg, ScanFilterStats* stats) {
    FilteredScan result;
    result.t_ns = frame.t_ns;
    result.scan_counter = frame.scan_counter;
    result.status = frame.status;
    result.points = keep_passing(frame.points, cfg, stats);
    return result;
}

FilteredScan filter_scan(const FilteredScan& scan, const FilterConfig& cfg, ScanFilterStats* stats) {
    FilteredScan result;
    result.t_ns = scan.t_ns;
    result.seq = scan.seq;
    result.scan_counter = scan.scan_counter;
    result.status = scan.status;
    result.points = keep_passing(scan.points, cfg, stats);
    return result;
}
