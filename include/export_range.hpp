//
//  export_range.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <vector>

namespace cutplan {

/// Shortest range the resolver will hand to the encoder (s).
inline constexpr double kMinExportRangeSec = 0.1;

/// @ingroup api
/// Final, disjoint interval of source media included in the rendered output.
struct ExportRange {
    double start_time = 0;
    double end_time = 0;

    double length() const { return end_time - start_time; }
};

inline bool operator==(const ExportRange &a, const ExportRange &b) {
    return a.start_time == b.start_time && a.end_time == b.end_time;
}

inline bool operator!=(const ExportRange &a, const ExportRange &b) { return !(a == b); }

}  // namespace cutplan
