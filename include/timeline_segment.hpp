//
//  timeline_segment.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace cutplan {

/// @ingroup api
/// One edit segment of the timeline. Times are seconds into the source media.
struct TimelineSegment {
    std::string id;          ///< Stable identifier ("seg-N")
    double start_time = 0;   ///< Inclusive start (s)
    double end_time = 0;     ///< Exclusive end (s), always > start_time
    bool deleted = false;    ///< Excluded from export, kept for restore
};

}  // namespace cutplan
