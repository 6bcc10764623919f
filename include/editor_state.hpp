//
//  editor_state.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "silence_segment.hpp"
#include "timeline_segment.hpp"

namespace cutplan {

/**
 * @brief Immutable snapshot of one editing session.
 *
 * Every transition in timeline_store.hpp / silence_ledger.hpp takes a snapshot by const
 * reference and returns a new one; snapshots never share mutable state.
 *
 * `segments` is kept in chronological order. `duration` is the source media length and is fixed
 * when the state is created. `next_segment_serial` feeds the id of the right half of the next split.
 */
struct EditorState {
    std::vector<TimelineSegment> segments;
    std::vector<SilenceSegment> silence_segments;  ///< Sorted by start_time
    double current_time = 0;
    double duration = 0;
    bool is_playing = false;
    uint32_t next_segment_serial = 1;
};

}  // namespace cutplan
