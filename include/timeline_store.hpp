//
//  timeline_store.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "editor_state.hpp"
#include "timeline_segment.hpp"

namespace cutplan {

/// Smallest length a trim may leave on the trimmed segment (s).
inline constexpr double kMinTrimLengthSec = 0.1;

/// @defgroup timeline Timeline edit operations
/// Pure transitions over EditorState. Every operation is total: a request that cannot be honoured
/// (unknown id, out-of-range time, last active segment) returns the input state unchanged, so
/// callers may forward raw UI input without validating it first.
/// @{

/// Fresh state for a recording of `duration` seconds: one active segment [0, duration].
EditorState create_initial_state(double duration);

/**
 * @brief Move the start of the earliest active segment.
 *
 * `new_start` is clamped to [lower, first_active.end - 0.1], where `lower` is the end of the
 * segment preceding it (0 when it is the first segment).
 */
EditorState trim_start(const EditorState &state, double new_start);

/// Mirror of trim_start on the latest active segment, clamped to
/// [last_active.start + 0.1, upper] with `upper` the next segment's start (or duration).
EditorState trim_end(const EditorState &state, double new_end);

/// Split an active segment at a strictly interior time. The left half keeps the id.
EditorState split_segment(const EditorState &state, const std::string &segment_id,
                          double split_time);

/// Flag a segment as deleted. Refused when it would leave no active segment.
EditorState delete_segment(const EditorState &state, const std::string &segment_id);

/// Clear the deleted flag.
EditorState restore_segment(const EditorState &state, const std::string &segment_id);

/// Move the playhead, clamped to [0, duration].
EditorState set_current_time(const EditorState &state, double time);

EditorState set_playing(const EditorState &state, bool playing);

/// @}

std::vector<TimelineSegment> active_segments(const EditorState &state);

double total_active_duration(const EditorState &state);

// Active segment containing `time` (bounds inclusive).
std::optional<TimelineSegment> segment_at_time(const EditorState &state, double time);

bool is_time_in_active_segment(const EditorState &state, double time);

// Playhead snapping: `time` itself when inside an active segment, else the start of the next
// active segment, else the first active start (wrap), else 0.
double next_active_time(const EditorState &state, double time);

// "M:SS.d" display string.
std::string format_time(double seconds);

}  // namespace cutplan
