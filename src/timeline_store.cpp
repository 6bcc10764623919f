//
//  timeline_store.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timeline_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>

#include "logging.hpp"

namespace cutplan {

namespace {

std::string make_segment_id(uint32_t serial) { return "seg-" + std::to_string(serial); }

std::vector<TimelineSegment>::const_iterator find_segment(const EditorState &state,
                                                          const std::string &id) {
    return std::find_if(state.segments.begin(), state.segments.end(),
                        [&](const TimelineSegment &s) { return s.id == id; });
}

size_t count_active(const EditorState &state) {
    return static_cast<size_t>(std::count_if(state.segments.begin(), state.segments.end(),
                                             [](const TimelineSegment &s) { return !s.deleted; }));
}

}  // namespace

EditorState create_initial_state(double duration) {
    EditorState state;
    state.duration = duration;
    TimelineSegment seg;
    seg.id = make_segment_id(state.next_segment_serial++);
    seg.start_time = 0;
    seg.end_time = duration;
    state.segments.push_back(seg);
    CP_LOG("timeline", "initial state duration=" << seconds_str(duration));
    return state;
}

EditorState trim_start(const EditorState &state, double new_start) {
    auto first = std::find_if(state.segments.begin(), state.segments.end(),
                              [](const TimelineSegment &s) { return !s.deleted; });
    if (first == state.segments.end() || std::isnan(new_start)) {
        return state;
    }
    const double lower = first == state.segments.begin() ? 0.0 : std::prev(first)->end_time;
    const double upper = first->end_time - kMinTrimLengthSec;
    const double clamped = std::max(lower, std::min(new_start, upper));

    EditorState next = state;
    next.segments[static_cast<size_t>(std::distance(state.segments.begin(), first))].start_time =
        clamped;
    return next;
}

EditorState trim_end(const EditorState &state, double new_end) {
    auto last = std::find_if(state.segments.rbegin(), state.segments.rend(),
                             [](const TimelineSegment &s) { return !s.deleted; });
    if (last == state.segments.rend() || std::isnan(new_end)) {
        return state;
    }
    const double upper = last == state.segments.rbegin() ? state.duration : std::prev(last)->start_time;
    const double lower = last->start_time + kMinTrimLengthSec;
    const double clamped = std::min(upper, std::max(new_end, lower));

    EditorState next = state;
    const auto index = state.segments.size() - 1 -
                       static_cast<size_t>(std::distance(state.segments.rbegin(), last));
    next.segments[index].end_time = clamped;
    return next;
}

EditorState split_segment(const EditorState &state, const std::string &segment_id,
                          double split_time) {
    auto it = find_segment(state, segment_id);
    if (it == state.segments.end() || it->deleted) {
        CP_LOG("timeline", "split ignored: no active segment " << segment_id);
        return state;
    }
    // Rejects NaN as well.
    if (!(split_time > it->start_time && split_time < it->end_time)) {
        CP_LOG("timeline", "split ignored: " << seconds_str(split_time) << " not inside "
                                             << segment_id);
        return state;
    }

    EditorState next = state;
    const auto index = static_cast<size_t>(std::distance(state.segments.begin(), it));
    TimelineSegment right;
    right.id = make_segment_id(next.next_segment_serial++);
    right.start_time = split_time;
    right.end_time = it->end_time;
    right.deleted = false;
    next.segments[index].end_time = split_time;
    next.segments.insert(next.segments.begin() + static_cast<std::ptrdiff_t>(index) + 1, right);
    return next;
}

EditorState delete_segment(const EditorState &state, const std::string &segment_id) {
    if (count_active(state) <= 1) {
        CP_LOG("timeline", "delete ignored: last active segment");
        return state;
    }
    auto it = find_segment(state, segment_id);
    if (it == state.segments.end() || it->deleted) {
        return state;
    }
    EditorState next = state;
    next.segments[static_cast<size_t>(std::distance(state.segments.begin(), it))].deleted = true;
    return next;
}

EditorState restore_segment(const EditorState &state, const std::string &segment_id) {
    auto it = find_segment(state, segment_id);
    if (it == state.segments.end() || !it->deleted) {
        return state;
    }
    EditorState next = state;
    next.segments[static_cast<size_t>(std::distance(state.segments.begin(), it))].deleted = false;
    return next;
}

EditorState set_current_time(const EditorState &state, double time) {
    if (std::isnan(time)) {
        return state;
    }
    EditorState next = state;
    next.current_time = std::max(0.0, std::min(time, state.duration));
    return next;
}

EditorState set_playing(const EditorState &state, bool playing) {
    EditorState next = state;
    next.is_playing = playing;
    return next;
}

std::vector<TimelineSegment> active_segments(const EditorState &state) {
    std::vector<TimelineSegment> out;
    out.reserve(state.segments.size());
    std::copy_if(state.segments.begin(), state.segments.end(), std::back_inserter(out),
                 [](const TimelineSegment &s) { return !s.deleted; });
    return out;
}

double total_active_duration(const EditorState &state) {
    double total = 0;
    for (const auto &s : state.segments) {
        if (!s.deleted) {
            total += s.end_time - s.start_time;
        }
    }
    return total;
}

std::optional<TimelineSegment> segment_at_time(const EditorState &state, double time) {
    for (const auto &s : state.segments) {
        if (!s.deleted && time >= s.start_time && time <= s.end_time) {
            return s;
        }
    }
    return std::nullopt;
}

bool is_time_in_active_segment(const EditorState &state, double time) {
    return segment_at_time(state, time).has_value();
}

double next_active_time(const EditorState &state, double time) {
    auto active = active_segments(state);
    if (active.empty()) {
        return 0;
    }
    for (const auto &s : active) {
        if (time < s.start_time) {
            return s.start_time;
        }
        if (time >= s.start_time && time < s.end_time) {
            return time;
        }
    }
    return active.front().start_time;
}

std::string format_time(double seconds) {
    if (!(seconds > 0)) {
        seconds = 0;
    }
    const auto mins = static_cast<long>(std::floor(seconds / 60));
    const auto secs = static_cast<int>(std::fmod(seconds, 60.0));
    const auto tenths = static_cast<int>(std::floor(std::fmod(seconds, 1.0) * 10));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%ld:%02d.%d", mins, secs, tenths);
    return buf;
}

}  // namespace cutplan
