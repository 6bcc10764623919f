//
//  silence_ledger.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "silence_ledger.hpp"

#include <algorithm>
#include <iterator>

#include "logging.hpp"

namespace cutplan {

namespace {

bool ledger_order(const SilenceSegment &a, const SilenceSegment &b) {
    if (a.start_time != b.start_time) {
        return a.start_time < b.start_time;
    }
    return a.end_time < b.end_time;
}

}  // namespace

std::vector<SilenceSegment> ingest_silence(const std::vector<SilenceDetection> &detections) {
    std::vector<SilenceSegment> out;
    out.reserve(detections.size());
    for (const auto &d : detections) {
        if (!(d.end_time > d.start_time)) {
            CP_LOG("warn", "dropping silence " << d.id << " with empty span ["
                                               << seconds_str(d.start_time) << ", "
                                               << seconds_str(d.end_time) << "]");
            continue;
        }
        SilenceSegment s;
        s.id = d.id;
        s.recording_id = d.recording_id;
        s.start_time = d.start_time;
        s.end_time = d.end_time;
        s.duration = d.end_time - d.start_time;
        s.average_decibels = d.average_decibels;
        out.push_back(std::move(s));
    }
    return sort_ledger(std::move(out));
}

std::vector<SilenceSegment> sort_ledger(std::vector<SilenceSegment> segments) {
    std::stable_sort(segments.begin(), segments.end(), ledger_order);
    return segments;
}

EditorState replace_silence(const EditorState &state, std::vector<SilenceSegment> segments) {
    EditorState next = state;
    next.silence_segments = sort_ledger(std::move(segments));
    CP_LOG("silence", "ledger replaced: " << next.silence_segments.size() << " entries");
    return next;
}

std::vector<SilenceSegment> mark_for_deletion(const std::vector<SilenceSegment> &segments,
                                              const std::string &id, bool deleted) {
    std::vector<SilenceSegment> out = segments;
    for (auto &s : out) {
        if (s.id == id) {
            s.deleted = deleted;
            s.reviewed = true;
        }
    }
    return out;
}

std::vector<SilenceSegment> batch_set_deleted(const std::vector<SilenceSegment> &segments,
                                              bool deleted) {
    std::vector<SilenceSegment> out = segments;
    for (auto &s : out) {
        s.deleted = deleted;
        s.reviewed = true;
    }
    return out;
}

std::vector<SilenceSegment> mark_reviewed(const std::vector<SilenceSegment> &segments,
                                          const std::string &id) {
    std::vector<SilenceSegment> out = segments;
    for (auto &s : out) {
        if (s.id == id) {
            s.reviewed = true;
        }
    }
    return out;
}

EditorState mark_for_deletion(const EditorState &state, const std::string &id, bool deleted) {
    EditorState next = state;
    next.silence_segments = mark_for_deletion(state.silence_segments, id, deleted);
    return next;
}

EditorState batch_set_deleted(const EditorState &state, bool deleted) {
    EditorState next = state;
    next.silence_segments = batch_set_deleted(state.silence_segments, deleted);
    return next;
}

std::optional<SilenceSegment> next_after(const std::vector<SilenceSegment> &segments,
                                         double time) {
    auto it = std::find_if(segments.begin(), segments.end(),
                           [&](const SilenceSegment &s) { return s.start_time > time; });
    if (it == segments.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<SilenceSegment> previous_before(const std::vector<SilenceSegment> &segments,
                                              double time) {
    auto it = std::find_if(segments.rbegin(), segments.rend(),
                           [&](const SilenceSegment &s) { return s.start_time < time; });
    if (it == segments.rend()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<SilenceSegment> silence_at(const std::vector<SilenceSegment> &segments,
                                         double time) {
    auto it = std::find_if(segments.begin(), segments.end(), [&](const SilenceSegment &s) {
        return time >= s.start_time && time <= s.end_time;
    });
    if (it == segments.end()) {
        return std::nullopt;
    }
    return *it;
}

double total_silence_duration(const std::vector<SilenceSegment> &segments) {
    double total = 0;
    for (const auto &s : segments) {
        total += s.duration;
    }
    return total;
}

double time_saved(const std::vector<SilenceSegment> &segments) {
    double total = 0;
    for (const auto &s : segments) {
        if (s.deleted) {
            total += s.duration;
        }
    }
    return total;
}

size_t reviewed_count(const std::vector<SilenceSegment> &segments) {
    return static_cast<size_t>(std::count_if(segments.begin(), segments.end(),
                                             [](const SilenceSegment &s) { return s.reviewed; }));
}

std::vector<SilenceSegment> cuts(const std::vector<SilenceSegment> &segments) {
    std::vector<SilenceSegment> out;
    std::copy_if(segments.begin(), segments.end(), std::back_inserter(out),
                 [](const SilenceSegment &s) { return s.deleted; });
    return out;
}

}  // namespace cutplan
