//
//  silence_ledger.hpp
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
#include "silence_segment.hpp"

namespace cutplan {

/// @defgroup silence Silence ledger
/// Detected silences and the user's keep/cut decisions. A ledger is always ordered by
/// start_time (then end_time); ingest_silence() and replace_silence() establish that order once,
/// the navigation helpers rely on it.
/// @{

// Build ledger entries from raw detections: computes duration, clears decisions, drops
// zero/negative spans and sorts.
std::vector<SilenceSegment> ingest_silence(const std::vector<SilenceDetection> &detections);

// Restore ledger order after entries arrived from somewhere other than ingest_silence().
std::vector<SilenceSegment> sort_ledger(std::vector<SilenceSegment> segments);

// Install a new ledger (e.g. a finished background analysis) without touching the timeline.
EditorState replace_silence(const EditorState &state, std::vector<SilenceSegment> segments);

// Accept (deleted=true) or reject (deleted=false) one silence. Either way it becomes reviewed.
std::vector<SilenceSegment> mark_for_deletion(const std::vector<SilenceSegment> &segments,
                                              const std::string &id, bool deleted);

// Bulk variant of mark_for_deletion().
std::vector<SilenceSegment> batch_set_deleted(const std::vector<SilenceSegment> &segments,
                                              bool deleted);

std::vector<SilenceSegment> mark_reviewed(const std::vector<SilenceSegment> &segments,
                                          const std::string &id);

EditorState mark_for_deletion(const EditorState &state, const std::string &id, bool deleted);
EditorState batch_set_deleted(const EditorState &state, bool deleted);

/// @}

// First silence starting strictly after `time`.
std::optional<SilenceSegment> next_after(const std::vector<SilenceSegment> &segments, double time);

// Closest silence starting strictly before `time`.
std::optional<SilenceSegment> previous_before(const std::vector<SilenceSegment> &segments,
                                              double time);

// First silence with start <= time <= end.
std::optional<SilenceSegment> silence_at(const std::vector<SilenceSegment> &segments, double time);

double total_silence_duration(const std::vector<SilenceSegment> &segments);

// Sum of durations the accepted cuts remove.
double time_saved(const std::vector<SilenceSegment> &segments);

size_t reviewed_count(const std::vector<SilenceSegment> &segments);

// Entries marked deleted, in ledger order.
std::vector<SilenceSegment> cuts(const std::vector<SilenceSegment> &segments);

}  // namespace cutplan
