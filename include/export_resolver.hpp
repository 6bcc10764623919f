//
//  export_resolver.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <vector>

#include "editor_state.hpp"
#include "export_range.hpp"
#include "silence_segment.hpp"
#include "timeline_segment.hpp"

namespace cutplan {

enum class ResolveOutcome {
    Ranges,           ///< At least one range survived; hand them to the planner.
    NothingToExport,  ///< Every active second was cut; the encoder must not be invoked.
};

/**
 * @brief Export ranges derived from the timeline and the accepted silence cuts.
 *
 * When `outcome == ResolveOutcome::Ranges`, `ranges` is non-empty, strictly increasing and
 * non-overlapping, and every range is at least kMinExportRangeSec long.
 */
struct ResolveResult {
    ResolveOutcome outcome = ResolveOutcome::NothingToExport;
    std::vector<ExportRange> ranges;

    bool has_ranges() const { return outcome == ResolveOutcome::Ranges; }
};

/**
 * @brief Merge timeline edits with silence cuts.
 *
 * @param active Active timeline segments, chronological and non-overlapping.
 * @param cuts Silence segments to excise. Any order; overlaps with segment bounds are clipped.
 *        The deleted flag is not consulted here, callers pass only what should be cut.
 */
ResolveResult resolve_export_ranges(const std::vector<TimelineSegment> &active,
                                    const std::vector<SilenceSegment> &cuts);

/// Convenience: active segments and deleted silences taken from `state`.
ResolveResult resolve_export_ranges(const EditorState &state);

double total_export_duration(const std::vector<ExportRange> &ranges);

#ifdef CUTPLAN_TESTING
namespace testing {
// Exposes the per-segment subtraction (cuts must already be sorted) before short ranges are dropped.
std::vector<ExportRange> subtract_cuts_for_test(const TimelineSegment &segment,
                                                const std::vector<SilenceSegment> &sorted_cuts);
}  // namespace testing
#endif

}  // namespace cutplan
