//
//  export_resolver.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "export_resolver.hpp"

#include <algorithm>

#include "logging.hpp"
#include "silence_ledger.hpp"
#include "timeline_store.hpp"

namespace cutplan {

namespace {

// Half-open overlap: touching intervals do not overlap.
bool overlaps(const SilenceSegment &cut, const TimelineSegment &segment) {
    return cut.end_time > segment.start_time && cut.start_time < segment.end_time;
}

// Pieces of `segment` not covered by any cut, clipped to the segment bounds.
std::vector<ExportRange> subtract_cuts(const TimelineSegment &segment,
                                       const std::vector<SilenceSegment> &sorted_cuts) {
    std::vector<ExportRange> pieces;
    double cursor = segment.start_time;
    for (const auto &cut : sorted_cuts) {
        if (!overlaps(cut, segment)) {
            continue;
        }
        if (cut.start_time > cursor) {
            pieces.push_back(ExportRange{cursor, std::min(cut.start_time, segment.end_time)});
        }
        cursor = std::max(cursor, cut.end_time);
        if (cursor >= segment.end_time) {
            break;
        }
    }
    if (cursor < segment.end_time) {
        pieces.push_back(ExportRange{cursor, segment.end_time});
    }
    return pieces;
}

ResolveResult make_result(std::vector<ExportRange> ranges) {
    ResolveResult res;
    res.outcome = ranges.empty() ? ResolveOutcome::NothingToExport : ResolveOutcome::Ranges;
    res.ranges = std::move(ranges);
    return res;
}

}  // namespace

ResolveResult resolve_export_ranges(const std::vector<TimelineSegment> &active,
                                    const std::vector<SilenceSegment> &cuts) {
    std::vector<ExportRange> ranges;
    ranges.reserve(active.size());

    if (cuts.empty()) {
        for (const auto &seg : active) {
            // Splits can leave slivers shorter than a frame; those are never exported.
            if (seg.end_time - seg.start_time < kMinExportRangeSec) {
                continue;
            }
            ranges.push_back(ExportRange{seg.start_time, seg.end_time});
        }
        CP_LOG("resolver", "no cuts; " << ranges.size() << " of " << active.size()
                                       << " segment(s) taken verbatim");
        return make_result(std::move(ranges));
    }

    // Callers hand cuts over in ledger order at best; sort here regardless.
    std::vector<SilenceSegment> sorted = cuts;
    std::sort(sorted.begin(), sorted.end(), [](const SilenceSegment &a, const SilenceSegment &b) {
        if (a.start_time != b.start_time) {
            return a.start_time < b.start_time;
        }
        return a.end_time < b.end_time;
    });

    size_t dropped = 0;
    for (const auto &seg : active) {
        for (const auto &piece : subtract_cuts(seg, sorted)) {
            if (piece.length() < kMinExportRangeSec) {
                ++dropped;
                continue;
            }
            ranges.push_back(piece);
        }
    }
    CP_LOG("resolver", active.size() << " segment(s) - " << sorted.size() << " cut(s) -> "
                                     << ranges.size() << " range(s), " << dropped
                                     << " short piece(s) dropped");
    return make_result(std::move(ranges));
}

ResolveResult resolve_export_ranges(const EditorState &state) {
    return resolve_export_ranges(active_segments(state), cuts(state.silence_segments));
}

double total_export_duration(const std::vector<ExportRange> &ranges) {
    double total = 0;
    for (const auto &r : ranges) {
        total += r.length();
    }
    return total;
}

#ifdef CUTPLAN_TESTING
namespace testing {
std::vector<ExportRange> subtract_cuts_for_test(const TimelineSegment &segment,
                                                const std::vector<SilenceSegment> &sorted_cuts) {
    return subtract_cuts(segment, sorted_cuts);
}
}  // namespace testing
#endif

}  // namespace cutplan
