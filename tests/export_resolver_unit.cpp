// Validates export range resolution: timeline edits merged with silence cuts, clipping,
// short-range dropping and the nothing-to-export outcome.
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "export_resolver.hpp"
#include "logging.hpp"
#include "silence_ledger.hpp"
#include "test_utils.hpp"
#include "timeline_store.hpp"

using namespace cutplan;
using test_utils::approx;
using test_utils::describe;
using test_utils::ranges_well_formed;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[resolver_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

SilenceSegment cut(double start, double end, const std::string &id = "") {
    SilenceSegment s;
    s.id = id.empty() ? "cut-" + std::to_string(start) : id;
    s.start_time = start;
    s.end_time = end;
    s.duration = end - start;
    s.deleted = true;
    s.reviewed = true;
    return s;
}

TimelineSegment seg(double start, double end, const std::string &id = "seg") {
    TimelineSegment s;
    s.id = id;
    s.start_time = start;
    s.end_time = end;
    return s;
}

bool ranges_equal(const std::vector<ExportRange> &got, const std::vector<ExportRange> &want,
                  const std::string &label) {
    bool same = got.size() == want.size();
    for (size_t i = 0; same && i < got.size(); ++i) {
        same = approx(got[i].start_time, want[i].start_time) &&
               approx(got[i].end_time, want[i].end_time);
    }
    if (!same) {
        std::cerr << "[resolver_unit] " << label << ": got " << describe(got) << " want "
                  << describe(want) << "\n";
    }
    return check(same, label);
}

bool test_scenario_a_untouched() {
    auto state = create_initial_state(30);
    auto res = resolve_export_ranges(state);
    bool ok = check(res.has_ranges(), "untouched timeline has ranges");
    ok &= ranges_equal(res.ranges, {{0, 30}}, "scenario A: whole recording");
    return ok;
}

bool test_scenario_b_split_and_delete() {
    auto state = split_segment(create_initial_state(30), "seg-1", 10);
    state = delete_segment(state, "seg-2");
    auto res = resolve_export_ranges(state);
    return ranges_equal(res.ranges, {{0, 10}}, "scenario B: second half deleted");
}

bool test_scenario_c_silence_cuts() {
    auto state = create_initial_state(30);
    SilenceDetection a{"s1", "rec", 5, 8, -50};
    SilenceDetection b{"s2", "rec", 15, 18.5, -55};
    SilenceDetection keep{"s3", "rec", 22, 24, -41};
    state = replace_silence(state, ingest_silence({b, keep, a}));
    state = mark_for_deletion(state, "s1", true);
    state = mark_for_deletion(state, "s2", true);
    state = mark_for_deletion(state, "s3", false);
    auto res = resolve_export_ranges(state);
    bool ok = ranges_equal(res.ranges, {{0, 5}, {8, 15}, {18.5, 30}},
                           "scenario C: two accepted cuts");
    ok &= check(approx(total_export_duration(res.ranges), 30 - 3 - 3.5), "exported duration");
    return ok;
}

bool test_scenario_d_short_piece_dropped() {
    // The cut ends 0.05s before the segment does; the sliver must not reach the encoder.
    std::vector<TimelineSegment> active{seg(0, 10)};
    auto res = resolve_export_ranges(active, {cut(4, 9.95)});
    bool ok = ranges_equal(res.ranges, {{0, 4}}, "scenario D: trailing sliver dropped");

    auto lead = resolve_export_ranges(active, {cut(0.05, 6)});
    ok &= ranges_equal(lead.ranges, {{6, 10}}, "leading sliver dropped");

    auto exact = resolve_export_ranges(active, {cut(0.5, 9.5)});
    ok &= ranges_equal(exact.ranges, {{0, 0.5}, {9.5, 10}}, "pieces of 0.5s survive");
    return ok;
}

bool test_scenario_e_everything_cut() {
    auto state = split_segment(create_initial_state(30), "seg-1", 12);
    state = replace_silence(state, ingest_silence({{"all", "rec", 0, 30, -60}}));
    state = batch_set_deleted(state, true);
    auto res = resolve_export_ranges(state);
    bool ok = check(!res.has_ranges(), "scenario E: fully cut timeline reports nothing to export");
    ok &= check(res.outcome == ResolveOutcome::NothingToExport && res.ranges.empty(),
                "nothing-to-export carries no ranges");

    // Cuts covering active parts while only deleted parts remain uncut.
    auto partial = delete_segment(split_segment(create_initial_state(20), "seg-1", 10), "seg-2");
    auto res2 = resolve_export_ranges(active_segments(partial), {cut(0, 10)});
    ok &= check(!res2.has_ranges(), "cut over the only active segment");
    return ok;
}

bool test_no_cuts_fast_path() {
    std::vector<TimelineSegment> active{seg(0, 3), seg(3, 9.04), seg(12, 20)};
    auto res = resolve_export_ranges(active, {});
    bool ok = ranges_equal(res.ranges, {{0, 3}, {3, 9.04}, {12, 20}},
                           "no cuts: active segments verbatim");

    // Rejected silences are not cuts.
    auto state = create_initial_state(30);
    state = replace_silence(state, ingest_silence({{"s", "rec", 5, 8, -50}}));
    state = mark_for_deletion(state, "s", false);
    ok &= ranges_equal(resolve_export_ranges(state).ranges, {{0, 30}},
                       "rejected silence leaves timeline intact");
    return ok;
}

bool test_sliver_dropped_without_cuts() {
    // A split 0.05 s in leaves a sliver that must not reach the planner, cuts or no cuts.
    auto state = split_segment(create_initial_state(30), "seg-1", 0.05);
    bool ok = check(state.segments.size() == 2, "split created the sliver");
    ok &= ranges_equal(resolve_export_ranges(state).ranges, {{0.05, 30}},
                       "no cuts: sliver dropped");

    state = replace_silence(state, ingest_silence({{"s", "rec", 20, 21, -50}}));
    state = mark_for_deletion(state, "s", true);
    ok &= ranges_equal(resolve_export_ranges(state).ranges, {{0.05, 20}, {21, 30}},
                       "with a cut: sliver dropped the same way");

    // A timeline made only of slivers has nothing to export.
    auto res = resolve_export_ranges({seg(0, 0.05), seg(4, 4.09)}, {});
    ok &= check(!res.has_ranges() && res.ranges.empty(), "only slivers -> nothing to export");
    return ok;
}

bool test_cut_order_independent() {
    std::vector<TimelineSegment> active{seg(0, 10, "a"), seg(10, 25, "b"), seg(30, 60, "c")};
    std::vector<SilenceSegment> sorted{cut(1, 2), cut(8, 12), cut(14, 14.5), cut(14.5, 16),
                                       cut(24.9, 31), cut(40, 41), cut(40, 45), cut(59, 70)};
    auto expected = resolve_export_ranges(active, sorted);
    bool ok = check(ranges_well_formed(expected.ranges), "sorted cuts give well formed ranges");

    auto reversed = sorted;
    std::reverse(reversed.begin(), reversed.end());
    ok &= ranges_equal(resolve_export_ranges(active, reversed).ranges, expected.ranges,
                       "reversed cuts give identical output");

    auto shuffled = sorted;
    uint32_t seed = 7;
    for (int round = 0; round < 20; ++round) {
        for (size_t i = shuffled.size() - 1; i > 0; --i) {
            seed = seed * 1664525u + 1013904223u;
            std::swap(shuffled[i], shuffled[seed % (i + 1)]);
        }
        ok &= ranges_equal(resolve_export_ranges(active, shuffled).ranges, expected.ranges,
                           "shuffled cuts round " + std::to_string(round));
    }

    ok &= ranges_equal(expected.ranges,
                       {{0, 1}, {2, 8}, {12, 14}, {16, 24.9}, {31, 40}, {45, 59}},
                       "overlapping, touching and boundary-crossing cuts");
    return ok;
}

bool test_clipping_to_segment_bounds() {
    // Cuts extending past segment bounds never extend the exported ranges.
    std::vector<TimelineSegment> active{seg(10, 20)};
    auto res = resolve_export_ranges(active, {cut(0, 12), cut(18, 40)});
    bool ok = ranges_equal(res.ranges, {{12, 18}}, "cuts clipped to segment");

    // Touching a segment edge is not an overlap.
    auto touching = resolve_export_ranges(active, {cut(5, 10), cut(20, 25)});
    ok &= ranges_equal(touching.ranges, {{10, 20}}, "touching cuts leave segment whole");

    // A cut spanning two segments removes from both.
    std::vector<TimelineSegment> two{seg(0, 10, "x"), seg(10, 20, "y")};
    ok &= ranges_equal(resolve_export_ranges(two, {cut(8, 13)}).ranges, {{0, 8}, {13, 20}},
                       "cut spanning segment boundary");
    return ok;
}

bool test_subtract_helper() {
    auto pieces = testing::subtract_cuts_for_test(seg(0, 10), {cut(2, 3), cut(9.98, 12)});
    // The second cut runs past the segment end, so nothing follows it.
    bool ok = ranges_equal(pieces, {{0, 2}, {3, 9.98}}, "subtract keeps uncovered pieces");
    auto sliver = testing::subtract_cuts_for_test(seg(0, 10), {cut(0.04, 10)});
    ok &= ranges_equal(sliver, {{0, 0.04}}, "subtract keeps slivers for the length filter");
    return ok;
}

bool test_property_sweep() {
    // Random timelines and cut sets: output stays well formed and inside active segments.
    uint32_t seed = 99;
    auto rnd = [&](uint32_t mod) {
        seed = seed * 1103515245u + 12345u;
        return static_cast<double>((seed >> 8) % mod);
    };
    bool ok = true;
    for (int round = 0; round < 200 && ok; ++round) {
        auto state = create_initial_state(100);
        for (int i = 0; i < 8; ++i) {
            const auto &segs = state.segments;
            state = split_segment(state, segs[static_cast<size_t>(rnd(100)) % segs.size()].id,
                                  rnd(10000) / 100.0);
        }
        for (int i = 0; i < 4; ++i) {
            const auto &segs = state.segments;
            state = delete_segment(state, segs[static_cast<size_t>(rnd(100)) % segs.size()].id);
        }
        std::vector<SilenceSegment> cuts_in;
        for (int i = 0; i < 6; ++i) {
            const double start = rnd(10000) / 100.0;
            cuts_in.push_back(cut(start, start + 0.01 + rnd(800) / 100.0));
        }
        auto active = active_segments(state);
        auto res = resolve_export_ranges(active, cuts_in);
        ok &= check(ranges_well_formed(res.ranges), "random round " + std::to_string(round));
        ok &= check(ranges_well_formed(resolve_export_ranges(active, {}).ranges),
                    "random round without cuts " + std::to_string(round));
        for (const auto &r : res.ranges) {
            bool inside = std::any_of(active.begin(), active.end(), [&](const TimelineSegment &s) {
                return r.start_time >= s.start_time && r.end_time <= s.end_time;
            });
            bool uncut = std::none_of(cuts_in.begin(), cuts_in.end(), [&](const SilenceSegment &c) {
                return c.end_time > r.start_time && c.start_time < r.end_time;
            });
            ok &= check(inside && uncut, "range inside an active segment and free of cuts");
        }
    }
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Warn);
    bool ok = true;
    ok &= test_scenario_a_untouched();
    ok &= test_scenario_b_split_and_delete();
    ok &= test_scenario_c_silence_cuts();
    ok &= test_scenario_d_short_piece_dropped();
    ok &= test_scenario_e_everything_cut();
    ok &= test_no_cuts_fast_path();
    ok &= test_sliver_dropped_without_cuts();
    ok &= test_cut_order_independent();
    ok &= test_clipping_to_segment_bounds();
    ok &= test_subtract_helper();
    ok &= test_property_sweep();
    if (ok) {
        std::cout << "export_resolver_unit OK\n";
    }
    return ok ? 0 : 1;
}
