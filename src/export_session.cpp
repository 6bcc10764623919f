//
//  export_session.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "export_session.hpp"

#include <chrono>
#include <exception>
#include <optional>

#include "caption_stylist.hpp"
#include "export_resolver.hpp"
#include "logging.hpp"
#include "subtitle_writer.hpp"

namespace cutplan {

namespace {

// Milestones on the 0..100 progress scale.
constexpr double kPreparingProgress = 10;
constexpr double kProcessingProgress = 20;
constexpr double kExtractSpan = 40;
constexpr double kSingleEncodeProgress = 50;
constexpr double kMergeProgress = 70;
constexpr double kFinalizeProgress = 90;
constexpr double kCompleteProgress = 100;

class ProgressReporter {
public:
    explicit ProgressReporter(const ProgressCallback &cb) : cb_(cb) {}

    void report(ExportStage stage, double progress, std::string message) {
        if (progress < last_) {
            progress = last_;
        }
        last_ = progress;
        if (cb_) {
            cb_(ExportProgress{stage, progress, std::move(message)});
        }
    }

    void fail(const std::string &message) { report(ExportStage::Error, last_, message); }

private:
    const ProgressCallback &cb_;
    double last_ = 0;
};

ExportStatus make_failure(std::string msg) {
    ExportStatus st;
    st.ok = false;
    st.message = std::move(msg);
    return st;
}

bool burn_in_requested(const ExportOptions &options, const std::vector<Caption> &captions) {
    return options.captions.enabled && options.captions.burn_in && !captions.empty();
}

}  // namespace

PreparedExport prepare_export(const EditorState &state, const std::vector<Caption> &captions,
                              const ExportOptions &options) {
    PreparedExport prepared;
    auto resolved = resolve_export_ranges(state);
    if (!resolved.has_ranges()) {
        prepared.nothing_to_export = true;
        prepared.planned.message = "No segments to export";
        return prepared;
    }

    std::optional<std::string> filter;
    if (burn_in_requested(options, captions)) {
        filter = subtitle_filter(kBurnInSubtitleName, captions);
    }
    prepared.planned = plan_export(resolved.ranges, options, filter);
    return prepared;
}

ExportStatus run_export(const EditorState &state, const std::vector<Caption> &captions,
                        const ExportOptions &options, Encoder &encoder,
                        const ProgressCallback &on_progress) {
    const auto t0 = std::chrono::steady_clock::now();
    ProgressReporter progress(on_progress);

    auto prepared = prepare_export(state, captions, options);
    if (prepared.nothing_to_export) {
        auto st = make_failure(prepared.planned.message);
        st.nothing_to_export = true;
        progress.fail(st.message);
        CP_LOG("info", "export skipped: nothing left after edits and silence cuts");
        return st;
    }
    if (!prepared.planned.ok) {
        progress.fail(prepared.planned.message);
        return make_failure(prepared.planned.message);
    }
    const EncodingPlan &plan = prepared.planned.plan;
    const bool burn_in = plan.subtitle_filter.has_value();

    try {
        progress.report(ExportStage::Preparing, kPreparingProgress, "Preparing video...");
        if (burn_in) {
            encoder.write_text_file(kBurnInSubtitleName, to_srt(captions));
        }

        progress.report(ExportStage::Processing, kProcessingProgress, "Processing segments...");

        if (plan.kind == PlanKind::SinglePass) {
            progress.report(ExportStage::Encoding, kSingleEncodeProgress, "Encoding video...");
            encoder.run_step(plan.encode_step());
        } else {
            const size_t count = plan.ranges.size();
            size_t index = 0;
            for (const auto &step : plan.steps) {
                if (step.kind != StepKind::Extract) {
                    continue;
                }
                progress.report(ExportStage::Processing,
                                kProcessingProgress +
                                    (static_cast<double>(index) / static_cast<double>(count)) *
                                        kExtractSpan,
                                "Processing segment " + std::to_string(index + 1) + " of " +
                                    std::to_string(count) + "...");
                encoder.run_step(step);
                ++index;
            }
            encoder.write_text_file(plan.concat_list_name, plan.concat_list);
            progress.report(ExportStage::Encoding, kMergeProgress, "Merging segments...");
            encoder.run_step(plan.encode_step());
        }

        progress.report(ExportStage::Encoding, kFinalizeProgress, "Finalizing video...");
    } catch (const std::exception &e) {
        std::string msg = std::string("Export failed: ") + e.what();
        CP_LOG("error", msg);
        progress.fail(msg);
        return make_failure(msg);
    }

    progress.report(ExportStage::Complete, kCompleteProgress, "Export complete!");
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    CP_LOG("debug", "run_export: " << plan.steps.size() << " step(s), exported "
                                   << seconds_str(total_export_duration(plan.ranges)) << " in "
                                   << ms << "ms");

    ExportStatus st;
    st.ok = true;
    st.plan = plan;
    return st;
}

const char *stage_name(ExportStage stage) {
    switch (stage) {
        case ExportStage::Preparing:
            return "preparing";
        case ExportStage::Processing:
            return "processing";
        case ExportStage::Encoding:
            return "encoding";
        case ExportStage::Complete:
            return "complete";
        case ExportStage::Error:
            return "error";
    }
    return "error";
}

}  // namespace cutplan
