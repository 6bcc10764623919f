//
//  encoding_planner.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "encoding_planner.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <stdexcept>

#include "logging.hpp"

namespace cutplan {

namespace {

const QualityParams kLowQuality{"veryfast", 28};
const QualityParams kMediumQuality{"fast", 23};
const QualityParams kHighQuality{"medium", 18};

const FormatProfile kMp4Profile{"mp4", "libx264", "aac",
                                {"-b:a", "128k", "-movflags", "+faststart"}, true};
const FormatProfile kWebmProfile{"webm", "libvpx-vp9", "libopus", {"-b:v", "0"}, false};

const char *const kConcatListName = "concat.txt";

std::string time_arg(double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", seconds);
    return buf;
}

// Codec, quality and container arguments shared by both plan kinds, plus the optional filter
// and the output.
void append_encode_args(std::vector<std::string> &args, const ExportOptions &options,
                        const std::optional<std::string> &subtitle_filter,
                        const std::string &output) {
    const auto &profile = format_profile(options.format);
    const auto &quality = quality_params(options.quality);
    auto add = [&](const std::string &flag, const std::string &value) {
        args.push_back(flag);
        args.push_back(value);
    };
    add("-c:v", profile.video_codec);
    if (profile.uses_preset) {
        add("-preset", quality.preset);
    }
    add("-crf", std::to_string(quality.crf));
    add("-c:a", profile.audio_codec);
    args.insert(args.end(), profile.extra_args.begin(), profile.extra_args.end());
    if (subtitle_filter && !subtitle_filter->empty()) {
        add("-vf", *subtitle_filter);
    }
    add("-y", output);
}

std::string intermediate_extension(const std::string &input_name) {
    auto ext = std::filesystem::path(input_name).extension().string();
    return ext.empty() ? ".webm" : ext;
}

}  // namespace

size_t EncodingPlan::encode_step_count() const {
    size_t n = 0;
    for (const auto &s : steps) {
        if (s.kind == StepKind::Encode) {
            ++n;
        }
    }
    return n;
}

const EncodeStep &EncodingPlan::encode_step() const {
    for (const auto &s : steps) {
        if (s.kind == StepKind::Encode) {
            return s;
        }
    }
    throw std::logic_error("encoding plan has no encode step");
}

const QualityParams &quality_params(ExportQuality quality) {
    switch (quality) {
        case ExportQuality::Low:
            return kLowQuality;
        case ExportQuality::Medium:
            return kMediumQuality;
        case ExportQuality::High:
            return kHighQuality;
    }
    return kMediumQuality;
}

const FormatProfile &format_profile(ExportFormat format) {
    switch (format) {
        case ExportFormat::Mp4:
            return kMp4Profile;
        case ExportFormat::WebM:
            return kWebmProfile;
    }
    return kMp4Profile;
}

PlanResult plan_export(const std::vector<ExportRange> &ranges, const ExportOptions &options,
                       const std::optional<std::string> &subtitle_filter) {
    PlanResult res;
    if (ranges.empty()) {
        res.message = "No segments to export";
        return res;
    }

    EncodingPlan &plan = res.plan;
    plan.format = options.format;
    plan.quality = options.quality;
    plan.ranges = ranges;
    plan.subtitle_filter = subtitle_filter;
    plan.output_name = std::string("output.") + format_profile(options.format).extension;

    if (ranges.size() == 1) {
        plan.kind = PlanKind::SinglePass;
        EncodeStep step;
        step.kind = StepKind::Encode;
        step.range = ranges.front();
        step.output = plan.output_name;
        step.args = {"-i", options.input_name, "-ss", time_arg(ranges.front().start_time), "-to",
                     time_arg(ranges.front().end_time)};
        append_encode_args(step.args, options, subtitle_filter, step.output);
        plan.steps.push_back(std::move(step));
    } else {
        plan.kind = PlanKind::TwoPhase;
        const auto ext = intermediate_extension(options.input_name);
        for (size_t i = 0; i < ranges.size(); ++i) {
            EncodeStep step;
            step.kind = StepKind::Extract;
            step.range = ranges[i];
            step.output = "segment_" + std::to_string(i) + ext;
            step.args = {"-i",  options.input_name, "-ss", time_arg(ranges[i].start_time),
                         "-to", time_arg(ranges[i].end_time), "-c", "copy",
                         "-y",  step.output};
            plan.concat_list += (i == 0 ? "" : "\n") + std::string("file '") + step.output + "'";
            plan.steps.push_back(std::move(step));
        }
        plan.concat_list_name = kConcatListName;

        EncodeStep encode;
        encode.kind = StepKind::Encode;
        encode.output = plan.output_name;
        encode.args = {"-f", "concat", "-safe", "0", "-i", plan.concat_list_name};
        append_encode_args(encode.args, options, subtitle_filter, encode.output);
        plan.steps.push_back(std::move(encode));
    }

    CP_LOG("plan", (plan.kind == PlanKind::SinglePass ? "single-pass" : "two-phase")
                       << " plan: ranges=" << ranges.size() << " format="
                       << format_name(options.format) << " quality="
                       << quality_name(options.quality)
                       << " subtitles=" << (subtitle_filter ? "yes" : "no"));
    res.ok = true;
    return res;
}

std::string export_filename(const std::string &extension,
                            std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%S", &tm);
    return std::string("cutplan-") + stamp + "." + extension;
}

std::string export_filename(ExportFormat format, std::chrono::system_clock::time_point when) {
    return export_filename(format_profile(format).extension, when);
}

const char *format_name(ExportFormat format) { return format_profile(format).extension; }

const char *quality_name(ExportQuality quality) {
    switch (quality) {
        case ExportQuality::Low:
            return "low";
        case ExportQuality::Medium:
            return "medium";
        case ExportQuality::High:
            return "high";
    }
    return "medium";
}

std::optional<ExportFormat> parse_export_format(const std::string &s) {
    if (s == "mp4") return ExportFormat::Mp4;
    if (s == "webm") return ExportFormat::WebM;
    return std::nullopt;
}

std::optional<ExportQuality> parse_export_quality(const std::string &s) {
    if (s == "low") return ExportQuality::Low;
    if (s == "medium") return ExportQuality::Medium;
    if (s == "high") return ExportQuality::High;
    return std::nullopt;
}

}  // namespace cutplan
