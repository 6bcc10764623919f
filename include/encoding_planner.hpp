//
//  encoding_planner.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "export_range.hpp"
#include "subtitle_writer.hpp"

namespace cutplan {

/// @defgroup planner Encoding planner
/// Turns export ranges plus the user's format/quality choice into encoder invocations.
/// @{

enum class ExportFormat { WebM, Mp4 };
enum class ExportQuality { Low, Medium, High };

/// Speed preset / constant-quality factor pair for one quality tier.
struct QualityParams {
    const char *preset;
    int crf;
};

/// Codec pair and container-specific flags for one output container.
struct FormatProfile {
    const char *extension;
    const char *video_codec;
    const char *audio_codec;
    std::vector<std::string> extra_args;  ///< Appended after the codec/quality arguments
    bool uses_preset;                     ///< Whether the video codec takes -preset
};

struct CaptionExportOptions {
    bool enabled = false;
    bool burn_in = false;                    ///< Render captions into the picture
    std::optional<SubtitleFormat> sidecar;   ///< Also ship a separate subtitle file
};

struct ExportOptions {
    ExportFormat format = ExportFormat::Mp4;
    ExportQuality quality = ExportQuality::Medium;
    CaptionExportOptions captions;
    std::string input_name = "input.webm";   ///< Source media as the encoder knows it
};

enum class PlanKind {
    SinglePass,  ///< One range: trim and encode in a single invocation.
    TwoPhase,    ///< Several ranges: stream-copy each, concat, encode once.
};

enum class StepKind {
    Extract,  ///< Lossless stream copy of one range into an intermediate file
    Encode,   ///< The one re-encode producing the output
};

struct EncodeStep {
    StepKind kind = StepKind::Encode;
    std::vector<std::string> args;      ///< Encoder arguments, without the program name
    std::string output;                 ///< File the step produces
    std::optional<ExportRange> range;   ///< Source range for trims/extracts
};

/**
 * @brief Complete, one-shot encoder contract for an export.
 *
 * `steps` are in execution order: for PlanKind::TwoPhase the extract steps come first, followed
 * by exactly one encode step; `concat_list` must be written to `concat_list_name` before that
 * step runs. For PlanKind::SinglePass `steps` holds the single encode step.
 */
struct EncodingPlan {
    PlanKind kind = PlanKind::SinglePass;
    ExportFormat format = ExportFormat::Mp4;
    ExportQuality quality = ExportQuality::Medium;
    std::vector<ExportRange> ranges;
    std::vector<EncodeStep> steps;
    std::string concat_list_name;
    std::string concat_list;
    std::optional<std::string> subtitle_filter;
    std::string output_name;

    size_t encode_step_count() const;
    const EncodeStep &encode_step() const;
};

struct PlanResult {
    bool ok{false};
    std::string message;
    EncodingPlan plan;
};

const QualityParams &quality_params(ExportQuality quality);

const FormatProfile &format_profile(ExportFormat format);

/**
 * @brief Build the plan for `ranges`.
 *
 * @param ranges Resolver output; must be non-empty.
 * @param options Container, quality and input naming.
 * @param subtitle_filter Optional video filter applied once, during the final encode.
 * @return ok=false with "No segments to export" when `ranges` is empty.
 */
PlanResult plan_export(const std::vector<ExportRange> &ranges, const ExportOptions &options,
                       const std::optional<std::string> &subtitle_filter = std::nullopt);

/// @}

// Deterministic download name: "cutplan-YYYY-MM-DDTHH-MM-SS.<extension>" (UTC, seconds).
std::string export_filename(const std::string &extension,
                            std::chrono::system_clock::time_point when);
std::string export_filename(ExportFormat format, std::chrono::system_clock::time_point when);

const char *format_name(ExportFormat format);
const char *quality_name(ExportQuality quality);
std::optional<ExportFormat> parse_export_format(const std::string &s);
std::optional<ExportQuality> parse_export_quality(const std::string &s);

}  // namespace cutplan
