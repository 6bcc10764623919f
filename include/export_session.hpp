//
//  export_session.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "caption.hpp"
#include "editor_state.hpp"
#include "encoding_planner.hpp"

namespace cutplan {

enum class ExportStage { Preparing, Processing, Encoding, Complete, Error };

/// Progress report for one export. `progress` runs 0..100 and never decreases.
struct ExportProgress {
    ExportStage stage = ExportStage::Preparing;
    double progress = 0;
    std::string message;
};

using ProgressCallback = std::function<void(const ExportProgress &)>;

/**
 * @brief Executes encoder steps on behalf of an export.
 *
 * Implementations report failures (unsupported codec, missing intermediate, I/O) by throwing a
 * std::exception; run_export() turns those into an error result.
 */
class Encoder {
public:
    virtual ~Encoder() = default;

    // Place a text artifact (subtitle track, concat list) where later steps can read it.
    virtual void write_text_file(const std::string &name, const std::string &contents) = 0;

    // Run one encoder invocation to completion.
    virtual void run_step(const EncodeStep &step) = 0;
};

/// Outcome of run_export(); on success `plan` is what was executed.
struct ExportStatus {
    bool ok{false};
    bool nothing_to_export{false};  ///< Every active second was cut; the encoder was never called
    std::string message;
    EncodingPlan plan;
};

/// Name of the burned-in subtitle track handed to the encoder.
inline constexpr const char *kBurnInSubtitleName = "captions.srt";

/// Plan that run_export() would execute for a state, before anything runs.
struct PreparedExport {
    bool nothing_to_export{false};  ///< No ranges survived; `planned.ok` is false
    PlanResult planned;
};

/**
 * @brief Resolve export ranges and build the encoding plan, adding the burn-in subtitle filter
 * when options.captions asks for it and there are captions to burn.
 */
PreparedExport prepare_export(const EditorState &state, const std::vector<Caption> &captions,
                              const ExportOptions &options);

/**
 * @brief Resolve, plan and drive one export.
 *
 * Recomputes everything from `state`; nothing is carried over between calls. Progress is
 * reported through `on_progress` (may be empty) across preparing, processing, encoding and
 * complete, or ends in an error event.
 *
 * @param captions Captions to burn in when options.captions enables burn-in. The first caption's
 *        style and position apply to the whole track.
 */
ExportStatus run_export(const EditorState &state, const std::vector<Caption> &captions,
                        const ExportOptions &options, Encoder &encoder,
                        const ProgressCallback &on_progress = {});

const char *stage_name(ExportStage stage);

}  // namespace cutplan
