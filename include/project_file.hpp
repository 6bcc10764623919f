//
//  project_file.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "caption.hpp"
#include "editor_state.hpp"
#include "encoding_planner.hpp"
#include "export_session.hpp"

namespace cutplan {

/// Everything needed to plan one export: the edited state, captions and export choices.
struct Project {
    std::string recording_id;
    EditorState state;
    std::vector<Caption> captions;
    ExportOptions options;
};

struct LoadStatus {
    bool ok{false};
    std::string message;
};

struct LoadResult {
    LoadStatus status;
    Project project;
};

/**
 * @brief Build a project from its JSON description.
 *
 * `edits` are replayed in order through the timeline operations (requests the timeline cannot
 * honour are skipped, like any other edit). Silence entries are ingested and their stored
 * decisions re-applied. Fails on a missing/non-positive duration, a malformed edit entry or a
 * caption style that does not validate. Values of the wrong JSON type throw
 * nlohmann::json::exception; load_project() reports those as a failed load.
 */
LoadResult parse_project(const nlohmann::json &j);

/// Read and parse a project file.
LoadResult load_project(const std::string &path);

/// Serialise a plan (steps, concat list, ranges) for the CLI and for scripting.
nlohmann::json plan_to_json(const EncodingPlan &plan);

/// Serialise the timeline and silence ledger summary of a state.
nlohmann::json state_summary_json(const EditorState &state);

}  // namespace cutplan
