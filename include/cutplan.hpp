//
//  cutplan.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "caption.hpp"
#include "editor_state.hpp"
#include "encoding_planner.hpp"
#include "export_range.hpp"
#include "export_resolver.hpp"
#include "export_session.hpp"
#include "project_file.hpp"
#include "silence_ledger.hpp"
#include "timeline_store.hpp"

namespace cutplan {

/// @defgroup api CutPlan Public API
/// Timeline editing, silence cut review and export planning.
/// @{

/**
 * @brief Result of planning a project file.
 *
 * When `ok == true`, `plan` is ready to hand to an Encoder. `nothing_to_export` distinguishes
 * the empty-timeline outcome from load failures; in both cases `message` says what happened.
 */
struct PlanStatus {
    bool ok{false};
    bool nothing_to_export{false};
    std::string message;
    Project project;
    EncodingPlan plan;
};

/**
 * @brief Return the CutPlan library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Load a project JSON file, resolve its export ranges and build the encoding plan.
PlanStatus plan_project_file(const std::string &project_json_path);  ///< @ingroup api

/// @overload for an already loaded project.
PlanStatus plan_project(const Project &project);  ///< @ingroup api

/// @}

}  // namespace cutplan
