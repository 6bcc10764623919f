//
//  cutplan.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "cutplan.hpp"
#include "cutplan_version.hpp"

#include <utility>

#include "logging.hpp"

namespace cutplan {

std::string version_string() { return CUTPLAN_VERSION_DISPLAY; }

namespace {
PlanStatus make_status(bool ok, std::string msg = {}) {
    PlanStatus st;
    st.ok = ok;
    st.message = std::move(msg);
    return st;
}
}  // namespace

PlanStatus plan_project(const Project &project) {
    auto prepared = prepare_export(project.state, project.captions, project.options);
    if (!prepared.planned.ok) {
        auto st = make_status(false, prepared.planned.message);
        st.nothing_to_export = prepared.nothing_to_export;
        st.project = project;
        return st;
    }
    auto st = make_status(true);
    st.project = project;
    st.plan = std::move(prepared.planned.plan);
    return st;
}

PlanStatus plan_project_file(const std::string &project_json_path) {
    CP_LOG("debug", "plan_project_file(" << project_json_path << ")");
    auto loaded = load_project(project_json_path);
    if (!loaded.status.ok) {
        std::string msg = "Failed to load project: " + loaded.status.message;
        CP_LOG("error", msg);
        return make_status(false, msg);
    }
    return plan_project(loaded.project);
}

}  // namespace cutplan
