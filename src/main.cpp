//
//  main.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "cutplan.hpp"
#include "cutplan_version.hpp"
#include "logging.hpp"
#include "script_encoder.hpp"
#include "subtitle_writer.hpp"
#include <nlohmann/json.hpp>

cutplan::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return cutplan::LogVerbosity::Debug;
    if (s == "info") return cutplan::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return cutplan::LogVerbosity::Warn;
    return cutplan::LogVerbosity::Error;
}

bool write_text(const std::filesystem::path &p, const std::string &text) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;
    out << text;
    return out.good();
}

// Stage the export in `dir`: burn-in subtitles, concat list, export.sh and the optional sidecar.
bool stage_export(const cutplan::Project &project, const std::filesystem::path &dir,
                  const std::string &sidecar_name) {
    cutplan::ScriptEncoder encoder(dir);
    auto status = cutplan::run_export(
        project.state, project.captions, project.options, encoder,
        [](const cutplan::ExportProgress &p) {
            CP_LOG("info", "[" << cutplan::stage_name(p.stage) << " " << static_cast<int>(p.progress)
                               << "%] " << p.message);
        });
    if (!status.ok) {
        CP_LOG("error", "cutplan: export failed: " << status.message);
        return false;
    }
    try {
        auto script = encoder.write_script();
        std::cout << "Wrote: " << script.string() << "\n";
    } catch (const std::exception &e) {
        CP_LOG("error", "cutplan: " << e.what());
        return false;
    }
    if (!sidecar_name.empty()) {
        const auto format = *project.options.captions.sidecar;
        if (!write_text(dir / sidecar_name, cutplan::render_subtitles(project.captions, format))) {
            CP_LOG("error", "cutplan: failed to write " << (dir / sidecar_name).string());
            return false;
        }
        std::cout << "Wrote: " << (dir / sidecar_name).string() << "\n";
    }
    return true;
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CutPlan " << CUTPLAN_VERSION_DISPLAY << "\n";
        return 0;
    }

    std::vector<std::string> positional;
    std::filesystem::path artifact_dir;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            cutplan::set_log_verbosity(parse_level(argv[i + 1]));
            ++i;
        } else if (arg == "--write-artifacts" && i + 1 < argc) {
            artifact_dir = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1) {
        std::cerr << "CutPlan " << CUTPLAN_VERSION_DISPLAY << "\n"
                  << "Copyright (c) 2025 Till Toenshoff\n\n"
                  << "usage:\n"
                  << "  cutplan <project.json> [--write-artifacts DIR] "
                  << "[--log-level warn|info|debug]\n"
                  << "Options:\n"
                  << "  --write-artifacts DIR  Stage the export in DIR (export.sh, concat list,\n"
                  << "                         subtitle files). The plan JSON is always written\n"
                  << "                         to stdout.\n"
                  << "  --log-level LEVEL      Set logging verbosity (default: info).\n";
        return 2;
    }

    auto status = cutplan::plan_project_file(positional[0]);
    if (!status.ok && !status.nothing_to_export) {
        CP_LOG("error", "cutplan: " << status.message);
        return 1;
    }

    const auto now = std::chrono::system_clock::now();
    nlohmann::json j;
    j["timeline"] = cutplan::state_summary_json(status.project.state);
    if (status.nothing_to_export) {
        j["result"] = "nothing_to_export";
        std::cout << j.dump(2) << "\n";
        CP_LOG("warn", "cutplan: every active second is cut; nothing to export");
        return 3;
    }
    j["result"] = "plan";
    j["plan"] = cutplan::plan_to_json(status.plan);
    j["filename"] = cutplan::export_filename(status.project.options.format, now);

    std::string sidecar_name;
    const auto &copts = status.project.options.captions;
    if (copts.enabled && copts.sidecar && !status.project.captions.empty()) {
        sidecar_name = cutplan::export_filename(cutplan::subtitle_extension(*copts.sidecar), now);
        j["sidecar"] = sidecar_name;
    }
    std::cout << j.dump(2) << "\n";

    if (!artifact_dir.empty() && !stage_export(status.project, artifact_dir, sidecar_name)) {
        return 1;
    }
    return 0;
}
