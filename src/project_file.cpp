//
//  project_file.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "project_file.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>

#include "caption_stylist.hpp"
#include "logging.hpp"
#include "silence_ledger.hpp"
#include "timeline_store.hpp"

using json = nlohmann::json;

namespace cutplan {

namespace {

LoadResult make_error(std::string msg) {
    LoadResult res;
    res.status = LoadStatus{false, std::move(msg)};
    return res;
}

HorizontalAlign parse_horizontal(const std::string &s) {
    if (s == "left") return HorizontalAlign::Left;
    if (s == "right") return HorizontalAlign::Right;
    return HorizontalAlign::Center;
}

VerticalAlign parse_vertical(const std::string &s) {
    if (s == "top") return VerticalAlign::Top;
    if (s == "middle") return VerticalAlign::Middle;
    return VerticalAlign::Bottom;
}

CaptionStyle parse_style(const json &j, const CaptionStyle &base) {
    CaptionStyle st = base;
    st.font_family = j.value("font_family", st.font_family);
    st.font_size = j.value("font_size", st.font_size);
    st.font_color = j.value("font_color", st.font_color);
    st.background_color = j.value("background_color", st.background_color);
    st.bold = j.value("bold", st.bold);
    st.italic = j.value("italic", st.italic);
    st.outline = j.value("outline", st.outline);
    st.outline_color = j.value("outline_color", st.outline_color);
    return st;
}

CaptionPosition parse_position(const json &j) {
    CaptionPosition pos;
    pos.horizontal = parse_horizontal(j.value("horizontal", "center"));
    pos.vertical = parse_vertical(j.value("vertical", "bottom"));
    pos.offset_x = j.value("offset_x", 0);
    pos.offset_y = j.value("offset_y", 0);
    return pos;
}

// Applies one edit entry. Returns false only for entries that are not edits at all.
bool apply_edit(const json &e, EditorState &state, std::string &error) {
    if (!e.is_object() || !e.contains("op") || !e["op"].is_string()) {
        error = "edit entry without 'op'";
        return false;
    }
    const std::string op = e["op"].get<std::string>();
    const double time = e.value("time", 0.0);
    const std::string segment = e.value("segment", "");
    if (op == "trim_start") {
        state = trim_start(state, time);
    } else if (op == "trim_end") {
        state = trim_end(state, time);
    } else if (op == "split") {
        state = split_segment(state, segment, time);
    } else if (op == "delete") {
        state = delete_segment(state, segment);
    } else if (op == "restore") {
        state = restore_segment(state, segment);
    } else if (op == "seek") {
        state = set_current_time(state, time);
    } else {
        error = "unknown edit op '" + op + "'";
        return false;
    }
    return true;
}

std::optional<SubtitleFormat> parse_sidecar(const std::string &s) {
    if (s == "srt") return SubtitleFormat::Srt;
    if (s == "vtt") return SubtitleFormat::Vtt;
    if (s == "txt") return SubtitleFormat::Txt;
    return std::nullopt;
}

ExportOptions parse_export(const json &j) {
    ExportOptions opt;
    const std::string format = j.value("format", "mp4");
    if (auto f = parse_export_format(format)) {
        opt.format = *f;
    } else {
        CP_LOG("warn", "unknown export format '" << format << "', using mp4");
    }
    const std::string quality = j.value("quality", "medium");
    if (auto q = parse_export_quality(quality)) {
        opt.quality = *q;
    } else {
        CP_LOG("warn", "unknown export quality '" << quality << "', using medium");
    }
    opt.input_name = j.value("input", opt.input_name);
    if (j.contains("captions") && j["captions"].is_object()) {
        const auto &c = j["captions"];
        opt.captions.enabled = c.value("enabled", false);
        opt.captions.burn_in = c.value("burn_in", false);
        const std::string sidecar = c.value("sidecar", "none");
        opt.captions.sidecar = parse_sidecar(sidecar);
        if (!opt.captions.sidecar && sidecar != "none") {
            CP_LOG("warn", "unknown sidecar format '" << sidecar << "', none written");
        }
    }
    return opt;
}

}  // namespace

LoadResult parse_project(const json &j) {
    if (!j.is_object()) {
        return make_error("project root must be an object");
    }
    const double duration = j.value("duration", 0.0);
    if (!(duration > 0)) {
        return make_error("project duration must be positive");
    }

    LoadResult res;
    Project &p = res.project;
    p.recording_id = j.value("recording_id", "");
    p.state = create_initial_state(duration);

    if (j.contains("edits") && j["edits"].is_array()) {
        for (const auto &e : j["edits"]) {
            std::string error;
            if (!apply_edit(e, p.state, error)) {
                return make_error("invalid edit: " + error);
            }
        }
    }

    if (j.contains("silence") && j["silence"].is_array()) {
        const auto &entries = j["silence"];
        // Entries without an id are named by position so their stored decision finds them again.
        std::vector<std::string> ids;
        ids.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            ids.push_back(entries[i].value("id", "silence-" + std::to_string(i + 1)));
        }

        std::vector<SilenceDetection> detections;
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto &s = entries[i];
            SilenceDetection d;
            d.id = ids[i];
            d.recording_id = s.value("recording_id", p.recording_id);
            d.start_time = s.value("start", 0.0);
            d.end_time = s.value("end", 0.0);
            d.average_decibels = s.value("average_db", 0.0);
            detections.push_back(std::move(d));
        }
        auto ledger = ingest_silence(detections);
        // Decisions stored with the project are restored as-is, not re-reviewed.
        for (size_t i = 0; i < entries.size(); ++i) {
            for (auto &entry : ledger) {
                if (entry.id == ids[i]) {
                    entry.deleted = entries[i].value("deleted", false);
                    entry.reviewed = entries[i].value("reviewed", entry.deleted);
                }
            }
        }
        p.state = replace_silence(p.state, std::move(ledger));
    }

    if (j.contains("captions") && j["captions"].is_array()) {
        const CaptionStyle default_style{};
        for (const auto &c : j["captions"]) {
            Caption cap;
            cap.id = c.value("id", "caption-" + std::to_string(p.captions.size() + 1));
            cap.recording_id = p.recording_id;
            cap.transcript_id = c.value("transcript_id", "");
            cap.text = c.value("text", "");
            cap.start_time = c.value("start", 0.0);
            cap.end_time = c.value("end", 0.0);
            cap.style = c.contains("style") ? parse_style(c["style"], default_style)
                                            : default_style;
            cap.position = c.contains("position") ? parse_position(c["position"])
                                                  : CaptionPosition{};
            auto check = validate_caption_style(cap.style);
            if (!check.ok) {
                return make_error("caption " + cap.id + ": " + check.message);
            }
            p.captions.push_back(std::move(cap));
        }
    }

    if (j.contains("export") && j["export"].is_object()) {
        p.options = parse_export(j["export"]);
    }

    CP_LOG("debug", "project: segments=" << p.state.segments.size() << " silences="
                                         << p.state.silence_segments.size()
                                         << " captions=" << p.captions.size());
    res.status = LoadStatus{true, {}};
    return res;
}

LoadResult load_project(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        CP_LOG("error", msg);
        return make_error(msg);
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        std::string msg = "malformed JSON in " + path;
        CP_LOG("error", msg);
        return make_error(msg);
    }
    try {
        return parse_project(j);
    } catch (const json::exception &e) {
        // Wrong value types (e.g. a string where a number belongs).
        return make_error(std::string("invalid project ") + path + ": " + e.what());
    }
}

json plan_to_json(const EncodingPlan &plan) {
    json j;
    j["kind"] = plan.kind == PlanKind::SinglePass ? "single_pass" : "two_phase";
    j["format"] = format_name(plan.format);
    j["quality"] = quality_name(plan.quality);
    j["output"] = plan.output_name;

    json ranges = json::array();
    for (const auto &r : plan.ranges) {
        ranges.push_back({{"start", r.start_time}, {"end", r.end_time}});
    }
    j["ranges"] = ranges;

    json steps = json::array();
    for (const auto &s : plan.steps) {
        json step;
        step["kind"] = s.kind == StepKind::Extract ? "extract" : "encode";
        step["output"] = s.output;
        step["args"] = s.args;
        steps.push_back(step);
    }
    j["steps"] = steps;

    if (plan.kind == PlanKind::TwoPhase) {
        j["concat_list"] = {{"name", plan.concat_list_name}, {"contents", plan.concat_list}};
    }
    if (plan.subtitle_filter) {
        j["subtitle_filter"] = *plan.subtitle_filter;
    }
    return j;
}

json state_summary_json(const EditorState &state) {
    json j;
    j["duration"] = state.duration;
    j["active_duration"] = total_active_duration(state);
    json segs = json::array();
    for (const auto &s : state.segments) {
        segs.push_back({{"id", s.id},
                        {"start", s.start_time},
                        {"end", s.end_time},
                        {"deleted", s.deleted}});
    }
    j["segments"] = segs;
    j["silence"] = {{"count", state.silence_segments.size()},
                    {"reviewed", reviewed_count(state.silence_segments)},
                    {"total", total_silence_duration(state.silence_segments)},
                    {"time_saved", time_saved(state.silence_segments)}};
    return j;
}

}  // namespace cutplan
