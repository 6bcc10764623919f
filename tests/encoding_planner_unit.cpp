// Unit coverage for export planning: strategy selection, static quality/format tables,
// encoder argument layout and output naming.
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "encoding_planner.hpp"
#include "logging.hpp"

using namespace cutplan;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[planner_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Value following `flag` in `args`, or "" when absent.
std::string arg_after(const std::vector<std::string> &args, const std::string &flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return {};
    }
    return *(it + 1);
}

size_t count_of(const std::vector<std::string> &args, const std::string &token) {
    return static_cast<size_t>(std::count(args.begin(), args.end(), token));
}

bool test_tables() {
    bool ok = true;
    ok &= check(std::string(quality_params(ExportQuality::Low).preset) == "veryfast" &&
                    quality_params(ExportQuality::Low).crf == 28,
                "low tier");
    ok &= check(std::string(quality_params(ExportQuality::Medium).preset) == "fast" &&
                    quality_params(ExportQuality::Medium).crf == 23,
                "medium tier");
    ok &= check(std::string(quality_params(ExportQuality::High).preset) == "medium" &&
                    quality_params(ExportQuality::High).crf == 18,
                "high tier");

    const auto &mp4 = format_profile(ExportFormat::Mp4);
    ok &= check(std::string(mp4.video_codec) == "libx264" && std::string(mp4.audio_codec) == "aac",
                "mp4 codec pair");
    ok &= check(arg_after(mp4.extra_args, "-movflags") == "+faststart",
                "mp4 places metadata up front for progressive playback");
    const auto &webm = format_profile(ExportFormat::WebM);
    ok &= check(std::string(webm.video_codec) == "libvpx-vp9" &&
                    std::string(webm.audio_codec) == "libopus",
                "webm codec pair");
    ok &= check(arg_after(webm.extra_args, "-b:v") == "0", "webm constant quality mode");

    ok &= check(parse_export_format("webm") == ExportFormat::WebM &&
                    parse_export_format("mp4") == ExportFormat::Mp4 && !parse_export_format("avi"),
                "parse_export_format");
    ok &= check(parse_export_quality("high") == ExportQuality::High && !parse_export_quality("max"),
                "parse_export_quality");
    return ok;
}

bool test_empty_ranges() {
    auto res = plan_export({}, ExportOptions{});
    bool ok = check(!res.ok, "empty ranges cannot be planned");
    ok &= check(res.message == "No segments to export", "empty ranges message");
    ok &= check(res.plan.steps.empty(), "no steps for empty ranges");
    return ok;
}

bool test_single_pass() {
    ExportOptions opt;
    opt.format = ExportFormat::Mp4;
    opt.quality = ExportQuality::High;
    auto res = plan_export({{1.5, 12.25}}, opt);
    bool ok = check(res.ok, "single range planned");
    const auto &plan = res.plan;
    ok &= check(plan.kind == PlanKind::SinglePass, "one range -> single pass");
    ok &= check(plan.steps.size() == 1 && plan.encode_step_count() == 1, "exactly one step");
    ok &= check(plan.concat_list.empty(), "no concat list for single pass");
    const auto &args = plan.steps[0].args;
    const std::vector<std::string> want{"-i",       "input.webm", "-ss",  "1.500",     "-to",
                                        "12.250",   "-c:v",       "libx264", "-preset", "medium",
                                        "-crf",     "18",         "-c:a", "aac",       "-b:a",
                                        "128k",     "-movflags",  "+faststart", "-y",  "output.mp4"};
    ok &= check(args == want, "single-pass argument layout");
    ok &= check(plan.output_name == "output.mp4" && plan.steps[0].output == "output.mp4",
                "output named after container");
    ok &= check(plan.steps[0].range && plan.steps[0].range->start_time == 1.5,
                "step carries its range");
    return ok;
}

bool test_two_phase() {
    ExportOptions opt;
    opt.format = ExportFormat::WebM;
    opt.quality = ExportQuality::Low;
    std::vector<ExportRange> ranges{{0, 5}, {8, 15}, {18.5, 30}};
    const std::string filter = "subtitles=captions.srt:force_style='Alignment=2'";
    auto res = plan_export(ranges, opt, filter);
    bool ok = check(res.ok, "multi-range planned");
    const auto &plan = res.plan;
    ok &= check(plan.kind == PlanKind::TwoPhase, ">1 range -> two phase");
    ok &= check(plan.steps.size() == 4, "three extracts plus one encode");
    ok &= check(plan.encode_step_count() == 1, "exactly one re-encode");
    ok &= check(plan.steps.back().kind == StepKind::Encode, "encode runs last");

    for (size_t i = 0; i < 3; ++i) {
        const auto &s = plan.steps[i];
        ok &= check(s.kind == StepKind::Extract, "extract step " + std::to_string(i));
        ok &= check(arg_after(s.args, "-c") == "copy", "extract is a stream copy");
        ok &= check(count_of(s.args, "-vf") == 0 && count_of(s.args, "-crf") == 0,
                    "extract neither filters nor re-encodes");
        ok &= check(s.output == "segment_" + std::to_string(i) + ".webm",
                    "intermediate name " + std::to_string(i));
    }
    ok &= check(arg_after(plan.steps[2].args, "-ss") == "18.500" &&
                    arg_after(plan.steps[2].args, "-to") == "30.000",
                "extract seeks to its range");

    ok &= check(plan.concat_list_name == "concat.txt", "concat list name");
    ok &= check(plan.concat_list ==
                    "file 'segment_0.webm'\nfile 'segment_1.webm'\nfile 'segment_2.webm'",
                "concat list preserves range order");

    const auto &enc = plan.encode_step().args;
    ok &= check(arg_after(enc, "-f") == "concat" && arg_after(enc, "-safe") == "0" &&
                    arg_after(enc, "-i") == "concat.txt",
                "final encode reads the concat list");
    ok &= check(arg_after(enc, "-c:v") == "libvpx-vp9" && arg_after(enc, "-crf") == "28",
                "final encode uses codec and quality");
    ok &= check(count_of(enc, "-preset") == 0, "vp9 takes no speed preset");
    ok &= check(arg_after(enc, "-vf") == filter && count_of(enc, "-vf") == 1,
                "subtitle filter applied once, in the final encode");
    ok &= check(enc.back() == "output.webm", "output last");

    // Many ranges still mean exactly one re-encode.
    std::vector<ExportRange> many;
    for (int i = 0; i < 40; ++i) {
        many.push_back({i * 2.0, i * 2.0 + 1.0});
    }
    auto big = plan_export(many, opt);
    ok &= check(big.plan.encode_step_count() == 1 && big.plan.steps.size() == 41,
                "40 ranges -> 40 extracts + 1 encode");
    return ok;
}

bool test_input_naming() {
    ExportOptions opt;
    opt.input_name = "recording.mkv";
    auto res = plan_export({{0, 1}, {2, 3}}, opt);
    bool ok = check(res.plan.steps[0].output == "segment_0.mkv",
                    "intermediates keep the source container");
    ok &= check(arg_after(res.plan.steps[0].args, "-i") == "recording.mkv", "input name used");
    return ok;
}

bool test_filenames() {
    // 2025-01-02T03:04:05Z
    const auto when = std::chrono::system_clock::from_time_t(1735787045);
    bool ok = check(export_filename(ExportFormat::Mp4, when) == "cutplan-2025-01-02T03-04-05.mp4",
                    "mp4 filename");
    ok &= check(export_filename(ExportFormat::WebM, when) == "cutplan-2025-01-02T03-04-05.webm",
                "webm filename");
    ok &= check(export_filename("vtt", when) == "cutplan-2025-01-02T03-04-05.vtt",
                "sidecar filename shares the stamp");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Warn);
    bool ok = true;
    ok &= test_tables();
    ok &= test_empty_ranges();
    ok &= test_single_pass();
    ok &= test_two_phase();
    ok &= test_input_naming();
    ok &= test_filenames();
    if (ok) {
        std::cout << "encoding_planner_unit OK\n";
    }
    return ok ? 0 : 1;
}
