//
//  subtitle_writer.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subtitle_writer.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace cutplan {

namespace {

std::string format_clock(double seconds, char ms_separator) {
    if (!(seconds > 0)) {
        seconds = 0;
    }
    const auto whole = static_cast<int64_t>(std::floor(seconds));
    const auto hours = whole / 3600;
    const auto minutes = (whole % 3600) / 60;
    const auto secs = whole % 60;
    auto millis = static_cast<int>(std::floor(std::fmod(seconds, 1.0) * 1000));
    if (millis > 999) {
        millis = 999;
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld%c%03d", static_cast<long long>(hours),
                  static_cast<long long>(minutes), static_cast<long long>(secs), ms_separator,
                  millis);
    return buf;
}

}  // namespace

std::string format_srt_time(double seconds) { return format_clock(seconds, ','); }

std::string format_vtt_time(double seconds) { return format_clock(seconds, '.'); }

std::string to_srt(const std::vector<Caption> &captions) {
    std::ostringstream out;
    for (size_t i = 0; i < captions.size(); ++i) {
        const auto &c = captions[i];
        if (i != 0) {
            out << "\n";
        }
        out << (i + 1) << "\n"
            << format_srt_time(c.start_time) << " --> " << format_srt_time(c.end_time) << "\n"
            << c.text << "\n";
    }
    return out.str();
}

std::string to_vtt(const std::vector<Caption> &captions) {
    std::ostringstream out;
    out << "WEBVTT\n\n";
    for (size_t i = 0; i < captions.size(); ++i) {
        const auto &c = captions[i];
        if (i != 0) {
            out << "\n";
        }
        out << format_vtt_time(c.start_time) << " --> " << format_vtt_time(c.end_time) << "\n"
            << c.text << "\n";
    }
    return out.str();
}

std::string to_txt(const std::vector<Caption> &captions) {
    std::ostringstream out;
    for (size_t i = 0; i < captions.size(); ++i) {
        const double t = captions[i].start_time > 0 ? captions[i].start_time : 0;
        const auto whole = static_cast<long long>(std::floor(t));
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "[%02lld:%02lld] ", whole / 60, whole % 60);
        if (i != 0) {
            out << "\n";
        }
        out << stamp << captions[i].text;
    }
    return out.str();
}

std::string render_subtitles(const std::vector<Caption> &captions, SubtitleFormat format) {
    switch (format) {
        case SubtitleFormat::Srt:
            return to_srt(captions);
        case SubtitleFormat::Vtt:
            return to_vtt(captions);
        case SubtitleFormat::Txt:
            return to_txt(captions);
    }
    return {};
}

const char *subtitle_extension(SubtitleFormat format) {
    switch (format) {
        case SubtitleFormat::Srt:
            return "srt";
        case SubtitleFormat::Vtt:
            return "vtt";
        case SubtitleFormat::Txt:
            return "txt";
    }
    return "txt";
}

}  // namespace cutplan
