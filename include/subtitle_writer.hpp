//
//  subtitle_writer.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "caption.hpp"

namespace cutplan {

enum class SubtitleFormat { Srt, Vtt, Txt };

// "HH:MM:SS,mmm" (milliseconds truncated).
std::string format_srt_time(double seconds);

// "HH:MM:SS.mmm".
std::string format_vtt_time(double seconds);

// Numbered, blank-line separated cues. Used for burn-in and for .srt sidecars.
std::string to_srt(const std::vector<Caption> &captions);

// "WEBVTT" header followed by unnumbered cues.
std::string to_vtt(const std::vector<Caption> &captions);

// One "[MM:SS] text" line per caption.
std::string to_txt(const std::vector<Caption> &captions);

std::string render_subtitles(const std::vector<Caption> &captions, SubtitleFormat format);

const char *subtitle_extension(SubtitleFormat format);

}  // namespace cutplan
