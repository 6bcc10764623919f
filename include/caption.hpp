//
//  caption.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace cutplan {

enum class HorizontalAlign { Left, Center, Right };
enum class VerticalAlign { Top, Middle, Bottom };

/// @ingroup api
/// Screen placement on a 3x3 grid with an optional pixel nudge.
struct CaptionPosition {
    HorizontalAlign horizontal = HorizontalAlign::Center;
    VerticalAlign vertical = VerticalAlign::Bottom;
    int offset_x = 0;
    int offset_y = 0;
};

/// @ingroup api
/// Visual appearance. Colors are "#RRGGBB" or "#RRGGBBAA" (alpha 255 = opaque).
struct CaptionStyle {
    std::string font_family = "Arial";
    int font_size = 24;
    std::string font_color = "#FFFFFF";
    std::string background_color = "#000000AA";
    bool bold = false;
    bool italic = false;
    bool outline = true;
    std::string outline_color = "#000000";  ///< Only used when outline is set
};

/// @ingroup api
/// One timed caption cue.
struct Caption {
    std::string id;
    std::string recording_id;
    std::string transcript_id;
    std::string text;
    double start_time = 0;
    double end_time = 0;
    CaptionPosition position;
    CaptionStyle style;
};

}  // namespace cutplan
