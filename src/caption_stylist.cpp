//
//  caption_stylist.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption_stylist.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "logging.hpp"

namespace cutplan {

namespace {

std::optional<uint8_t> parse_hex_byte(char hi, char lo) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };
    const int h = nibble(hi);
    const int l = nibble(lo);
    if (h < 0 || l < 0) {
        return std::nullopt;
    }
    return static_cast<uint8_t>((h << 4) | l);
}

}  // namespace

std::optional<RgbaColor> parse_hex_color(const std::string &hex) {
    std::string clean = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (clean.size() != 6 && clean.size() != 8) {
        return std::nullopt;
    }
    uint8_t bytes[4] = {0, 0, 0, 0xFF};
    for (size_t i = 0; i < clean.size() / 2; ++i) {
        auto b = parse_hex_byte(clean[i * 2], clean[i * 2 + 1]);
        if (!b) {
            return std::nullopt;
        }
        bytes[i] = *b;
    }
    RgbaColor c;
    c.r = bytes[0];
    c.g = bytes[1];
    c.b = bytes[2];
    c.a = bytes[3];
    return c;
}

std::string to_ass_color(const RgbaColor &color) {
    std::ostringstream oss;
    oss << "&H" << std::uppercase << std::hex << std::setfill('0');
    oss << std::setw(2) << static_cast<unsigned int>(255 - color.a);
    oss << std::setw(2) << static_cast<unsigned int>(color.b);
    oss << std::setw(2) << static_cast<unsigned int>(color.g);
    oss << std::setw(2) << static_cast<unsigned int>(color.r);
    return oss.str();
}

int alignment_code(const CaptionPosition &position) {
    int column = 2;
    switch (position.horizontal) {
        case HorizontalAlign::Left:
            column = 1;
            break;
        case HorizontalAlign::Center:
            column = 2;
            break;
        case HorizontalAlign::Right:
            column = 3;
            break;
    }
    int row_base = 0;
    switch (position.vertical) {
        case VerticalAlign::Bottom:
            row_base = 0;
            break;
        case VerticalAlign::Middle:
            row_base = 3;
            break;
        case VerticalAlign::Top:
            row_base = 6;
            break;
    }
    return row_base + column;
}

StyleCheck validate_caption_style(const CaptionStyle &style) {
    if (style.font_family.empty()) {
        return {false, "font family is empty"};
    }
    if (style.font_family.find_first_of(",':\\") != std::string::npos) {
        return {false, "font family '" + style.font_family + "' contains a reserved character"};
    }
    if (style.font_size <= 0) {
        return {false, "font size must be positive, got " + std::to_string(style.font_size)};
    }
    if (!parse_hex_color(style.font_color)) {
        return {false, "invalid font color '" + style.font_color + "'"};
    }
    if (!parse_hex_color(style.background_color)) {
        return {false, "invalid background color '" + style.background_color + "'"};
    }
    if (style.outline && !parse_hex_color(style.outline_color)) {
        return {false, "invalid outline color '" + style.outline_color + "'"};
    }
    return {true, {}};
}

std::string build_force_style(const CaptionStyle &style, const CaptionPosition &position) {
    std::vector<std::string> parts;
    parts.push_back("FontName=" + style.font_family);
    parts.push_back("FontSize=" + std::to_string(style.font_size));

    if (auto c = parse_hex_color(style.font_color)) {
        parts.push_back("PrimaryColour=" + to_ass_color(*c));
    } else {
        CP_LOG("warn", "caption font color '" << style.font_color << "' ignored");
    }
    if (auto c = parse_hex_color(style.background_color)) {
        parts.push_back("BackColour=" + to_ass_color(*c));
    } else {
        CP_LOG("warn", "caption background color '" << style.background_color << "' ignored");
    }

    if (style.bold) parts.push_back("Bold=1");
    if (style.italic) parts.push_back("Italic=1");

    if (style.outline && !style.outline_color.empty()) {
        if (auto c = parse_hex_color(style.outline_color)) {
            parts.push_back("OutlineColour=" + to_ass_color(*c));
            parts.push_back("Outline=" + std::to_string(kCaptionOutlineWidth));
        } else {
            CP_LOG("warn", "caption outline color '" << style.outline_color << "' ignored");
        }
    }

    parts.push_back("Alignment=" + std::to_string(alignment_code(position)));

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) {
            out += ',';
        }
        out += parts[i];
    }
    return out;
}

std::optional<std::string> subtitle_filter(const std::string &subtitle_file,
                                           const std::vector<Caption> &captions) {
    if (captions.empty()) {
        return std::nullopt;
    }
    // TODO: per-caption styles collapse to the first caption's; needs ASS cue styles to lift.
    const auto &ref = captions.front();
    return "subtitles=" + subtitle_file + ":force_style='" +
           build_force_style(ref.style, ref.position) + "'";
}

}  // namespace cutplan
