//
//  caption_stylist.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "caption.hpp"

namespace cutplan {

/// Outline width the renderer gets whenever the style asks for an outline.
inline constexpr int kCaptionOutlineWidth = 2;

/// Source convention: alpha 255 is opaque.
struct RgbaColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 0xFF;
};

/// Result of validating a style before it is stored.
struct StyleCheck {
    bool ok{false};
    std::string message;
};

// "#RRGGBB" or "#RRGGBBAA" (leading '#' optional, hex case-insensitive). RRGGBB implies opaque.
std::optional<RgbaColor> parse_hex_color(const std::string &hex);

// Renderer color literal "&HAABBGGRR". The renderer counts alpha the other way round
// (00 opaque, FF transparent), so AA is 255 - alpha.
std::string to_ass_color(const RgbaColor &color);

// 3x3 grid to numpad-style alignment: bottom row 1..3, middle 4..6, top 7..9.
int alignment_code(const CaptionPosition &position);

/**
 * @brief Check that a style can be rendered.
 *
 * Rejects unparsable colors, a non-positive font size, and font names that are empty or contain
 * characters that would terminate the renderer's override list (`,` `'` `:` `\`).
 */
StyleCheck validate_caption_style(const CaptionStyle &style);

/**
 * @brief Renderer override list for one style/position pair.
 *
 * Example: `FontName=Arial,FontSize=24,PrimaryColour=&H00FFFFFF,BackColour=&H55000000,`
 * `OutlineColour=&H00000000,Outline=2,Alignment=2`. Colors that fail to parse are omitted;
 * run validate_caption_style() when the style is set to catch them early.
 */
std::string build_force_style(const CaptionStyle &style, const CaptionPosition &position);

/**
 * @brief Video filter that burns `subtitle_file` into the picture.
 *
 * The whole track is rendered with the style and position of the first caption.
 * Returns nullopt when there are no captions.
 */
std::optional<std::string> subtitle_filter(const std::string &subtitle_file,
                                           const std::vector<Caption> &captions);

}  // namespace cutplan
