#pragma once

#include <optional>
#include <string>
#include <vector>

#include "layercast/style/paint.h"

namespace layercast::style {

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);

// Splits on `delimiter` at parenthesis depth zero. Pieces are trimmed and
// empty pieces are dropped.
std::vector<std::string> split_top_level(const std::string& input, char delimiter = ',');

// Whitespace-separated tokens, keeping function arguments such as
// "rgba(0, 0, 0, 0.5)" in one token.
std::vector<std::string> split_tokens(const std::string& input);

// rgb()/rgba() (comma or space syntax), hsl()/hsla(), hex and named colors.
// Channels are normalized to 0..1. Returns std::nullopt for `transparent`,
// fully transparent black and anything unrecognized.
std::optional<Rgba> parse_color(const std::string& value);

// First linear-gradient()/radial-gradient() of a background-image value.
// repeating-linear-gradient() is read as linear; conic gradients and other
// functions yield std::nullopt, as do gradients with fewer than two stops.
std::optional<Paint> parse_gradient(const std::string& background_image);

// Comma-separated box-shadow clauses. Clauses with fewer than two lengths
// are skipped.
std::vector<Effect> parse_box_shadow(const std::string& box_shadow);

// CSS font-weight keyword or number; unknown values read as 400.
int parse_font_weight(const std::string& weight);
// Thin, ExtraLight, Light, Regular, Medium, SemiBold, Bold, ExtraBold or
// Black, with " Italic" appended for italic faces.
std::string font_style_name(int weight, bool italic);
std::string font_style_from_css(const std::string& weight, const std::string& font_style);

// First family of a font-family list with quotes stripped.
std::string primary_font_family(const std::string& font_family);

TextAlign map_text_align(const std::string& text_align);
// `underline` wins over `line-through` when both are present.
TextDecoration map_text_decoration(const std::string& decoration_line);
// `normal` (or anything without a number) is AUTO.
LineHeight parse_line_height(const std::string& line_height);

// Leading numeric value of a computed length: "12.5px" -> 12.5.
std::optional<float> parse_px(const std::string& value);

// Target of the first url(...) in a property value, quotes stripped.
std::optional<std::string> extract_url(const std::string& value);

// Strips the surrounding quotes of a CSS string and decodes its escapes
// ("\"", "\\", "\201C").
std::string unquote_css_string(const std::string& value);

}  // namespace layercast::style
