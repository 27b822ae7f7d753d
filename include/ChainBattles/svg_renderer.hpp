#pragma once

#include <string>
#include <string_view>

#include "collection_config.hpp"
#include "decimal.hpp"
#include "stats.hpp"

namespace ChainBattles {

namespace svg_details {

constexpr std::string_view header =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" preserveAspectRatio=\"xMinYMin meet\" viewBox=\"0 0 350 350\">"
    "<style>.base { fill: white; font-family: serif; font-size: 14px; }</style>"
    "<rect width=\"100%\" height=\"100%\" fill=\"black\" />";

constexpr std::string_view title_open  = "<text x=\"50%\" y=\"40%\" class=\"base\" dominant-baseline=\"middle\" text-anchor=\"middle\">";
constexpr std::string_view line_open   = "<text x=\"50%\" y=\"50%\" class=\"base\" dominant-baseline=\"middle\" text-anchor=\"middle\">";
constexpr std::string_view text_close  = "</text>";
constexpr std::string_view footer      = "</svg>";

} // namespace svg_details

/// Appends text with the five XML special characters replaced by entities.
constexpr void AppendXmlEscaped(std::string_view text, std::string & out) {
    for (char c : text) {
        switch (c) {
        case '&':  out += "&amp;";  break;
        case '<':  out += "&lt;";   break;
        case '>':  out += "&gt;";   break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:   out += c;        break;
        }
    }
}

/// Fixed 350x350 card with a title line and a second line below it. Both
/// lines are escaped, so any text is safe to pass.
constexpr std::string RenderCard(std::string_view title, std::string_view line) {
    using namespace svg_details;
    std::string out;
    out.reserve(header.size() + title_open.size() + line_open.size()
                + 2 * text_close.size() + footer.size() + title.size() + line.size());
    out += header;
    out += title_open;
    AppendXmlEscaped(title, out);
    out += text_close;
    out += line_open;
    AppendXmlEscaped(line, out);
    out += text_close;
    out += footer;
    return out;
}

/// Character card for a stat record. Only the level is shown.
template<StatRecord S>
constexpr std::string RenderCharacterSvg(const S & stats, const CharacterCardConfig & card = {}) {
    std::string line(card.level_label);
    line += ToDecimalString(static_cast<std::uint64_t>(stats.level));
    return RenderCard(card.title, line);
}

} // namespace ChainBattles
