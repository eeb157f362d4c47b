#include "prefstore/format.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace prefstore {

namespace {
std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}
}  // namespace

Format::Format()
    : Format("json")
{
}

Format::Format(std::string tag, Indent indent, unsigned indentWidth)
    : tag_(to_lower(std::move(tag))), indent_(indent), indentWidth_(indent == Indent::Spaces ? indentWidth : 0)
{
    if (tag_.empty()) {
        throw std::invalid_argument("Format tag must not be empty");
    }
    if (indent_ == Indent::Tabs) {
        indentWidth_ = 1;
    }
}

Format Format::json()
{
    return Format("json");
}

Format Format::json_pretty(unsigned spaces)
{
    return Format("json", Indent::Spaces, spaces);
}

Format Format::json_tabs()
{
    return Format("json", Indent::Tabs);
}

Format Format::yaml()
{
    return Format("yaml");
}

Format Format::toml()
{
    return Format("toml");
}

Format Format::ini()
{
    return Format("ini");
}

Format Format::xml()
{
    return Format("xml");
}

Format Format::pickle()
{
    return Format("pickle");
}

std::string Format::default_name() const
{
    return "config." + tag_;
}

bool Format::operator==(const Format &other) const
{
    return tag_ == other.tag_ && indent_ == other.indent_ && indentWidth_ == other.indentWidth_;
}

Format format_from_string(const std::string &tag, const std::string &indent)
{
    const auto lowered = to_lower(indent);
    if (lowered.empty() || lowered == "none") {
        return Format(tag);
    }
    if (lowered == "tab" || lowered == "tabs") {
        return Format(tag, Format::Indent::Tabs);
    }
    if (!std::all_of(lowered.begin(), lowered.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::runtime_error("Invalid indent value: " + indent);
    }
    unsigned long spaces = 0;
    try {
        spaces = std::stoul(lowered);
    } catch (const std::exception &) {
        throw std::runtime_error("Invalid indent value: " + indent);
    }
    if (spaces > 16) {
        throw std::runtime_error("Indent must not exceed 16 spaces: " + indent);
    }
    return Format(tag, Format::Indent::Spaces, static_cast<unsigned>(spaces));
}

std::string format_to_string(const Format &format)
{
    switch (format.indent()) {
    case Format::Indent::None:
        return format.tag();
    case Format::Indent::Tabs:
        return format.tag() + " (tabs)";
    case Format::Indent::Spaces:
        return format.tag() + " (" + std::to_string(format.indent_width()) + " spaces)";
    }
    return format.tag();
}

}  // namespace prefstore
