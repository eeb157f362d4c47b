#pragma once

#include <string>

namespace prefstore {

// Serialization format of a settings file: a lowercase tag naming the codec plus
// layout options the codec may honour. Options never affect default_name().
class Format {
public:
    enum class Indent {
        None,
        Tabs,
        Spaces
    };

    Format();
    explicit Format(std::string tag, Indent indent = Indent::None, unsigned indentWidth = 0);

    static Format json();
    static Format json_pretty(unsigned spaces = 4);
    static Format json_tabs();
    static Format yaml();
    static Format toml();
    static Format ini();
    static Format xml();
    static Format pickle();

    const std::string &tag() const { return tag_; }
    Indent indent() const { return indent_; }
    unsigned indent_width() const { return indentWidth_; }

    // "config.<tag>"
    std::string default_name() const;

    bool operator==(const Format &other) const;
    bool operator!=(const Format &other) const { return !(*this == other); }

private:
    std::string tag_;
    Indent indent_;
    unsigned indentWidth_;
};

// Accepts "tab"/"tabs", a space count, or an empty string for no indentation.
Format format_from_string(const std::string &tag, const std::string &indent = "");
std::string format_to_string(const Format &format);

}  // namespace prefstore
