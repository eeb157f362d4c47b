#include "prefstore/codec.hpp"

#include <cctype>
#include <sstream>

#include "prefstore/errors.hpp"
#include "scalar_text.hpp"

namespace prefstore {
namespace {

std::string trim(const std::string &text)
{
    auto begin = text.begin();
    auto end = text.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
    return std::string(begin, end);
}

bool is_scalar(const Document &value)
{
    return value.is_boolean() || value.is_number() || value.is_string();
}

void check_name(const std::string &name, const char *what)
{
    if (name.empty() || name != trim(name)) {
        throw EncodingFailure(std::string("INI ") + what + " names must be non-empty without surrounding spaces: '" + name + "'");
    }
    if (name.front() == ';' || name.front() == '#' || name.front() == '[') {
        throw EncodingFailure(std::string("INI ") + what + " name starts with a reserved character: '" + name + "'");
    }
    if (name.find_first_of("=[]\r\n") != std::string::npos) {
        throw EncodingFailure(std::string("INI ") + what + " name contains a reserved character: '" + name + "'");
    }
}

bool needs_quotes(const std::string &text)
{
    if (text.empty()) {
        return false;
    }
    return text != trim(text) || text.front() == '"' || text.find_first_of("\r\n") != std::string::npos ||
           scalar_text::is_ambiguous(text);
}

std::string quote(const std::string &text)
{
    std::string quoted("\"");
    for (char c : text) {
        switch (c) {
        case '"':
            quoted += "\\\"";
            break;
        case '\\':
            quoted += "\\\\";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\r':
            quoted += "\\r";
            break;
        case '\t':
            quoted += "\\t";
            break;
        default:
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

std::string unquote(const std::string &text, std::size_t lineNumber)
{
    if (text.size() < 2 || text.back() != '"') {
        throw DecodingFailure("Unterminated quoted INI value on line " + std::to_string(lineNumber));
    }
    std::string value;
    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            value.push_back(c);
            continue;
        }
        if (i + 2 >= text.size()) {
            throw DecodingFailure("Dangling escape in INI value on line " + std::to_string(lineNumber));
        }
        c = text[++i];
        switch (c) {
        case 'n':
            value.push_back('\n');
            break;
        case 'r':
            value.push_back('\r');
            break;
        case 't':
            value.push_back('\t');
            break;
        case '"':
        case '\\':
            value.push_back(c);
            break;
        default:
            throw DecodingFailure("Unknown escape '\\" + std::string(1, c) + "' in INI value on line " +
                                  std::to_string(lineNumber));
        }
    }
    return value;
}

void write_entry(std::ostringstream &out, const std::string &key, const Document &value)
{
    check_name(key, "key");
    if (!is_scalar(value)) {
        throw EncodingFailure(std::string("INI cannot store a ") + value.type_name() + " value under '" + key + "'");
    }
    std::string text = scalar_text::format(value);
    if (value.is_string() && needs_quotes(text)) {
        text = quote(text);
    }
    out << key << '=' << text << '\n';
}

Document read_value(const std::string &text, std::size_t lineNumber)
{
    if (!text.empty() && text.front() == '"') {
        return unquote(text, lineNumber);
    }
    if (auto flag = scalar_text::parse_bool(text)) {
        return *flag;
    }
    if (auto number = scalar_text::parse_number(text)) {
        return *number;
    }
    return text;
}

class IniCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &) const override
    {
        if (!document.is_object()) {
            throw EncodingFailure(std::string("INI documents must be objects, not ") + document.type_name());
        }

        std::ostringstream out;
        for (const auto &entry : document.items()) {
            if (!entry.value().is_object()) {
                write_entry(out, entry.key(), entry.value());
            }
        }
        for (const auto &entry : document.items()) {
            if (!entry.value().is_object()) {
                continue;
            }
            check_name(entry.key(), "section");
            out << '[' << entry.key() << "]\n";
            for (const auto &field : entry.value().items()) {
                write_entry(out, field.key(), field.value());
            }
        }
        return out.str();
    }

    Document decode(const std::string &data, const Format &) const override
    {
        Document document = Document::object();
        Document *section = &document;

        std::istringstream in(data);
        std::string raw;
        std::size_t lineNumber = 0;
        while (std::getline(in, raw)) {
            ++lineNumber;
            const auto line = trim(raw);
            if (line.empty() || line.front() == ';' || line.front() == '#') {
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']') {
                    throw DecodingFailure("Malformed INI section header on line " + std::to_string(lineNumber));
                }
                const auto name = trim(line.substr(1, line.size() - 2));
                if (name.empty()) {
                    throw DecodingFailure("Empty INI section name on line " + std::to_string(lineNumber));
                }
                auto &target = document[name];
                if (target.is_null()) {
                    target = Document::object();
                } else if (!target.is_object()) {
                    throw DecodingFailure("INI section '" + name + "' collides with a key on line " +
                                          std::to_string(lineNumber));
                }
                section = &target;
                continue;
            }

            const auto separator = line.find('=');
            if (separator == std::string::npos) {
                throw DecodingFailure("Expected key=value on INI line " + std::to_string(lineNumber));
            }
            const auto key = trim(line.substr(0, separator));
            if (key.empty()) {
                throw DecodingFailure("Empty INI key on line " + std::to_string(lineNumber));
            }
            if (section == &document && document.contains(key) && document[key].is_object()) {
                throw DecodingFailure("INI key '" + key + "' collides with a section on line " +
                                      std::to_string(lineNumber));
            }
            (*section)[key] = read_value(trim(line.substr(separator + 1)), lineNumber);
        }
        return document;
    }
};

}  // namespace

std::unique_ptr<Codec> create_ini_codec()
{
    return std::make_unique<IniCodec>();
}

}  // namespace prefstore
