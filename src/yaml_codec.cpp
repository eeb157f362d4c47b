#include "prefstore/codec.hpp"

#include <cstdint>
#include <limits>

#include <yaml-cpp/yaml.h>

#include "prefstore/errors.hpp"
#include "scalar_text.hpp"

namespace prefstore {
namespace {

// Tags yaml-cpp assigns to scalars written in quotes or marked !!str.
bool is_string_tag(const std::string &tag)
{
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

bool is_null_text(const std::string &text)
{
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

void emit(YAML::Emitter &out, const Document &value)
{
    switch (value.type()) {
    case Document::value_t::null:
        out << YAML::Null;
        break;
    case Document::value_t::boolean:
        out << value.get<bool>();
        break;
    case Document::value_t::number_integer:
        out << value.get<std::int64_t>();
        break;
    case Document::value_t::number_unsigned:
        out << value.get<std::uint64_t>();
        break;
    case Document::value_t::number_float:
        out << value.get<double>();
        break;
    case Document::value_t::string:
        out << value.get_ref<const std::string &>();
        break;
    case Document::value_t::array:
        out << YAML::BeginSeq;
        for (const auto &item : value) {
            emit(out, item);
        }
        out << YAML::EndSeq;
        break;
    case Document::value_t::object:
        out << YAML::BeginMap;
        for (const auto &entry : value.items()) {
            out << YAML::Key << entry.key() << YAML::Value;
            emit(out, entry.value());
        }
        out << YAML::EndMap;
        break;
    default:
        throw EncodingFailure(std::string("YAML cannot represent a ") + value.type_name() + " value");
    }
}

Document plain_scalar(const std::string &text)
{
    if (is_null_text(text)) {
        return nullptr;
    }
    if (text == ".inf" || text == "+.inf" || text == ".Inf" || text == ".INF") {
        return std::numeric_limits<double>::infinity();
    }
    if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (auto number = scalar_text::parse_number(text)) {
        return *number;
    }
    if (auto flag = scalar_text::parse_bool(text)) {
        return *flag;
    }
    return text;
}

Document to_document(const YAML::Node &node)
{
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return nullptr;
    case YAML::NodeType::Scalar:
        if (is_string_tag(node.Tag())) {
            return node.Scalar();
        }
        return plain_scalar(node.Scalar());
    case YAML::NodeType::Sequence: {
        Document array = Document::array();
        for (const auto &item : node) {
            array.push_back(to_document(item));
        }
        return array;
    }
    case YAML::NodeType::Map: {
        Document object = Document::object();
        for (const auto &entry : node) {
            object[entry.first.as<std::string>()] = to_document(entry.second);
        }
        return object;
    }
    }
    throw DecodingFailure("Unknown YAML node type");
}

class YamlCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &format) const override
    {
        YAML::Emitter out;
        out.SetStringFormat(YAML::DoubleQuoted);
        out.SetDoublePrecision(std::numeric_limits<double>::max_digits10);
        if (format.indent() == Format::Indent::Spaces && format.indent_width() >= 2) {
            out.SetIndent(format.indent_width());
        }
        emit(out, document);
        if (!out.good()) {
            throw EncodingFailure("YAML encoding failed: " + out.GetLastError());
        }
        return std::string(out.c_str(), out.size()) + "\n";
    }

    Document decode(const std::string &data, const Format &) const override
    {
        try {
            return to_document(YAML::Load(data));
        } catch (const YAML::Exception &ex) {
            throw DecodingFailure(std::string("YAML decoding failed: ") + ex.what());
        }
    }
};

}  // namespace

std::unique_ptr<Codec> create_yaml_codec()
{
    return std::make_unique<YamlCodec>();
}

}  // namespace prefstore
