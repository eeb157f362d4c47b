#include "prefstore/codec.hpp"

#include <cstdint>

#include "tinyxml2.h"
#include "prefstore/errors.hpp"
#include "scalar_text.hpp"

namespace prefstore {
namespace {

constexpr const char *RootElement = "config";
constexpr const char *EntryElement = "entry";
constexpr const char *ItemElement = "item";

const char *type_name_of(const Document &value)
{
    switch (value.type()) {
    case Document::value_t::null:
        return "null";
    case Document::value_t::boolean:
        return "bool";
    case Document::value_t::number_integer:
        return "int";
    case Document::value_t::number_unsigned:
        return "uint";
    case Document::value_t::number_float:
        return "float";
    case Document::value_t::string:
        return "string";
    case Document::value_t::array:
        return "array";
    case Document::value_t::object:
        return "object";
    default:
        break;
    }
    throw EncodingFailure(std::string("XML cannot represent a ") + value.type_name() + " value");
}

void write_value(tinyxml2::XMLDocument &doc, tinyxml2::XMLElement &element, const Document &value)
{
    element.SetAttribute("type", type_name_of(value));
    if (value.is_array()) {
        for (const auto &item : value) {
            auto *child = doc.NewElement(ItemElement);
            element.InsertEndChild(child);
            write_value(doc, *child, item);
        }
    } else if (value.is_object()) {
        for (const auto &entry : value.items()) {
            auto *child = doc.NewElement(EntryElement);
            child->SetAttribute("key", entry.key().c_str());
            element.InsertEndChild(child);
            write_value(doc, *child, entry.value());
        }
    } else if (!value.is_null()) {
        const auto text = scalar_text::format(value);
        if (!text.empty()) {
            element.SetText(text.c_str());
        }
    }
}

std::string require_attribute(const tinyxml2::XMLElement &element, const char *name)
{
    const char *value = element.Attribute(name);
    if (!value) {
        throw DecodingFailure(std::string("Missing attribute '") + name + "' in element '" + element.Name() + "'");
    }
    return value;
}

Document read_number(const std::string &type, const std::string &text, const tinyxml2::XMLElement &element)
{
    auto number = scalar_text::parse_number(text);
    if (!number) {
        throw DecodingFailure("Invalid " + type + " value '" + text + "' in element '" + element.Name() + "'");
    }
    if (type == "float") {
        return number->get<double>();
    }
    if (type == "int" && number->is_number_integer() && !number->is_number_unsigned()) {
        return *number;
    }
    if (type == "uint" && number->is_number_unsigned()) {
        return *number;
    }
    if (type == "uint" && number->is_number_integer() && number->get<std::int64_t>() >= 0) {
        return number->get<std::uint64_t>();
    }
    throw DecodingFailure("Value '" + text + "' does not fit type " + type + " in element '" + element.Name() + "'");
}

Document read_value(const tinyxml2::XMLElement &element)
{
    const auto type = require_attribute(element, "type");
    const char *rawText = element.GetText();
    const std::string text = rawText ? rawText : "";

    if (type == "null") {
        return nullptr;
    }
    if (type == "bool") {
        auto flag = scalar_text::parse_bool(text);
        if (!flag) {
            throw DecodingFailure("Invalid bool value '" + text + "' in element '" + element.Name() + "'");
        }
        return *flag;
    }
    if (type == "int" || type == "uint" || type == "float") {
        return read_number(type, text, element);
    }
    if (type == "string") {
        return text;
    }
    if (type == "array") {
        Document array = Document::array();
        for (const auto *child = element.FirstChildElement(ItemElement); child;
             child = child->NextSiblingElement(ItemElement)) {
            array.push_back(read_value(*child));
        }
        return array;
    }
    if (type == "object") {
        Document object = Document::object();
        for (const auto *child = element.FirstChildElement(EntryElement); child;
             child = child->NextSiblingElement(EntryElement)) {
            object[require_attribute(*child, "key")] = read_value(*child);
        }
        return object;
    }
    throw DecodingFailure("Unknown value type '" + type + "' in element '" + element.Name() + "'");
}

class XmlCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &format) const override
    {
        tinyxml2::XMLDocument doc;
        doc.InsertEndChild(doc.NewDeclaration());
        auto *root = doc.NewElement(RootElement);
        doc.InsertEndChild(root);
        write_value(doc, *root, document);

        tinyxml2::XMLPrinter printer(nullptr, format.indent() == Format::Indent::None);
        doc.Print(&printer);
        return std::string(printer.CStr());
    }

    Document decode(const std::string &data, const Format &) const override
    {
        tinyxml2::XMLDocument doc;
        const auto result = doc.Parse(data.c_str(), data.size());
        if (result != tinyxml2::XML_SUCCESS) {
            throw DecodingFailure("XML decoding failed: " + std::string(doc.ErrorStr() ? doc.ErrorStr() : "unknown error"));
        }
        const auto *root = doc.RootElement();
        if (!root || std::string(root->Name()) != RootElement) {
            throw DecodingFailure(std::string("Root element <") + RootElement + "> not found");
        }
        return read_value(*root);
    }
};

}  // namespace

std::unique_ptr<Codec> create_xml_codec()
{
    return std::make_unique<XmlCodec>();
}

}  // namespace prefstore
