#include "prefstore/codec.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

#include "prefstore/errors.hpp"

namespace prefstore {
namespace {

std::int64_t checked_integer(const Document &value)
{
    if (value.is_number_unsigned()) {
        const auto unsignedValue = value.get<std::uint64_t>();
        if (unsignedValue > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw EncodingFailure("TOML integers are limited to 64-bit signed values: " + std::to_string(unsignedValue));
        }
        return static_cast<std::int64_t>(unsignedValue);
    }
    return value.get<std::int64_t>();
}

toml::array to_array(const Document &value);
toml::table to_table(const Document &value);

template <typename Inserter>
void insert_value(const Document &value, Inserter insert)
{
    switch (value.type()) {
    case Document::value_t::boolean:
        insert(value.get<bool>());
        break;
    case Document::value_t::number_integer:
    case Document::value_t::number_unsigned:
        insert(checked_integer(value));
        break;
    case Document::value_t::number_float:
        insert(value.get<double>());
        break;
    case Document::value_t::string:
        insert(value.get<std::string>());
        break;
    case Document::value_t::array:
        insert(to_array(value));
        break;
    case Document::value_t::object:
        insert(to_table(value));
        break;
    case Document::value_t::null:
        throw EncodingFailure("TOML has no representation for null values");
    default:
        throw EncodingFailure(std::string("TOML cannot represent a ") + value.type_name() + " value");
    }
}

toml::array to_array(const Document &value)
{
    toml::array array;
    for (const auto &item : value) {
        insert_value(item, [&array](auto &&element) {
            array.push_back(std::forward<decltype(element)>(element));
        });
    }
    return array;
}

toml::table to_table(const Document &value)
{
    toml::table table;
    for (const auto &entry : value.items()) {
        const std::string key = entry.key();
        insert_value(entry.value(), [&table, &key](auto &&element) {
            table.insert_or_assign(key, std::forward<decltype(element)>(element));
        });
    }
    return table;
}

Document to_document(const toml::node &node);

Document to_document(const toml::table &table)
{
    Document object = Document::object();
    for (auto &&[key, node] : table) {
        object[std::string(key.str())] = to_document(node);
    }
    return object;
}

Document to_document(const toml::node &node)
{
    if (const auto *table = node.as_table()) {
        return to_document(*table);
    }
    if (const auto *array = node.as_array()) {
        Document items = Document::array();
        for (const auto &element : *array) {
            items.push_back(to_document(element));
        }
        return items;
    }
    if (const auto *text = node.as_string()) {
        return text->get();
    }
    if (const auto *integer = node.as_integer()) {
        return integer->get();
    }
    if (const auto *floating = node.as_floating_point()) {
        return floating->get();
    }
    if (const auto *flag = node.as_boolean()) {
        return flag->get();
    }
    // Dates and times have no Document counterpart; keep their TOML spelling.
    std::ostringstream oss;
    if (const auto *date = node.as_date()) {
        oss << *date;
    } else if (const auto *time = node.as_time()) {
        oss << *time;
    } else if (const auto *dateTime = node.as_date_time()) {
        oss << *dateTime;
    } else {
        throw DecodingFailure("Unsupported TOML node type");
    }
    return oss.str();
}

class TomlCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &) const override
    {
        if (!document.is_object()) {
            throw EncodingFailure(std::string("TOML documents must be tables, not ") + document.type_name());
        }
        std::ostringstream oss;
        oss << to_table(document) << '\n';
        return oss.str();
    }

    Document decode(const std::string &data, const Format &) const override
    {
        try {
            const toml::table table = toml::parse(std::string_view(data));
            return to_document(table);
        } catch (const toml::parse_error &ex) {
            throw DecodingFailure(std::string("TOML decoding failed: ") + std::string(ex.description()));
        }
    }
};

}  // namespace

std::unique_ptr<Codec> create_toml_codec()
{
    return std::make_unique<TomlCodec>();
}

}  // namespace prefstore
