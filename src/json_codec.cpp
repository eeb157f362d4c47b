#include "prefstore/codec.hpp"

#include "prefstore/errors.hpp"

namespace prefstore {
namespace {

class JsonCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &format) const override
    {
        try {
            switch (format.indent()) {
            case Format::Indent::None:
                return document.dump();
            case Format::Indent::Tabs:
                return document.dump(1, '\t');
            case Format::Indent::Spaces:
                return document.dump(static_cast<int>(format.indent_width()), ' ');
            }
        } catch (const nlohmann::json::exception &ex) {
            // type_error 316: invalid UTF-8 inside a string
            throw EncodingFailure(std::string("JSON encoding failed: ") + ex.what());
        }
        throw EncodingFailure("Unsupported JSON indentation");
    }

    Document decode(const std::string &data, const Format &) const override
    {
        try {
            return Document::parse(data);
        } catch (const nlohmann::json::exception &ex) {
            throw DecodingFailure(std::string("JSON decoding failed: ") + ex.what());
        }
    }
};

}  // namespace

std::unique_ptr<Codec> create_json_codec()
{
    return std::make_unique<JsonCodec>();
}

}  // namespace prefstore
