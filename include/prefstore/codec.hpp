#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "prefstore/format.hpp"

namespace prefstore {

// Codec-neutral tree every record is converted to before encoding.
using Document = nlohmann::json;

class Codec {
public:
    virtual ~Codec() = default;

    // Throws EncodingFailure when the document holds values the format cannot express.
    virtual std::string encode(const Document &document, const Format &format) const = 0;
    // Throws DecodingFailure on malformed input.
    virtual Document decode(const std::string &data, const Format &format) const = 0;
};

class CodecRegistry {
public:
    // Replaces any codec already registered under the same tag.
    void register_codec(const std::string &tag, std::shared_ptr<const Codec> codec);

    bool supports(const std::string &tag) const;
    // Throws UnsupportedFormat when nothing is registered for format.tag().
    const Codec &codec_for(const Format &format) const;
    std::vector<std::string> tags() const;

private:
    std::map<std::string, std::shared_ptr<const Codec>> codecs_;
};

std::unique_ptr<Codec> create_json_codec();
std::unique_ptr<Codec> create_yaml_codec();
std::unique_ptr<Codec> create_toml_codec();
std::unique_ptr<Codec> create_ini_codec();
std::unique_ptr<Codec> create_xml_codec();
std::unique_ptr<Codec> create_pickle_codec();

// Registry holding every codec built into the library.
CodecRegistry create_default_codec_registry();

}  // namespace prefstore
