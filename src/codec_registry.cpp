#include "prefstore/codec.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "prefstore/errors.hpp"

namespace prefstore {

namespace {
std::string normalize_tag(const std::string &tag)
{
    std::string lowered(tag);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}
}  // namespace

void CodecRegistry::register_codec(const std::string &tag, std::shared_ptr<const Codec> codec)
{
    if (tag.empty()) {
        throw std::invalid_argument("Codec tag must not be empty");
    }
    if (!codec) {
        throw std::invalid_argument("Codec for '" + tag + "' must not be null");
    }
    codecs_[normalize_tag(tag)] = std::move(codec);
}

bool CodecRegistry::supports(const std::string &tag) const
{
    return codecs_.find(normalize_tag(tag)) != codecs_.end();
}

const Codec &CodecRegistry::codec_for(const Format &format) const
{
    auto it = codecs_.find(format.tag());
    if (it == codecs_.end()) {
        throw UnsupportedFormat(format.tag());
    }
    return *it->second;
}

std::vector<std::string> CodecRegistry::tags() const
{
    std::vector<std::string> names;
    names.reserve(codecs_.size());
    for (const auto &entry : codecs_) {
        names.push_back(entry.first);
    }
    return names;
}

CodecRegistry create_default_codec_registry()
{
    CodecRegistry registry;
    registry.register_codec("json", create_json_codec());
    registry.register_codec("yaml", create_yaml_codec());
    registry.register_codec("toml", create_toml_codec());
    registry.register_codec("ini", create_ini_codec());
    registry.register_codec("xml", create_xml_codec());
    registry.register_codec("pickle", create_pickle_codec());
    return registry;
}

}  // namespace prefstore
