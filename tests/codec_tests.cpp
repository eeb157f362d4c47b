#include "prefstore/codec.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>

#include "prefstore/errors.hpp"
#include "test_support.hpp"

namespace prefstore {

namespace {

using prefstore_test::bytes_from_hex;

Document nested_document()
{
    return Document{
        {"name", "nested"},
        {"count", 42},
        {"negative", -9000000000000LL},
        {"huge", 18000000000000000000ULL},
        {"ratio", 0.1},
        {"enabled", false},
        {"missing", nullptr},
        {"numeric_text", "123"},
        {"bool_text", "true"},
        {"list", {1, "two", 3.5, nullptr, {{"inner", true}}}},
        {"map", {{"a", Document::array()}, {"b", Document::object()}}},
    };
}

Document flat_document()
{
    return Document{
        {"title", "Main"},
        {"count", 3},
        {"ratio", 2.5},
        {"visible", true},
        {"numeric_text", "123"},
        {"bool_text", "false"},
        {"padded", "  spaced  "},
        {"quoted", "\"already\""},
        {"empty", ""},
        {"window", {{"x", 10}, {"y", -20}, {"label", "multi\nline"}}},
    };
}

// Doubles at the edges of the range, subnormals included.
Document extreme_floats()
{
    return Document{
        {"smallest", std::numeric_limits<double>::denorm_min()},
        {"negative_smallest", -std::numeric_limits<double>::denorm_min()},
        {"subnormal", 2.5e-310},
        {"largest", std::numeric_limits<double>::max()},
    };
}

int round_trip(const CodecRegistry &registry, const Format &format, const Document &document)
{
    try {
        const auto &codec = registry.codec_for(format);
        const auto encoded = codec.encode(document, format);
        const auto decoded = codec.decode(encoded, format);
        if (decoded != document) {
            std::cerr << format_to_string(format) << " round trip changed the document:\n"
                      << document.dump() << "\n" << decoded.dump() << std::endl;
            return 1;
        }
    } catch (const std::exception &ex) {
        std::cerr << format_to_string(format) << " round trip failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

template <typename Error>
int expect_encode_error(const CodecRegistry &registry, const Format &format, const Document &document, const char *label)
{
    try {
        (void)registry.codec_for(format).encode(document, format);
        std::cerr << label << ": encoding succeeded unexpectedly" << std::endl;
        return 1;
    } catch (const Error &) {
        // Expected path
    } catch (const std::exception &ex) {
        std::cerr << label << ": wrong error type: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int expect_decode_error(const CodecRegistry &registry, const Format &format, const std::string &data, const char *label)
{
    try {
        (void)registry.codec_for(format).decode(data, format);
        std::cerr << label << ": decoding succeeded unexpectedly" << std::endl;
        return 1;
    } catch (const DecodingFailure &) {
        // Expected path
    } catch (const std::exception &ex) {
        std::cerr << label << ": wrong error type: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int expect_decoded(const CodecRegistry &registry, const Format &format, const std::string &data,
                   const Document &expected, const char *label)
{
    try {
        const auto decoded = registry.codec_for(format).decode(data, format);
        if (decoded != expected) {
            std::cerr << label << ": expected " << expected.dump() << " but decoded " << decoded.dump() << std::endl;
            return 1;
        }
    } catch (const std::exception &ex) {
        std::cerr << label << ": decoding failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

class SuffixedJsonCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &) const override { return document.dump() + "!"; }

    Document decode(const std::string &data, const Format &) const override
    {
        return Document::parse(data.substr(0, data.size() - 1));
    }
};

int run_registry_tests()
{
    int failures = 0;
    auto registry = create_default_codec_registry();

    const std::vector<std::string> expectedTags{"ini", "json", "pickle", "toml", "xml", "yaml"};
    if (registry.tags() != expectedTags) {
        std::cerr << "Default registry does not hold every built-in codec" << std::endl;
        ++failures;
    }
    if (!registry.supports("JSON") || registry.supports("bson")) {
        std::cerr << "Registry tag lookup is wrong" << std::endl;
        ++failures;
    }
    try {
        (void)registry.codec_for(Format("bson"));
        std::cerr << "Unregistered format resolved to a codec" << std::endl;
        ++failures;
    } catch (const UnsupportedFormat &ex) {
        if (ex.kind() != ErrorKind::UnsupportedFormat) {
            std::cerr << "UnsupportedFormat reported the wrong kind" << std::endl;
            ++failures;
        }
    }

    registry.register_codec("Shout", std::make_shared<SuffixedJsonCodec>());
    const Format shout("shout");
    if (shout.default_name() != "config.shout") {
        std::cerr << "Custom format default name is wrong" << std::endl;
        ++failures;
    }
    failures += round_trip(registry, shout, Document{{"x", 1}});
    return failures;
}

int run_json_tests(const CodecRegistry &registry)
{
    int failures = 0;
    failures += round_trip(registry, Format::json(), nested_document());
    failures += round_trip(registry, Format::json_pretty(2), nested_document());
    failures += round_trip(registry, Format::json_tabs(), nested_document());

    const Document small{{"x", 1}};
    if (registry.codec_for(Format::json()).encode(small, Format::json()) != "{\"x\":1}") {
        std::cerr << "Compact JSON output is not minimal" << std::endl;
        ++failures;
    }
    if (registry.codec_for(Format::json()).encode(small, Format::json_tabs()) != "{\n\t\"x\": 1\n}") {
        std::cerr << "Tab-indented JSON output is wrong" << std::endl;
        ++failures;
    }
    if (registry.codec_for(Format::json()).encode(small, Format::json_pretty(4)) != "{\n    \"x\": 1\n}") {
        std::cerr << "Space-indented JSON output is wrong" << std::endl;
        ++failures;
    }
    failures += expect_decode_error(registry, Format::json(), "{\"x\": ", "truncated JSON");
    return failures;
}

int run_yaml_tests(const CodecRegistry &registry)
{
    int failures = 0;
    failures += round_trip(registry, Format::yaml(), nested_document());
    failures += round_trip(registry, Format::yaml(), flat_document());
    failures += round_trip(registry, Format::yaml(), extreme_floats());
    failures += expect_decoded(registry, Format::yaml(), "x: 1\ny: true\nz: hello\nw: ~\nv: -2.5\nu: \"7\"\n",
                               Document{{"x", 1}, {"y", true}, {"z", "hello"}, {"w", nullptr}, {"v", -2.5}, {"u", "7"}},
                               "hand-written YAML");
    failures += expect_decode_error(registry, Format::yaml(), "key: [unterminated", "malformed YAML");
    return failures;
}

int run_toml_tests(const CodecRegistry &registry)
{
    int failures = 0;
    Document document = nested_document();
    document.erase("missing");
    document.erase("huge");
    document["list"] = Document{1, "two", 3.5, Document{{"inner", true}}};
    failures += round_trip(registry, Format::toml(), document);
    failures += round_trip(registry, Format::toml(), flat_document());

    failures += expect_encode_error<EncodingFailure>(registry, Format::toml(), Document{{"x", nullptr}}, "TOML null");
    failures += expect_encode_error<EncodingFailure>(registry, Format::toml(),
                                                     Document{{"x", std::numeric_limits<std::uint64_t>::max()}},
                                                     "TOML unsigned overflow");
    failures += expect_encode_error<EncodingFailure>(registry, Format::toml(), Document::array({1, 2}),
                                                     "TOML top-level array");
    failures += expect_decoded(registry, Format::toml(), "title = \"T\"\n[owner]\nage = 5\n",
                               Document{{"title", "T"}, {"owner", {{"age", 5}}}}, "hand-written TOML");
    failures += expect_decode_error(registry, Format::toml(), "title = ", "malformed TOML");
    return failures;
}

int run_ini_tests(const CodecRegistry &registry)
{
    int failures = 0;
    failures += round_trip(registry, Format::ini(), flat_document());
    failures += round_trip(registry, Format::ini(), extreme_floats());

    const auto encoded = registry.codec_for(Format::ini()).encode(Document{{"a", 1}, {"s", {{"b", "x"}}}}, Format::ini());
    if (encoded != "a=1\n[s]\nb=x\n") {
        std::cerr << "Unexpected INI layout: " << encoded << std::endl;
        ++failures;
    }

    failures += expect_decoded(registry, Format::ini(),
                               "; comment\nname = demo\n\n[window]\nwidth=800\nratio = 0.5\nshown = TRUE\n",
                               Document{{"name", "demo"}, {"window", {{"width", 800}, {"ratio", 0.5}, {"shown", true}}}},
                               "hand-written INI");
    failures += expect_encode_error<EncodingFailure>(registry, Format::ini(), Document{{"list", {1, 2}}}, "INI array");
    failures += expect_encode_error<EncodingFailure>(registry, Format::ini(), Document{{"x", nullptr}}, "INI null");
    failures += expect_encode_error<EncodingFailure>(registry, Format::ini(),
                                                     Document{{"s", {{"deep", {{"x", 1}}}}}}, "INI nesting");
    failures += expect_encode_error<EncodingFailure>(registry, Format::ini(), Document{{"a=b", 1}}, "INI key");
    failures += expect_decode_error(registry, Format::ini(), "[broken\n", "INI section header");
    failures += expect_decode_error(registry, Format::ini(), "no separator\n", "INI line without '='");
    return failures;
}

int run_xml_tests(const CodecRegistry &registry)
{
    int failures = 0;
    failures += round_trip(registry, Format::xml(), nested_document());
    failures += round_trip(registry, Format("xml", Format::Indent::Spaces, 4), flat_document());
    failures += round_trip(registry, Format::xml(), extreme_floats());
    failures += expect_decode_error(registry, Format::xml(), "<config type=\"object\">", "unterminated XML");
    failures += expect_decode_error(registry, Format::xml(), "<settings type=\"object\"/>", "wrong XML root");
    failures += expect_decode_error(registry, Format::xml(), "<config type=\"int\">abc</config>", "bad XML int");
    return failures;
}

int run_pickle_tests(const CodecRegistry &registry)
{
    int failures = 0;
    failures += round_trip(registry, Format::pickle(), nested_document());

    Document integers = Document::array();
    integers.push_back(0);
    integers.push_back(255);
    integers.push_back(65535);
    integers.push_back(-1);
    integers.push_back(std::numeric_limits<std::int32_t>::min());
    integers.push_back(-1099511627776LL);
    integers.push_back(std::numeric_limits<std::int64_t>::min());
    integers.push_back(std::numeric_limits<std::int64_t>::max());
    integers.push_back(std::numeric_limits<std::uint64_t>::max());
    failures += round_trip(registry, Format::pickle(), integers);

    const auto &codec = registry.codec_for(Format::pickle());
    if (codec.encode(Document{{"x", 1}}, Format::pickle()) != bytes_from_hex("80 03 7d 28 58 01 00 00 00 78 4b 01 75 2e")) {
        std::cerr << "Pickle encoding of {'x': 1} differs from protocol 3 layout" << std::endl;
        ++failures;
    }
    if (codec.encode(Document(-1099511627776LL), Format::pickle()) != bytes_from_hex("80 03 8a 06 00 00 00 00 00 ff 2e")) {
        std::cerr << "Pickle LONG1 encoding is not minimal" << std::endl;
        ++failures;
    }

    // Byte strings produced by CPython's pickle module.
    failures += expect_decoded(registry, Format::pickle(),
                               bytes_from_hex("80 03 7d 71 00 58 01 00 00 00 78 71 01 4b 01 73 2e"),
                               Document{{"x", 1}}, "CPython protocol 3 dict");
    failures += expect_decoded(registry, Format::pickle(),
                               bytes_from_hex("80 04 95 10 00 00 00 00 00 00 00 7d 94 8c 01 61 94 5d 94 28 4b 01 4b 02 65 73 2e"),
                               Document{{"a", {1, 2}}}, "CPython protocol 4 framed dict");
    failures += expect_decoded(registry, Format::pickle(),
                               bytes_from_hex("80 02 4b 01 58 01 00 00 00 62 71 00 86 71 01 2e"),
                               Document::array({1, "b"}), "CPython protocol 2 tuple");
    failures += expect_decoded(registry, Format::pickle(),
                               bytes_from_hex("80 03 8a 09 05 00 00 00 00 00 00 80 00 2e"),
                               Document(9223372036854775813ULL), "CPython unsigned long");

    failures += expect_decode_error(registry, Format::pickle(), bytes_from_hex("80 03 7d"), "pickle without STOP");
    failures += expect_decode_error(registry, Format::pickle(), bytes_from_hex("80 03 63 2e"), "pickle GLOBAL opcode");
    failures += expect_decode_error(registry, Format::pickle(), bytes_from_hex("80 03 58 ff 00 00 00 2e"),
                                    "pickle truncated string");
    return failures;
}

}  // namespace

int run_codec_tests()
{
    const auto registry = create_default_codec_registry();

    int failures = 0;
    failures += run_registry_tests();
    failures += run_json_tests(registry);
    failures += run_yaml_tests(registry);
    failures += run_toml_tests(registry);
    failures += run_ini_tests(registry);
    failures += run_xml_tests(registry);
    failures += run_pickle_tests(registry);
    return failures == 0 ? 0 : 1;
}

}  // namespace prefstore
