#include "scalar_text.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

#include "prefstore/errors.hpp"

namespace prefstore {
namespace scalar_text {

namespace {
std::string to_lower(const std::string &text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}
}  // namespace

std::optional<Document> parse_number(const std::string &text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    const auto lowered = to_lower(text);
    if (lowered == "inf" || lowered == "+inf") {
        return Document(std::numeric_limits<double>::infinity());
    }
    if (lowered == "-inf") {
        return Document(-std::numeric_limits<double>::infinity());
    }
    if (lowered == "nan") {
        return Document(std::numeric_limits<double>::quiet_NaN());
    }

    const std::size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    bool integral = true;
    bool digits = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isdigit(c)) {
            digits = true;
        } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
            integral = false;
        } else {
            return std::nullopt;
        }
    }
    if (!digits) {
        return std::nullopt;
    }

    const char *begin = text.c_str();
    const char *finish = begin + text.size();
    char *end = nullptr;

    if (integral) {
        errno = 0;
        const long long value = std::strtoll(begin, &end, 10);
        if (errno == 0 && end == finish) {
            return Document(static_cast<std::int64_t>(value));
        }
        if (text[0] != '-') {
            errno = 0;
            const unsigned long long unsignedValue = std::strtoull(begin, &end, 10);
            if (errno == 0 && end == finish) {
                return Document(static_cast<std::uint64_t>(unsignedValue));
            }
        }
        return std::nullopt;
    }

    errno = 0;
    const double value = std::strtod(begin, &end);
    // Subnormal results also report ERANGE; only overflow is rejected.
    if (end != finish || (errno == ERANGE && (value == HUGE_VAL || value == -HUGE_VAL))) {
        return std::nullopt;
    }
    return Document(value);
}

std::optional<bool> parse_bool(const std::string &text)
{
    const auto lowered = to_lower(text);
    if (lowered == "true") return true;
    if (lowered == "false") return false;
    return std::nullopt;
}

std::string format(const Document &scalar)
{
    switch (scalar.type()) {
    case Document::value_t::boolean:
        return scalar.get<bool>() ? "true" : "false";
    case Document::value_t::number_integer:
        return std::to_string(scalar.get<std::int64_t>());
    case Document::value_t::number_unsigned:
        return std::to_string(scalar.get<std::uint64_t>());
    case Document::value_t::number_float: {
        const double value = scalar.get<double>();
        if (std::isnan(value)) return "nan";
        if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
        return scalar.dump();
    }
    case Document::value_t::string:
        return scalar.get<std::string>();
    default:
        break;
    }
    throw EncodingFailure(std::string("Expected a scalar value but found ") + scalar.type_name());
}

bool is_ambiguous(const std::string &text)
{
    return parse_number(text).has_value() || parse_bool(text).has_value();
}

}  // namespace scalar_text
}  // namespace prefstore
