#include "prefstore/codec.hpp"

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_map>

#include "prefstore/errors.hpp"

namespace prefstore {
namespace {

// Python pickle opcodes understood by this codec (protocols 2 to 5).
namespace op {
constexpr std::uint8_t Mark = '(';
constexpr std::uint8_t Stop = '.';
constexpr std::uint8_t Pop = '0';
constexpr std::uint8_t PopMark = '1';
constexpr std::uint8_t None = 'N';
constexpr std::uint8_t BinInt = 'J';
constexpr std::uint8_t BinInt1 = 'K';
constexpr std::uint8_t BinInt2 = 'M';
constexpr std::uint8_t BinFloat = 'G';
constexpr std::uint8_t BinUnicode = 'X';
constexpr std::uint8_t EmptyList = ']';
constexpr std::uint8_t Append = 'a';
constexpr std::uint8_t Appends = 'e';
constexpr std::uint8_t EmptyDict = '}';
constexpr std::uint8_t SetItem = 's';
constexpr std::uint8_t SetItems = 'u';
constexpr std::uint8_t EmptyTuple = ')';
constexpr std::uint8_t Tuple = 't';
constexpr std::uint8_t BinGet = 'h';
constexpr std::uint8_t LongBinGet = 'j';
constexpr std::uint8_t BinPut = 'q';
constexpr std::uint8_t LongBinPut = 'r';
constexpr std::uint8_t Proto = 0x80;
constexpr std::uint8_t Tuple1 = 0x85;
constexpr std::uint8_t Tuple2 = 0x86;
constexpr std::uint8_t Tuple3 = 0x87;
constexpr std::uint8_t NewTrue = 0x88;
constexpr std::uint8_t NewFalse = 0x89;
constexpr std::uint8_t Long1 = 0x8a;
constexpr std::uint8_t Long4 = 0x8b;
constexpr std::uint8_t ShortBinUnicode = 0x8c;
constexpr std::uint8_t BinUnicode8 = 0x8d;
constexpr std::uint8_t Memoize = 0x94;
constexpr std::uint8_t Frame = 0x95;
}  // namespace op

constexpr std::uint8_t WriteProtocol = 3;
constexpr std::uint8_t HighestProtocol = 5;

void append_le(std::string &out, std::uint64_t value, std::size_t width)
{
    for (std::size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<char>(value & 0xFFU));
        value >>= 8U;
    }
}

// Minimal little-endian two's complement, as Python's encode_long produces.
std::string long_bytes(std::int64_t value)
{
    std::string bytes;
    while (true) {
        const auto byte = static_cast<std::uint8_t>(value & 0xFF);
        bytes.push_back(static_cast<char>(byte));
        value >>= 8;
        if ((value == 0 && (byte & 0x80U) == 0) || (value == -1 && (byte & 0x80U) != 0)) {
            break;
        }
    }
    return bytes;
}

std::string long_bytes(std::uint64_t value)
{
    std::string bytes;
    std::uint8_t byte = 0;
    do {
        byte = static_cast<std::uint8_t>(value & 0xFFU);
        bytes.push_back(static_cast<char>(byte));
        value >>= 8U;
    } while (value != 0);
    if ((byte & 0x80U) != 0) {
        bytes.push_back('\0');
    }
    return bytes;
}

void write_signed(std::string &out, std::int64_t value)
{
    if (value >= 0 && value <= 0xFF) {
        out.push_back(static_cast<char>(op::BinInt1));
        append_le(out, static_cast<std::uint64_t>(value), 1);
    } else if (value >= 0 && value <= 0xFFFF) {
        out.push_back(static_cast<char>(op::BinInt2));
        append_le(out, static_cast<std::uint64_t>(value), 2);
    } else if (value >= std::numeric_limits<std::int32_t>::min() && value <= std::numeric_limits<std::int32_t>::max()) {
        out.push_back(static_cast<char>(op::BinInt));
        append_le(out, static_cast<std::uint32_t>(static_cast<std::int32_t>(value)), 4);
    } else {
        const auto bytes = long_bytes(value);
        out.push_back(static_cast<char>(op::Long1));
        out.push_back(static_cast<char>(bytes.size()));
        out += bytes;
    }
}

void write_value(std::string &out, const Document &value)
{
    switch (value.type()) {
    case Document::value_t::null:
        out.push_back(static_cast<char>(op::None));
        break;
    case Document::value_t::boolean:
        out.push_back(static_cast<char>(value.get<bool>() ? op::NewTrue : op::NewFalse));
        break;
    case Document::value_t::number_integer:
        write_signed(out, value.get<std::int64_t>());
        break;
    case Document::value_t::number_unsigned: {
        const auto unsignedValue = value.get<std::uint64_t>();
        if (unsignedValue <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            write_signed(out, static_cast<std::int64_t>(unsignedValue));
        } else {
            const auto bytes = long_bytes(unsignedValue);
            out.push_back(static_cast<char>(op::Long1));
            out.push_back(static_cast<char>(bytes.size()));
            out += bytes;
        }
        break;
    }
    case Document::value_t::number_float: {
        const double number = value.get<double>();
        std::uint64_t bits = 0;
        std::memcpy(&bits, &number, sizeof(bits));
        out.push_back(static_cast<char>(op::BinFloat));
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<char>((bits >> shift) & 0xFFU));
        }
        break;
    }
    case Document::value_t::string: {
        const auto &text = value.get_ref<const std::string &>();
        if (text.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw EncodingFailure("String too long for pickle BINUNICODE");
        }
        out.push_back(static_cast<char>(op::BinUnicode));
        append_le(out, text.size(), 4);
        out += text;
        break;
    }
    case Document::value_t::array:
        out.push_back(static_cast<char>(op::EmptyList));
        if (!value.empty()) {
            out.push_back(static_cast<char>(op::Mark));
            for (const auto &item : value) {
                write_value(out, item);
            }
            out.push_back(static_cast<char>(op::Appends));
        }
        break;
    case Document::value_t::object:
        out.push_back(static_cast<char>(op::EmptyDict));
        if (!value.empty()) {
            out.push_back(static_cast<char>(op::Mark));
            for (const auto &entry : value.items()) {
                write_value(out, Document(entry.key()));
                write_value(out, entry.value());
            }
            out.push_back(static_cast<char>(op::SetItems));
        }
        break;
    default:
        throw EncodingFailure(std::string("Pickle cannot represent a ") + value.type_name() + " value");
    }
}

class Unpickler {
public:
    explicit Unpickler(const std::string &data)
        : data_(data)
    {
    }

    Document load()
    {
        while (position_ < data_.size()) {
            const std::uint8_t code = read_byte();
            switch (code) {
            case op::Proto: {
                const auto protocol = read_byte();
                if (protocol > HighestProtocol) {
                    fail("Unsupported pickle protocol " + std::to_string(protocol));
                }
                break;
            }
            case op::Frame:
                (void)read_uint(8);
                break;
            case op::Stop:
                return *pop();
            case op::Mark:
                marks_.push_back(stack_.size());
                break;
            case op::Pop:
                (void)pop();
                break;
            case op::PopMark:
                (void)pop_mark();
                break;
            case op::None:
                push(nullptr);
                break;
            case op::NewTrue:
                push(true);
                break;
            case op::NewFalse:
                push(false);
                break;
            case op::BinInt:
                push(static_cast<std::int64_t>(static_cast<std::int32_t>(read_uint(4))));
                break;
            case op::BinInt1:
                push(static_cast<std::int64_t>(read_uint(1)));
                break;
            case op::BinInt2:
                push(static_cast<std::int64_t>(read_uint(2)));
                break;
            case op::Long1:
                push(read_long(read_uint(1)));
                break;
            case op::Long4:
                push(read_long(read_uint(4)));
                break;
            case op::BinFloat:
                push(read_float());
                break;
            case op::BinUnicode:
                push(read_bytes(read_uint(4)));
                break;
            case op::ShortBinUnicode:
                push(read_bytes(read_uint(1)));
                break;
            case op::BinUnicode8:
                push(read_bytes(read_uint(8)));
                break;
            case op::EmptyList:
            case op::EmptyTuple:
                push(Document::array());
                break;
            case op::EmptyDict:
                push(Document::object());
                break;
            case op::Append: {
                auto item = pop();
                top_of_type(Document::value_t::array, "APPEND").push_back(*item);
                break;
            }
            case op::Appends: {
                auto items = pop_mark();
                auto &list = top_of_type(Document::value_t::array, "APPENDS");
                for (const auto &item : items) {
                    list.push_back(*item);
                }
                break;
            }
            case op::SetItem: {
                auto value = pop();
                auto key = pop();
                top_of_type(Document::value_t::object, "SETITEM")[key_text(*key)] = *value;
                break;
            }
            case op::SetItems: {
                auto items = pop_mark();
                if (items.size() % 2 != 0) {
                    fail("SETITEMS with an odd number of stack items");
                }
                auto &dict = top_of_type(Document::value_t::object, "SETITEMS");
                for (std::size_t i = 0; i < items.size(); i += 2) {
                    dict[key_text(*items[i])] = *items[i + 1];
                }
                break;
            }
            case op::Tuple:
                push_tuple(pop_mark());
                break;
            case op::Tuple1:
            case op::Tuple2:
            case op::Tuple3: {
                const std::size_t count = static_cast<std::size_t>(code - op::Tuple1) + 1;
                if (stack_.size() < count + base()) {
                    fail("Stack underflow building tuple");
                }
                std::vector<Slot> items(stack_.end() - static_cast<std::ptrdiff_t>(count), stack_.end());
                stack_.resize(stack_.size() - count);
                push_tuple(items);
                break;
            }
            case op::BinPut:
                memo_[read_uint(1)] = peek();
                break;
            case op::LongBinPut:
                memo_[read_uint(4)] = peek();
                break;
            case op::Memoize:
                memo_[memo_.size()] = peek();
                break;
            case op::BinGet:
                stack_.push_back(memo_get(read_uint(1)));
                break;
            case op::LongBinGet:
                stack_.push_back(memo_get(read_uint(4)));
                break;
            default: {
                std::ostringstream oss;
                oss << "Unsupported pickle opcode 0x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(code);
                fail(oss.str());
            }
            }
        }
        fail("Pickle data ended without STOP");
    }

private:
    using Slot = std::shared_ptr<Document>;

    [[noreturn]] void fail(const std::string &message) const
    {
        throw DecodingFailure("Pickle decoding failed at offset " + std::to_string(position_) + ": " + message);
    }

    std::uint8_t read_byte()
    {
        if (position_ >= data_.size()) {
            fail("Unexpected end of data");
        }
        return static_cast<std::uint8_t>(data_[position_++]);
    }

    std::uint64_t read_uint(std::size_t width)
    {
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            value |= static_cast<std::uint64_t>(read_byte()) << (8U * i);
        }
        return value;
    }

    std::string read_bytes(std::uint64_t count)
    {
        if (count > data_.size() - position_) {
            fail("Length " + std::to_string(count) + " runs past the end of data");
        }
        std::string bytes = data_.substr(position_, static_cast<std::size_t>(count));
        position_ += static_cast<std::size_t>(count);
        return bytes;
    }

    Document read_long(std::uint64_t count)
    {
        const auto bytes = read_bytes(count);
        if (bytes.empty()) {
            return static_cast<std::int64_t>(0);
        }
        const bool negative = (static_cast<std::uint8_t>(bytes.back()) & 0x80U) != 0;
        std::size_t significant = bytes.size();
        // Drop sign-extension bytes that carry no magnitude.
        while (significant > 1) {
            const auto last = static_cast<std::uint8_t>(bytes[significant - 1]);
            const auto next = static_cast<std::uint8_t>(bytes[significant - 2]);
            if (!negative && last == 0x00 && (next & 0x80U) == 0) {
                --significant;
            } else if (negative && last == 0xFF && (next & 0x80U) != 0) {
                --significant;
            } else {
                break;
            }
        }

        if (!negative && significant == 9 && bytes[8] == '\0') {
            significant = 8;
        } else if (significant > 8) {
            fail("Integer does not fit in 64 bits");
        }

        std::uint64_t raw = 0;
        for (std::size_t i = 0; i < significant; ++i) {
            raw |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(bytes[i])) << (8U * i);
        }
        if (negative) {
            for (std::size_t i = significant; i < 8; ++i) {
                raw |= static_cast<std::uint64_t>(0xFFU) << (8U * i);
            }
            return static_cast<std::int64_t>(raw);
        }
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return raw;
        }
        return static_cast<std::int64_t>(raw);
    }

    double read_float()
    {
        std::uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits = (bits << 8U) | read_byte();
        }
        double value = 0.0;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::size_t base() const { return marks_.empty() ? 0 : marks_.back(); }

    void push(Document value) { stack_.push_back(std::make_shared<Document>(std::move(value))); }

    Slot pop()
    {
        if (stack_.size() <= base()) {
            fail("Stack underflow");
        }
        auto slot = stack_.back();
        stack_.pop_back();
        return slot;
    }

    const Slot &peek() const
    {
        if (stack_.size() <= base()) {
            fail("Stack underflow");
        }
        return stack_.back();
    }

    std::vector<Slot> pop_mark()
    {
        if (marks_.empty()) {
            fail("MARK expected on the stack");
        }
        const auto mark = marks_.back();
        marks_.pop_back();
        std::vector<Slot> items(stack_.begin() + static_cast<std::ptrdiff_t>(mark), stack_.end());
        stack_.resize(mark);
        return items;
    }

    Document &top_of_type(Document::value_t type, const char *opcode)
    {
        auto &target = *peek();
        if (target.type() != type) {
            fail(std::string(opcode) + " applied to a " + target.type_name());
        }
        return target;
    }

    void push_tuple(const std::vector<Slot> &items)
    {
        Document array = Document::array();
        for (const auto &item : items) {
            array.push_back(*item);
        }
        push(std::move(array));
    }

    Slot memo_get(std::uint64_t index) const
    {
        auto it = memo_.find(index);
        if (it == memo_.end()) {
            fail("Memo key " + std::to_string(index) + " not found");
        }
        return it->second;
    }

    std::string key_text(const Document &key) const
    {
        if (key.is_string()) {
            return key.get<std::string>();
        }
        if (key.is_number_integer()) {
            return key.dump();
        }
        fail(std::string("Dictionary keys must be strings or integers, not ") + key.type_name());
    }

    const std::string &data_;
    std::size_t position_{0};
    std::vector<Slot> stack_;
    std::vector<std::size_t> marks_;
    std::unordered_map<std::uint64_t, Slot> memo_;
};

class PickleCodec : public Codec {
public:
    std::string encode(const Document &document, const Format &) const override
    {
        std::string out;
        out.push_back(static_cast<char>(op::Proto));
        out.push_back(static_cast<char>(WriteProtocol));
        write_value(out, document);
        out.push_back(static_cast<char>(op::Stop));
        return out;
    }

    Document decode(const std::string &data, const Format &) const override
    {
        return Unpickler(data).load();
    }
};

}  // namespace

std::unique_ptr<Codec> create_pickle_codec()
{
    return std::make_unique<PickleCodec>();
}

}  // namespace prefstore
