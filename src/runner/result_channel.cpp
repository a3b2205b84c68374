#include "runner/result_channel.hpp"

#include <suitegrader/api/suite_result.hpp>

#include <gsl/util>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace suitegrader::result_channel {

namespace {

template <typename UInt>
void put_uint(std::string& out, UInt value) {
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
    }
}

void put_tag(std::string& out, Tag tag) {
    out.push_back(static_cast<char>(tag));
}

void put_string(std::string& out, Tag tag, std::string_view str) {
    put_tag(out, tag);
    put_uint(out, gsl::narrow_cast<std::uint32_t>(str.size()));
    out.append(str);
}

void put_double(std::string& out, Tag tag, double value) {
    put_tag(out, tag);
    put_uint(out, std::bit_cast<std::uint64_t>(value));
}

class Reader
{
public:
    explicit Reader(std::string_view data)
        : data_{data} {}

    bool has(std::size_t count) const { return count <= data_.size() - pos_; }

    template <typename UInt>
    std::optional<UInt> get_uint() {
        if (!has(sizeof(UInt))) {
            return std::nullopt;
        }

        UInt value{};
        for (std::size_t i = 0; i < sizeof(UInt); ++i) {
            value |= static_cast<UInt>(static_cast<UInt>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i));
        }
        pos_ += sizeof(UInt);

        return value;
    }

    std::optional<std::string> get_string() {
        auto len = get_uint<std::uint32_t>();

        if (!len || !has(*len)) {
            return std::nullopt;
        }

        std::string str{data_.substr(pos_, *len)};
        pos_ += *len;

        return str;
    }

    std::optional<double> get_double() {
        auto bits = get_uint<std::uint64_t>();

        if (!bits) {
            return std::nullopt;
        }

        return std::bit_cast<double>(*bits);
    }

private:
    std::string_view data_;
    std::size_t pos_ = 0;
};

} // namespace

std::string encode(const SuiteResult& result) {
    std::string out{MAGIC};

    put_tag(out, Tag::Success);
    out.push_back(static_cast<char>(result.success ? 1 : 0));

    put_double(out, Tag::Score, result.score);
    put_double(out, Tag::MaxScore, result.max_score);

    for (const auto& msg : result.feedback_messages) {
        put_string(out, Tag::Feedback, msg);
    }

    if (result.error) {
        put_string(out, Tag::Error, *result.error);
    }

    put_tag(out, Tag::End);

    return out;
}

std::string encode_setup_error(std::string_view reason) {
    std::string out{MAGIC};

    put_string(out, Tag::SetupError, reason);
    put_tag(out, Tag::End);

    return out;
}

DecodedResult decode(std::string_view data) {
    DecodedResult result;

    if (!data.starts_with(MAGIC)) {
        return result;
    }

    Reader reader{data.substr(MAGIC.size())};

    while (auto raw_tag = reader.get_uint<std::uint8_t>()) {
        switch (static_cast<Tag>(*raw_tag)) {
        case Tag::Success: {
            auto value = reader.get_uint<std::uint8_t>();
            if (!value) {
                return result;
            }
            result.success = *value != 0;
            break;
        }
        case Tag::Score: {
            auto value = reader.get_double();
            if (!value) {
                return result;
            }
            result.score = *value;
            break;
        }
        case Tag::MaxScore: {
            auto value = reader.get_double();
            if (!value) {
                return result;
            }
            result.max_score = *value;
            break;
        }
        case Tag::Feedback: {
            auto value = reader.get_string();
            if (!value) {
                return result;
            }
            result.feedback_messages.push_back(std::move(*value));
            break;
        }
        case Tag::Error: {
            auto value = reader.get_string();
            if (!value) {
                return result;
            }
            result.error = std::move(*value);
            break;
        }
        case Tag::SetupError: {
            auto value = reader.get_string();
            if (!value) {
                return result;
            }
            result.setup_error = std::move(*value);
            break;
        }
        case Tag::End:
            result.complete = true;
            return result;
        default:
            // Unknown tag: its length is unknown, so nothing after it can be trusted
            return result;
        }
    }

    return result;
}

} // namespace suitegrader::result_channel
