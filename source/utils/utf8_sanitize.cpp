#include "utils/utf8_sanitize.hpp"

#include <cstddef>
#include <utility>

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at position, or 0 if the bytes
// there do not form one. Second-byte ranges follow RFC 3629 table 3-7.
std::size_t sequence_length(const std::string &text, std::size_t position) {
    const auto byte_at = [&text](std::size_t index) {
        return static_cast<unsigned char>(text[index]);
    };
    const std::size_t remaining = text.size() - position;
    const unsigned char lead = byte_at(position);

    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }

    const unsigned char second = byte_at(position + 1);
    if (second < second_low || second > second_high) {
        return 0;
    }
    for (std::size_t offset = 2; offset < length; ++offset) {
        if ((byte_at(position + offset) & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(text, position);
        if (length == 0) {
            return false;
        }
        position += length;
    }
    return true;
}

std::string sanitize(const std::string &text) {
    if (is_valid(text)) {
        return text;
    }

    std::string result;
    result.reserve(text.size() + 8);

    std::size_t position = 0;
    while (position < text.size()) {
        std::size_t length = sequence_length(text, position);
        if (length == 0) {
            result += kReplacement;
            ++position;
            continue;
        }
        result.append(text, position, length);
        position += length;
    }
    return result;
}

void sanitize_json(nlohmann::json &document) {
    if (document.is_string()) {
        const auto &value = document.get_ref<const std::string &>();
        if (!is_valid(value)) {
            document = sanitize(value);
        }
        return;
    }

    if (document.is_array()) {
        for (auto &element : document) {
            sanitize_json(element);
        }
        return;
    }

    if (document.is_object()) {
        nlohmann::json rebuilt = nlohmann::json::object();
        for (auto &item : document.items()) {
            nlohmann::json value = std::move(item.value());
            sanitize_json(value);
            rebuilt[sanitize(item.key())] = std::move(value);
        }
        document = std::move(rebuilt);
    }
}

} // namespace utf8_sanitize
