/**
 * @file utf8.cpp
 * @brief UTF-8 validation and repair for text that ends up in JSON
 */

#include "ossensor/common.hpp"

#include <array>

namespace ossensor::common {

namespace {

/// Length of the valid sequence starting at text[i], or 0 when invalid
[[nodiscard]] std::size_t valid_sequence_length(std::string_view text, std::size_t i)
{
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
        return 1;
    }
    std::size_t extra = 0;
    std::uint32_t code_point = 0;
    if ((lead & 0xE0U) == 0xC0U) {
        extra = 1;
        code_point = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
        extra = 2;
        code_point = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
        extra = 3;
        code_point = lead & 0x07U;
    } else {
        return 0;
    }
    if (i + extra >= text.size()) {
        return 0;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(text[i + k]);
        if ((cont & 0xC0U) != 0x80U) {
            return 0;
        }
        code_point = (code_point << 6U) | (cont & 0x3FU);
    }
    constexpr std::array<std::uint32_t, 4> kMinForLength = {0, 0x80, 0x800, 0x10000};
    if (code_point < kMinForLength[extra] || code_point > 0x10FFFF
        || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return extra + 1;
}

}  // namespace

bool is_valid_utf8(std::string_view text)
{
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t len = valid_sequence_length(text, i);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string sanitize_utf8(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const std::size_t len = valid_sequence_length(text, i);
        if (len == 0) {
            result += '?';
            ++i;
            continue;
        }
        result.append(text.substr(i, len));
        i += len;
    }
    return result;
}

std::string truncate_utf8(std::string_view text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    std::size_t cut = max_bytes;
    // Back up over continuation bytes so the cut lands on a sequence boundary
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

}  // namespace ossensor::common
