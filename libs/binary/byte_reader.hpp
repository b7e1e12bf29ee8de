#pragma once

/**
 * @file byte_reader.hpp
 * @brief Bounds-checked, endian-aware reads over an in-memory image
 */

#include "ossensor/common.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace ossensor::binary {

/// Error codes raised by the format readers; mapped to ExtractionStatus by the extractor
constexpr const char* kTruncatedCode = "Truncated";
constexpr const char* kMalformedCode = "Malformed";

class ByteReader
{
public:
    ByteReader(std::span<const std::uint8_t> data, std::endian order)
        : m_data(data),
          m_order(order)
    {}

    [[nodiscard]] std::size_t size() const { return m_data.size(); }
    [[nodiscard]] std::endian order() const { return m_order; }

    /// True when [offset, offset + length) lies inside the image
    [[nodiscard]] bool contains(std::uint64_t offset, std::uint64_t length) const
    {
        return offset <= m_data.size() && length <= m_data.size() - offset;
    }

    template <typename T>
        requires std::is_integral_v<T>
    [[nodiscard]] ossensor::Result<T> read(std::uint64_t offset, std::string_view what) const
    {
        if (!contains(offset, sizeof(T))) {
            return std::unexpected(Error::make(
                kTruncatedCode,
                std::string(what) + " at offset " + std::to_string(offset) + " extends past end of file"));
        }
        T value{};
        std::memcpy(&value, m_data.data() + offset, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (m_order != std::endian::native) {
                value = std::byteswap(value);
            }
        }
        return value;
    }

    /// Raw copy of a trivially copyable record; fields still need host()
    template <typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] ossensor::Result<T> read_raw(std::uint64_t offset, std::string_view what) const
    {
        if (!contains(offset, sizeof(T))) {
            return std::unexpected(Error::make(
                kTruncatedCode,
                std::string(what) + " at offset " + std::to_string(offset) + " extends past end of file"));
        }
        T value{};
        std::memcpy(&value, m_data.data() + offset, sizeof(T));
        return value;
    }

    /// Convert a field of a read_raw record to host byte order
    template <typename T>
        requires std::is_integral_v<T>
    [[nodiscard]] T host(T value) const
    {
        if constexpr (sizeof(T) > 1) {
            if (m_order != std::endian::native) {
                return std::byteswap(value);
            }
        }
        return value;
    }

    /**
     * NUL-terminated string starting at offset, not reading past limit.
     * @return Malformed when the string runs off the end of its table
     */
    [[nodiscard]] ossensor::Result<std::string> read_cstring(std::uint64_t offset,
                                                             std::uint64_t limit,
                                                             std::string_view what) const
    {
        if (limit > m_data.size()) {
            limit = m_data.size();
        }
        if (offset >= limit) {
            return std::unexpected(Error::make(
                kMalformedCode, std::string(what) + " offset " + std::to_string(offset) + " out of range"));
        }
        const auto* begin = reinterpret_cast<const char*>(m_data.data() + offset);
        const auto max_len = static_cast<std::size_t>(limit - offset);
        const auto* nul = static_cast<const char*>(std::memchr(begin, '\0', max_len));
        if (nul == nullptr) {
            return std::unexpected(
                Error::make(kMalformedCode, std::string(what) + " is not NUL-terminated"));
        }
        // Names end up in JSON; repair any bytes that are not UTF-8
        return common::sanitize_utf8(std::string_view(begin, static_cast<std::size_t>(nul - begin)));
    }

    /// Fixed-width name field (e.g. Mach-O segname), trailing NULs dropped
    [[nodiscard]] ossensor::Result<std::string> read_fixed_name(std::uint64_t offset,
                                                                std::size_t width,
                                                                std::string_view what) const
    {
        if (!contains(offset, width)) {
            return std::unexpected(Error::make(
                kTruncatedCode, std::string(what) + " extends past end of file"));
        }
        const auto* begin = reinterpret_cast<const char*>(m_data.data() + offset);
        std::size_t len = 0;
        while (len < width && begin[len] != '\0') {
            ++len;
        }
        return common::sanitize_utf8(std::string_view(begin, len));
    }

private:
    std::span<const std::uint8_t> m_data;
    std::endian m_order;
};

/// Symbols, imports and ObjC section names read out of one image
struct ParsedImage
{
    struct Symbol
    {
        std::string name;
        std::uint64_t address;
    };

    std::vector<Symbol> symbols;
    std::vector<std::string> imports;
    std::vector<std::string> objc_sections;
    std::vector<std::string> notices;
};

}  // namespace ossensor::binary
