#pragma once

/**
 * @file elf_reader.hpp
 * @brief ELF symbol / dependency reader (32/64-bit, either byte order)
 */

#include "byte_reader.hpp"

#include <cstdint>
#include <span>

namespace ossensor::binary {

/// "\x7f" "ELF" magic check
[[nodiscard]] bool has_elf_magic(std::span<const std::uint8_t> data);

/**
 * Read defined symbols (.symtab, falling back to .dynsym), undefined symbols
 * and DT_NEEDED entries as imports.
 * @return Error with kTruncatedCode or kMalformedCode
 */
[[nodiscard]] ossensor::Result<ParsedImage> parse_elf(std::span<const std::uint8_t> data);

}  // namespace ossensor::binary
