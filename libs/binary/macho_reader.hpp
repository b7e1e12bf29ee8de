#pragma once

/**
 * @file macho_reader.hpp
 * @brief Mach-O reader (thin 32/64-bit in either byte order, and fat archives)
 */

#include "byte_reader.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace ossensor::binary {

enum class MachOKind { kThin, kFat };

/**
 * Classify by magic. Fat archives share 0xcafebabe with Java class files,
 * so an implausible slice count is not reported as Mach-O.
 */
[[nodiscard]] std::optional<MachOKind> detect_macho(std::span<const std::uint8_t> data);

/**
 * Read LC_SYMTAB symbols and imports, dylib load commands and __objc_* sections.
 * Fat archives are read from their first slice.
 * @return Error with kTruncatedCode or kMalformedCode
 */
[[nodiscard]] ossensor::Result<ParsedImage> parse_macho(std::span<const std::uint8_t> data);

}  // namespace ossensor::binary
