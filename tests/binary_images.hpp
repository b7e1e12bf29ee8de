#pragma once

/**
 * @file binary_images.hpp
 * @brief Minimal ELF64 and Mach-O images assembled in memory for tests
 *
 * Multi-byte fields are written little-endian regardless of host order.
 */

#include <elf.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ossensor::test {

struct ImageSymbol
{
    std::string name;
    std::uint64_t address = 0;
    bool defined = true;  ///< false: undefined reference (an import)
};

class ImageBuffer
{
public:
    [[nodiscard]] std::size_t size() const { return m_bytes.size(); }
    [[nodiscard]] std::vector<std::uint8_t> take() && { return std::move(m_bytes); }

    void grow(std::size_t count) { m_bytes.resize(m_bytes.size() + count, 0); }

    void align(std::size_t alignment)
    {
        while (m_bytes.size() % alignment != 0) {
            m_bytes.push_back(0);
        }
    }

    void append(std::string_view text)
    {
        m_bytes.insert(m_bytes.end(), text.begin(), text.end());
    }

    void append_cstring(std::string_view text)
    {
        append(text);
        m_bytes.push_back(0);
    }

    template <typename T>
    void put_le(std::size_t offset, T value)
    {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            m_bytes[offset + i] = static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> (8 * i)) & 0xffU);
        }
    }

    template <typename T>
    void put_be(std::size_t offset, T value)
    {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            m_bytes[offset + sizeof(T) - 1 - i] =
                static_cast<std::uint8_t>((static_cast<std::uint64_t>(value) >> (8 * i)) & 0xffU);
        }
    }

    template <typename T>
    void push_le(T value)
    {
        const std::size_t at = m_bytes.size();
        grow(sizeof(T));
        put_le(at, value);
    }

    void put_name(std::size_t offset, std::string_view name, std::size_t width)
    {
        for (std::size_t i = 0; i < width && i < name.size(); ++i) {
            m_bytes[offset + i] = static_cast<std::uint8_t>(name[i]);
        }
    }

private:
    std::vector<std::uint8_t> m_bytes;
};

/**
 * ELF64 little-endian shared object with .rodata, .symtab, .strtab and a
 * .dynamic section listing `needed` as DT_NEEDED entries.
 */
[[nodiscard]] inline std::vector<std::uint8_t> make_elf64(const std::vector<ImageSymbol>& symbols,
                                                          const std::vector<std::string>& needed,
                                                          std::string_view rodata)
{
    constexpr std::size_t kEhdrSize = 64;
    constexpr std::size_t kShdrSize = 64;
    constexpr std::size_t kSymSize = 24;
    constexpr std::size_t kDynSize = 16;
    constexpr std::uint16_t kSectionCount = 5;

    ImageBuffer image;
    image.grow(kEhdrSize);

    const std::size_t rodata_offset = image.size();
    image.append_cstring("");
    image.append_cstring(rodata);
    const std::size_t rodata_size = image.size() - rodata_offset;

    const std::size_t strtab_offset = image.size();
    image.append_cstring("");
    std::vector<std::size_t> symbol_names;
    for (const auto& symbol : symbols) {
        symbol_names.push_back(image.size() - strtab_offset);
        image.append_cstring(symbol.name);
    }
    std::vector<std::size_t> needed_names;
    for (const auto& name : needed) {
        needed_names.push_back(image.size() - strtab_offset);
        image.append_cstring(name);
    }
    const std::size_t strtab_size = image.size() - strtab_offset;

    image.align(8);
    const std::size_t symtab_offset = image.size();
    image.grow(kSymSize);  // reserved null symbol
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        const std::size_t at = image.size();
        image.grow(kSymSize);
        image.put_le<std::uint32_t>(at, static_cast<std::uint32_t>(symbol_names[i]));
        image.put_le<std::uint8_t>(at + 4, ELF64_ST_INFO(STB_GLOBAL, STT_FUNC));
        image.put_le<std::uint16_t>(at + 6, symbols[i].defined ? std::uint16_t{1} : std::uint16_t{SHN_UNDEF});
        image.put_le<std::uint64_t>(at + 8, symbols[i].address);
    }
    const std::size_t symtab_size = image.size() - symtab_offset;

    const std::size_t dynamic_offset = image.size();
    for (std::size_t name : needed_names) {
        image.push_le<std::int64_t>(DT_NEEDED);
        image.push_le<std::uint64_t>(name);
    }
    image.push_le<std::int64_t>(DT_NULL);
    image.push_le<std::uint64_t>(0);
    const std::size_t dynamic_size = image.size() - dynamic_offset;

    image.align(8);
    const std::size_t shoff = image.size();
    image.grow(kShdrSize * kSectionCount);
    const auto section = [&](std::size_t index,
                             std::uint32_t type,
                             std::size_t offset,
                             std::size_t size,
                             std::uint32_t link,
                             std::size_t entsize) {
        const std::size_t at = shoff + index * kShdrSize;
        image.put_le<std::uint32_t>(at + 4, type);
        image.put_le<std::uint64_t>(at + 24, offset);
        image.put_le<std::uint64_t>(at + 32, size);
        image.put_le<std::uint32_t>(at + 40, link);
        image.put_le<std::uint64_t>(at + 56, entsize);
    };
    section(1, SHT_PROGBITS, rodata_offset, rodata_size, 0, 0);
    section(2, SHT_SYMTAB, symtab_offset, symtab_size, 3, kSymSize);
    section(3, SHT_STRTAB, strtab_offset, strtab_size, 0, 0);
    section(4, SHT_DYNAMIC, dynamic_offset, dynamic_size, 3, kDynSize);

    image.put_name(0, ELFMAG, SELFMAG);
    image.put_le<std::uint8_t>(EI_CLASS, ELFCLASS64);
    image.put_le<std::uint8_t>(EI_DATA, ELFDATA2LSB);
    image.put_le<std::uint8_t>(EI_VERSION, EV_CURRENT);
    image.put_le<std::uint16_t>(16, ET_DYN);
    image.put_le<std::uint16_t>(18, EM_X86_64);
    image.put_le<std::uint32_t>(20, EV_CURRENT);
    image.put_le<std::uint64_t>(40, shoff);
    image.put_le<std::uint16_t>(52, kEhdrSize);
    image.put_le<std::uint16_t>(58, kShdrSize);
    image.put_le<std::uint16_t>(60, kSectionCount);
    return std::move(image).take();
}

/**
 * Thin 64-bit little-endian Mach-O executable: an LC_SEGMENT_64 (with an
 * __objc_classlist section when `objc` is set), one LC_LOAD_DYLIB per
 * dylib and an LC_SYMTAB. `cstrings` is appended after the string table.
 */
[[nodiscard]] inline std::vector<std::uint8_t> make_macho64(const std::vector<ImageSymbol>& symbols,
                                                            const std::vector<std::string>& dylibs,
                                                            std::string_view cstrings,
                                                            bool objc)
{
    constexpr std::size_t kHeaderSize = 32;
    constexpr std::size_t kSegmentSize = 72;
    constexpr std::size_t kSectionSize = 80;
    constexpr std::size_t kSymtabCmdSize = 24;
    constexpr std::size_t kNlistSize = 16;

    const std::size_t segment_cmd_size = kSegmentSize + (objc ? kSectionSize : 0);
    std::vector<std::size_t> dylib_cmd_sizes;
    std::size_t sizeofcmds = segment_cmd_size + kSymtabCmdSize;
    for (const auto& dylib : dylibs) {
        const std::size_t size = (24 + dylib.size() + 1 + 7) / 8 * 8;
        dylib_cmd_sizes.push_back(size);
        sizeofcmds += size;
    }

    ImageBuffer image;
    image.grow(kHeaderSize + sizeofcmds);
    image.put_le<std::uint32_t>(0, 0xfeedfacfU);
    image.put_le<std::uint32_t>(4, 0x01000007U);  // x86_64
    image.put_le<std::uint32_t>(8, 3);
    image.put_le<std::uint32_t>(12, 2);           // executable
    image.put_le<std::uint32_t>(16, static_cast<std::uint32_t>(2 + dylibs.size()));
    image.put_le<std::uint32_t>(20, static_cast<std::uint32_t>(sizeofcmds));

    std::size_t cmd = kHeaderSize;
    image.put_le<std::uint32_t>(cmd, 0x19);  // LC_SEGMENT_64
    image.put_le<std::uint32_t>(cmd + 4, static_cast<std::uint32_t>(segment_cmd_size));
    image.put_name(cmd + 8, "__DATA", 16);
    image.put_le<std::uint32_t>(cmd + 64, objc ? 1U : 0U);
    if (objc) {
        const std::size_t sect = cmd + kSegmentSize;
        image.put_name(sect, "__objc_classlist", 16);
        image.put_name(sect + 16, "__DATA", 16);
    }
    cmd += segment_cmd_size;

    for (std::size_t i = 0; i < dylibs.size(); ++i) {
        image.put_le<std::uint32_t>(cmd, 0xc);  // LC_LOAD_DYLIB
        image.put_le<std::uint32_t>(cmd + 4, static_cast<std::uint32_t>(dylib_cmd_sizes[i]));
        image.put_le<std::uint32_t>(cmd + 8, 24);
        image.put_name(cmd + 24, dylibs[i], dylibs[i].size());
        cmd += dylib_cmd_sizes[i];
    }

    const std::size_t symtab_cmd = cmd;
    image.put_le<std::uint32_t>(symtab_cmd, 0x2);  // LC_SYMTAB
    image.put_le<std::uint32_t>(symtab_cmd + 4, kSymtabCmdSize);

    const std::size_t symoff = image.size();
    image.grow(kNlistSize * symbols.size());
    const std::size_t stroff = image.size();
    image.append_cstring(" ");
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        const std::size_t entry = symoff + i * kNlistSize;
        image.put_le<std::uint32_t>(entry, static_cast<std::uint32_t>(image.size() - stroff));
        image.put_le<std::uint8_t>(entry + 4, symbols[i].defined ? 0x0f : 0x01);  // N_SECT|N_EXT or N_UNDF|N_EXT
        image.put_le<std::uint8_t>(entry + 5, symbols[i].defined ? 1 : 0);
        image.put_le<std::uint64_t>(entry + 8, symbols[i].address);
        image.append_cstring(symbols[i].name);
    }
    const std::size_t strsize = image.size() - stroff;

    image.put_le<std::uint32_t>(symtab_cmd + 8, static_cast<std::uint32_t>(symoff));
    image.put_le<std::uint32_t>(symtab_cmd + 12, static_cast<std::uint32_t>(symbols.size()));
    image.put_le<std::uint32_t>(symtab_cmd + 16, static_cast<std::uint32_t>(stroff));
    image.put_le<std::uint32_t>(symtab_cmd + 20, static_cast<std::uint32_t>(strsize));

    image.append_cstring(cstrings);
    return std::move(image).take();
}

/// Universal binary holding `slice` as its only architecture
[[nodiscard]] inline std::vector<std::uint8_t> make_fat(const std::vector<std::uint8_t>& slice)
{
    constexpr std::size_t kSliceOffset = 64;
    ImageBuffer image;
    image.grow(kSliceOffset);
    image.put_be<std::uint32_t>(0, 0xcafebabeU);
    image.put_be<std::uint32_t>(4, 1);
    image.put_be<std::uint32_t>(8, 0x01000007U);
    image.put_be<std::uint32_t>(12, 3);
    image.put_be<std::uint32_t>(16, static_cast<std::uint32_t>(kSliceOffset));
    image.put_be<std::uint32_t>(20, static_cast<std::uint32_t>(slice.size()));
    image.put_be<std::uint32_t>(24, 3);
    std::vector<std::uint8_t> bytes = std::move(image).take();
    bytes.insert(bytes.end(), slice.begin(), slice.end());
    return bytes;
}

}  // namespace ossensor::test
