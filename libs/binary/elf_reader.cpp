/**
 * @file elf_reader.cpp
 * @brief ELF section, symbol table and dynamic section walk
 */

#include "elf_reader.hpp"

#include <elf.h>

#include <optional>
#include <string>
#include <vector>

namespace ossensor::binary {

namespace {

struct Elf32Layout
{
    using Ehdr = Elf32_Ehdr;
    using Shdr = Elf32_Shdr;
    using Sym = Elf32_Sym;
    using Dyn = Elf32_Dyn;
};

struct Elf64Layout
{
    using Ehdr = Elf64_Ehdr;
    using Shdr = Elf64_Shdr;
    using Sym = Elf64_Sym;
    using Dyn = Elf64_Dyn;
};

/// Section header fields in host order
struct Section
{
    std::uint32_t type;
    std::uint64_t offset;
    std::uint64_t size;
    std::uint32_t link;
};

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(kMalformedCode, std::move(message));
}

[[nodiscard]] Error truncated(std::string message)
{
    return Error::make(kTruncatedCode, std::move(message));
}

/// Section data must lie inside the file (SHT_NOBITS has none)
[[nodiscard]] ossensor::VoidResult check_section_data(const ByteReader& reader,
                                                      const Section& section,
                                                      std::string_view what)
{
    if (section.type != SHT_NOBITS && !reader.contains(section.offset, section.size)) {
        return std::unexpected(truncated(std::string(what) + " data extends past end of file"));
    }
    return {};
}

template <typename Layout>
[[nodiscard]] ossensor::Result<std::vector<Section>> read_sections(const ByteReader& reader,
                                                                   const typename Layout::Ehdr& ehdr)
{
    using Shdr = typename Layout::Shdr;
    const std::uint64_t shoff = reader.host(ehdr.e_shoff);
    const std::uint64_t shnum = reader.host(ehdr.e_shnum);
    const std::uint64_t shentsize = reader.host(ehdr.e_shentsize);

    std::vector<Section> sections;
    if (shoff == 0 || shnum == 0) {
        return sections;
    }
    if (shentsize != sizeof(Shdr)) {
        return std::unexpected(malformed("unexpected section header size " + std::to_string(shentsize)));
    }
    if (!reader.contains(shoff, shnum * sizeof(Shdr))) {
        return std::unexpected(truncated("section header table extends past end of file"));
    }

    sections.reserve(static_cast<std::size_t>(shnum));
    for (std::uint64_t i = 0; i < shnum; ++i) {
        auto shdr = reader.read_raw<Shdr>(shoff + i * sizeof(Shdr), "section header");
        if (!shdr) {
            return std::unexpected(shdr.error());
        }
        sections.push_back(Section{.type = reader.host(shdr->sh_type),
                                   .offset = reader.host(shdr->sh_offset),
                                   .size = reader.host(shdr->sh_size),
                                   .link = reader.host(shdr->sh_link)});
    }
    return sections;
}

[[nodiscard]] ossensor::Result<const Section*> linked_string_table(const std::vector<Section>& sections,
                                                                   const Section& owner,
                                                                   std::string_view what)
{
    if (owner.link >= sections.size() || sections[owner.link].type != SHT_STRTAB) {
        return std::unexpected(malformed(std::string(what) + " links to an invalid string table"));
    }
    return &sections[owner.link];
}

template <typename Layout>
[[nodiscard]] ossensor::VoidResult read_symbols(const ByteReader& reader,
                                                const std::vector<Section>& sections,
                                                ParsedImage& image)
{
    using Sym = typename Layout::Sym;

    const Section* table = nullptr;
    for (const auto& section : sections) {
        if (section.type == SHT_SYMTAB) {
            table = &section;
            break;
        }
    }
    if (table == nullptr) {
        for (const auto& section : sections) {
            if (section.type == SHT_DYNSYM) {
                table = &section;
                image.notices.emplace_back("no .symtab; symbols read from .dynsym");
                break;
            }
        }
    }
    if (table == nullptr) {
        image.notices.emplace_back("no symbol table");
        return {};
    }

    auto strtab = linked_string_table(sections, *table, "symbol table");
    if (!strtab) {
        return std::unexpected(strtab.error());
    }
    if (auto checked = check_section_data(reader, *table, "symbol table"); !checked) {
        return checked;
    }
    if (auto checked = check_section_data(reader, **strtab, "string table"); !checked) {
        return checked;
    }

    const std::uint64_t str_begin = (*strtab)->offset;
    const std::uint64_t str_end = str_begin + (*strtab)->size;
    const std::uint64_t count = table->size / sizeof(Sym);
    // Index 0 is the reserved null symbol
    for (std::uint64_t i = 1; i < count; ++i) {
        auto sym = reader.read_raw<Sym>(table->offset + i * sizeof(Sym), "symbol");
        if (!sym) {
            return std::unexpected(sym.error());
        }
        const std::uint32_t name_offset = reader.host(sym->st_name);
        const unsigned type = static_cast<unsigned>(sym->st_info) & 0x0fU;
        if (name_offset == 0 || type == STT_SECTION || type == STT_FILE) {
            continue;
        }
        auto name = reader.read_cstring(str_begin + name_offset, str_end, "symbol name");
        if (!name) {
            return std::unexpected(name.error());
        }
        if (name->empty()) {
            continue;
        }
        if (reader.host(sym->st_shndx) == SHN_UNDEF) {
            image.imports.push_back(std::move(*name));
        } else {
            image.symbols.push_back(
                ParsedImage::Symbol{.name = std::move(*name),
                                    .address = static_cast<std::uint64_t>(reader.host(sym->st_value))});
        }
    }
    return {};
}

template <typename Layout>
[[nodiscard]] ossensor::VoidResult read_needed(const ByteReader& reader,
                                               const std::vector<Section>& sections,
                                               ParsedImage& image)
{
    using Dyn = typename Layout::Dyn;

    for (const auto& section : sections) {
        if (section.type != SHT_DYNAMIC) {
            continue;
        }
        auto strtab = linked_string_table(sections, section, "dynamic section");
        if (!strtab) {
            return std::unexpected(strtab.error());
        }
        if (auto checked = check_section_data(reader, section, "dynamic section"); !checked) {
            return checked;
        }
        if (auto checked = check_section_data(reader, **strtab, "dynamic string table"); !checked) {
            return checked;
        }
        const std::uint64_t str_begin = (*strtab)->offset;
        const std::uint64_t str_end = str_begin + (*strtab)->size;
        const std::uint64_t count = section.size / sizeof(Dyn);
        for (std::uint64_t i = 0; i < count; ++i) {
            auto dyn = reader.read_raw<Dyn>(section.offset + i * sizeof(Dyn), "dynamic entry");
            if (!dyn) {
                return std::unexpected(dyn.error());
            }
            const auto tag = reader.host(dyn->d_tag);
            if (tag == DT_NULL) {
                break;
            }
            if (tag != DT_NEEDED) {
                continue;
            }
            auto name = reader.read_cstring(str_begin + reader.host(dyn->d_un.d_val),
                                            str_end,
                                            "DT_NEEDED name");
            if (!name) {
                return std::unexpected(name.error());
            }
            image.imports.push_back(std::move(*name));
        }
    }
    return {};
}

template <typename Layout>
[[nodiscard]] ossensor::Result<ParsedImage> parse_elf_image(const ByteReader& reader)
{
    auto ehdr = reader.read_raw<typename Layout::Ehdr>(0, "ELF header");
    if (!ehdr) {
        return std::unexpected(ehdr.error());
    }
    auto sections = read_sections<Layout>(reader, *ehdr);
    if (!sections) {
        return std::unexpected(sections.error());
    }

    ParsedImage image;
    if (sections->empty()) {
        image.notices.emplace_back("no section header table");
        return image;
    }
    if (auto result = read_symbols<Layout>(reader, *sections, image); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = read_needed<Layout>(reader, *sections, image); !result) {
        return std::unexpected(result.error());
    }
    return image;
}

}  // namespace

bool has_elf_magic(std::span<const std::uint8_t> data)
{
    return data.size() >= 4 && data[EI_MAG0] == ELFMAG0 && data[EI_MAG1] == ELFMAG1
           && data[EI_MAG2] == ELFMAG2 && data[EI_MAG3] == ELFMAG3;
}

ossensor::Result<ParsedImage> parse_elf(std::span<const std::uint8_t> data)
{
    if (data.size() < EI_NIDENT) {
        return std::unexpected(truncated("ELF identification truncated ("
                                         + std::to_string(data.size()) + " bytes)"));
    }

    std::endian order{};
    switch (data[EI_DATA]) {
        case ELFDATA2LSB:
            order = std::endian::little;
            break;
        case ELFDATA2MSB:
            order = std::endian::big;
            break;
        default:
            return std::unexpected(malformed("invalid ELF data encoding"));
    }

    const ByteReader reader(data, order);
    switch (data[EI_CLASS]) {
        case ELFCLASS32:
            return parse_elf_image<Elf32Layout>(reader);
        case ELFCLASS64:
            return parse_elf_image<Elf64Layout>(reader);
        default:
            return std::unexpected(malformed("invalid ELF class"));
    }
}

}  // namespace ossensor::binary
