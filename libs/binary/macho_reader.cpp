/**
 * @file macho_reader.cpp
 * @brief Mach-O load command walk
 *
 * Layout constants follow <mach-o/loader.h>, <mach-o/nlist.h> and
 * <mach-o/fat.h>, which are not available on non-Apple hosts.
 */

#include "macho_reader.hpp"

#include <string>
#include <vector>

namespace ossensor::binary {

namespace {

constexpr std::uint32_t kMhMagic = 0xfeedfaceU;
constexpr std::uint32_t kMhCigam = 0xcefaedfeU;
constexpr std::uint32_t kMhMagic64 = 0xfeedfacfU;
constexpr std::uint32_t kMhCigam64 = 0xcffaedfeU;
constexpr std::uint32_t kFatMagic = 0xcafebabeU;
// Java class files put their major version (45 and up) where nfat_arch sits
constexpr std::uint32_t kMaxFatSlices = 20;

constexpr std::uint32_t kLcSegment = 0x1;
constexpr std::uint32_t kLcSymtab = 0x2;
constexpr std::uint32_t kLcLoadDylib = 0xc;
constexpr std::uint32_t kLcSegment64 = 0x19;
constexpr std::uint32_t kLcLazyLoadDylib = 0x20;
constexpr std::uint32_t kLcLoadWeakDylib = 0x80000018U;
constexpr std::uint32_t kLcReexportDylib = 0x8000001fU;
constexpr std::uint32_t kLcLoadUpwardDylib = 0x80000023U;

constexpr std::uint8_t kNStab = 0xe0;
constexpr std::uint8_t kNType = 0x0e;
constexpr std::uint8_t kNExt = 0x01;
constexpr std::uint8_t kNUndf = 0x0;
constexpr std::uint8_t kNSect = 0xe;

constexpr std::uint64_t kFatHeaderSize = 8;
constexpr std::uint64_t kFatArchSize = 20;

/// Width-dependent layout of a thin image
struct ThinLayout
{
    bool is_64;
    std::uint64_t header_size;   ///< mach_header / mach_header_64
    std::uint64_t nlist_size;    ///< nlist / nlist_64
    std::uint64_t segment_size;  ///< segment_command / segment_command_64
    std::uint64_t nsects_offset;
    std::uint64_t section_size;  ///< section / section_64
};

constexpr ThinLayout kLayout32{.is_64 = false,
                               .header_size = 28,
                               .nlist_size = 12,
                               .segment_size = 56,
                               .nsects_offset = 48,
                               .section_size = 68};
constexpr ThinLayout kLayout64{.is_64 = true,
                               .header_size = 32,
                               .nlist_size = 16,
                               .segment_size = 72,
                               .nsects_offset = 64,
                               .section_size = 80};

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(kMalformedCode, std::move(message));
}

[[nodiscard]] Error truncated(std::string message)
{
    return Error::make(kTruncatedCode, std::move(message));
}

[[nodiscard]] std::uint32_t big_endian_magic(std::span<const std::uint8_t> data)
{
    return (static_cast<std::uint32_t>(data[0]) << 24U) | (static_cast<std::uint32_t>(data[1]) << 16U)
           | (static_cast<std::uint32_t>(data[2]) << 8U) | static_cast<std::uint32_t>(data[3]);
}

[[nodiscard]] ossensor::VoidResult read_symtab(const ByteReader& reader,
                                               const ThinLayout& layout,
                                               std::uint64_t cmd_offset,
                                               ParsedImage& image)
{
    auto symoff = reader.read<std::uint32_t>(cmd_offset + 8, "symoff");
    auto nsyms = reader.read<std::uint32_t>(cmd_offset + 12, "nsyms");
    auto stroff = reader.read<std::uint32_t>(cmd_offset + 16, "stroff");
    auto strsize = reader.read<std::uint32_t>(cmd_offset + 20, "strsize");
    if (!symoff || !nsyms || !stroff || !strsize) {
        return std::unexpected(truncated("symtab command extends past end of file"));
    }
    if (!reader.contains(*stroff, *strsize)) {
        return std::unexpected(truncated("string table extends past end of file"));
    }
    if (!reader.contains(*symoff, static_cast<std::uint64_t>(*nsyms) * layout.nlist_size)) {
        return std::unexpected(truncated("symbol table extends past end of file"));
    }

    const std::uint64_t str_end = static_cast<std::uint64_t>(*stroff) + *strsize;
    for (std::uint64_t i = 0; i < *nsyms; ++i) {
        const std::uint64_t entry = *symoff + i * layout.nlist_size;
        auto strx = reader.read<std::uint32_t>(entry, "n_strx");
        auto type = reader.read<std::uint8_t>(entry + 4, "n_type");
        if (!strx || !type) {
            return std::unexpected(truncated("nlist entry extends past end of file"));
        }
        if ((*type & kNStab) != 0 || *strx == 0) {
            continue;
        }
        std::uint64_t value = 0;
        if (layout.is_64) {
            auto v = reader.read<std::uint64_t>(entry + 8, "n_value");
            if (!v) {
                return std::unexpected(v.error());
            }
            value = *v;
        } else {
            auto v = reader.read<std::uint32_t>(entry + 8, "n_value");
            if (!v) {
                return std::unexpected(v.error());
            }
            value = *v;
        }

        auto name = reader.read_cstring(static_cast<std::uint64_t>(*stroff) + *strx, str_end, "symbol name");
        if (!name) {
            return std::unexpected(name.error());
        }
        if (name->empty()) {
            continue;
        }
        const std::uint8_t kind = *type & kNType;
        if (kind == kNSect) {
            image.symbols.push_back(ParsedImage::Symbol{.name = std::move(*name), .address = value});
        } else if (kind == kNUndf && (*type & kNExt) != 0) {
            image.imports.push_back(std::move(*name));
        }
    }
    return {};
}

[[nodiscard]] ossensor::VoidResult read_dylib(const ByteReader& reader,
                                              std::uint64_t cmd_offset,
                                              std::uint32_t cmd_size,
                                              ParsedImage& image)
{
    auto name_offset = reader.read<std::uint32_t>(cmd_offset + 8, "dylib name offset");
    if (!name_offset) {
        return std::unexpected(name_offset.error());
    }
    if (*name_offset >= cmd_size) {
        return std::unexpected(malformed("dylib name offset outside its load command"));
    }
    auto name = reader.read_cstring(cmd_offset + *name_offset, cmd_offset + cmd_size, "dylib name");
    if (!name) {
        return std::unexpected(name.error());
    }
    image.imports.push_back(std::move(*name));
    return {};
}

[[nodiscard]] ossensor::VoidResult read_segment(const ByteReader& reader,
                                                const ThinLayout& layout,
                                                std::uint64_t cmd_offset,
                                                std::uint32_t cmd_size,
                                                ParsedImage& image)
{
    auto nsects = reader.read<std::uint32_t>(cmd_offset + layout.nsects_offset, "nsects");
    if (!nsects) {
        return std::unexpected(nsects.error());
    }
    if (layout.segment_size + static_cast<std::uint64_t>(*nsects) * layout.section_size > cmd_size) {
        return std::unexpected(malformed("segment sections exceed their load command"));
    }
    for (std::uint64_t i = 0; i < *nsects; ++i) {
        const std::uint64_t section = cmd_offset + layout.segment_size + i * layout.section_size;
        auto sectname = reader.read_fixed_name(section, 16, "sectname");
        auto segname = reader.read_fixed_name(section + 16, 16, "segname");
        if (!sectname || !segname) {
            return std::unexpected(truncated("section header extends past end of file"));
        }
        if (sectname->starts_with("__objc_")) {
            image.objc_sections.push_back(*segname + "," + *sectname);
        }
    }
    return {};
}

[[nodiscard]] ossensor::Result<ParsedImage> parse_thin(std::span<const std::uint8_t> data)
{
    if (data.size() < 4) {
        return std::unexpected(truncated("Mach-O magic truncated"));
    }
    const std::uint32_t magic = big_endian_magic(data);
    const bool is_64 = magic == kMhMagic64 || magic == kMhCigam64;
    const bool big = magic == kMhMagic || magic == kMhMagic64;
    const ThinLayout& layout = is_64 ? kLayout64 : kLayout32;
    const ByteReader reader(data, big ? std::endian::big : std::endian::little);

    if (!reader.contains(0, layout.header_size)) {
        return std::unexpected(truncated("Mach-O header truncated (" + std::to_string(data.size())
                                         + " of " + std::to_string(layout.header_size) + " bytes)"));
    }
    auto ncmds = reader.read<std::uint32_t>(16, "ncmds");
    auto sizeofcmds = reader.read<std::uint32_t>(20, "sizeofcmds");
    if (!ncmds || !sizeofcmds) {
        return std::unexpected(truncated("Mach-O header truncated"));
    }
    if (!reader.contains(layout.header_size, *sizeofcmds)) {
        return std::unexpected(truncated("load commands extend past end of file"));
    }
    if (static_cast<std::uint64_t>(*ncmds) * 8 > *sizeofcmds) {
        return std::unexpected(malformed("ncmds does not fit in sizeofcmds"));
    }

    ParsedImage image;
    const std::uint64_t cmds_end = layout.header_size + *sizeofcmds;
    std::uint64_t offset = layout.header_size;
    for (std::uint32_t k = 0; k < *ncmds; ++k) {
        auto cmd = reader.read<std::uint32_t>(offset, "cmd");
        auto cmd_size = reader.read<std::uint32_t>(offset + 4, "cmdsize");
        if (!cmd || !cmd_size) {
            return std::unexpected(truncated("load command header truncated"));
        }
        if (*cmd_size < 8 || offset + *cmd_size > cmds_end) {
            return std::unexpected(malformed("load command " + std::to_string(k) + " has invalid size"));
        }

        ossensor::VoidResult step;
        switch (*cmd) {
            case kLcSymtab:
                step = read_symtab(reader, layout, offset, image);
                break;
            case kLcLoadDylib:
            case kLcLoadWeakDylib:
            case kLcReexportDylib:
            case kLcLazyLoadDylib:
            case kLcLoadUpwardDylib:
                step = read_dylib(reader, offset, *cmd_size, image);
                break;
            case kLcSegment:
            case kLcSegment64:
                step = read_segment(reader, layout, offset, *cmd_size, image);
                break;
            default:
                break;
        }
        if (!step) {
            return std::unexpected(step.error());
        }
        offset += *cmd_size;
    }
    return image;
}

}  // namespace

std::optional<MachOKind> detect_macho(std::span<const std::uint8_t> data)
{
    if (data.size() < 4) {
        return std::nullopt;
    }
    const std::uint32_t magic = big_endian_magic(data);
    if (magic == kMhMagic || magic == kMhCigam || magic == kMhMagic64 || magic == kMhCigam64) {
        return MachOKind::kThin;
    }
    if (magic == kFatMagic) {
        if (data.size() < kFatHeaderSize) {
            return MachOKind::kFat;
        }
        const ByteReader reader(data, std::endian::big);
        auto nfat = reader.read<std::uint32_t>(4, "nfat_arch");
        if (nfat && *nfat > 0 && *nfat <= kMaxFatSlices) {
            return MachOKind::kFat;
        }
    }
    return std::nullopt;
}

ossensor::Result<ParsedImage> parse_macho(std::span<const std::uint8_t> data)
{
    const auto kind = detect_macho(data);
    if (!kind) {
        return std::unexpected(malformed("not a Mach-O image"));
    }
    if (*kind == MachOKind::kThin) {
        return parse_thin(data);
    }

    // Fat headers are always big-endian
    const ByteReader reader(data, std::endian::big);
    auto nfat = reader.read<std::uint32_t>(4, "nfat_arch");
    if (!nfat) {
        return std::unexpected(truncated("fat header truncated"));
    }
    auto cputype = reader.read<std::uint32_t>(kFatHeaderSize, "fat_arch.cputype");
    auto slice_offset = reader.read<std::uint32_t>(kFatHeaderSize + 8, "fat_arch.offset");
    auto slice_size = reader.read<std::uint32_t>(kFatHeaderSize + 12, "fat_arch.size");
    if (!cputype || !slice_offset || !slice_size
        || !reader.contains(kFatHeaderSize, static_cast<std::uint64_t>(*nfat) * kFatArchSize)) {
        return std::unexpected(truncated("fat_arch table extends past end of file"));
    }
    if (!reader.contains(*slice_offset, *slice_size)) {
        return std::unexpected(truncated("fat slice 0 extends past end of file"));
    }

    auto slice = data.subspan(*slice_offset, *slice_size);
    if (auto inner = detect_macho(slice); !inner || *inner != MachOKind::kThin) {
        return std::unexpected(malformed("fat slice 0 is not a thin Mach-O image"));
    }
    auto image = parse_thin(slice);
    if (!image) {
        return std::unexpected(image.error());
    }
    image->notices.push_back("fat archive with " + std::to_string(*nfat)
                             + " slices; features read from slice 0 (cputype "
                             + std::to_string(*cputype) + ")");
    return image;
}

}  // namespace ossensor::binary
