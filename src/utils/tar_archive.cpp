/**
 * @file tar_archive.cpp
 * @brief POSIX ustar encoding and decoding
 *
 * **Header Layout** (512 bytes, offsets in bytes):
 * ```
 *   0 name[100]   100 mode[8]    108 uid[8]     116 gid[8]
 * 124 size[12]    136 mtime[12]  148 chksum[8]  156 typeflag
 * 157 linkname    257 magic[6]   263 version[2] 265 uname[32]
 * 297 gname[32]   345 prefix[155]
 * ```
 * Numeric fields are NUL-terminated octal. Sizes too large for octal use the
 * GNU base-256 form (high bit of the first byte set), which the runtime
 * emits for very large files.
 *
 * @date 2025
 */

#include "sandcell/utils/tar_archive.hpp"
#include "sandcell/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace sandcell {
namespace utils {

namespace {

constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;

void WriteOctal(std::string& header, std::size_t offset, std::size_t width,
                std::uint64_t value) {
    // width includes the terminating NUL
    std::string digits(width - 1, '0');
    for (std::size_t i = width - 1; i > 0; --i) {
        digits[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
    std::memcpy(&header[offset], digits.data(), digits.size());
    header[offset + width - 1] = '\0';
}

std::uint64_t ParseNumeric(const char* field, std::size_t width) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(field);
    if (bytes[0] & 0x80) {
        std::uint64_t value = bytes[0] & 0x7F;
        for (std::size_t i = 1; i < width; ++i) {
            value = (value << 8) | bytes[i];
        }
        return value;
    }

    std::uint64_t value = 0;
    std::size_t i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < width && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<std::uint64_t>(field[i] - '0');
    }
    return value;
}

std::uint32_t ComputeChecksum(const char* block) {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < TarArchive::kBlockSize; ++i) {
        bool in_checksum = i >= kChecksumOffset && i < kChecksumOffset + 8;
        sum += in_checksum ? static_cast<unsigned char>(' ')
                           : static_cast<unsigned char>(block[i]);
    }
    return sum;
}

bool IsZeroBlock(const char* block) {
    return std::all_of(block, block + TarArchive::kBlockSize,
                       [](char c) { return c == '\0'; });
}

std::size_t PaddedSize(std::uint64_t size) {
    return static_cast<std::size_t>(
        (size + TarArchive::kBlockSize - 1) / TarArchive::kBlockSize * TarArchive::kBlockSize);
}

} // anonymous namespace

// ============================================================================
// PACKING
// ============================================================================

std::string TarArchive::Pack(const std::string& file_name,
                             const std::string& data,
                             std::uint32_t mode) {
    if (file_name.empty() || file_name.size() > 100) {
        throw std::invalid_argument("Tar entry name must be 1-100 bytes: '" + file_name + "'");
    }

    std::string header(kBlockSize, '\0');
    std::memcpy(&header[kNameOffset], file_name.data(), file_name.size());
    WriteOctal(header, kModeOffset, 8, mode);
    WriteOctal(header, kUidOffset, 8, 0);
    WriteOctal(header, kGidOffset, 8, 0);
    WriteOctal(header, kSizeOffset, 12, data.size());

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    WriteOctal(header, kMtimeOffset, 12, static_cast<std::uint64_t>(now));

    header[kTypeOffset] = '0';
    std::memcpy(&header[kMagicOffset], "ustar", 6);
    std::memcpy(&header[kVersionOffset], "00", 2);

    std::uint32_t checksum = ComputeChecksum(header.data());
    WriteOctal(header, kChecksumOffset, 7, checksum);
    header[kChecksumOffset + 7] = ' ';

    std::string stream;
    stream.reserve(kBlockSize + PaddedSize(data.size()) + 2 * kBlockSize);
    stream += header;
    stream += data;
    stream.append(PaddedSize(data.size()) - data.size(), '\0');
    stream.append(2 * kBlockSize, '\0');

    spdlog::debug("Packed '{}' ({} bytes) into {} byte tar stream",
                  file_name, data.size(), stream.size());
    return stream;
}

// ============================================================================
// UNPACKING
// ============================================================================

std::string TarArchive::Unpack(const std::string& stream) {
    std::size_t offset = 0;

    while (offset + kBlockSize <= stream.size()) {
        const char* block = stream.data() + offset;

        if (IsZeroBlock(block)) {
            break;
        }

        std::uint32_t stored = static_cast<std::uint32_t>(
            ParseNumeric(block + kChecksumOffset, 8));
        if (stored != ComputeChecksum(block)) {
            throw core::ExtractionError("Corrupt tar header at offset " + std::to_string(offset));
        }

        std::uint64_t size = ParseNumeric(block + kSizeOffset, 12);
        char type = block[kTypeOffset];
        std::size_t data_offset = offset + kBlockSize;
        // Compare against what remains so a huge base-256 size cannot wrap
        if (size > stream.size() - data_offset) {
            throw core::ExtractionError("Truncated tar entry");
        }

        // pax and GNU long-name records describe the entry that follows them
        if (type == 'x' || type == 'g' || type == 'L' || type == 'K') {
            spdlog::debug("Skipping tar metadata entry of type '{}'", type);
            offset = data_offset + PaddedSize(size);
            continue;
        }

        if (type != '0' && type != '\0' && type != '7') {
            throw core::ExtractionError(
                std::string("First archive entry is not a regular file (type '") + type + "')");
        }
        return stream.substr(data_offset, static_cast<std::size_t>(size));
    }

    throw core::ExtractionError("Archive contains no extractable file");
}

// ============================================================================
// PATH HELPERS
// ============================================================================

std::string TarArchive::ParentDirectory(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

std::string TarArchive::BaseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // namespace utils
} // namespace sandcell
