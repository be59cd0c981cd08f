/**
 * @file tar_archive.hpp
 * @brief Tar-stream packing for the container runtime's archive copy API
 *
 * The runtime copies files into and out of containers as tar streams only.
 * Pack wraps raw bytes into a single-entry POSIX ustar stream; Unpack takes
 * the first regular file out of a stream returned by the runtime.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>

namespace sandcell {
namespace utils {

/**
 * @class TarArchive
 * @brief Single-entry ustar packing and first-file extraction
 *
 * **Usage Example**:
 * @code
 * auto dir = TarArchive::ParentDirectory("/home/sandbox/data/input.csv");
 * auto stream = TarArchive::Pack("input.csv", file_bytes);
 * client.PutArchive(container, dir, stream);
 *
 * auto bytes = TarArchive::Unpack(client.GetArchive(container, "/tmp/out.txt"));
 * @endcode
 */
class TarArchive {
public:
    static constexpr std::size_t kBlockSize = 512;

    /**
     * @brief Build a tar stream holding one regular file
     *
     * @param file_name Entry name (no directory component)
     * @param data File contents
     * @param mode Permission bits stored in the header
     * @return Complete stream including the two zero end blocks
     *
     * @throws std::invalid_argument if the name is empty or longer than 100 bytes
     */
    static std::string Pack(const std::string& file_name,
                            const std::string& data,
                            std::uint32_t mode = 0644);

    /**
     * @brief Return the bytes of the first entry in a tar stream
     *
     * pax/GNU metadata records are skipped; the first real entry must be a
     * regular file (a directory or link is not extractable).
     *
     * @throws core::ExtractionError if no extractable file is present or a
     *         header fails its checksum
     */
    static std::string Unpack(const std::string& stream);

    /**
     * @brief Directory part of a sandbox path
     *
     * A path with no directory component maps to the sandbox root `/`.
     */
    static std::string ParentDirectory(const std::string& path);

    /**
     * @brief Final path component of a sandbox path
     */
    static std::string BaseName(const std::string& path);
};

} // namespace utils
} // namespace sandcell
