#pragma once

#include "types/image.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace imgen_core::decoding {

    struct ArchiveEntry {
        std::string name;
        std::vector<uint8_t> data;
    };

    /**
     * @brief Reads every file entry of a ZIP archive held in memory.
     *
     * Entries come back in central-directory order. Stored and deflate
     * entries are supported; each entry's CRC-32 is verified. Directory
     * entries are skipped.
     *
     * @throws FormatError if the buffer is not a ZIP archive, is a ZIP64
     *         archive, holds an encrypted entry or an unsupported compression
     *         method, or fails the CRC check
     */
    [[nodiscard]] std::vector<ArchiveEntry> read_archive(std::span<const uint8_t> archive);

    /**
     * @brief Unpacks a legacy generation response, one image per entry,
     * named `<timestamp>_p<index>.png`.
     */
    [[nodiscard]] std::vector<Image> extract_images(std::span<const uint8_t> archive);

    /**
     * @brief First file entry of the archive.
     * @throws FormatError if the archive holds no file
     */
    [[nodiscard]] ArchiveEntry read_first_entry(std::span<const uint8_t> archive);

} // namespace imgen_core::decoding
