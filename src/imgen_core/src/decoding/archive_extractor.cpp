#include "decoding/archive_extractor.hpp"
#include "decoding/image_format.hpp"
#include "utils/timestamp.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <zlib.h>

namespace imgen_core::decoding {

    namespace {

        constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
        constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
        constexpr uint32_t END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;
        constexpr uint32_t ZIP64_LOCATOR_SIGNATURE = 0x07064b50;

        constexpr size_t LOCAL_HEADER_SIZE = 30;
        constexpr size_t CENTRAL_HEADER_SIZE = 46;
        constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;
        constexpr size_t ZIP64_LOCATOR_SIZE = 20;
        constexpr size_t MAX_COMMENT_SIZE = 0xFFFF;

        constexpr uint16_t METHOD_STORED = 0;
        constexpr uint16_t METHOD_DEFLATE = 8;
        constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

        uint16_t read_le16(std::span<const uint8_t> bytes, size_t offset) {
            return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
        }

        uint32_t read_le32(std::span<const uint8_t> bytes, size_t offset) {
            return static_cast<uint32_t>(bytes[offset]) |
                   (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
                   (static_cast<uint32_t>(bytes[offset + 2]) << 16) |
                   (static_cast<uint32_t>(bytes[offset + 3]) << 24);
        }

        void require(std::span<const uint8_t> bytes, size_t offset, size_t size, const char* what) {
            if (offset > bytes.size() || size > bytes.size() - offset) {
                throw FormatError(fmt::format("ZIP archive truncated: {} at offset {}", what, offset));
            }
        }

        struct CentralEntry {
            std::string name;
            uint16_t flags;
            uint16_t method;
            uint32_t crc;
            uint32_t compressed_size;
            uint32_t uncompressed_size;
            uint32_t local_header_offset;
        };

        struct DirectoryLocation {
            uint16_t entry_count;
            uint32_t offset;
            uint32_t size;
        };

        DirectoryLocation find_central_directory(std::span<const uint8_t> archive) {
            if (archive.size() < END_OF_CENTRAL_DIR_SIZE) {
                throw FormatError("Response is not a ZIP archive");
            }

            const size_t last = archive.size() - END_OF_CENTRAL_DIR_SIZE;
            const size_t first = last > MAX_COMMENT_SIZE ? last - MAX_COMMENT_SIZE : 0;
            for (size_t pos = last + 1; pos-- > first;) {
                if (read_le32(archive, pos) != END_OF_CENTRAL_DIR_SIGNATURE) {
                    continue;
                }
                if (pos >= ZIP64_LOCATOR_SIZE &&
                    read_le32(archive, pos - ZIP64_LOCATOR_SIZE) == ZIP64_LOCATOR_SIGNATURE) {
                    throw FormatError("ZIP64 archives are not supported");
                }
                DirectoryLocation location{
                    .entry_count = read_le16(archive, pos + 10),
                    .offset = read_le32(archive, pos + 16),
                    .size = read_le32(archive, pos + 12),
                };
                if (location.entry_count == 0xFFFF || location.offset == 0xFFFFFFFF ||
                    location.size == 0xFFFFFFFF) {
                    throw FormatError("ZIP64 archives are not supported");
                }
                require(archive, location.offset, location.size, "central directory");
                return location;
            }
            throw FormatError("Response is not a ZIP archive");
        }

        std::vector<CentralEntry> read_central_directory(std::span<const uint8_t> archive,
                                                         const DirectoryLocation& location) {
            std::vector<CentralEntry> entries;
            entries.reserve(location.entry_count);

            size_t offset = location.offset;
            for (uint16_t i = 0; i < location.entry_count; ++i) {
                require(archive, offset, CENTRAL_HEADER_SIZE, "central directory header");
                if (read_le32(archive, offset) != CENTRAL_HEADER_SIGNATURE) {
                    throw FormatError(fmt::format("Bad central directory signature for entry {}", i));
                }
                const uint16_t name_length = read_le16(archive, offset + 28);
                const uint16_t extra_length = read_le16(archive, offset + 30);
                const uint16_t comment_length = read_le16(archive, offset + 32);
                require(archive, offset + CENTRAL_HEADER_SIZE, name_length, "entry name");

                const auto* name_begin = archive.data() + offset + CENTRAL_HEADER_SIZE;
                entries.push_back(CentralEntry{
                    .name = std::string(name_begin, name_begin + name_length),
                    .flags = read_le16(archive, offset + 8),
                    .method = read_le16(archive, offset + 10),
                    .crc = read_le32(archive, offset + 16),
                    .compressed_size = read_le32(archive, offset + 20),
                    .uncompressed_size = read_le32(archive, offset + 24),
                    .local_header_offset = read_le32(archive, offset + 42),
                });
                offset += CENTRAL_HEADER_SIZE + name_length + extra_length + comment_length;
            }
            return entries;
        }

        // Deflate cannot expand data by more than 1032:1.
        constexpr size_t MAX_DEFLATE_RATIO = 1032;

        size_t max_inflated_size(size_t compressed_size) {
            return compressed_size * MAX_DEFLATE_RATIO + 64;
        }

        // RAII owner of a raw-deflate inflate stream.
        class InflateStream {
        public:
            InflateStream() {
                if (inflateInit2(&stream_, -MAX_WBITS) != Z_OK) {
                    throw FormatError("Failed to initialize zlib inflate stream");
                }
            }
            ~InflateStream() { inflateEnd(&stream_); }

            InflateStream(const InflateStream&) = delete;
            InflateStream& operator=(const InflateStream&) = delete;

            std::vector<uint8_t> inflate_all(std::span<const uint8_t> input, size_t expected_size, const std::string& name) {
                if (expected_size > max_inflated_size(input.size())) {
                    throw FormatError(fmt::format("Entry '{}' claims {} bytes from {} compressed bytes",
                                                  name, expected_size, input.size()));
                }

                // One spare byte keeps next_out valid for empty entries and catches overlong streams.
                std::vector<uint8_t> output(expected_size + 1);
                stream_.next_in = const_cast<Bytef*>(input.data());
                stream_.avail_in = static_cast<uInt>(input.size());
                stream_.next_out = output.data();
                stream_.avail_out = static_cast<uInt>(output.size());

                const int ret = inflate(&stream_, Z_FINISH);
                if (ret != Z_STREAM_END || stream_.total_out != expected_size) {
                    throw FormatError(fmt::format("Failed to inflate entry '{}' (zlib status {})", name, ret));
                }
                output.resize(expected_size);
                return output;
            }

        private:
            z_stream stream_{};
        };

        std::vector<uint8_t> read_entry_data(std::span<const uint8_t> archive, const CentralEntry& entry) {
            if (entry.flags & FLAG_ENCRYPTED) {
                throw FormatError(fmt::format("Entry '{}' is encrypted", entry.name));
            }

            const size_t header = entry.local_header_offset;
            require(archive, header, LOCAL_HEADER_SIZE, "local header");
            if (read_le32(archive, header) != LOCAL_HEADER_SIGNATURE) {
                throw FormatError(fmt::format("Bad local header signature for entry '{}'", entry.name));
            }
            const size_t data_offset = header + LOCAL_HEADER_SIZE +
                                       read_le16(archive, header + 26) + read_le16(archive, header + 28);
            require(archive, data_offset, entry.compressed_size, "entry data");
            const auto compressed = archive.subspan(data_offset, entry.compressed_size);

            std::vector<uint8_t> data;
            switch (entry.method) {
                case METHOD_STORED:
                    if (entry.compressed_size != entry.uncompressed_size) {
                        throw FormatError(fmt::format("Stored entry '{}' has mismatched sizes", entry.name));
                    }
                    data.assign(compressed.begin(), compressed.end());
                    break;
                case METHOD_DEFLATE: {
                    InflateStream stream;
                    data = stream.inflate_all(compressed, entry.uncompressed_size, entry.name);
                    break;
                }
                default:
                    throw FormatError(fmt::format("Entry '{}' uses unsupported compression method {}",
                                                  entry.name, entry.method));
            }

            const uint32_t actual_crc = static_cast<uint32_t>(
                crc32(0L, data.data(), static_cast<uInt>(data.size())));
            if (actual_crc != entry.crc) {
                throw FormatError(fmt::format("CRC mismatch for entry '{}': expected {:08x}, got {:08x}",
                                              entry.name, entry.crc, actual_crc));
            }
            return data;
        }

    } // namespace

    std::vector<ArchiveEntry> read_archive(std::span<const uint8_t> archive) {
        const DirectoryLocation location = find_central_directory(archive);

        std::vector<ArchiveEntry> entries;
        for (const auto& entry : read_central_directory(archive, location)) {
            if (!entry.name.empty() && entry.name.back() == '/') {
                continue;
            }
            entries.push_back({entry.name, read_entry_data(archive, entry)});
        }

        spdlog::debug("ArchiveExtractor: Read {} entries from {} byte archive", entries.size(), archive.size());
        return entries;
    }

    std::vector<Image> extract_images(std::span<const uint8_t> archive) {
        const std::string timestamp = utils::filename_timestamp();

        std::vector<Image> images;
        auto entries = read_archive(archive);
        images.reserve(entries.size());
        for (size_t i = 0; i < entries.size(); ++i) {
            const ImageFormat format = detect_image_format(entries[i].data);
            images.emplace_back(fmt::format("{}_p{}.png", timestamp, i), std::move(entries[i].data), format);
        }
        return images;
    }

    ArchiveEntry read_first_entry(std::span<const uint8_t> archive) {
        auto entries = read_archive(archive);
        if (entries.empty()) {
            throw FormatError("ZIP archive holds no file entries");
        }
        return std::move(entries.front());
    }

} // namespace imgen_core::decoding
