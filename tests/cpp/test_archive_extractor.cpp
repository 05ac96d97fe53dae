#include <gtest/gtest.h>
#include "decoding/archive_extractor.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <regex>
#include <string>

using namespace imgen_core;
using namespace test_support;

// -----------------------------------------------------------------------------
// Test fixture holding sample entries
// -----------------------------------------------------------------------------
class ArchiveExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        first_ = fake_png(832, 1216);
        // Repetitive enough that deflate actually shrinks it
        second_ = fake_png(1216, 832);
        second_.resize(second_.size() + 4096, 0x42);
    }

    Bytes first_;
    Bytes second_;
};

// --------------------------------------------------------------------------
// Entry reading
// --------------------------------------------------------------------------
TEST_F(ArchiveExtractorTest, ReadsStoredAndDeflatedEntries) {
    const Bytes archive = ZipBuilder()
        .add_stored("image_0.png", first_)
        .add_deflated("image_1.png", second_)
        .build();

    const auto entries = decoding::read_archive(archive);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "image_0.png");
    EXPECT_EQ(entries[0].data, first_);
    EXPECT_EQ(entries[1].name, "image_1.png");
    EXPECT_EQ(entries[1].data, second_);
}

TEST_F(ArchiveExtractorTest, ReadsEmptyDeflatedEntry) {
    const Bytes archive = ZipBuilder()
        .add_deflated("empty.txt", Bytes{})
        .add_stored("image_0.png", first_)
        .build();

    const auto entries = decoding::read_archive(archive);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "empty.txt");
    EXPECT_TRUE(entries[0].data.empty());
    EXPECT_EQ(entries[1].data, first_);
}

TEST_F(ArchiveExtractorTest, SkipsDirectoryEntries) {
    const Bytes archive = ZipBuilder()
        .add_directory("images/")
        .add_stored("images/image_0.png", first_)
        .build();

    const auto entries = decoding::read_archive(archive);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "images/image_0.png");
}

TEST_F(ArchiveExtractorTest, FirstEntry) {
    const Bytes archive = ZipBuilder()
        .add_deflated("image.png", second_)
        .add_stored("other.png", first_)
        .build();

    EXPECT_EQ(decoding::read_first_entry(archive).data, second_);
}

// --------------------------------------------------------------------------
// Image naming
// --------------------------------------------------------------------------
TEST_F(ArchiveExtractorTest, ExtractImagesNamesByIndex) {
    const Bytes archive = ZipBuilder()
        .add_stored("image_0.png", first_)
        .add_deflated("image_1.png", second_)
        .build();

    const auto images = decoding::extract_images(archive);
    ASSERT_EQ(images.size(), 2u);
    EXPECT_TRUE(std::regex_match(images[0].filename(), std::regex(R"(\d{8}_\d{6}_p0\.png)")))
        << images[0].filename();
    EXPECT_TRUE(std::regex_match(images[1].filename(), std::regex(R"(\d{8}_\d{6}_p1\.png)")))
        << images[1].filename();
    EXPECT_EQ(images[0].format(), ImageFormat::PNG);
    EXPECT_EQ(images[1].data(), second_);
}

// --------------------------------------------------------------------------
// Malformed archives
// --------------------------------------------------------------------------
TEST_F(ArchiveExtractorTest, RejectsCrcMismatch) {
    const Bytes archive = ZipBuilder()
        .add_stored("image_0.png", first_)
        .corrupt_last_crc()
        .build();

    EXPECT_THROW((void)decoding::read_archive(archive), FormatError);
}

TEST_F(ArchiveExtractorTest, RejectsImplausibleDeclaredSize) {
    // A few compressed bytes cannot inflate to 4 GiB
    const Bytes archive = ZipBuilder()
        .add_deflated("image_0.png", Bytes(16, 0x00))
        .declare_last_size(0xFFFFFFF0u)
        .build();

    EXPECT_THROW((void)decoding::read_archive(archive), FormatError);
}

TEST_F(ArchiveExtractorTest, RejectsDeclaredSizeMismatch) {
    const Bytes shorter = ZipBuilder()
        .add_deflated("image_0.png", second_)
        .declare_last_size(static_cast<uint32_t>(second_.size() - 1))
        .build();
    const Bytes longer = ZipBuilder()
        .add_deflated("image_0.png", second_)
        .declare_last_size(static_cast<uint32_t>(second_.size() + 1))
        .build();

    EXPECT_THROW((void)decoding::read_archive(shorter), FormatError);
    EXPECT_THROW((void)decoding::read_archive(longer), FormatError);
}

TEST_F(ArchiveExtractorTest, RejectsNonArchives) {
    EXPECT_THROW((void)decoding::read_archive(Bytes{}), FormatError);
    EXPECT_THROW((void)decoding::read_archive(first_), FormatError);

    const std::string text = "{\"error\": \"not a zip, but long enough to search for a trailer\"}";
    EXPECT_THROW((void)decoding::read_archive(Bytes(text.begin(), text.end())), FormatError);
}

TEST_F(ArchiveExtractorTest, RejectsTruncatedArchive) {
    Bytes archive = ZipBuilder().add_stored("image_0.png", first_).build();
    // Drop the start of the local header so the directory points past it
    archive.erase(archive.begin(), archive.begin() + 8);

    EXPECT_THROW((void)decoding::read_archive(archive), FormatError);
}

TEST_F(ArchiveExtractorTest, EmptyArchiveHasNoFirstEntry) {
    const Bytes archive = ZipBuilder().build();

    EXPECT_TRUE(decoding::read_archive(archive).empty());
    EXPECT_THROW((void)decoding::read_first_entry(archive), FormatError);
}
