#include "bulkup/archive/archive_source.hpp"
#include "bulkup/transfer/chunk_planner.hpp"
#include "bulkup/transfer/file_source.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using bulkup::ErrorCode;
using bulkup::archive::ArchiveEntry;
using bulkup::archive::ArchiveFileSource;
using bulkup::archive::TarEncoder;
using bulkup::transfer::MemoryFileSource;

namespace {

std::vector<std::uint8_t> pattern(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i * 7 + 3);
    }
    return data;
}

} // namespace

TEST(ArchiveFileSourceTest, NamesArchiveAfterInnerFile) {
    auto inner = std::make_shared<MemoryFileSource>("photo.jpg", pattern(100));
    auto archive = ArchiveFileSource::create(inner);
    ASSERT_TRUE(archive.is_ok());

    EXPECT_EQ(archive.value()->name(), "photo.jpg.tar");
    EXPECT_EQ(archive.value()->entry().name, "photo.jpg");
    EXPECT_EQ(archive.value()->size(), TarEncoder::archive_size(100));
}

TEST(ArchiveFileSourceTest, AnyReadSplitMatchesEncoder) {
    for (std::size_t size : {0u, 1u, 511u, 512u, 513u, 10000u}) {
        const auto data = pattern(size);
        auto archive = ArchiveFileSource::create(std::make_shared<MemoryFileSource>("data.bin", data));
        ASSERT_TRUE(archive.is_ok());
        auto& source = *archive.value();

        auto expected = TarEncoder::encode(source.entry(), data);
        ASSERT_TRUE(expected.is_ok());
        ASSERT_EQ(source.size(), expected.value().size());

        for (std::uint64_t chunk : {1ULL, 100ULL, 511ULL, 512ULL, 1000ULL, 1ULL << 20}) {
            auto plan = bulkup::transfer::plan_chunks(source.size(), chunk);
            ASSERT_TRUE(plan.is_ok());

            std::vector<std::uint8_t> joined;
            for (const auto& range : plan.value().ranges()) {
                auto part = source.read(range.offset, range.length);
                ASSERT_TRUE(part.is_ok());
                ASSERT_EQ(part.value().size(), range.length);
                joined.insert(joined.end(), part.value().begin(), part.value().end());
            }
            EXPECT_EQ(joined, expected.value()) << "size=" << size << " chunk=" << chunk;
        }
    }
}

TEST(ArchiveFileSourceTest, StampsCurrentTimeUnlessGiven) {
    using namespace std::chrono;
    const auto before = static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());

    auto stamped = ArchiveFileSource::create(std::make_shared<MemoryFileSource>("now.bin", pattern(10)));
    ASSERT_TRUE(stamped.is_ok());
    const auto after = static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
    EXPECT_GE(stamped.value()->entry().mtime, before);
    EXPECT_LE(stamped.value()->entry().mtime, after);

    ArchiveEntry fixed;
    fixed.mtime = 1'700'000'000;
    auto kept = ArchiveFileSource::create(std::make_shared<MemoryFileSource>("then.bin", pattern(10)), fixed);
    ASSERT_TRUE(kept.is_ok());
    EXPECT_EQ(kept.value()->entry().mtime, 1'700'000'000u);

    auto header = kept.value()->read(136, 12);
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(std::string(header.value().begin(), header.value().end()), "14524770400 ");
}

TEST(ArchiveFileSourceTest, ReadPastEndIsEmpty) {
    auto archive = ArchiveFileSource::create(std::make_shared<MemoryFileSource>("x", pattern(10)));
    ASSERT_TRUE(archive.is_ok());
    auto past = archive.value()->read(archive.value()->size(), 10);
    ASSERT_TRUE(past.is_ok());
    EXPECT_TRUE(past.value().empty());
}

TEST(ArchiveFileSourceTest, RejectsMissingOrUnencodableInner) {
    auto missing = ArchiveFileSource::create(nullptr);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::Validation);

    auto long_name = ArchiveFileSource::create(std::make_shared<MemoryFileSource>(std::string(120, 'n'), pattern(1)));
    ASSERT_TRUE(long_name.is_error());
    EXPECT_EQ(long_name.error().code, ErrorCode::ArchiveEncoding);
}
