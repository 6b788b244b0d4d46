// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tether/core/checkpoint.hpp>
#include <tether/core/error.hpp>
#include "test_support.hpp"
#include <bit>
#include <vector>

using namespace tether::core;
using tether::test::TempDir;

namespace {

// Control file writer, version 1 (big-endian) or 0 (host order)
class ControlFileBuilder {
public:
    explicit ControlFileBuilder(std::uint16_t version) : version_(version) {
        put(version, true);
    }

    template<typename T>
    ControlFileBuilder& field(T value) {
        bool big = version_ == 1 || std::endian::native == std::endian::big;
        put(value, big);
        return *this;
    }

    ControlFileBuilder& bytes(std::initializer_list<unsigned char> raw) {
        data_.insert(data_.end(), raw.begin(), raw.end());
        return *this;
    }

    void write(const std::filesystem::path& p) const {
        tether::test::write_file(p, std::string(data_.begin(), data_.end()));
    }

private:
    template<typename T>
    void put(T value, bool big) {
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            std::size_t shift = big ? (sizeof(T) - 1 - i) * 8 : i * 8;
            data_.push_back(static_cast<unsigned char>((static_cast<std::uint64_t>(value) >> shift) & 0xff));
        }
    }

    std::uint16_t version_;
    std::vector<unsigned char> data_;
};

// 10 pieces of 1 MiB, the last one 512 KiB short
constexpr std::uint32_t PIECE = 1024 * 1024;
constexpr std::uint64_t TOTAL = 9ull * PIECE + PIECE / 2;

ControlFileBuilder http_control(std::uint16_t version) {
    ControlFileBuilder b(version);
    b.field<std::uint32_t>(0)          // extension
     .field<std::uint32_t>(0)          // no infohash
     .field<std::uint32_t>(PIECE)
     .field<std::uint64_t>(TOTAL)
     .field<std::uint64_t>(0)          // uploaded
     .field<std::uint32_t>(2);         // bitfield bytes
    return b;
}

} // namespace

TEST_CASE("CheckpointStore paths", "[checkpoint]") {
    CHECK(CheckpointStore::checkpoint_path("/tmp/file.iso") == "/tmp/file.iso.aria2");

    TempDir dir;
    auto output = (dir.path() / "file.iso").string();
    CHECK(!CheckpointStore::exists(output));

    tether::test::write_file(output + ".aria2", "x");
    CHECK(CheckpointStore::exists(output));
}

TEST_CASE("CheckpointStore::inspect version 1", "[checkpoint]") {
    TempDir dir;
    auto file = dir.path() / "data.bin.aria2";

    SECTION("First three pieces and the short last piece") {
        http_control(1).bytes({0b11100000, 0b01000000}).field<std::uint32_t>(0).write(file);

        auto info = CheckpointStore::inspect(file.string());
        REQUIRE(info.has_value());
        CHECK(info->version == 1);
        CHECK(info->piece_length == PIECE);
        CHECK(info->total_length == TOTAL);
        CHECK(info->piece_count == 10);
        CHECK(info->completed_pieces == 4);
        CHECK(info->completed_bytes == 3ull * PIECE + PIECE / 2);
    }

    SECTION("Nothing retrieved yet") {
        http_control(1).bytes({0, 0}).write(file);
        auto info = CheckpointStore::inspect(file.string());
        REQUIRE(info.has_value());
        CHECK(info->completed_pieces == 0);
        CHECK(info->completed_bytes == 0);
    }

    SECTION("With an infohash") {
        ControlFileBuilder b(1);
        b.field<std::uint32_t>(0)
         .field<std::uint32_t>(4).bytes({0xde, 0xad, 0xbe, 0xef})
         .field<std::uint32_t>(PIECE)
         .field<std::uint64_t>(2ull * PIECE)
         .field<std::uint64_t>(0)
         .field<std::uint32_t>(1)
         .bytes({0b10000000})
         .write(file);

        auto info = CheckpointStore::inspect(file.string());
        REQUIRE(info.has_value());
        CHECK(info->piece_count == 2);
        CHECK(info->completed_bytes == PIECE);
    }
}

TEST_CASE("CheckpointStore::inspect version 0", "[checkpoint]") {
    TempDir dir;
    auto file = dir.path() / "legacy.bin.aria2";
    http_control(0).bytes({0xff, 0xc0}).write(file);

    auto info = CheckpointStore::inspect(file.string());
    REQUIRE(info.has_value());
    CHECK(info->version == 0);
    CHECK(info->completed_pieces == 10);
    CHECK(info->completed_bytes == TOTAL);
}

TEST_CASE("CheckpointStore::inspect rejects damaged files", "[checkpoint]") {
    TempDir dir;
    auto file = dir.path() / "bad.aria2";

    SECTION("Missing file") {
        CHECK(!CheckpointStore::inspect(file.string()).has_value());
    }

    SECTION("Text content") {
        tether::test::write_file(file, "120000\n");
        auto info = CheckpointStore::inspect(file.string());
        REQUIRE(!info.has_value());
        CHECK(info.error() == TaskErrc::checkpoint_unreadable);
    }

    SECTION("Truncated bitfield") {
        http_control(1).bytes({0xff}).write(file);
        CHECK(!CheckpointStore::inspect(file.string()).has_value());
    }

    SECTION("Bitfield length does not match the piece count") {
        ControlFileBuilder b(1);
        b.field<std::uint32_t>(0).field<std::uint32_t>(0)
         .field<std::uint32_t>(PIECE).field<std::uint64_t>(TOTAL).field<std::uint64_t>(0)
         .field<std::uint32_t>(3).bytes({0, 0, 0})
         .write(file);
        CHECK(!CheckpointStore::inspect(file.string()).has_value());
    }

    SECTION("Zero piece length") {
        ControlFileBuilder b(1);
        b.field<std::uint32_t>(0).field<std::uint32_t>(0)
         .field<std::uint32_t>(0).field<std::uint64_t>(TOTAL).field<std::uint64_t>(0)
         .field<std::uint32_t>(0)
         .write(file);
        CHECK(!CheckpointStore::inspect(file.string()).has_value());
    }
}

TEST_CASE("CheckpointStore removal", "[checkpoint]") {
    TempDir dir;
    auto output = (dir.path() / "movie.mkv").string();
    tether::test::write_file(output, "partial");
    tether::test::write_file(output + ".aria2", "control");

    SECTION("remove_checkpoint keeps the partial file") {
        CheckpointStore::remove_checkpoint(output);
        CHECK(!std::filesystem::exists(output + ".aria2"));
        CHECK(std::filesystem::exists(output));
    }

    SECTION("remove_partial deletes both") {
        CheckpointStore::remove_partial(output);
        CHECK(!std::filesystem::exists(output + ".aria2"));
        CHECK(!std::filesystem::exists(output));
    }

    SECTION("Removing what is not there is harmless") {
        CheckpointStore::remove_partial((dir.path() / "nothing").string());
        CHECK(std::filesystem::exists(output));
    }
}
