// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/checkpoint.hpp>
#include <tether/core/config.hpp>
#include <tether/core/error.hpp>
#include <spdlog/spdlog.h>
#include <bit>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace tether::core {

namespace {

// Control files for HTTP/FTP transfers are tiny; anything huge is not ours
constexpr std::uintmax_t MAX_CONTROL_FILE_SIZE = 64 * 1024 * 1024;

// Layout (version 1 is big-endian, version 0 host order):
//   u16 version, u32 extension, u32 infohash length, infohash,
//   u32 piece length, u64 total length, u64 upload length,
//   u32 bitfield length, bitfield, u32 in-flight piece count, ...
class ControlReader {
public:
    ControlReader(const std::vector<unsigned char>& data, bool big_endian) noexcept
        : data_(data)
        , big_endian_(big_endian) {}

    template<typename T>
    bool read(T& out) noexcept {
        if (data_.size() - pos_ < sizeof(T)) {
            return false;
        }
        T value = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            std::size_t shift = big_endian_ ? (sizeof(T) - 1 - i) * 8 : i * 8;
            value |= static_cast<T>(static_cast<T>(data_[pos_ + i]) << shift);
        }
        pos_ += sizeof(T);
        out = value;
        return true;
    }

    bool skip(std::size_t n) noexcept {
        if (data_.size() - pos_ < n) {
            return false;
        }
        pos_ += n;
        return true;
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    const std::vector<unsigned char>& data_;
    std::size_t pos_{0};
    bool big_endian_;
};

} // namespace

std::string CheckpointStore::checkpoint_path(std::string_view output_path) {
    return std::string(output_path) + std::string(CHECKPOINT_SUFFIX);
}

bool CheckpointStore::exists(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        return std::filesystem::exists(checkpoint_path(output_path), ec);
    } catch (const std::exception&) {
        return false;
    }
}

std::expected<CheckpointInfo, std::error_code>
CheckpointStore::inspect(std::string_view checkpoint_file) noexcept {
    try {
        std::error_code ec;
        auto size = std::filesystem::file_size(std::string(checkpoint_file), ec);
        if (ec) {
            return std::unexpected(ec);
        }
        if (size > MAX_CONTROL_FILE_SIZE) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        std::ifstream file(std::string(checkpoint_file), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }
        std::vector<unsigned char> data((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());

        if (data.size() < 2) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        CheckpointInfo info;
        info.version = static_cast<std::uint16_t>((data[0] << 8) | data[1]);
        bool big_endian;
        if (info.version == 1) {
            big_endian = true;
        } else if (info.version == 0) {
            big_endian = std::endian::native == std::endian::big;
        } else {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        ControlReader reader(data, big_endian);
        std::uint16_t version_field = 0;
        std::uint32_t extension = 0;
        std::uint32_t infohash_length = 0;
        std::uint64_t upload_length = 0;
        std::uint32_t bitfield_length = 0;

        if (!reader.read(version_field) || !reader.read(extension) ||
            !reader.read(infohash_length) || !reader.skip(infohash_length) ||
            !reader.read(info.piece_length) || !reader.read(info.total_length) ||
            !reader.read(upload_length) || !reader.read(bitfield_length)) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        if (info.piece_length == 0) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        std::uint64_t pieces = (info.total_length + info.piece_length - 1) / info.piece_length;
        if (pieces > UINT32_MAX || bitfield_length != (pieces + 7) / 8) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }
        info.piece_count = static_cast<std::uint32_t>(pieces);

        std::size_t bitfield_start = reader.position();
        if (!reader.skip(bitfield_length)) {
            return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
        }

        for (std::uint32_t i = 0; i < info.piece_count; ++i) {
            unsigned char byte = data[bitfield_start + i / 8];
            if ((byte & (0x80u >> (i % 8))) == 0) {
                continue;
            }
            ++info.completed_pieces;
            bool last = i + 1 == info.piece_count;
            info.completed_bytes += last
                ? info.total_length - static_cast<std::uint64_t>(i) * info.piece_length
                : info.piece_length;
        }

        return info;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::checkpoint_unreadable));
    }
}

void CheckpointStore::remove_checkpoint(std::string_view output_path) noexcept {
    try {
        std::error_code ec;
        auto path = checkpoint_path(output_path);
        std::filesystem::remove(path, ec);
        if (ec) {
            spdlog::warn("could not remove {}: {}", path, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("could not remove checkpoint of {}: {}", output_path, e.what());
    }
}

void CheckpointStore::remove_partial(std::string_view output_path) noexcept {
    remove_checkpoint(output_path);
    try {
        std::error_code ec;
        std::filesystem::remove(std::string(output_path), ec);
        if (ec) {
            spdlog::warn("could not remove {}: {}", output_path, ec.message());
        }
    } catch (const std::exception& e) {
        spdlog::warn("could not remove {}: {}", output_path, e.what());
    }
}

} // namespace tether::core
