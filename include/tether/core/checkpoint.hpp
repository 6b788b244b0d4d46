// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tether::core {

// What the engine's control file says about a partial transfer
struct CheckpointInfo {
    std::uint16_t version{0};
    std::uint32_t piece_length{0};
    std::uint64_t total_length{0};
    std::uint32_t piece_count{0};
    std::uint32_t completed_pieces{0};
    std::uint64_t completed_bytes{0};   // Bytes in fully retrieved pieces
};

// The control file sits beside the output as <output>.aria2 and belongs to
// the engine. The core only locates, inspects and (by policy) deletes it.
struct CheckpointStore {
    // Get the checkpoint path for a given output file
    [[nodiscard]] static std::string checkpoint_path(std::string_view output_path);

    // Check if a checkpoint exists for the given output
    [[nodiscard]] static bool exists(std::string_view output_path) noexcept;

    // Decode the control file header and piece bitfield
    [[nodiscard]] static std::expected<CheckpointInfo, std::error_code>
    inspect(std::string_view checkpoint_file) noexcept;

    // Delete the checkpoint only
    static void remove_checkpoint(std::string_view output_path) noexcept;

    // Delete the checkpoint and the partial output
    static void remove_partial(std::string_view output_path) noexcept;
};

} // namespace tether::core
