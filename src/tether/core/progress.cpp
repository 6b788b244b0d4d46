// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/progress.hpp>
#include <tether/process/worker_process.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>

namespace tether::core {

namespace {

constexpr std::size_t MAX_PENDING = 64 * 1024;     // A "line" longer than this is not a readout
constexpr std::size_t MAX_QUEUED_MESSAGES = 1000;

const std::regex& size_regex() {
    static const std::regex re(R"(^\s*([0-9]+(?:\.[0-9]+)?)\s*([KMGTkmgt]?)(i?[Bb])?\s*$)");
    return re;
}

const std::regex& readout_regex() {
    static const std::regex re(
        R"(\[#([0-9a-fA-F]+)\s+([0-9.]+[A-Za-z]*)/([0-9.]+[A-Za-z]*)(?:\((\d+)%\))?([^\]]*)\])");
    return re;
}

const std::regex& connections_regex() {
    static const std::regex re(R"(CN:(\d+))");
    return re;
}

const std::regex& speed_regex() {
    static const std::regex re(R"(DL:([0-9.]+[A-Za-z]*))");
    return re;
}

const std::regex& eta_regex() {
    static const std::regex re(R"(ETA:([0-9hms]+))");
    return re;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

double ProgressSnapshot::percent() const noexcept {
    if (!total_bytes || *total_bytes == 0) {
        return 0.0;
    }
    double p = static_cast<double>(downloaded_bytes) * 100.0 / static_cast<double>(*total_bytes);
    return std::clamp(p, 0.0, 100.0);
}

std::expected<std::uint64_t, std::error_code> parse_size(std::string_view text) noexcept {
    try {
        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_match(text.begin(), text.end(), m, size_regex())) {
            return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }

        double value = std::stod(m[1].str());
        double multiplier = 1.0;
        switch (m[2].length() ? std::toupper(static_cast<unsigned char>(*m[2].first)) : 0) {
            case 'K': multiplier = 1024.0; break;
            case 'M': multiplier = 1024.0 * 1024.0; break;
            case 'G': multiplier = 1024.0 * 1024.0 * 1024.0; break;
            case 'T': multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0; break;
            default: break;
        }

        double bytes = value * multiplier;
        if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
            return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }
        return static_cast<std::uint64_t>(bytes);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::progress_parse));
    }
}

std::expected<std::uint64_t, std::error_code> parse_duration(std::string_view text) noexcept {
    if (text.empty()) {
        return std::unexpected(make_error_code(TaskErrc::progress_parse));
    }

    std::uint64_t total = 0;
    std::uint64_t number = 0;
    bool have_digits = false;

    for (char c : text) {
        if (c >= '0' && c <= '9') {
            if (number > std::numeric_limits<std::uint64_t>::max() / 10) {
                return std::unexpected(make_error_code(TaskErrc::progress_parse));
            }
            number = number * 10 + static_cast<std::uint64_t>(c - '0');
            have_digits = true;
            continue;
        }
        if (!have_digits) {
            return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }
        switch (c) {
            case 'h': total += number * 3600; break;
            case 'm': total += number * 60; break;
            case 's': total += number; break;
            default:
                return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }
        number = 0;
        have_digits = false;
    }

    // Trailing digits without a unit
    if (have_digits) {
        return std::unexpected(make_error_code(TaskErrc::progress_parse));
    }
    return total;
}

bool looks_like_readout(std::string_view line) noexcept {
    return line.find("[#") != std::string_view::npos;
}

std::expected<ProgressSnapshot, std::error_code> parse_readout(std::string_view line) noexcept {
    try {
        std::match_results<std::string_view::const_iterator> m;
        if (!std::regex_search(line.begin(), line.end(), m, readout_regex())) {
            return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }

        auto have = parse_size(std::string_view(&*m[2].first, static_cast<std::size_t>(m[2].length())));
        auto total = parse_size(std::string_view(&*m[3].first, static_cast<std::size_t>(m[3].length())));
        if (!have || !total) {
            return std::unexpected(make_error_code(TaskErrc::progress_parse));
        }

        ProgressSnapshot snap;
        snap.downloaded_bytes = *have;
        if (*total > 0) {
            snap.total_bytes = *total;
        }
        snap.updated = std::chrono::system_clock::now();

        const std::string rest = m[5].str();
        std::smatch field;

        if (std::regex_search(rest, field, connections_regex())) {
            snap.connections = static_cast<std::uint32_t>(std::stoul(field[1].str()));
        }
        if (std::regex_search(rest, field, speed_regex())) {
            auto speed = parse_size(field[1].str());
            if (!speed) {
                return std::unexpected(speed.error());
            }
            snap.speed_bps = *speed;
        }
        if (std::regex_search(rest, field, eta_regex())) {
            // A garbled ETA is not worth dropping the whole reading
            if (auto eta = parse_duration(field[1].str())) {
                snap.eta_seconds = *eta;
            }
        }

        if (!snap.eta_seconds && snap.total_bytes && snap.speed_bps > 0 &&
            *snap.total_bytes >= snap.downloaded_bytes) {
            snap.eta_seconds = (*snap.total_bytes - snap.downloaded_bytes) / snap.speed_bps;
        }

        return snap;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::progress_parse));
    }
}

//=============================================================================
// ProgressSampler
//=============================================================================

std::optional<ProgressSnapshot> ProgressSampler::sample(process::WorkerProcess& worker) noexcept {
    std::string chunk;
    worker.read_output(chunk);
    if (chunk.empty()) {
        return std::nullopt;
    }
    return feed(chunk);
}

std::optional<ProgressSnapshot> ProgressSampler::feed(std::string_view chunk) noexcept {
    std::optional<ProgressSnapshot> latest;

    try {
        pending_.append(chunk);

        std::size_t start = 0;
        while (true) {
            auto end = pending_.find_first_of("\r\n", start);
            if (end == std::string::npos) {
                break;
            }
            if (auto snap = consume_line(std::string_view(pending_).substr(start, end - start))) {
                latest = snap;
            }
            start = end + 1;
        }
        pending_.erase(0, start);

        if (pending_.size() > MAX_PENDING) {
            if (auto snap = consume_line(pending_)) {
                latest = snap;
            }
            pending_.clear();
        }
    } catch (const std::bad_alloc&) {
        pending_.clear();
    }

    return latest;
}

std::optional<ProgressSnapshot> ProgressSampler::flush() noexcept {
    std::string rest;
    rest.swap(pending_);
    return consume_line(rest);
}

std::vector<std::string> ProgressSampler::drain_messages() noexcept {
    std::vector<std::string> out;
    out.swap(messages_);
    return out;
}

void ProgressSampler::reset() noexcept {
    pending_.clear();
    messages_.clear();
    floor_bytes_ = 0;
    known_total_.reset();
}

void ProgressSampler::reset(std::uint64_t floor_bytes, std::optional<std::uint64_t> known_total) noexcept {
    reset();
    floor_bytes_ = floor_bytes;
    known_total_ = known_total;
}

std::optional<ProgressSnapshot> ProgressSampler::consume_line(std::string_view raw) noexcept {
    auto line = trim(raw);
    if (line.empty()) {
        return std::nullopt;
    }

    if (!looks_like_readout(line)) {
        try {
            if (messages_.size() >= MAX_QUEUED_MESSAGES) {
                messages_.erase(messages_.begin());
            }
            messages_.emplace_back(line);
        } catch (const std::bad_alloc&) {
            messages_.clear();
        }
        return std::nullopt;
    }

    auto snap = parse_readout(line);
    if (!snap) {
        ++parse_errors_;
        spdlog::debug("ignoring progress readout '{}': {}", line, snap.error().message());
        return std::nullopt;
    }

    // aria2c prints 0B/0B while reconnecting, before it reads the control file
    if (snap->total_bytes) {
        known_total_ = snap->total_bytes;
    } else {
        snap->total_bytes = known_total_;
    }

    // Within one run the byte count only moves forward
    snap->downloaded_bytes = std::max(snap->downloaded_bytes, floor_bytes_);
    floor_bytes_ = snap->downloaded_bytes;
    return *snap;
}

} // namespace tether::core
