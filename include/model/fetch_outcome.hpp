#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "model/health_snapshot.hpp"

namespace status_poller::model {

enum class error_kind : std::uint8_t {
    TRANSPORT = 0,
    DECODE = 1,
    EXHAUSTED = 2,
};

struct ErrorDetail {
    error_kind kind{error_kind::TRANSPORT};
    std::string message{};
    // 1-based attempt that failed; total attempts for EXHAUSTED.
    std::uint32_t attempt{0};
    // Kind of the last underlying failure when kind == EXHAUSTED.
    error_kind final_cause{error_kind::TRANSPORT};
};

// Result of a single fetch attempt.
using FetchResult = std::variant<HealthSnapshot, ErrorDetail>;

// Result of one complete attempt sequence (after retries).
struct FetchOutcome {
    std::variant<HealthSnapshot, ErrorDetail> value{};
    std::uint32_t attempts{0};

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<HealthSnapshot>(value); }
    [[nodiscard]] const HealthSnapshot& snapshot() const { return std::get<HealthSnapshot>(value); }
    [[nodiscard]] const ErrorDetail& error() const { return std::get<ErrorDetail>(value); }
    [[nodiscard]] std::uint32_t retries() const noexcept { return attempts > 0 ? attempts - 1 : 0; }
};

const char* to_string(error_kind kind) noexcept;

} // namespace status_poller::model
