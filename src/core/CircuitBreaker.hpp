// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub
{

/// @brief Phase of a circuit breaker.
enum class CircuitState
{
    Closed,
    Open,
    HalfOpen,
};

/// @brief Returns the lowercase name of a circuit state.
[[nodiscard]] constexpr auto circuitStateToString(CircuitState state) -> std::string_view
{
    switch (state)
    {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "closed";
}

/// @brief Thresholds and cooldown of a circuit breaker.
struct CircuitBreakerConfig
{
    /// @brief Consecutive failures (while Closed) before the circuit opens.
    uint32_t failureThreshold = 5;

    /// @brief Time the circuit stays Open before allowing a probe.
    std::chrono::milliseconds cooldown = std::chrono::seconds(60);

    /// @brief Consecutive successes (while HalfOpen) before the circuit closes.
    uint32_t successThreshold = 2;

    /// @brief Preset for LLM provider endpoints: 3 failures, 30 s cooldown, 1 success.
    [[nodiscard]] static auto forLlmProvider() -> CircuitBreakerConfig
    {
        return CircuitBreakerConfig {
            .failureThreshold = 3,
            .cooldown = std::chrono::seconds(30),
            .successThreshold = 1,
        };
    }
};

/// @brief Point-in-time snapshot of a circuit breaker.
struct CircuitBreakerStats
{
    std::string name;
    CircuitState state = CircuitState::Closed;
    uint32_t consecutiveFailures = 0;
    uint32_t consecutiveSuccesses = 0;

    /// @brief Time left before an Open circuit allows a probe; std::nullopt unless Open.
    std::optional<std::chrono::milliseconds> cooldownRemaining;
};

/// @brief Closed / Open / HalfOpen fault-isolation state machine.
///
/// All operations are serialized by an internal mutex, so an availability check
/// and a counter update never interleave inconsistently.
class CircuitBreaker
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @brief Constructs a breaker in the Closed state.
    /// @param name Name of the guarded dependency (used in log messages).
    /// @param config Thresholds and cooldown.
    explicit CircuitBreaker(std::string name, CircuitBreakerConfig config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// @brief Returns true if a call may proceed.
    ///
    /// An Open circuit whose cooldown has elapsed transitions to HalfOpen here.
    [[nodiscard]] auto isAvailable() -> bool;

    /// @brief Records a successful call.
    void recordSuccess();

    /// @brief Records a failed call.
    void recordFailure();

    /// @brief Manually returns the circuit to Closed and clears all counters.
    void reset();

    [[nodiscard]] auto state() const -> CircuitState;
    [[nodiscard]] auto stats() const -> CircuitBreakerStats;
    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto config() const -> const CircuitBreakerConfig& { return _config; }

  private:
    void transitionTo(CircuitState next);

    std::string _name;
    CircuitBreakerConfig _config;

    mutable std::mutex _mutex;
    CircuitState _state = CircuitState::Closed;
    uint32_t _consecutiveFailures = 0;
    uint32_t _consecutiveSuccesses = 0;
    std::optional<Clock::time_point> _openedAt;
};

} // namespace mcphub
