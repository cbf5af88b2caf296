// SPDX-License-Identifier: Apache-2.0
#include "CircuitBreaker.hpp"

#include <core/Log.hpp>

namespace mcphub
{

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config):
    _name(std::move(name)), _config(config)
{
}

auto CircuitBreaker::isAvailable() -> bool
{
    auto lock = std::lock_guard(_mutex);

    switch (_state)
    {
        case CircuitState::Closed: return true;
        case CircuitState::HalfOpen: return true;
        case CircuitState::Open:
            if (_openedAt && Clock::now() - *_openedAt >= _config.cooldown)
            {
                transitionTo(CircuitState::HalfOpen);
                _consecutiveSuccesses = 0;
                return true;
            }
            return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess()
{
    auto lock = std::lock_guard(_mutex);

    switch (_state)
    {
        case CircuitState::Closed: _consecutiveFailures = 0; break;
        case CircuitState::HalfOpen:
            ++_consecutiveSuccesses;
            if (_consecutiveSuccesses >= _config.successThreshold)
            {
                transitionTo(CircuitState::Closed);
                _consecutiveFailures = 0;
                _consecutiveSuccesses = 0;
                _openedAt.reset();
            }
            break;
        case CircuitState::Open:
            log::warning("Circuit '{}': success recorded while open, ignoring", _name);
            break;
    }
}

void CircuitBreaker::recordFailure()
{
    auto lock = std::lock_guard(_mutex);

    switch (_state)
    {
        case CircuitState::Closed:
            ++_consecutiveFailures;
            if (_consecutiveFailures >= _config.failureThreshold)
            {
                transitionTo(CircuitState::Open);
                _openedAt = Clock::now();
            }
            break;
        case CircuitState::HalfOpen:
            transitionTo(CircuitState::Open);
            _openedAt = Clock::now();
            _consecutiveSuccesses = 0;
            break;
        case CircuitState::Open:
            // Failures while open extend the cooldown.
            _openedAt = Clock::now();
            break;
    }
}

void CircuitBreaker::reset()
{
    auto lock = std::lock_guard(_mutex);
    if (_state != CircuitState::Closed)
        log::info("Circuit '{}' manually reset", _name);
    _state = CircuitState::Closed;
    _consecutiveFailures = 0;
    _consecutiveSuccesses = 0;
    _openedAt.reset();
}

auto CircuitBreaker::state() const -> CircuitState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto CircuitBreaker::stats() const -> CircuitBreakerStats
{
    auto lock = std::lock_guard(_mutex);

    auto remaining = std::optional<std::chrono::milliseconds> {};
    if (_state == CircuitState::Open && _openedAt)
    {
        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - *_openedAt);
        remaining = elapsed >= _config.cooldown ? std::chrono::milliseconds(0) : _config.cooldown - elapsed;
    }

    return CircuitBreakerStats {
        .name = _name,
        .state = _state,
        .consecutiveFailures = _consecutiveFailures,
        .consecutiveSuccesses = _consecutiveSuccesses,
        .cooldownRemaining = remaining,
    };
}

void CircuitBreaker::transitionTo(CircuitState next)
{
    if (_state == next)
        return;

    if (next == CircuitState::Open)
        log::warning("Circuit '{}' opened (was {}, {} consecutive failures)",
                     _name,
                     circuitStateToString(_state),
                     _consecutiveFailures);
    else
        log::info("Circuit '{}': {} -> {}", _name, circuitStateToString(_state), circuitStateToString(next));

    _state = next;
}

} // namespace mcphub
