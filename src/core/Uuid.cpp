// SPDX-License-Identifier: Apache-2.0
#include "Uuid.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <mutex>
#include <random>

namespace mcphub
{

namespace
{
    auto generatorMutex = std::mutex {};

    auto generator() -> std::mt19937_64&
    {
        static auto engine = std::mt19937_64 { std::random_device {}() };
        return engine;
    }
} // namespace

auto generateUuid() -> std::string
{
    auto bytes = std::array<uint8_t, 16> {};
    {
        auto lock = std::lock_guard(generatorMutex);
        auto& engine = generator();
        for (auto i = 0u; i < bytes.size(); i += 8)
        {
            auto const value = engine();
            for (auto j = 0u; j < 8; ++j)
                bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
        }
    }

    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10xx

    auto out = std::string {};
    out.reserve(36);
    for (auto i = 0u; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

auto currentTimestamp() -> std::string
{
    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

} // namespace mcphub
