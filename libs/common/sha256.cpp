/**
 * @file sha256.cpp
 * @brief SHA-256 used for descriptor fingerprints (FIPS 180-4)
 *
 * The message is padded up front and processed block by block; the input of
 * a fingerprint is a short canonical JSON string, so streaming is not needed.
 */

#include "typeguard/common.hpp"
#include "typeguard/require_cpp23.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <ranges>
#include <span>
#include <vector>

namespace typeguard::common {

namespace {

constexpr std::size_t kBlockSize = 64;

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
    0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
    0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
    0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
    0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
    0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
    0xc67178f2};

constexpr std::array<std::uint32_t, 8> kInitialState = {0x6a09e667,
                                                        0xbb67ae85,
                                                        0x3c6ef372,
                                                        0xa54ff53a,
                                                        0x510e527f,
                                                        0x9b05688c,
                                                        0x1f83d9ab,
                                                        0x5be0cd19};

using State = std::array<std::uint32_t, 8>;

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_big_endian(const std::uint8_t* bytes) noexcept
{
    std::uint32_t word{};
    std::memcpy(&word, bytes, sizeof(word));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(word);
    } else {
        return word;
    }
}

/// Message bytes followed by 0x80, zero fill and the 64-bit bit length.
[[nodiscard]] std::vector<std::uint8_t> pad_message(std::string_view data)
{
    const std::uint64_t bit_length = static_cast<std::uint64_t>(data.size()) * 8U;
    std::size_t padded_size = data.size() + 1 + 8;
    padded_size = (padded_size + kBlockSize - 1) / kBlockSize * kBlockSize;

    std::vector<std::uint8_t> padded(padded_size, 0);
    if (!data.empty()) {
        std::memcpy(padded.data(), data.data(), data.size());
    }
    padded[data.size()] = 0x80;
    for (std::size_t i = 0; i < 8; ++i) {
        padded[padded_size - 1 - i] = static_cast<std::uint8_t>(bit_length >> (8U * i));
    }
    return padded;
}

void compress_block(State& state, std::span<const std::uint8_t, kBlockSize> block)
{
    std::array<std::uint32_t, 64> schedule{};
    for (std::size_t i = 0; i < 16; ++i) {
        schedule[i] = load_big_endian(block.data() + i * 4);
    }
    for (std::size_t i = 16; i < schedule.size(); ++i) {
        schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                      + small_sigma0(schedule[i - 15]) + schedule[i - 16];
    }

    State work = state;
    for (auto [i, word] : std::views::enumerate(schedule)) {
        auto& [a, b, c, d, e, f, g, h] = work;
        const std::uint32_t choose = (e & f) ^ (~e & g);
        const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        const std::uint32_t t1 =
            h + big_sigma1(e) + choose + kRoundConstants[static_cast<std::size_t>(i)] + word;
        const std::uint32_t t2 = big_sigma0(a) + majority;
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    for (auto [slot, value] : std::views::zip(state, work)) {
        slot += value;
    }
}

}  // namespace

std::string sha256(std::string_view data)
{
    State state = kInitialState;
    const auto padded = pad_message(data);
    for (std::size_t offset = 0; offset < padded.size(); offset += kBlockSize) {
        compress_block(state,
                       std::span<const std::uint8_t, kBlockSize>(padded.data() + offset,
                                                                 kBlockSize));
    }

    std::string hex;
    hex.reserve(64);
    for (std::uint32_t word : state) {
        hex += std::format("{:08x}", word);
    }
    return hex;
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace typeguard::common
