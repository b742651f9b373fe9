#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tg::crypto {

inline constexpr std::size_t kSha256DigestSize = 32;
using Sha256Digest = std::array<std::uint8_t, kSha256DigestSize>;

// nullopt only when the OpenSSL digest itself fails.
std::optional<Sha256Digest> SHA256_Hash(std::span<const std::uint8_t> data);
std::optional<Sha256Digest> SHA256_Hash(std::string_view text);

} // namespace tg::crypto
