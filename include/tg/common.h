#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace tg {

// Rendered in place of any secret or redacted field, regardless of content.
inline constexpr std::string_view kRedactionToken{"[REDACTED]"};

inline std::span<const std::uint8_t> AsBytesConst(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

// Truncates untrusted input for audit records. Cuts on a UTF-8 boundary and
// appends an ellipsis marker when anything was dropped.
inline std::string TruncateForAudit(std::string_view raw, std::size_t max_bytes) {
  if (raw.size() <= max_bytes) {
    return std::string(raw);
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(raw[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  std::string out(raw.substr(0, cut));
  out.append("...");
  return out;
}

} // namespace tg
