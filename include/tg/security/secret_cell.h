#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "tg/common.h"
#include "tg/fault.h"
#include "tg/outcome.h"
#include "tg/security/secure_buffer.h"
#include "tg/security/zeroizer.h"

namespace tg::security {

using SecretCellOptions = SecureBufferOptions;

// Owns one piece of sensitive material. The bytes are only reachable through
// Expose(); on destruction or Clear() the storage is overwritten with the
// configured pattern before it is freed. Every textual rendering is
// kRedactionToken.
template <typename CharT>
class SecretCell {
  static_assert(std::is_same_v<CharT, std::uint8_t> || std::is_same_v<CharT, char>,
                "SecretCell holds bytes or narrow characters");

public:
  using view_type = std::conditional_t<std::is_same_v<CharT, char>, std::string_view,
                                       std::span<const std::uint8_t>>;

  SecretCell() = default;

  // Copies |material| into secure storage and wipes the caller's container.
  explicit SecretCell(std::vector<CharT>&& material, SecretCellOptions options = {})
      : buffer_(material.size(), std::move(options)) {
    std::copy(material.begin(), material.end(), buffer_.data());
    Zeroizer::WipeVector(material);
    material.clear();
  }

  explicit SecretCell(std::string&& material, SecretCellOptions options = {})
    requires std::is_same_v<CharT, char>
      : buffer_(material.size(), std::move(options)) {
    std::copy(material.begin(), material.end(), buffer_.data());
    Zeroizer::WipeString(material);
  }

  // As the constructors, but a kStrict lock policy that could not pin the
  // pages yields kMemoryLockFailed instead of a cell.
  static Outcome<SecretCell> Create(std::vector<CharT>&& material, SecretCellOptions options = {}) {
    SecretCell cell(std::move(material), std::move(options));
    return Checked(std::move(cell));
  }

  static Outcome<SecretCell> Create(std::string&& material, SecretCellOptions options = {})
    requires std::is_same_v<CharT, char>
  {
    SecretCell cell(std::move(material), std::move(options));
    return Checked(std::move(cell));
  }

  SecretCell(const SecretCell&) = delete;
  SecretCell& operator=(const SecretCell&) = delete;
  SecretCell(SecretCell&&) noexcept = default;
  SecretCell& operator=(SecretCell&&) noexcept = default;
  ~SecretCell() = default;

  bool operator==(const SecretCell&) const = delete;

  // Runs |fn| with a read-only view of the material and returns its result.
  // The view is only valid inside |fn|; results that could carry it out are
  // rejected.
  template <typename F>
  auto Expose(F&& fn) const -> std::invoke_result_t<F, view_type> {
    using R = std::invoke_result_t<F, view_type>;
    using Plain = std::remove_cvref_t<R>;
    static_assert(!std::is_reference_v<R> && !std::is_pointer_v<Plain>,
                  "Expose must not return a reference or pointer into the secret");
    static_assert(!std::is_same_v<Plain, std::string_view> &&
                      !std::is_same_v<Plain, std::span<const std::uint8_t>> &&
                      !std::is_same_v<Plain, std::span<const char>>,
                  "Expose must not return a view of the secret");
    return std::invoke(std::forward<F>(fn), View());
  }

  std::size_t Size() const noexcept { return buffer_.size(); }
  bool Empty() const noexcept { return buffer_.size() == 0; }
  bool IsLocked() const noexcept { return buffer_.IsLocked(); }

  // Scrubs and releases the storage now instead of at destruction.
  void Clear() noexcept { buffer_.Reset(); }

  std::string_view Redacted() const noexcept { return kRedactionToken; }

  friend std::ostream& operator<<(std::ostream& os, const SecretCell&) {
    return os << kRedactionToken;
  }

private:
  static Outcome<SecretCell> Checked(SecretCell cell) {
    if (cell.buffer_.Options().lock_policy == LockPolicy::kStrict && !cell.Empty() &&
        !cell.IsLocked()) {
      const int native = cell.buffer_.LockError();
      return Outcome<SecretCell>::Failure(Fault::MemoryLockFailed(
          "unable to lock secret storage in memory",
          native != 0 ? std::optional<int>(native) : std::nullopt));
    }
    return Outcome<SecretCell>::Success(std::move(cell));
  }

  view_type View() const noexcept {
    if constexpr (std::is_same_v<CharT, char>) {
      return std::string_view(buffer_.data(), buffer_.size());
    } else {
      return std::span<const std::uint8_t>(buffer_.data(), buffer_.size());
    }
  }

  SecureBuffer<CharT> buffer_{0};
};

using SecretBytes = SecretCell<std::uint8_t>;
using SecretString = SecretCell<char>;

} // namespace tg::security
