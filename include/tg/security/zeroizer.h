#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "tg/platform/memory_lock.h"

namespace tg::security {

class Zeroizer {
public:
  // Overwrites |data| with zeros; the stores are not elided by the optimizer.
  static void Wipe(std::span<uint8_t> data) noexcept;

  // Overwrites |data| with |pattern| and reads it back. Returns false when the
  // read-back did not observe the pattern everywhere.
  static bool Fill(std::span<uint8_t> data, uint8_t pattern) noexcept;

  static bool MemoryLockingSupported() noexcept;

  enum class LockStatus {
    Locked,
    BestEffort,
    Unsupported,
  };

  struct LockAttempt {
    LockStatus status{LockStatus::Unsupported};
    int native_error{0};
  };

  static LockAttempt TryLockMemory(std::span<uint8_t> data) noexcept;
  static void UnlockMemory(std::span<uint8_t> data) noexcept;

  // Wipes the whole capacity, spare elements left by earlier contents
  // included. size() is unchanged.
  template <typename T, typename Alloc>
  static void WipeVector(std::vector<T, Alloc>& vec) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "WipeVector needs trivially copyable elements");
    if (vec.capacity() == 0) {
      return;
    }
    const std::size_t live = vec.size();
    vec.resize(vec.capacity()); // within capacity: no reallocation
    Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(vec.data()), vec.size() * sizeof(T)));
    vec.resize(live);
  }

  // Wipes the whole capacity, not only size(), so short-string buffers and
  // previously longer contents are covered too. Leaves the string empty.
  static void WipeString(std::string& text) noexcept;

  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> span) noexcept : span_(span) {}
    ScopeWiper(T* ptr, std::size_t count) noexcept : ScopeWiper(std::span<T>(ptr, count)) {}

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

    ScopeWiper(ScopeWiper&&) = delete;
    ScopeWiper& operator=(ScopeWiper&&) = delete;

    ~ScopeWiper() noexcept {
      if (span_.empty()) {
        return;
      }
      const std::size_t bytes = span_.size_bytes();
      auto byte_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(span_.data()), bytes);
      Zeroizer::Wipe(byte_span);
    }

  private:
    std::span<T> span_;
  };
};

} // namespace tg::security
