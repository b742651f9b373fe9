#include "tg/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <span>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#endif

namespace tg::security {
  namespace {

    // Volatile stores plus a compiler barrier keep the overwrite from being
    // treated as a dead store before free(). Returns the OR of (byte ^ pattern)
    // over the read-back, zero when every byte holds the pattern.
    std::uint8_t PortableFill(std::span<uint8_t> data, std::uint8_t pattern) noexcept {
      if (data.empty()) {
        return 0;
      }

#if defined(_WIN32)
      if (pattern == 0) {
        ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
      } else {
        volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
        for (std::size_t i = 0; i < data.size(); ++i) {
          ptr[i] = pattern;
        }
      }
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = pattern;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" : : "r"(data.data()) : "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
      volatile uint8_t mismatch = 0;
      const volatile uint8_t* verify_ptr = reinterpret_cast<const volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        mismatch |= static_cast<uint8_t>(verify_ptr[i] ^ pattern);
      }
      return mismatch;
    }

    Zeroizer::LockStatus ToLockStatus(tg::platform::MemoryLockStatus status) noexcept {
      switch (status) {
        case tg::platform::MemoryLockStatus::kLocked:
          return Zeroizer::LockStatus::Locked;
        case tg::platform::MemoryLockStatus::kBestEffort:
          return Zeroizer::LockStatus::BestEffort;
        case tg::platform::MemoryLockStatus::kUnsupported:
          return Zeroizer::LockStatus::Unsupported;
      }
      return Zeroizer::LockStatus::Unsupported;
    }

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    if (PortableFill(data, 0) != 0) {
      std::clog << "{\"event\":\"zeroize_warning\",\"message\":\"zeroization verification failed\"}"
                << std::endl;
    }
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  bool Zeroizer::Fill(std::span<uint8_t> data, uint8_t pattern) noexcept {
    const bool ok = PortableFill(data, pattern) == 0;
    std::atomic_signal_fence(std::memory_order_seq_cst);
    return ok;
  }

  void Zeroizer::WipeString(std::string& text) noexcept {
    if (text.capacity() > 0) {
      // size() may be smaller than capacity(); expose the full buffer first
      const std::size_t capacity = text.capacity();
      text.resize(capacity);
      Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), capacity));
    }
    text.clear();
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
    return tg::platform::MemoryLockSupported();
  }

  Zeroizer::LockAttempt Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return {LockStatus::Locked, 0};
    }
    const auto result = tg::platform::LockMemory(data.data(), data.size());
    return {ToLockStatus(result.status), result.native_error};
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    tg::platform::UnlockMemory(data.data(), data.size());
  }

} // namespace tg::security
