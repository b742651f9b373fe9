#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>
#if defined(_WIN32)
#include <malloc.h>
#else
#include <unistd.h>
#endif
#include "tg/platform/memory_lock.h"
#include "tg/security/zeroizer.h"

namespace tg::security {

enum class LockPolicy : std::uint8_t {
  kOff,         // never mlock
  kBestEffort,  // try, warn on failure
  kStrict,      // try; callers must reject the buffer when IsLocked() is false
};

struct SecureBufferOptions {
  uint8_t wipe_pattern{0x00};
  LockPolicy lock_policy{LockPolicy::kBestEffort};
  bool exclude_from_core_dump{true};
  // Test seam: observes the allocation after scrubbing, right before it is
  // unlocked and freed.
  std::function<void(std::span<const uint8_t>)> before_release;
};

template<typename T>
class SecureBuffer {
  static_assert(std::is_trivially_copyable_v<T>, "SecureBuffer holds raw bytes only");

  T* ptr_{nullptr};
  size_t size_{0};
  size_t allocation_size_{0}; // padded allocation size for wiping/locking
  bool locked_{false};
  bool lock_capable_{false};
  bool dump_excluded_{false};
  int lock_error_{0};
  SecureBufferOptions options_;
  struct LockRegion {
    uint8_t* begin{nullptr};
    size_t length{0};
    bool locked{false};
  };
  std::vector<LockRegion> lock_regions_;

  void Release() noexcept {
    if (!ptr_) {
      ResetState();
      return;
    }

    if (allocation_size_ > 0) {
      auto bytes_span = std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_);
      if (!Zeroizer::Fill(bytes_span, options_.wipe_pattern)) {
        std::clog << "{\"event\":\"secure_buffer_warning\",\"message\":\"scrub verification failed\"}"
                  << std::endl;
      }
      if (options_.before_release) {
        options_.before_release(std::span<const uint8_t>(bytes_span.data(), bytes_span.size()));
      }
      for (auto& region : lock_regions_) {
        if (region.locked) {
          Zeroizer::UnlockMemory(std::span<uint8_t>(region.begin, region.length));
        }
      }
      if (dump_excluded_) {
        tg::platform::IncludeInCoreDump(ptr_, allocation_size_);
      }
    }

#if defined(_WIN32)
    _aligned_free(ptr_);
#else
    std::free(ptr_);
#endif
    ResetState();
  }

  void ResetState() noexcept {
    ptr_ = nullptr;
    size_ = 0;
    allocation_size_ = 0;
    locked_ = false;
    lock_capable_ = false;
    dump_excluded_ = false;
    lock_error_ = 0;
    lock_regions_.clear();
  }

  static size_t PageSize() noexcept {
#if defined(_WIN32)
    return 4096U;
#else
    const long page = ::sysconf(_SC_PAGESIZE);
    return page > 0 ? static_cast<size_t>(page) : 4096U;
#endif
  }

  static size_t RoundUp(size_t value, size_t alignment) {
    if (alignment <= 1U) {
      return value;
    }
    const size_t remainder = value % alignment;
    if (remainder == 0U) {
      return value;
    }
    const size_t padding = alignment - remainder;
    if (value > (std::numeric_limits<size_t>::max() - padding)) {
      throw std::bad_array_new_length{};
    }
    return value + padding;
  }

  void LockChunks() {
    lock_capable_ = Zeroizer::MemoryLockingSupported();
    if (!lock_capable_) {
      return;
    }
    auto* raw = reinterpret_cast<uint8_t*>(ptr_);
    const size_t chunk_target = 64U * 1024U;
    size_t offset = 0;
    bool all_chunks_locked = true;
    while (offset < allocation_size_) {
      const size_t chunk_size = std::min(chunk_target, allocation_size_ - offset);
      const auto attempt = Zeroizer::TryLockMemory(std::span<uint8_t>(raw + offset, chunk_size));
      const bool chunk_locked = (attempt.status == Zeroizer::LockStatus::Locked);
      if (!chunk_locked && lock_error_ == 0) {
        lock_error_ = attempt.native_error;
      }
      lock_regions_.push_back(LockRegion{raw + offset, chunk_size, chunk_locked});
      all_chunks_locked = all_chunks_locked && chunk_locked;
      offset += chunk_size;
    }
    locked_ = all_chunks_locked;
    if (!locked_ && options_.lock_policy == LockPolicy::kBestEffort) {
      std::clog << "{\"event\":\"secure_buffer_warning\",\"message\":\"unable to lock all sensitive "
                   "memory chunks; data may page to disk\",\"errno\":"
                << lock_error_ << "}" << std::endl;
    }
  }

public:
  explicit SecureBuffer(size_t n, SecureBufferOptions options = {})
      : size_(n), options_(std::move(options)) {
    if (n > 0 && n > (std::numeric_limits<size_t>::max() / sizeof(T))) {
      throw std::bad_array_new_length{};
    }
    const size_t bytes = n * sizeof(T);
    if (bytes == 0) {
      return;
    }
    // Dump exclusion works on whole pages, so such buffers get pages of their own.
    const size_t alignment =
        options_.exclude_from_core_dump ? std::max(PageSize(), alignof(T)) : alignof(T);
    allocation_size_ = RoundUp(bytes, alignment);
#if defined(_WIN32)
    ptr_ = static_cast<T*>(_aligned_malloc(allocation_size_, alignment));
#else
    ptr_ = static_cast<T*>(std::aligned_alloc(alignment, allocation_size_));
#endif
    if (!ptr_) {
      size_ = 0;
      allocation_size_ = 0;
      throw std::bad_alloc{};
    }
    Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_), allocation_size_));
    if (options_.exclude_from_core_dump) {
      dump_excluded_ = tg::platform::ExcludeFromCoreDump(ptr_, allocation_size_);
    }
    if (options_.lock_policy != LockPolicy::kOff) {
      LockChunks();
    }
  }
  ~SecureBuffer() {
    Release();
  }
  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& o) noexcept
      : ptr_(o.ptr_), size_(o.size_), allocation_size_(o.allocation_size_), locked_(o.locked_),
        lock_capable_(o.lock_capable_), dump_excluded_(o.dump_excluded_),
        lock_error_(o.lock_error_), options_(std::move(o.options_)),
        lock_regions_(std::move(o.lock_regions_)) {
    o.ResetState();
  }
  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = o.ptr_;
      size_ = o.size_;
      allocation_size_ = o.allocation_size_;
      locked_ = o.locked_;
      lock_capable_ = o.lock_capable_;
      dump_excluded_ = o.dump_excluded_;
      lock_error_ = o.lock_error_;
      options_ = std::move(o.options_);
      lock_regions_ = std::move(o.lock_regions_);
      o.ResetState();
    }
    return *this;
  }

  // Scrubs and frees now; the buffer is empty afterwards.
  void Reset() noexcept { Release(); }

  T* data() noexcept { return ptr_; }
  const T* data() const noexcept { return ptr_; }
  size_t size() const noexcept { return size_; }
  std::span<T> AsSpan() noexcept { return {ptr_, size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_, size_}; }
  bool IsLocked() const noexcept { return locked_; }
  int LockError() const noexcept { return lock_error_; }
  const SecureBufferOptions& Options() const noexcept { return options_; }
};

} // namespace tg::security
