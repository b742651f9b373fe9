#pragma once
// platform abstraction for pinning and hiding sensitive pages

#include <cstddef>
#include <cstdint>

namespace tg::platform {

enum class MemoryLockStatus {
  kLocked,
  kBestEffort,
  kUnsupported,
};

struct MemoryLockResult {
  MemoryLockStatus status{MemoryLockStatus::kUnsupported};
  int native_error{0};  // errno / GetLastError when not locked
};

MemoryLockResult LockMemory(void* ptr, std::size_t length) noexcept;
void UnlockMemory(void* ptr, std::size_t length) noexcept;
bool MemoryLockSupported() noexcept;

// Marks the pages covering [ptr, ptr + length) as excluded from core dumps
// where the platform supports it (MADV_DONTDUMP). Page-granular: neighbouring
// data sharing a page is excluded as well. Returns false when unsupported or
// the kernel refused.
bool ExcludeFromCoreDump(void* ptr, std::size_t length) noexcept;
void IncludeInCoreDump(void* ptr, std::size_t length) noexcept;

const char* MemoryLockStatusName(MemoryLockStatus status) noexcept;

}  // namespace tg::platform
