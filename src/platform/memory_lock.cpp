#include "tg/platform/memory_lock.h"
// platform-specific implementations for VirtualLock/mlock and dump exclusion

#include <cerrno>
#include <cstdint>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#if defined(_POSIX_VERSION) || defined(__APPLE__)
#include <sys/mman.h>
#endif
#endif

namespace tg::platform {

namespace {

#if !defined(_WIN32)
// madvise wants a page-aligned start; widen the range to whole pages.
bool PageRange(void* ptr, std::size_t length, void*& begin, std::size_t& span) noexcept {
  const long page = ::sysconf(_SC_PAGESIZE);
  if (page <= 0) {
    return false;
  }
  const auto page_size = static_cast<std::uintptr_t>(page);
  const auto start = reinterpret_cast<std::uintptr_t>(ptr);
  const auto aligned_start = start & ~(page_size - 1U);
  const auto end = start + length;
  const auto aligned_end = (end + page_size - 1U) & ~(page_size - 1U);
  begin = reinterpret_cast<void*>(aligned_start);
  span = static_cast<std::size_t>(aligned_end - aligned_start);
  return true;
}
#endif

}  // namespace

MemoryLockResult LockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return {MemoryLockStatus::kBestEffort, 0};
  }
#if defined(_WIN32)
  if (::VirtualLock(ptr, length) != 0) {
    return {MemoryLockStatus::kLocked, 0};
  }
  const DWORD err = ::GetLastError();
  if (err == ERROR_NOT_SUPPORTED) {
    return {MemoryLockStatus::kUnsupported, static_cast<int>(err)};
  }
  return {MemoryLockStatus::kBestEffort, static_cast<int>(err)};
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
  if (::mlock(ptr, length) == 0) {
    return {MemoryLockStatus::kLocked, 0};
  }
  const int err = errno;
  if (err == ENOSYS) {
    return {MemoryLockStatus::kUnsupported, err};
  }
  // EPERM / ENOMEM: RLIMIT_MEMLOCK exhausted or no CAP_IPC_LOCK
  return {MemoryLockStatus::kBestEffort, err};
#else
  (void)ptr;
  (void)length;
  return {MemoryLockStatus::kUnsupported, 0};
#endif
}

void UnlockMemory(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return;
  }
#if defined(_WIN32)
  ::VirtualUnlock(ptr, length);
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
  ::munlock(ptr, length);
#else
  (void)ptr;
  (void)length;
#endif
}

bool MemoryLockSupported() noexcept {
#if defined(_WIN32)
  return true;
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
  return true;
#else
  return false;
#endif
}

bool ExcludeFromCoreDump(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return false;
  }
#if defined(__linux__) && defined(MADV_DONTDUMP)
  void* begin = nullptr;
  std::size_t span = 0;
  if (!PageRange(ptr, length, begin, span)) {
    return false;
  }
  return ::madvise(begin, span, MADV_DONTDUMP) == 0;
#elif defined(__FreeBSD__) && defined(MADV_NOCORE)
  void* begin = nullptr;
  std::size_t span = 0;
  if (!PageRange(ptr, length, begin, span)) {
    return false;
  }
  return ::madvise(begin, span, MADV_NOCORE) == 0;
#else
  (void)ptr;
  (void)length;
  return false;
#endif
}

void IncludeInCoreDump(void* ptr, std::size_t length) noexcept {
  if (!ptr || length == 0) {
    return;
  }
#if defined(__linux__) && defined(MADV_DODUMP)
  void* begin = nullptr;
  std::size_t span = 0;
  if (PageRange(ptr, length, begin, span)) {
    ::madvise(begin, span, MADV_DODUMP);
  }
#elif defined(__FreeBSD__) && defined(MADV_CORE)
  void* begin = nullptr;
  std::size_t span = 0;
  if (PageRange(ptr, length, begin, span)) {
    ::madvise(begin, span, MADV_CORE);
  }
#else
  (void)ptr;
  (void)length;
#endif
}

const char* MemoryLockStatusName(MemoryLockStatus status) noexcept {
  switch (status) {
    case MemoryLockStatus::kLocked:
      return "locked";
    case MemoryLockStatus::kBestEffort:
      return "best_effort";
    case MemoryLockStatus::kUnsupported:
      return "unsupported";
  }
  return "unsupported";
}

}  // namespace tg::platform
