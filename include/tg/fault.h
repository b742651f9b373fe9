#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tg {

  enum class FaultKind : std::uint8_t {
    kInvalidRoot = 1,
    kPathTraversal,
    kNotFound,
    kSpawnFailed,
    kNonZeroExit,
    kInvalidConfig,
    kMemoryLockFailed,
  };

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  // Stable identifiers used in structured events and CLI output.
  constexpr std::string_view FaultKindName(FaultKind kind) noexcept {
    switch (kind) {
    case FaultKind::kInvalidRoot:
      return "invalid_root";
    case FaultKind::kPathTraversal:
      return "path_traversal";
    case FaultKind::kNotFound:
      return "not_found";
    case FaultKind::kSpawnFailed:
      return "spawn_failed";
    case FaultKind::kNonZeroExit:
      return "nonzero_exit";
    case FaultKind::kInvalidConfig:
      return "invalid_config";
    case FaultKind::kMemoryLockFailed:
      return "memory_lock_failed";
    }
    return "unknown";
  }

  constexpr Retryability DefaultRetryability(FaultKind kind) noexcept {
    switch (kind) {
    case FaultKind::kNotFound:
    case FaultKind::kNonZeroExit:
      return Retryability::kRetryable;
    default:
      return Retryability::kFatal;
    }
  }

  Retryability ClassifyNativeError(int native) noexcept;

  struct Fault {
    FaultKind kind;
    std::string message;
    std::optional<int> native_code;
    std::optional<int> exit_code;       // kNonZeroExit only
    std::string subject;                // untrusted input, already truncated
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;   // innermost first

    Fault(FaultKind k, std::string msg)
        : kind(k), message(std::move(msg)), retryability(DefaultRetryability(k)) {}

    static Fault InvalidRoot(std::string msg, std::optional<int> native = std::nullopt);
    static Fault PathTraversal(std::string msg, std::string subject);
    static Fault NotFound(std::string msg, std::string subject,
                          std::optional<int> native = std::nullopt);
    static Fault SpawnFailed(std::string msg, std::optional<int> native = std::nullopt);
    static Fault NonZeroExit(int code, std::string msg);
    static Fault InvalidConfig(std::string msg, std::string subject = {});
    static Fault MemoryLockFailed(std::string msg, std::optional<int> native = std::nullopt);

    bool Is(FaultKind k) const noexcept { return kind == k; }
    bool IsRetryable() const noexcept { return retryability != Retryability::kFatal; }

    Fault& WithContext(std::string description) {
      context.push_back(std::move(description));
      return *this;
    }

    // Message followed by one "while:" line per context entry, outermost last.
    std::string Describe() const;
  };

  std::ostream& operator<<(std::ostream& os, const Fault& fault);

} // namespace tg
