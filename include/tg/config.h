#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "tg/boundary/command_spec.h"
#include "tg/boundary/path_guard.h"
#include "tg/diagnostics/event_bus.h"
#include "tg/outcome.h"
#include "tg/security/secret_cell.h"

namespace tg {

  inline constexpr std::size_t kDefaultAuditSubjectMax = 64;
  inline constexpr std::size_t kMaxAuditSubjectMax = 4096;

  // Owned by the application and handed to the components that need it;
  // nothing in the toolkit reads the environment behind the caller's back.
  struct ToolkitConfig {
    std::uint8_t wipe_pattern{0x00};                                    // TG_WIPE_PATTERN
    security::LockPolicy lock_policy{security::LockPolicy::kBestEffort}; // TG_MEMLOCK
    bool exclude_from_core_dump{true};                                  // TG_NO_CORE_DUMP
    std::size_t max_capture_bytes{boundary::kDefaultMaxCaptureBytes};   // TG_MAX_CAPTURE_BYTES
    bool fail_on_nonzero_exit{false};                                   // TG_FAIL_ON_NONZERO
    diagnostics::EventSeverity min_log_severity{diagnostics::EventSeverity::kInfo}; // TG_LOG_LEVEL
    std::size_t audit_subject_max{kDefaultAuditSubjectMax};             // TG_AUDIT_SUBJECT_MAX
  };

  // Returns the variable's value, or nullopt when unset.
  using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

  Outcome<ToolkitConfig> LoadConfig(const EnvironmentLookup& lookup);
  Outcome<ToolkitConfig> LoadConfigFromEnvironment();

  std::optional<security::LockPolicy> ParseLockPolicy(std::string_view text) noexcept;
  const char* LockPolicyName(security::LockPolicy policy) noexcept;

  security::SecretCellOptions SecretOptionsFrom(const ToolkitConfig& config);
  boundary::PathGuardOptions PathGuardOptionsFrom(const ToolkitConfig& config);

  // A CommandSpec carrying the configured capture cap and nonzero-exit policy.
  boundary::CommandSpec CommandFrom(const ToolkitConfig& config, std::string program);

} // namespace tg
