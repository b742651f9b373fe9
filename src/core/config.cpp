#include "tg/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>

#include "tg/common.h"

namespace tg {

namespace {

constexpr std::size_t kConfigSubjectMax = 32;

Fault BadValue(std::string_view name, std::string_view value, std::string_view expected) {
  std::string message(name);
  message.append(": expected ");
  message.append(expected);
  return Fault::InvalidConfig(std::move(message), TruncateForAudit(value, kConfigSubjectMax));
}

std::optional<unsigned long long> ParseUnsigned(std::string_view text, int base) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> ParseFlag(std::string_view text) noexcept {
  if (text == "1" || text == "true") {
    return true;
  }
  if (text == "0" || text == "false") {
    return false;
  }
  return std::nullopt;
}

// Unset and empty variables both leave the default in place.
std::optional<std::string> Lookup(const EnvironmentLookup& lookup, std::string_view name) {
  auto value = lookup(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<security::LockPolicy> ParseLockPolicy(std::string_view text) noexcept {
  if (text == "off") {
    return security::LockPolicy::kOff;
  }
  if (text == "best-effort") {
    return security::LockPolicy::kBestEffort;
  }
  if (text == "strict") {
    return security::LockPolicy::kStrict;
  }
  return std::nullopt;
}

const char* LockPolicyName(security::LockPolicy policy) noexcept {
  switch (policy) {
    case security::LockPolicy::kOff:
      return "off";
    case security::LockPolicy::kBestEffort:
      return "best-effort";
    case security::LockPolicy::kStrict:
      return "strict";
  }
  return "best-effort";
}

Outcome<ToolkitConfig> LoadConfig(const EnvironmentLookup& lookup) {
  ToolkitConfig config;

  if (auto raw = Lookup(lookup, "TG_WIPE_PATTERN")) {
    std::string_view text(*raw);
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
      text.remove_prefix(2);
      base = 16;
    }
    auto value = ParseUnsigned(text, base);
    if (!value || *value > 0xFF) {
      return Fail(BadValue("TG_WIPE_PATTERN", *raw, "a byte value 0-255"));
    }
    config.wipe_pattern = static_cast<std::uint8_t>(*value);
  }

  if (auto raw = Lookup(lookup, "TG_MEMLOCK")) {
    auto policy = ParseLockPolicy(*raw);
    if (!policy) {
      return Fail(BadValue("TG_MEMLOCK", *raw, "off, best-effort or strict"));
    }
    config.lock_policy = *policy;
  }

  if (auto raw = Lookup(lookup, "TG_NO_CORE_DUMP")) {
    auto flag = ParseFlag(*raw);
    if (!flag) {
      return Fail(BadValue("TG_NO_CORE_DUMP", *raw, "0 or 1"));
    }
    config.exclude_from_core_dump = *flag;
  }

  if (auto raw = Lookup(lookup, "TG_MAX_CAPTURE_BYTES")) {
    auto value = ParseUnsigned(*raw, 10);
    if (!value || *value == 0 || *value > std::numeric_limits<std::size_t>::max()) {
      return Fail(BadValue("TG_MAX_CAPTURE_BYTES", *raw, "a positive byte count"));
    }
    config.max_capture_bytes = static_cast<std::size_t>(*value);
  }

  if (auto raw = Lookup(lookup, "TG_FAIL_ON_NONZERO")) {
    auto flag = ParseFlag(*raw);
    if (!flag) {
      return Fail(BadValue("TG_FAIL_ON_NONZERO", *raw, "0 or 1"));
    }
    config.fail_on_nonzero_exit = *flag;
  }

  if (auto raw = Lookup(lookup, "TG_LOG_LEVEL")) {
    auto severity = diagnostics::ParseSeverity(*raw);
    if (!severity) {
      return Fail(BadValue("TG_LOG_LEVEL", *raw, "debug, info, warning, error or critical"));
    }
    config.min_log_severity = *severity;
  }

  if (auto raw = Lookup(lookup, "TG_AUDIT_SUBJECT_MAX")) {
    auto value = ParseUnsigned(*raw, 10);
    if (!value || *value == 0 || *value > kMaxAuditSubjectMax) {
      return Fail(BadValue("TG_AUDIT_SUBJECT_MAX", *raw, "a length between 1 and 4096"));
    }
    config.audit_subject_max = static_cast<std::size_t>(*value);
  }

  return config;
}

Outcome<ToolkitConfig> LoadConfigFromEnvironment() {
  return LoadConfig([](std::string_view name) -> std::optional<std::string> {
    const std::string key(name);
    if (const char* value = std::getenv(key.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  });
}

security::SecretCellOptions SecretOptionsFrom(const ToolkitConfig& config) {
  security::SecretCellOptions options;
  options.wipe_pattern = config.wipe_pattern;
  options.lock_policy = config.lock_policy;
  options.exclude_from_core_dump = config.exclude_from_core_dump;
  return options;
}

boundary::PathGuardOptions PathGuardOptionsFrom(const ToolkitConfig& config) {
  boundary::PathGuardOptions options;
  options.audit_subject_max = config.audit_subject_max;
  return options;
}

boundary::CommandSpec CommandFrom(const ToolkitConfig& config, std::string program) {
  boundary::CommandSpec spec(std::move(program));
  spec.MaxCaptureBytes(config.max_capture_bytes).FailOnNonZeroExit(config.fail_on_nonzero_exit);
  return spec;
}

} // namespace tg
