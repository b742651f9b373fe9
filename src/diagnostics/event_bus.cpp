#include "tg/diagnostics/event_bus.h"

#include "tg/common.h"
#include "tg/crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace tg::diagnostics {
namespace {

// Buses currently delivering on this thread. A subscriber may forward to a
// different bus, but not back into one that is already delivering.
class PublishReentrancyGuard {
 public:
  explicit PublishReentrancyGuard(const void* bus) : bus_(bus) {
    auto& active = Active();
    entered_ = std::find(active.begin(), active.end(), bus_) == active.end();
    if (entered_) {
      active.push_back(bus_);
    }
  }
  ~PublishReentrancyGuard() {
    if (entered_) {
      auto& active = Active();
      active.erase(std::find(active.begin(), active.end(), bus_));
    }
  }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

  bool Entered() const noexcept { return entered_; }

 private:
  static std::vector<const void*>& Active() {
    static thread_local std::vector<const void*> active;
    return active;
  }

  const void* bus_;
  bool entered_{false};
};

std::string HexEncode(std::span<const std::uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::string HashTag(std::string_view value) {
  auto digest = HashForTelemetry(value);
  if (digest.empty()) {
    return std::string{"hash:"};
  }
  return std::string{"hash:"} + digest;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

bool AppendWithLimit(std::string& out, std::string_view chunk, std::size_t limit) {
  if (out.size() > limit || chunk.size() > limit - out.size()) {
    return false;
  }
  out.append(chunk.data(), chunk.size());
  return true;
}

bool AppendEscapedWithLimit(std::string& out, std::string_view chunk, std::size_t limit) {
  return AppendWithLimit(out, EscapeJson(chunk), limit);
}

bool AppendStringMember(std::string& out, std::string_view key, std::string_view value,
                        std::size_t limit) {
  return AppendWithLimit(out, ",\"", limit) && AppendEscapedWithLimit(out, key, limit) &&
         AppendWithLimit(out, "\":\"", limit) && AppendEscapedWithLimit(out, value, limit) &&
         AppendWithLimit(out, "\"", limit);
}

bool IsBoundaryFault(FaultKind kind) noexcept {
  return kind == FaultKind::kPathTraversal || kind == FaultKind::kInvalidRoot;
}

EventSeverity SeverityForFault(const Fault& fault) noexcept {
  switch (fault.kind) {
  case FaultKind::kPathTraversal:
  case FaultKind::kMemoryLockFailed:
    return EventSeverity::kError;
  case FaultKind::kNotFound:
  case FaultKind::kNonZeroExit:
    return EventSeverity::kWarning;
  default:
    return EventSeverity::kError;
  }
}

const char* RetryabilityToString(Retryability retry) noexcept {
  switch (retry) {
  case Retryability::kFatal:
    return "fatal";
  case Retryability::kTransient:
    return "transient";
  case Retryability::kRetryable:
    return "retryable";
  }
  return "fatal";
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto digest = tg::crypto::SHA256_Hash(input);
  if (!digest) {
    return "";
  }
  return HexEncode(std::span<const std::uint8_t>(digest->data(), digest->size()));
}

const char* SeverityToString(EventSeverity severity) noexcept {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) noexcept {
  switch (category) {
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) noexcept {
  std::string lowered;
  lowered.reserve(text.size());
  for (char ch : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  for (auto candidate : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                         EventSeverity::kError, EventSeverity::kCritical}) {
    if (lowered == SeverityToString(candidate)) {
      return candidate;
    }
  }
  if (lowered == "warn") {
    return EventSeverity::kWarning;
  }
  return std::nullopt;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                          std::size_t max_bytes) {
  std::string payload;
  payload.reserve(std::min<std::size_t>(max_bytes, 256));
  if (!AppendWithLimit(payload, "{\"ts\":\"", max_bytes) ||
      !AppendEscapedWithLimit(payload, timestamp, max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes) ||
      !AppendWithLimit(payload, ",\"severity\":\"", max_bytes) ||
      !AppendWithLimit(payload, SeverityToString(event.severity), max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes) ||
      !AppendWithLimit(payload, ",\"category\":\"", max_bytes) ||
      !AppendWithLimit(payload, CategoryToString(event.category), max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes)) {
    return std::nullopt;
  }
  if (!event.event_id.empty() &&
      !AppendStringMember(payload, "event_id", event.event_id, max_bytes)) {
    return std::nullopt;
  }
  if (!event.message.empty() &&
      !AppendStringMember(payload, "message", event.message, max_bytes)) {
    return std::nullopt;
  }
  for (const auto& field : event.fields) {
    std::string sanitized;
    switch (field.privacy) {
    case FieldPrivacy::kRedact:
      sanitized = std::string(kRedactionToken);
      break;
    case FieldPrivacy::kHash:
      sanitized = HashTag(field.value);
      break;
    case FieldPrivacy::kPublic:
      sanitized = field.value;
      break;
    }
    if (!AppendWithLimit(payload, ",\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, field.key, max_bytes) ||
        !AppendWithLimit(payload, "\":", max_bytes)) {
      return std::nullopt;
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      if (!AppendWithLimit(payload, sanitized, max_bytes)) {
        return std::nullopt;
      }
    } else if (!AppendWithLimit(payload, "\"", max_bytes) ||
               !AppendEscapedWithLimit(payload, sanitized, max_bytes) ||
               !AppendWithLimit(payload, "\"", max_bytes)) {
      return std::nullopt;
    }
  }
  if (!AppendWithLimit(payload, "}", max_bytes)) {
    return std::nullopt;
  }
  return payload;
}

Event FaultEvent(const Fault& fault, std::string_view operation) {
  Event event;
  event.category = IsBoundaryFault(fault.kind) ? EventCategory::kSecurity
                                               : EventCategory::kDiagnostics;
  event.severity = SeverityForFault(fault);
  event.event_id = std::string("fault.") + std::string(FaultKindName(fault.kind));
  event.message = fault.message;
  if (!operation.empty()) {
    event.fields.emplace_back("operation", std::string(operation));
  }
  event.fields.emplace_back("retry", RetryabilityToString(fault.retryability));
  if (fault.exit_code) {
    event.fields.emplace_back("exit_code", std::to_string(*fault.exit_code),
                              FieldPrivacy::kPublic, true);
  }
  if (fault.native_code) {
    event.fields.emplace_back("errno", std::to_string(*fault.native_code),
                              FieldPrivacy::kPublic, true);
  }
  if (!fault.subject.empty()) {
    event.fields.emplace_back("subject", fault.subject, FieldPrivacy::kHash);
  }
  for (std::size_t i = 0; i < fault.context.size(); ++i) {
    event.fields.emplace_back("context_" + std::to_string(i), fault.context[i]);
  }
  return event;
}

EventBus::EventBus(EventSeverity minimum) noexcept
    : minimum_severity_(static_cast<int>(minimum)) {}

bool EventBus::Publish(const Event& event) {
  if (static_cast<int>(event.severity) < minimum_severity_.load(std::memory_order_relaxed)) {
    return false;
  }
  return Deliver(event);
}

bool EventBus::PublishRecord(const Event& event) {
  return Deliver(event);
}

bool EventBus::Deliver(const Event& event) {
  PublishReentrancyGuard guard(this);
  if (!guard.Entered()) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return false;
  }
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  published_.fetch_add(1, std::memory_order_relaxed);
  if (!targets) {
    return false;
  }
  bool delivered = false;
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
      delivered = true;
    }
  }
  return delivered;
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current)
                         : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void EventBus::SetMinimumSeverity(EventSeverity minimum) noexcept {
  minimum_severity_.store(static_cast<int>(minimum), std::memory_order_relaxed);
}

EventSeverity EventBus::MinimumSeverity() const noexcept {
  return static_cast<EventSeverity>(minimum_severity_.load(std::memory_order_relaxed));
}

std::uint64_t EventBus::PublishedCount() const noexcept {
  return published_.load(std::memory_order_relaxed);
}

StreamSink::StreamSink(std::ostream& out) : out_(&out), mutex_(std::make_shared<std::mutex>()) {}

void StreamSink::operator()(const Event& event) const {
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  auto line = BuildEventJson(event, timestamp);
  if (!line) {
    Event replacement;
    replacement.category = event.category;
    replacement.severity = event.severity;
    replacement.event_id = "event_oversize";
    replacement.fields.emplace_back("original_event_id", TruncateForAudit(event.event_id, 128));
    replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes),
                                    FieldPrivacy::kPublic, true);
    line = BuildEventJson(replacement, timestamp);
    if (!line) {
      return;
    }
  }
  std::lock_guard<std::mutex> guard(*mutex_);
  (*out_) << *line << '\n';
  out_->flush();
}

} // namespace tg::diagnostics
