#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tg/fault.h"

namespace tg::diagnostics {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  inline constexpr std::size_t kMaxEventBytes = 16 * 1024;

  // Lowercase hex SHA-256 of |input|, empty for empty input or digest failure.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity) noexcept;
  const char* CategoryToString(EventCategory category) noexcept;
  std::optional<EventSeverity> ParseSeverity(std::string_view text) noexcept;

  std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

  // Renders one JSON object (no trailing newline). Returns nullopt when the
  // rendering would exceed |max_bytes|.
  std::optional<std::string> BuildEventJson(const Event& event, const std::string& timestamp,
                                            std::size_t max_bytes = kMaxEventBytes);

  // Security events for boundary faults, diagnostics for the rest. The fault
  // subject is always attached as a hashed field.
  Event FaultEvent(const Fault& fault, std::string_view operation);

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    explicit EventBus(EventSeverity minimum = EventSeverity::kInfo) noexcept;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Returns true when the event reached at least one subscriber. Events
    // below the minimum severity are filtered out.
    bool Publish(const Event& event);
    // Same delivery without the severity filter; for records that must not be
    // lost, such as a failure being dropped on purpose.
    bool PublishRecord(const Event& event);
    void Subscribe(Subscriber fn);

    void SetMinimumSeverity(EventSeverity minimum) noexcept;
    EventSeverity MinimumSeverity() const noexcept;
    std::uint64_t PublishedCount() const noexcept;

  private:
    using SubscriberList = std::vector<Subscriber>;

    bool Deliver(const Event& event);

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    std::atomic<int> minimum_severity_;
    std::atomic<std::uint64_t> published_{0};
  };

  // Subscriber writing one JSON line per event. Copies share the same stream lock.
  class StreamSink {
  public:
    explicit StreamSink(std::ostream& out = std::clog);
    void operator()(const Event& event) const;

  private:
    std::ostream* out_;
    std::shared_ptr<std::mutex> mutex_;
  };

} // namespace tg::diagnostics
