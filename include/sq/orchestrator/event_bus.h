#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sq::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError };

  enum class EventCategory { kLifecycle, kDiagnostics };

  enum class FieldPrivacy { kPublic, kHash };

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

  // Short SHA-256 tag used in place of values logged with FieldPrivacy::kHash.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity);

  // Renders the value of a field after its privacy policy is applied.
  std::string RenderFieldValue(const EventField& field);

  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path);

    void Log(const Event& event);
    void SetPath(std::filesystem::path log_path);
    std::filesystem::path path() const;

  private:
    static std::filesystem::path DefaultLogPath();
    static size_t ResolveMaxBytes();
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpenLocked();
    void RotateIfNeededLocked(size_t incoming_bytes);

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    bool disabled_{false};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Builds and publishes an event in one call; the common case at call sites.
  void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                    std::string message, std::vector<EventField> fields = {});

  void ResetEventBusForTesting(); // test-only teardown

} // namespace sq::orchestrator
