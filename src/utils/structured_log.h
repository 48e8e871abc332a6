/**
 * @file structured_log.h
 * @brief Structured event logging on top of spdlog
 *
 * Events render as one JSON object or as key=value text, selected globally
 * from the logging.json setting.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace dnsstatd::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"stats_flush","unit_id":480000}
  TEXT   // event=stats_flush unit_id=480000
};

/**
 * @brief Builder for one structured log line
 *
 * @code
 * StructuredLog()
 *   .Event("store_error")
 *   .Field("operation", "flush")
 *   .Field("unit_id", static_cast<uint64_t>(id))
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  StructuredLog& Event(std::string event) {
    event_ = std::move(event);
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  void Error() const { spdlog::error("{}", ToString()); }
  void Warn() const { spdlog::warn("{}", ToString()); }
  void Info() const { spdlog::info("{}", ToString()); }
  void Debug() const { spdlog::debug("{}", ToString()); }

  /**
   * @brief Render the line in the current global format
   */
  std::string ToString() const { return GetFormat() == LogFormat::TEXT ? RenderText() : RenderJson(); }

 private:
  struct FieldValue {
    std::string key;
    std::string value;
    bool quoted;
  };

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.push_back(FieldValue{key, std::move(value), true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, std::string value) {
    fields_.push_back(FieldValue{key, std::move(value), false});
    return *this;
  }

  std::string RenderJson() const {
    std::string out = "{";
    auto append = [&out](const std::string& key, const std::string& value, bool quoted) {
      if (out.size() > 1) {
        out += ',';
      }
      out += '"';
      out += EscapeJson(key);
      out += "\":";
      if (quoted) {
        out += '"';
        out += EscapeJson(value);
        out += '"';
      } else {
        out += value;
      }
    };
    if (!event_.empty()) {
      append("event", event_, true);
    }
    for (const auto& field : fields_) {
      append(field.key, field.value, field.quoted);
    }
    out += '}';
    return out;
  }

  std::string RenderText() const {
    std::string out;
    auto append = [&out](const std::string& key, const std::string& value) {
      if (!out.empty()) {
        out += ' ';
      }
      out += key;
      out += '=';
      if (value.empty() || value.find_first_of(" \"\\\n\r\t=") != std::string::npos) {
        out += '"';
        out += EscapeJson(value);
        out += '"';
      } else {
        out += value;
      }
    };
    if (!event_.empty()) {
      append("event", event_);
    }
    for (const auto& field : fields_) {
      append(field.key, field.value);
    }
    return out;
  }

  static std::string EscapeJson(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped += "\\\"";
          break;
        case '\\':
          escaped += "\\\\";
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          if (static_cast<unsigned char>(chr) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(chr)));
            escaped += buf;
          } else {
            escaped += chr;
          }
      }
    }
    return escaped;
  }

  std::string event_;
  std::vector<FieldValue> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

inline void LogStatsError(const std::string& operation, const std::string& error_msg) {
  StructuredLog().Event("stats_error").Field("operation", operation).Field("error", error_msg).Error();
}

/**
 * @brief Log the outcome of one flush transaction
 */
inline void LogStatsFlush(uint32_t unit_id, size_t units_written, bool ok) {
  StructuredLog()
      .Event("stats_flush")
      .Field("unit_id", static_cast<uint64_t>(unit_id))
      .Field("units_written", static_cast<uint64_t>(units_written))
      .Field("ok", ok)
      .Debug();
}

inline void LogStoreError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("store_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

inline void LogStoreInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("store_info").Field("operation", operation).Field("message", message).Info();
}

inline void LogStoreWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("store_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a failed or rejected HTTP request
 *
 * Paths are cut to 200 characters.
 */
inline void LogHttpRequestError(const std::string& path, const std::string& remote_addr, const std::string& error_msg) {
  constexpr size_t kMaxPathLogLength = 200;

  StructuredLog()
      .Event("http_request_error")
      .Field("path", path.substr(0, kMaxPathLogLength))
      .Field("remote_addr", remote_addr)
      .Field("error", error_msg)
      .Warn();
}

}  // namespace dnsstatd::utils
