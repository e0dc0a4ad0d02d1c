#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <iostream>

#include "error_context.hpp"

namespace feishu_auth {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

class FeishuTracer {
public:
    static FeishuTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutputMode(const std::string& output_mode);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);

    // Convenience methods for different trace levels
    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

    static std::string LevelToString(TraceLevel level);

private:
    FeishuTracer() = default;
    ~FeishuTracer() = default;
    FeishuTracer(const FeishuTracer&) = delete;
    FeishuTracer& operator=(const FeishuTracer&) = delete;

    void Emit(const std::string& line);
    void WriteToFile(const std::string& message);
    void OpenTraceFile();
    std::string GetTimestamp();

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

// ----------------------------------------------------------------------

// Structured event sink handed to the authentication strategy. Fields are
// carried in an ErrorContext so the same key/value formatting is used for
// log lines and error messages.
class EventLogger {
public:
    virtual ~EventLogger() = default;
    virtual void Log(TraceLevel level, const std::string& event, const ErrorContext& fields) = 0;
};

// Default sink, forwards every event to the FeishuTracer singleton
class TracerEventLogger : public EventLogger {
public:
    explicit TracerEventLogger(std::string component = "AUTH_STRATEGY");
    void Log(TraceLevel level, const std::string& event, const ErrorContext& fields) override;

private:
    std::string component_;
};

// Convenience macros for tracing
#define FEISHU_TRACE_ERROR(component, message) \
    ::feishu_auth::FeishuTracer::Instance().Error(component, message)

#define FEISHU_TRACE_ERROR_DATA(component, message, data) \
    ::feishu_auth::FeishuTracer::Instance().Error(component, message, data)

#define FEISHU_TRACE_WARN(component, message) \
    ::feishu_auth::FeishuTracer::Instance().Warn(component, message)

#define FEISHU_TRACE_WARN_DATA(component, message, data) \
    ::feishu_auth::FeishuTracer::Instance().Warn(component, message, data)

#define FEISHU_TRACE_INFO(component, message) \
    ::feishu_auth::FeishuTracer::Instance().Info(component, message)

#define FEISHU_TRACE_INFO_DATA(component, message, data) \
    ::feishu_auth::FeishuTracer::Instance().Info(component, message, data)

#define FEISHU_TRACE_DEBUG(component, message) \
    ::feishu_auth::FeishuTracer::Instance().Debug(component, message)

#define FEISHU_TRACE_DEBUG_DATA(component, message, data) \
    ::feishu_auth::FeishuTracer::Instance().Debug(component, message, data)

#define FEISHU_TRACE_TRACE(component, message) \
    ::feishu_auth::FeishuTracer::Instance().Trace(component, message)

} // namespace feishu_auth
