#include "feishu_tracing.hpp"
#include <filesystem>
#include <iomanip>
#include <ctime>

namespace feishu_auth {

static const char* TRACE_FILE_NAME = "feishu_auth_trace.log";

FeishuTracer& FeishuTracer::Instance() {
    static FeishuTracer instance;
    return instance;
}

void FeishuTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;

        if (enabled && !trace_file && output_mode != "console") {
            OpenTraceFile();
        } else if (!enabled && trace_file) {
            if (trace_file->is_open()) {
                trace_file->close();
            }
            trace_file.reset();
        }
    }
    Info("TRACER", std::string("Tracing ") + (enabled ? "enabled" : "disabled"));
}

void FeishuTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + LevelToString(level));
}

void FeishuTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory;

        std::filesystem::path dir_path(directory);
        std::error_code ec;
        if (!std::filesystem::exists(dir_path, ec)) {
            std::filesystem::create_directories(dir_path, ec);
            if (ec) {
                std::cerr << "Failed to create trace directory: " << directory << " (" << ec.message() << ")" << std::endl;
            }
        }

        // Reopen trace file if tracing is enabled
        if (enabled && trace_file) {
            trace_file->close();
            trace_file.reset();
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void FeishuTracer::SetOutputMode(const std::string& output_mode) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = output_mode;
        if (enabled && !trace_file && output_mode != "console") {
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace output mode set to: " + output_mode);
}

void FeishuTracer::OpenTraceFile() {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

void FeishuTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, std::string());
}

void FeishuTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled || msg_level > level || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(100 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    Emit(log_message);
}

void FeishuTracer::Emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(trace_mutex);
    if (output_mode != "file") {
        std::cout << line << std::endl;
    }
    WriteToFile(line);
}

void FeishuTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void FeishuTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void FeishuTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void FeishuTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void FeishuTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void FeishuTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void FeishuTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void FeishuTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void FeishuTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void FeishuTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void FeishuTracer::WriteToFile(const std::string& message) {
    if (trace_file && trace_file->is_open()) {
        *trace_file << message << std::endl;
        trace_file->flush();
    }
}

std::string FeishuTracer::GetTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

std::string FeishuTracer::LevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

// ----------------------------------------------------------------------

TracerEventLogger::TracerEventLogger(std::string component)
    : component_(std::move(component)) {
}

void TracerEventLogger::Log(TraceLevel level, const std::string& event, const ErrorContext& fields) {
    FeishuTracer::Instance().Trace(level, component_, fields.Format(event));
}

} // namespace feishu_auth
