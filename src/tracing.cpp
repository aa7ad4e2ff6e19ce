#include "tracing.hpp"
#include "duckdb.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace odata_writer {

static const char *TRACE_FILE_NAME = "odata_writer_trace.log";

TraceLevel TraceLevelFromString(const std::string& level_str) {
    auto upper = duckdb::StringUtil::Upper(level_str);
    if (upper == "NONE") {
        return TraceLevel::NONE;
    } else if (upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (upper == "WARN") {
        return TraceLevel::WARN;
    } else if (upper == "INFO") {
        return TraceLevel::INFO;
    } else if (upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (upper == "TRACE") {
        return TraceLevel::TRACE;
    }
    throw duckdb::InvalidInputException("Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string TraceLevelToString(TraceLevel level) {
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

ODataWriterTracer& ODataWriterTracer::Instance() {
    static ODataWriterTracer instance;
    return instance;
}

void ODataWriterTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->enabled = enabled;
        if (enabled && WritesToFile()) {
            OpenTraceFile();
        } else if (!enabled) {
            CloseTraceFile();
        }
    }
    Info("TRACER", enabled ? "Tracing enabled" : "Tracing disabled");
}

void ODataWriterTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + TraceLevelToString(level));
}

void ODataWriterTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory;

        std::filesystem::path dir_path(directory);
        if (!std::filesystem::exists(dir_path)) {
            std::filesystem::create_directories(dir_path);
        }

        if (trace_file) {
            CloseTraceFile();
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void ODataWriterTracer::SetOutputMode(const std::string& output_mode) {
    auto mode = duckdb::StringUtil::Lower(output_mode);
    if (mode != "console" && mode != "file" && mode != "both") {
        throw duckdb::InvalidInputException("Invalid trace output: " + output_mode + ". Valid outputs are: console, file, both");
    }

    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output_mode = mode;
        if (enabled && WritesToFile() && !trace_file) {
            OpenTraceFile();
        } else if (!WritesToFile()) {
            CloseTraceFile();
        }
    }
    Info("TRACER", "Trace output mode set to: " + mode);
}

void ODataWriterTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!ShouldTrace(msg_level)) {
        return;
    }

    std::string log_message;
    log_message.reserve(64 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += TraceLevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    std::lock_guard<std::mutex> lock(trace_mutex);
    if (WritesToConsole()) {
        std::cout << log_message << std::endl;
    }
    if (trace_file && trace_file->is_open()) {
        *trace_file << log_message << std::endl;
    }
}

void ODataWriterTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void ODataWriterTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void ODataWriterTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void ODataWriterTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void ODataWriterTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

// Caller holds trace_mutex
void ODataWriterTracer::OpenTraceFile() {
    std::filesystem::path trace_path = trace_directory;
    trace_path /= TRACE_FILE_NAME;

    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

// Caller holds trace_mutex
void ODataWriterTracer::CloseTraceFile() {
    if (trace_file) {
        trace_file->close();
        trace_file.reset();
    }
}

std::string ODataWriterTracer::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream timestamp;
    timestamp << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count();
    return timestamp.str();
}

} // namespace odata_writer
