#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <iostream>

namespace odata_writer {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

// Parses NONE, ERROR, WARN, INFO, DEBUG or TRACE (case-insensitive)
TraceLevel TraceLevelFromString(const std::string& level_str);
std::string TraceLevelToString(TraceLevel level);

class ODataWriterTracer {
public:
    static ODataWriterTracer& Instance();

    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    // One of "console", "file" or "both"
    void SetOutputMode(const std::string& output_mode);

    bool IsEnabled() const { return enabled; }
    TraceLevel GetLevel() const { return level; }
    std::string GetOutputMode() const { return output_mode; }
    std::string GetTraceDirectory() const { return trace_directory; }
    bool ShouldTrace(TraceLevel msg_level) const { return enabled && msg_level != TraceLevel::NONE && msg_level <= level; }

    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data = "");

    void Error(const std::string& component, const std::string& message, const std::string& data = "");
    void Warn(const std::string& component, const std::string& message, const std::string& data = "");
    void Info(const std::string& component, const std::string& message, const std::string& data = "");
    void Debug(const std::string& component, const std::string& message, const std::string& data = "");
    void Trace(const std::string& component, const std::string& message, const std::string& data = "");

private:
    ODataWriterTracer() = default;
    ~ODataWriterTracer() = default;
    ODataWriterTracer(const ODataWriterTracer&) = delete;
    ODataWriterTracer& operator=(const ODataWriterTracer&) = delete;

    void OpenTraceFile();
    void CloseTraceFile();
    std::string GetTimestamp() const;
    bool WritesToConsole() const { return output_mode == "console" || output_mode == "both"; }
    bool WritesToFile() const { return output_mode == "file" || output_mode == "both"; }

    bool enabled = false;
    TraceLevel level = TraceLevel::INFO;
    std::string trace_directory = ".";
    std::string output_mode = "console";
    std::unique_ptr<std::ofstream> trace_file;
    std::mutex trace_mutex;
};

#define ODATA_WRITER_TRACE_ERROR(component, message) \
    ::odata_writer::ODataWriterTracer::Instance().Error(component, message)

#define ODATA_WRITER_TRACE_ERROR_DATA(component, message, data) \
    ::odata_writer::ODataWriterTracer::Instance().Error(component, message, data)

#define ODATA_WRITER_TRACE_WARN(component, message) \
    ::odata_writer::ODataWriterTracer::Instance().Warn(component, message)

#define ODATA_WRITER_TRACE_INFO(component, message) \
    ::odata_writer::ODataWriterTracer::Instance().Info(component, message)

#define ODATA_WRITER_TRACE_DEBUG(component, message) \
    ::odata_writer::ODataWriterTracer::Instance().Debug(component, message)

#define ODATA_WRITER_TRACE_DEBUG_DATA(component, message, data) \
    ::odata_writer::ODataWriterTracer::Instance().Debug(component, message, data)

#define ODATA_WRITER_TRACE_TRACE(component, message) \
    ::odata_writer::ODataWriterTracer::Instance().Trace(component, message)

#define ODATA_WRITER_TRACE_TRACE_DATA(component, message, data) \
    ::odata_writer::ODataWriterTracer::Instance().Trace(component, message, data)

} // namespace odata_writer
