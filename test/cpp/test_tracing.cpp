#include <catch2/catch.hpp>
#include "tracing.hpp"
#include "duckdb.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace odata_writer;

namespace {

// Redirects std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_buffer(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_buffer); }

    std::string Output() const { return buffer.str(); }

private:
    std::stringstream buffer;
    std::streambuf* old_buffer;
};

void ResetTracer() {
    auto& tracer = ODataWriterTracer::Instance();
    tracer.SetEnabled(false);
    tracer.SetOutputMode("console");
    tracer.SetLevel(TraceLevel::INFO);
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("ODataWriterTracer is a singleton", "[tracing]") {
    REQUIRE(&ODataWriterTracer::Instance() == &ODataWriterTracer::Instance());
}

TEST_CASE("Trace levels parse from strings", "[tracing]") {
    REQUIRE(TraceLevelFromString("none") == TraceLevel::NONE);
    REQUIRE(TraceLevelFromString("Error") == TraceLevel::ERROR);
    REQUIRE(TraceLevelFromString("WARN") == TraceLevel::WARN);
    REQUIRE(TraceLevelFromString("info") == TraceLevel::INFO);
    REQUIRE(TraceLevelFromString("debug") == TraceLevel::DEBUG_LEVEL);
    REQUIRE(TraceLevelFromString("TRACE") == TraceLevel::TRACE);
    REQUIRE_THROWS_AS(TraceLevelFromString("verbose"), duckdb::InvalidInputException);

    REQUIRE(TraceLevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
    REQUIRE(TraceLevelToString(TraceLevelFromString("warn")) == "WARN");
}

TEST_CASE("Messages are filtered by level", "[tracing]") {
    auto& tracer = ODataWriterTracer::Instance();
    ResetTracer();
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::WARN);

    SECTION("Messages at or below the level are written") {
        CoutCapture capture;
        tracer.Error("ODATA_ENCODER", "conversion failed");
        tracer.Warn("ODATA_ENCODER", "two entity sets match");
        REQUIRE(capture.Output().find("[ERROR] [ODATA_ENCODER] conversion failed") != std::string::npos);
        REQUIRE(capture.Output().find("[WARN] [ODATA_ENCODER] two entity sets match") != std::string::npos);
    }

    SECTION("Messages above the level are dropped") {
        CoutCapture capture;
        tracer.Info("ODATA_ENCODER", "info message");
        tracer.Debug("ODATA_ENCODER", "debug message");
        ODATA_WRITER_TRACE_TRACE("ODATA_ENCODER", "trace message");
        REQUIRE(capture.Output().empty());
    }

    SECTION("Nothing is written while disabled") {
        tracer.SetEnabled(false);
        CoutCapture capture;
        tracer.Error("ODATA_ENCODER", "conversion failed");
        REQUIRE(capture.Output().empty());
        REQUIRE_FALSE(tracer.ShouldTrace(TraceLevel::ERROR));
    }

    ResetTracer();
}

TEST_CASE("Data is appended below the message", "[tracing]") {
    auto& tracer = ODataWriterTracer::Instance();
    ResetTracer();
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    std::string output;
    {
        CoutCapture capture;
        ODATA_WRITER_TRACE_DEBUG_DATA("ODATA_PAYLOAD", "Wrote entry", "{\"Id\":1}");
        output = capture.Output();
    }

    REQUIRE(output.find("[DEBUG] [ODATA_PAYLOAD] Wrote entry") != std::string::npos);
    REQUIRE(output.find("\nData: {\"Id\":1}") != std::string::npos);

    ResetTracer();
}

TEST_CASE("Output modes", "[tracing]") {
    auto& tracer = ODataWriterTracer::Instance();
    ResetTracer();

    auto dir = std::filesystem::temp_directory_path() / "odata_writer_trace_test";
    std::filesystem::remove_all(dir);

    SECTION("Invalid modes are rejected") {
        REQUIRE_THROWS_AS(tracer.SetOutputMode("syslog"), duckdb::InvalidInputException);
        REQUIRE(tracer.GetOutputMode() == "console");
    }

    SECTION("File mode writes to the trace file only") {
        tracer.SetTraceDirectory(dir.string());
        REQUIRE(std::filesystem::exists(dir));

        tracer.SetOutputMode("FILE");
        REQUIRE(tracer.GetOutputMode() == "file");
        tracer.SetEnabled(true);

        std::string console;
        {
            CoutCapture capture;
            tracer.Info("ODATA_BATCH", "Started batch batch_1");
            console = capture.Output();
        }
        tracer.SetEnabled(false);

        REQUIRE(console.empty());
        auto content = ReadFile(dir / "odata_writer_trace.log");
        REQUIRE(content.find("[INFO] [ODATA_BATCH] Started batch batch_1") != std::string::npos);
    }

    ResetTracer();
    tracer.SetTraceDirectory(".");
    std::filesystem::remove_all(dir);
}

TEST_CASE("Tracing from several threads", "[tracing]") {
    auto& tracer = ODataWriterTracer::Instance();
    ResetTracer();
    tracer.SetEnabled(true);

    std::atomic<int> written(0);
    {
        CoutCapture capture;
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; i++) {
            threads.emplace_back([&tracer, &written, i]() {
                for (int j = 0; j < 25; j++) {
                    tracer.Info("THREAD_" + std::to_string(i), "message " + std::to_string(j));
                    written++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    REQUIRE(written == 100);
    ResetTracer();
}
