#include "catch2/catch.hpp"
#include "feishu_tracing.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace feishu_auth;

namespace {

// Redirects std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_cout(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_cout); }
    std::string str() const { return buffer.str(); }

private:
    std::stringstream buffer;
    std::streambuf* old_cout;
};

} // anonymous namespace

TEST_CASE("FeishuTracer Singleton Pattern", "[tracing]") {
    SECTION("Instance returns same reference") {
        auto& instance1 = FeishuTracer::Instance();
        auto& instance2 = FeishuTracer::Instance();
        REQUIRE(&instance1 == &instance2);
    }
}

TEST_CASE("FeishuTracer Basic Functionality", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();

    // Reset to known state
    tracer.SetEnabled(false);
    tracer.SetLevel(TraceLevel::INFO);

    SECTION("Default state") {
        REQUIRE_FALSE(tracer.IsEnabled());
        REQUIRE(tracer.GetLevel() == TraceLevel::INFO);
    }

    SECTION("Enable/Disable tracing") {
        tracer.SetEnabled(true);
        REQUIRE(tracer.IsEnabled());

        tracer.SetEnabled(false);
        REQUIRE_FALSE(tracer.IsEnabled());
    }

    SECTION("Set trace level") {
        tracer.SetLevel(TraceLevel::DEBUG_LEVEL);
        REQUIRE(tracer.GetLevel() == TraceLevel::DEBUG_LEVEL);

        tracer.SetLevel(TraceLevel::ERROR);
        REQUIRE(tracer.GetLevel() == TraceLevel::ERROR);

        tracer.SetLevel(TraceLevel::INFO);
    }
}

TEST_CASE("FeishuTracer Level Filtering", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();
    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    SECTION("Messages at or below current level are logged") {
        CoutCapture capture;
        tracer.Error("TEST", "Error message");
        tracer.Warn("TEST", "Warning message");
        tracer.Info("TEST", "Info message");

        auto output = capture.str();
        REQUIRE(output.find("[ERROR] [TEST] Error message") != std::string::npos);
        REQUIRE(output.find("[WARN] [TEST] Warning message") != std::string::npos);
        REQUIRE(output.find("[INFO] [TEST] Info message") != std::string::npos);
    }

    SECTION("Messages above current level are not logged") {
        CoutCapture capture;
        tracer.Debug("TEST", "Debug message");
        tracer.Trace("TEST", "Trace message");

        auto output = capture.str();
        REQUIRE(output.find("Debug message") == std::string::npos);
        REQUIRE(output.find("Trace message") == std::string::npos);
    }

    SECTION("Disabled tracer is silent") {
        tracer.SetEnabled(false);
        CoutCapture capture;
        tracer.Error("TEST", "Suppressed error");
        REQUIRE(capture.str().empty());
    }

    tracer.SetEnabled(false);
}

TEST_CASE("FeishuTracer Data Messages", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();
    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);

    CoutCapture capture;
    std::string test_data = "{\"key\": \"value\", \"number\": 42}";
    FEISHU_TRACE_INFO_DATA("TEST", "JSON data received", test_data);

    auto output = capture.str();
    REQUIRE(output.find("JSON data received") != std::string::npos);
    REQUIRE(output.find("Data: " + test_data) != std::string::npos);

    tracer.SetEnabled(false);
    tracer.SetLevel(TraceLevel::INFO);
}

TEST_CASE("FeishuTracer File Output", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();

    std::string test_dir = "./test_feishu_trace_output";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir);
    REQUIRE(std::filesystem::exists(test_dir));

    tracer.SetOutputMode("file");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    {
        CoutCapture capture;
        tracer.Info("TEST", "Written to file only");
        REQUIRE(capture.str().empty());
    }

    std::filesystem::path trace_file_path = std::filesystem::path(test_dir) / "feishu_auth_trace.log";
    REQUIRE(std::filesystem::exists(trace_file_path));

    std::ifstream file(trace_file_path);
    REQUIRE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("[INFO] [TEST] Written to file only") != std::string::npos);

    tracer.SetEnabled(false);
    tracer.SetOutputMode("console");
    tracer.SetTraceDirectory(".");
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("FeishuTracer Thread Safety", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();
    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    CoutCapture capture;
    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::vector<std::thread> threads;
    std::atomic<int> total_messages(0);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&tracer, i, &total_messages]() {
            for (int j = 0; j < messages_per_thread; ++j) {
                tracer.Info("THREAD_" + std::to_string(i), "Message " + std::to_string(j));
                total_messages++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(total_messages == num_threads * messages_per_thread);
    tracer.SetEnabled(false);
}

TEST_CASE("FeishuTracer Level String Conversion", "[tracing]") {
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::NONE) == "NONE");
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::ERROR) == "ERROR");
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::WARN) == "WARN");
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::INFO) == "INFO");
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
    REQUIRE(FeishuTracer::LevelToString(TraceLevel::TRACE) == "TRACE");
}

TEST_CASE("TracerEventLogger forwards events with fields", "[tracing]") {
    auto& tracer = FeishuTracer::Instance();
    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::INFO);

    CoutCapture capture;
    TracerEventLogger logger("AUTH_TEST");
    ErrorContext fields;
    fields.Set("variant", "miniapp").Set("code", "present");
    logger.Log(TraceLevel::WARN, "callback_received", fields);
    logger.Log(TraceLevel::DEBUG_LEVEL, "filtered_out", ErrorContext());

    auto output = capture.str();
    REQUIRE(output.find("[WARN] [AUTH_TEST] callback_received [variant: miniapp, code: present]") != std::string::npos);
    REQUIRE(output.find("filtered_out") == std::string::npos);

    tracer.SetEnabled(false);
}
