#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "../testing/test_main.hpp"
#include "logger.hxx"

using reqprof::log_level;
using reqprof::logger;
using reqprof::logger_options;

namespace {

// Initializes the singleton onto @p sink; the destructor restores the runner's defaults.
struct captured_logger {
    explicit captured_logger(std::ostringstream& sink, log_level min = log_level::BASIC, bool async = false) {
        logger::get_instance().initialize({.use_colors = false, .show_thread = false, .async_mode = async, .min_level = min, .console = &sink});
    }
    captured_logger(const captured_logger&) = delete;
    auto operator=(const captured_logger&) -> captured_logger& = delete;
    ~captured_logger() {
        logger::get_instance().shutdown();
        logger::get_instance().set_min_level(log_level::WARNING);
    }
};

// Redirects std::cout into @p sink until destroyed.
struct captured_stdout {
    explicit captured_stdout(std::ostringstream& sink) : previous(std::cout.rdbuf(sink.rdbuf())) {}
    captured_stdout(const captured_stdout&) = delete;
    auto operator=(const captured_stdout&) -> captured_stdout& = delete;
    ~captured_stdout() { std::cout.rdbuf(previous); }

    std::streambuf* previous;
};

}  // namespace

TEST_SUITE("logger – output")

TEST_CASE("stream macros write one tagged line per message") {
    std::ostringstream sink;
    {
        captured_logger guard(sink);
        REQPROF_LOG_INFO << "answer = " << 42;
        REQPROF_LOG_WARN << "careful";
    }
    const std::string out = sink.str();
    expect(out).to_contain("INFO ] answer = 42\n");
    expect(out).to_contain("careful\n");
}

TEST_CASE("BASIC messages carry no level tag") {
    std::ostringstream sink;
    {
        captured_logger guard(sink);
        REQPROF_LOG << "plain";
    }
    expect(sink.str()).to_contain("] plain\n");
}

TEST_CASE("messages below the minimum level are dropped") {
    std::ostringstream sink;
    {
        captured_logger guard(sink, log_level::WARNING);
        REQPROF_LOG_DEBUG << "hidden-debug";
        REQPROF_LOG_INFO << "hidden-info";
        REQPROF_LOG_ERROR << "shown-error";
    }
    const std::string out = sink.str();
    expect(out.find("hidden-debug") == std::string::npos).to_be_true();
    expect(out.find("hidden-info") == std::string::npos).to_be_true();
    expect(out).to_contain("shown-error");
}

TEST_CASE("error() logs and returns") {
    std::ostringstream sink;
    bool reached = false;
    {
        captured_logger guard(sink);
        logger::get_instance().error("bad thing");
        reached = true;
    }
    expect(reached).to_be_true();
    expect(sink.str()).to_contain("bad thing");
}

TEST_CASE("empty stream messages are not written") {
    std::ostringstream sink;
    {
        captured_logger guard(sink);
        REQPROF_LOG_INFO;
    }
    expect(sink.str().empty()).to_be_true();
}

TEST_SUITE("logger – lifecycle")

TEST_CASE("initialize twice throws") {
    std::ostringstream sink;
    captured_logger guard(sink);
    expect(logger::get_instance().is_initialized()).to_be_true();
    expect_throws_with(std::runtime_error, "already initialized", logger::get_instance().initialize());
}

TEST_CASE("shutdown returns the logger to the uninitialized state") {
    std::ostringstream sink;
    {
        captured_logger guard(sink);
    }
    expect(logger::get_instance().is_initialized()).to_be_false();
}

TEST_CASE("async mode delivers every record by shutdown") {
    std::ostringstream sink;
    {
        captured_logger guard(sink, log_level::BASIC, true);
        for (int i = 0; i < 50; ++i) {
            REQPROF_LOG_INFO << "async-" << i;
        }
    }
    const std::string out = sink.str();
    expect(out).to_contain("async-0\n");
    expect(out).to_contain("async-49\n");
}

TEST_CASE("records logged after an async shutdown are written directly") {
    std::ostringstream sink;
    std::ostringstream out;
    {
        captured_stdout redirect(out);
        logger::get_instance().initialize({.use_colors = false, .show_thread = false, .async_mode = true, .console = &sink});
        REQPROF_LOG_INFO << "before-shutdown";
        logger::get_instance().shutdown();
        REQPROF_LOG_INFO << "after-shutdown";
        logger::get_instance().set_min_level(log_level::WARNING);
    }

    expect(sink.str()).to_contain("before-shutdown\n");
    expect(out.str()).to_contain("after-shutdown\n");
}

TEST_CASE("records racing an async shutdown are never dropped") {
    constexpr int MESSAGES = 2000;
    std::ostringstream sink;
    std::ostringstream out;
    {
        captured_stdout redirect(out);
        logger::get_instance().initialize({.use_colors = false, .show_thread = false, .async_mode = true, .console = &sink});
        std::thread writer([] {
            for (int i = 0; i < MESSAGES; ++i) {
                REQPROF_LOG_INFO << "race-" << i << ";";
            }
        });
        std::this_thread::yield();
        logger::get_instance().shutdown();
        writer.join();
        logger::get_instance().set_min_level(log_level::WARNING);
    }

    const std::string written = sink.str() + out.str();
    int missing = 0;
    for (int i = 0; i < MESSAGES; ++i) {
        if (written.find("race-" + std::to_string(i) + ";") == std::string::npos) {
            ++missing;
        }
    }
    expect(missing).to_equal(0);
}
