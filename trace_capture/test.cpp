#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "trace_capture.hxx"

namespace {

struct get_user {
    int id = 0;
};

struct user {
    int id = 0;
    std::string name;
};

// Shared journal so dispatcher and tracer calls land in one ordered list.
using journal = std::vector<std::string>;

class recording_tracer {
   public:
    explicit recording_tracer(journal& log, bool enabled = true) : log_(&log), enabled_(enabled) {}

    auto start_trace(const get_user& req) -> std::optional<int> {
        log_->push_back("start:" + std::to_string(req.id));
        if (!enabled_) {
            return std::nullopt;
        }
        return 1000 + req.id;
    }

    void record_exception(std::exception_ptr error) {
        log_->push_back("exception");
        recorded = error;
    }

    void complete_trace(bool success) { log_->push_back(success ? "complete:true" : "complete:false"); }

    std::exception_ptr recorded;

   private:
    journal* log_;
    bool enabled_;
};

class user_dispatcher {
   public:
    explicit user_dispatcher(journal& log) : log_(&log) {}

    auto send(const get_user& req, std::stop_token /*token*/) -> user {
        log_->push_back("send");
        return user{req.id, "user-" + std::to_string(req.id)};
    }

   private:
    journal* log_;
};

class command_dispatcher {
   public:
    explicit command_dispatcher(journal& log) : log_(&log) {}

    void send(const get_user& /*req*/, std::stop_token /*token*/) { log_->push_back("send"); }

   private:
    journal* log_;
};

class async_dispatcher {
   public:
    explicit async_dispatcher(journal& log) : log_(&log) {}

    auto send(const get_user& req, std::stop_token /*token*/) -> std::future<user> {
        log_->push_back("send");
        return std::async(std::launch::async, [id = req.id] { return user{id, "async"}; });
    }

   private:
    journal* log_;
};

struct lookup_failed : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class failing_dispatcher {
   public:
    explicit failing_dispatcher(journal& log) : log_(&log) {}

    auto send(const get_user& /*req*/, std::stop_token /*token*/) -> user {
        log_->push_back("send");
        throw lookup_failed("user not found");
    }

   private:
    journal* log_;
};

class failing_async_dispatcher {
   public:
    auto send(const get_user& /*req*/, std::stop_token /*token*/) -> std::future<void> {
        std::promise<void> promise;
        promise.set_exception(std::make_exception_ptr(lookup_failed("late failure")));
        return promise.get_future();
    }
};

class token_dispatcher {
   public:
    auto send(const get_user& /*req*/, std::stop_token token) -> bool { return token.stop_requested(); }
};

auto joined(const journal& log) -> std::string {
    std::string out;
    for (const auto& entry : log) {
        out += (out.empty() ? "" : " ") + entry;
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Success path
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("trace_capture – success")

TEST_CASE("start, send, complete(true) in that order") {
    journal log;
    recording_tracer tracer(log);
    user_dispatcher dispatcher(log);
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{7});
    expect(joined(log)).to_equal("start:7 send complete:true");
    expect(res.response.id).to_equal(7);
    expect(res.response.name).to_equal("user-7");
}

TEST_CASE("the tracer's handle is returned untouched") {
    journal log;
    recording_tracer tracer(log);
    user_dispatcher dispatcher(log);
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{5});
    expect(res.trace.has_value()).to_be_true();
    expect(*res.trace).to_equal(1005);
}

TEST_CASE("an empty handle does not change the dispatch") {
    journal log;
    recording_tracer tracer(log, false);
    user_dispatcher dispatcher(log);
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{3});
    expect(res.trace.has_value()).to_be_false();
    expect(res.response.id).to_equal(3);
    expect(joined(log)).to_equal("start:3 send complete:true");
}

TEST_CASE("void dispatch yields only the handle") {
    journal log;
    recording_tracer tracer(log);
    command_dispatcher dispatcher(log);
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{1});
    expect(*res.trace).to_equal(1001);
    expect(joined(log)).to_equal("start:1 send complete:true");
}

TEST_CASE("future responses are awaited before completion") {
    journal log;
    recording_tracer tracer(log);
    async_dispatcher dispatcher(log);
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{9});
    expect(res.response.name).to_equal("async");
    expect(joined(log)).to_equal("start:9 send complete:true");
}

TEST_CASE("the stop token reaches the dispatcher") {
    journal log;
    recording_tracer tracer(log);
    token_dispatcher dispatcher;
    std::stop_source source;
    source.request_stop();
    auto res = reqprof::trace_capture(dispatcher, tracer, get_user{}, source.get_token());
    expect(res.response).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Failure path
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("trace_capture – failure")

TEST_CASE("failure records the exception, completes with false, then rethrows") {
    journal log;
    recording_tracer tracer(log);
    failing_dispatcher dispatcher(log);
    expect_throws_with(lookup_failed, "user not found", (void)reqprof::trace_capture(dispatcher, tracer, get_user{4}));
    expect(joined(log)).to_equal("start:4 send exception complete:false");
}

TEST_CASE("the rethrown exception is the recorded one") {
    journal log;
    recording_tracer tracer(log);
    failing_dispatcher dispatcher(log);
    std::exception_ptr caught;
    try {
        (void)reqprof::trace_capture(dispatcher, tracer, get_user{4});
    } catch (const lookup_failed&) {
        caught = std::current_exception();
    }
    expect(static_cast<bool>(caught)).to_be_true();
    expect(caught == tracer.recorded).to_be_true();
}

TEST_CASE("exceptions stored in a future take the failure path") {
    journal log;
    recording_tracer tracer(log);
    failing_async_dispatcher dispatcher;
    expect_throws_with(lookup_failed, "late failure", (void)reqprof::trace_capture(dispatcher, tracer, get_user{2}));
    expect(joined(log)).to_equal("start:2 exception complete:false");
}
