// tests/test_dispatch.cpp
//
// NOTE:
//   Do NOT define DOCTEST_CONFIG_IMPLEMENT* in this file.
//   tests/test_main.cpp is the only TU that provides doctest implementation + main.

#include <doctest/doctest.h>

#include "support.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace webframe::test;
using namespace std::chrono_literals;

namespace {

constexpr int kThreads = 8;
constexpr int kPerThread = 50;
constexpr std::size_t kTotal = kThreads * kPerThread;

struct Ledger {
    std::thread::id loop_thread;
    std::vector<std::pair<int, int>> runs; // (thread index, sequence)
    int off_thread = 0;
};

struct Job {
    Ledger* ledger;
    int thread_index;
    int sequence;
};

void record_job(void* user_data) {
    auto* job = static_cast<Job*>(user_data);

    if (std::this_thread::get_id() != job->ledger->loop_thread)
        ++job->ledger->off_thread;

    job->ledger->runs.emplace_back(job->thread_index, job->sequence);
}

void set_flag(void* user_data) {
    static_cast<std::atomic<bool>*>(user_data)->store(true);
}

void count_call(void* user_data) {
    ++*static_cast<int*>(user_data);
}

} // namespace

TEST_CASE("invoke from many threads runs every task once on the loop thread in per-thread order") {
    ScopedApp app;

    Ledger ledger;
    ledger.loop_thread = std::this_thread::get_id();

    std::vector<std::vector<Job>> jobs(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        for (int s = 0; s < kPerThread; ++s)
            jobs[t].push_back(Job{&ledger, t, s});
    }

    std::vector<std::thread> senders;

    Recorder recorder;
    recorder.max_iterations = 100000;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "new-events") {
            for (int t = 0; t < kThreads; ++t) {
                senders.emplace_back([&app, &jobs, t] {
                    for (auto& job : jobs[t])
                        webframe_invoke(app, &record_job, &job);
                });
            }
        }

        if (type == "main-events-cleared" && ledger.runs.size() == kTotal)
            return WEBFRAME_CONTROL_FLOW_EXIT;

        return WEBFRAME_CONTROL_FLOW_WAIT;
    };

    REQUIRE(recorder.pump(app).success);
    for (auto& sender : senders)
        sender.join();

    REQUIRE(ledger.runs.size() == kTotal);
    CHECK(ledger.off_thread == 0);

    std::vector<int> next(kThreads, 0);
    for (const auto& [thread_index, sequence] : ledger.runs) {
        INFO("thread " << thread_index);
        CHECK(sequence == next[thread_index]);
        next[thread_index] = sequence + 1;
    }
}

TEST_CASE("invoke before the loop starts runs on its first iteration") {
    ScopedApp app;

    int calls = 0;
    webframe_invoke(app, &count_call, &calls);

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();
    REQUIRE(recorder.pump(app).success);

    CHECK(calls == 1);
}

TEST_CASE("invoke after the loop stopped is rejected") {
    ScopedApp app;

    Recorder recorder;
    recorder.on_event = exit_after_first_iteration();
    REQUIRE(recorder.pump(app).success);

    int calls = 0;
    webframe_clear_last_error();
    webframe_invoke(app, &count_call, &calls);

    CHECK(calls == 0);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
}

TEST_CASE("invoke with a null callback is an invalid parameter") {
    ScopedApp app;

    webframe_invoke(app, nullptr, nullptr);
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_INVALID_PARAMETER);

    CHECK_FALSE(webframe_invoke_sync(app, nullptr, nullptr));
    CHECK(webframe_get_last_error_code() == WEBFRAME_ERROR_INVALID_PARAMETER);
}

TEST_CASE("invoke_sync returns after the work has completed") {
    ScopedApp app{false};

    std::atomic<bool> done{false};
    bool seen_by_caller = false;
    bool returned = false;
    std::thread caller;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type == "new-events") {
            caller = std::thread([&] {
                returned = webframe_invoke_sync(app, &set_flag, &done);
                seen_by_caller = done.load();
                webframe_app_quit(app);
            });
        }
        return WEBFRAME_CONTROL_FLOW_WAIT;
    };

    REQUIRE(recorder.pump(app).success);
    caller.join();

    CHECK(returned);
    CHECK(seen_by_caller);
}

TEST_CASE("invoke_sync on the loop thread fails instead of deadlocking") {
    ScopedApp app;

    int calls = 0;
    bool returned = true;
    int32_t code = 0;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type != "new-events")
            return WEBFRAME_CONTROL_FLOW_POLL;

        returned = webframe_invoke_sync(app, &count_call, &calls);
        code = webframe_get_last_error_code();
        return WEBFRAME_CONTROL_FLOW_EXIT;
    };

    REQUIRE(recorder.pump(app).success);

    CHECK_FALSE(returned);
    CHECK(code == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
    CHECK(calls == 0);
}

TEST_CASE("invoke_sync returns false when the loop exits with the work still queued") {
    ScopedApp app;

    int calls = 0;
    bool returned = true;
    int32_t code = 0;
    std::thread caller;

    Recorder recorder;
    recorder.on_event = [&](glz::json_t&, const std::string& type) {
        if (type != "new-events")
            return WEBFRAME_CONTROL_FLOW_POLL;

        caller = std::thread([&] {
            returned = webframe_invoke_sync(app, &count_call, &calls);
            code = webframe_get_last_error_code();
        });

        // Exit before the first drain, once the work is queued.
        auto channel = app.get()->app->channel();
        while (channel->Empty())
            std::this_thread::sleep_for(1ms);

        return WEBFRAME_CONTROL_FLOW_EXIT;
    };

    REQUIRE(recorder.pump(app).success);
    caller.join();

    CHECK_FALSE(returned);
    CHECK(code == WEBFRAME_ERROR_EVENT_LOOP_ERROR);
    CHECK(calls == 0);
}
