#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include "core/shutdown_coordinator.hpp"

using core::PipelineState;
using core::ShutdownCoordinator;
using core::StopReason;

namespace {

struct Consumer {
    std::thread thread;
    std::shared_future<void> done;
};

// Loop that polls the token every `poll` and returns once stop is seen
Consumer start_consumer(core::CancellationToken& token, std::chrono::milliseconds poll) {
    std::promise<void> promise;
    Consumer c;
    c.done = promise.get_future().share();
    c.thread = std::thread([&token, poll](std::promise<void> p) {
        while (!token.stop_requested()) {
            token.wait_for(poll);
        }
        p.set_value();
    }, std::move(promise));
    return c;
}

}

static void test_first_trigger_wins() {
    core::CancellationToken token;
    ShutdownCoordinator sc(token, std::chrono::milliseconds(2000));
    assert(sc.state() == PipelineState::Running);
    assert(sc.reason() == StopReason::None);

    assert(sc.request_stop(StopReason::Interrupt));
    assert(!sc.request_stop(StopReason::CaptureFatal));
    assert(!sc.request_stop(StopReason::EndOfStream));
    assert(sc.reason() == StopReason::Interrupt);
    assert(sc.state() == PipelineState::Stopping);
    assert(token.stop_requested());
}

static void test_flush_runs_exactly_once() {
    core::CancellationToken token;
    ShutdownCoordinator sc(token, std::chrono::milliseconds(2000));
    Consumer c = start_consumer(token, std::chrono::milliseconds(500));

    std::atomic<int> flushes{0};
    auto flush = [&] { flushes++; };

    // Several triggers racing, then several finish calls
    std::thread t1([&] { sc.request_stop(StopReason::Interrupt); });
    std::thread t2([&] { sc.request_stop(StopReason::CaptureFatal); });
    t1.join();
    t2.join();

    auto t0 = std::chrono::steady_clock::now();
    assert(sc.finish(c.thread, c.done, flush));
    // The consumer notices the stop well within one poll interval plus slack
    assert(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(1000));

    assert(sc.finish(c.thread, c.done, flush));
    assert(flushes == 1);
    assert(sc.flushed());
    assert(sc.state() == PipelineState::Stopped);
}

static void test_finish_without_trigger_is_normal_stop() {
    core::CancellationToken token;
    ShutdownCoordinator sc(token, std::chrono::milliseconds(2000));
    std::thread none;
    int flushes = 0;
    assert(sc.finish(none, {}, [&] { flushes++; }));
    assert(flushes == 1);
    assert(sc.reason() == StopReason::EndOfStream);
}

static void test_stuck_consumer_is_abandoned() {
    core::CancellationToken token;
    ShutdownCoordinator sc(token, std::chrono::milliseconds(200));

    // Ignores the token for a while, like a long model call
    auto release = std::make_shared<std::atomic<bool>>(false);
    std::promise<void> promise;
    std::shared_future<void> done = promise.get_future().share();
    std::thread stuck([release](std::promise<void> p) {
        while (!release->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        p.set_value();
    }, std::move(promise));

    sc.request_stop(StopReason::Interrupt);
    int flushes = 0;
    auto t0 = std::chrono::steady_clock::now();
    assert(!sc.finish(stuck, done, [&] { flushes++; }));
    auto waited = std::chrono::steady_clock::now() - t0;
    assert(waited >= std::chrono::milliseconds(150));
    assert(waited < std::chrono::seconds(2));
    assert(!stuck.joinable());
    assert(flushes == 1);
    assert(sc.state() == PipelineState::Stopped);

    release->store(true);
    assert(done.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

static void test_flush_failure_is_contained() {
    core::CancellationToken token;
    ShutdownCoordinator sc(token, std::chrono::milliseconds(200));
    std::thread none;
    assert(sc.finish(none, {}, [] { throw std::runtime_error("disk full"); }));
    assert(sc.flushed());
    assert(sc.state() == PipelineState::Stopped);
}

int main() {
    test_first_trigger_wins();
    test_flush_runs_exactly_once();
    test_finish_without_trigger_is_normal_stop();
    test_stuck_consumer_is_abandoned();
    test_flush_failure_is_contained();
    return 0;
}
