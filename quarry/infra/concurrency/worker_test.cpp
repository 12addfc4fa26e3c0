// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "worker.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

namespace quarry {

class CountingWorker final : public Worker {
  public:
    explicit CountingWorker(bool fail = false) : Worker("counting"), fail_{fail} {}
    ~CountingWorker() override { stop(/*wait=*/true); }

    std::atomic<uint64_t> iterations{0};

  private:
    void work() override {
        if (fail_) {
            throw std::runtime_error("boom");
        }
        while (!is_stopping()) {
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    bool fail_;
};

TEST_CASE("Worker lifecycle", "[infra][concurrency][worker]") {
    CountingWorker worker;
    uint32_t started{0}, stopped{0};
    worker.signal_worker_started.connect([&](Worker*) { ++started; });
    worker.signal_worker_stopped.connect([&](Worker*) { ++stopped; });

    worker.start();
    CHECK(worker.get_state() == Worker::State::kStarted);
    while (worker.iterations.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    worker.stop(/*wait=*/true);
    CHECK(worker.get_state() == Worker::State::kStopped);
    CHECK(started == 1);
    CHECK(stopped == 1);
    CHECK(!worker.has_exception());

    SECTION("restart after stop") {
        worker.start();
        worker.stop(/*wait=*/true);
        CHECK(started == 2);
        CHECK(stopped == 2);
    }
}

TEST_CASE("Worker captures exceptions", "[infra][concurrency][worker]") {
    CountingWorker worker{/*fail=*/true};
    worker.start();
    worker.stop(/*wait=*/true);
    CHECK(worker.has_exception());
    CHECK(worker.what() == "boom");
    CHECK_THROWS_AS(worker.rethrow(), std::runtime_error);
}

}  // namespace quarry
