/*
   Copyright 2023 Reese Levine, Devon McKee, Sean Siddens

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "test_support.h"

TEST_CASE("async reads stay pending until the Framework is polled", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<uint32_t> buf = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{4, 5, 6});

    gpgpu::Deferred<std::vector<uint32_t> > pending = buf.readAsync();
    REQUIRE(pending.valid());

    // The device is long done by now, but nobody polled
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(pending.isReady());
    REQUIRE_THROWS_AS(pending.get(), std::logic_error);

    REQUIRE(pending.wait() == std::vector<uint32_t>({4, 5, 6}));
}

TEST_CASE("async writes stay pending until the Framework is polled", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<uint32_t> buf(*fw, 3);

    gpgpu::Deferred<void> written = buf.writeAsync(std::vector<uint32_t>{9, 8, 7});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(written.isReady());
    REQUIRE_THROWS_AS(written.get(), std::logic_error);

    REQUIRE_NOTHROW(written.wait());
    REQUIRE(buf.read() == std::vector<uint32_t>({9, 8, 7}));
}

TEST_CASE("poll resolves finished operations without blocking", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<uint32_t> buf = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, std::vector<uint32_t>{7, 8});

    gpgpu::Deferred<std::vector<uint32_t> > pending = buf.readAsync();
    REQUIRE(fw->pendingSubmissions() >= 1);

    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!pending.isReady() && std::chrono::steady_clock::now() < deadline) {
        fw->poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(pending.isReady());
    REQUIRE(pending.get() == std::vector<uint32_t>({7, 8}));
}

TEST_CASE("blockingPoll retires every in-flight submission", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<uint32_t> buf(*fw, 2);

    gpgpu::Deferred<void> written = buf.writeAsync(std::vector<uint32_t>{1, 2});
    gpgpu::Deferred<std::vector<uint32_t> > readBack = buf.readAsync();
    REQUIRE(fw->pendingSubmissions() >= 2);

    REQUIRE(fw->blockingPoll() >= 2);
    REQUIRE(fw->pendingSubmissions() == 0);
    REQUIRE(written.isReady());
    REQUIRE(readBack.isReady());

    REQUIRE_NOTHROW(written.get());
    // Queue order: the read observes the earlier write
    REQUIRE(readBack.get() == std::vector<uint32_t>({1, 2}));
}

TEST_CASE("a consumed Deferred cannot be waited on again", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<uint32_t> buf(*fw, 1);
    gpgpu::Deferred<std::vector<uint32_t> > pending = buf.readAsync();
    pending.wait();
    REQUIRE_FALSE(pending.valid());
    REQUIRE_THROWS_AS(pending.wait(), std::logic_error);
}

TEST_CASE("zero-length writes complete immediately", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    gpgpu::GpuBuffer<float> buf(*fw, 0);
    gpgpu::Deferred<void> written = buf.writeAsync(std::vector<float>());
    REQUIRE(written.isReady());
}

TEST_CASE("blocking reads succeed while another thread polls", "[deferred][device]") {
    GPGPU_REQUIRE_DEVICE(fw);
    const std::vector<uint32_t> expected = {3, 1, 4, 1, 5};
    gpgpu::GpuBuffer<uint32_t> buf = gpgpu::GpuBuffer<uint32_t>::fromSlice(*fw, expected);

    std::atomic<bool> stop(false);
    std::thread pump([fw, &stop] {
        while (!stop.load()) {
            fw->poll();
        }
    });

    // The pump may collect a read's submission before its completion has run
    size_t mismatches = 0;
    std::string failure;
    try {
        for (int i = 0; i < 200; ++i) {
            if (buf.read() != expected) {
                ++mismatches;
            }
        }
    } catch (const std::exception &e) {
        failure = e.what();
    }
    stop = true;
    pump.join();

    REQUIRE(failure.empty());
    REQUIRE(mismatches == 0);
    REQUIRE(fw->pendingSubmissions() == 0);
}
