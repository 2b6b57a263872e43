#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "mesh.hpp"

// Drives MeshNode::tick from a steady clock on a background thread.
class MeshRuntime {
public:
    explicit MeshRuntime(MeshNode& node, uint32_t tick_interval_ms = 50);
    ~MeshRuntime();

    MeshRuntime(const MeshRuntime&) = delete;
    MeshRuntime& operator=(const MeshRuntime&) = delete;

    bool start();
    void stop();
    bool running() const { return running_.load(); }
    uint64_t ticks() const { return ticks_.load(); }

private:
    void loop();
    uint64_t elapsed_ms() const;

    MeshNode& node_;
    const uint32_t tick_interval_ms_;
    // Fixed for the runtime's lifetime so the node clock never runs backwards
    // across stop/start.
    const std::chrono::steady_clock::time_point epoch_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
};
