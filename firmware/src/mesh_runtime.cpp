#include "mesh_runtime.hpp"

#include "logging.hpp"

MeshRuntime::MeshRuntime(MeshNode& node, uint32_t tick_interval_ms)
    : node_(node),
      tick_interval_ms_(tick_interval_ms == 0 ? 1 : tick_interval_ms),
      epoch_(std::chrono::steady_clock::now()) {}

MeshRuntime::~MeshRuntime() {
    stop();
}

uint64_t MeshRuntime::elapsed_ms() const {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - epoch_)
                                     .count());
}

bool MeshRuntime::start() {
    if (running_.load()) {
        return true;
    }
    if (!node_.start(elapsed_ms())) {
        return false;
    }
    running_.store(true);
    thread_ = std::thread(&MeshRuntime::loop, this);
    log_info("[RUNTIME] tick thread started (%ums)", static_cast<unsigned>(tick_interval_ms_));
    return true;
}

void MeshRuntime::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    node_.stop();
    log_info("[RUNTIME] stopped after %llu ticks", static_cast<unsigned long long>(ticks_.load()));
}

void MeshRuntime::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        lock.unlock();
        node_.tick(elapsed_ms());
        ticks_.fetch_add(1);
        lock.lock();
        cv_.wait_for(lock, std::chrono::milliseconds(tick_interval_ms_), [this]() { return !running_.load(); });
    }
}
