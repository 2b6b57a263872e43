#include "fault.hpp"

#include <mutex>

namespace {
std::mutex g_fault_mutex;
FaultStatus g_fault{
    false,
    nullptr,
    {0, 0, 0, 0, 0}
};
} // namespace

void init_fault_monitor() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault = FaultStatus{false, nullptr, {0, 0, 0, 0, 0}};
}

void record_fault(const char* msg) {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.fault_active = true;
    g_fault.fault_msg = msg;
}

void clear_fault() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.fault_active = false;
    g_fault.fault_msg = nullptr;
}

void record_send_failure() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.send_failures += 1;
}

void record_connect_failure() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.connect_failures += 1;
}

void record_malformed_frame() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.malformed_frames += 1;
}

void record_oversized_drop() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.oversized_drops += 1;
}

void record_radio_restart() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    g_fault.counters.radio_restarts += 1;
    g_fault.fault_active = true;
    g_fault.fault_msg = "Radio restart";
}

FaultStatus fault_status() {
    std::lock_guard<std::mutex> lock(g_fault_mutex);
    return g_fault;
}
