#pragma once

#include <cstdint>

struct FaultCounters {
    uint32_t send_failures;
    uint32_t connect_failures;
    uint32_t malformed_frames;
    uint32_t oversized_drops;
    uint32_t radio_restarts;
};

struct FaultStatus {
    bool fault_active;
    const char* fault_msg;
    FaultCounters counters;
};

// Process-wide fault monitor. fault_msg must point at a string literal.
void init_fault_monitor();
void record_fault(const char* msg);
void clear_fault();
void record_send_failure();
void record_connect_failure();
void record_malformed_frame();
void record_oversized_drop();
void record_radio_restart();
FaultStatus fault_status();
