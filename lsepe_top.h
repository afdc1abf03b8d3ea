// =============================================================================
// lsepe_top.h — Top-Level LSE PE Adder Module
// =============================================================================
// Hardware Mapping: This class is the structural top-level of the SIMD LSE
// adder. It instantiates the lane split, the per-lane lse_add_adaptive blocks
// and the output packer, and manages the cycle-level simulation via step().
//
// Architecture:
//   x_in/y_in → [Lane Split] → [lse_add_adaptive × N] → [Lane Pack] → z_out
//
// Timing:
//   - One registered stage: a result is visible on output_z after one step()
// =============================================================================
#pragma once

#include "lsepe_types.h"
#include "lane_pack_unit.h"
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Configuration and Status Registers
// ─────────────────────────────────────────────────────────────────────────────
struct CfgReg {
    SimdMode mode = SimdMode::W24X1;   // pe_mode[1:0]
};

/// Status bits are per-lane masks: bit i reflects lane i of the last result
struct StatusReg {
    uint8_t  neg_inf_lanes    = 0;
    uint8_t  correction_lanes = 0;
    uint8_t  saturated_lanes  = 0;
    uint32_t cycle_cnt        = 0;
};

class LSEPE_Top {
public:
    // ─────────────────────────────────────────────────────────────────────
    // System Interface (top-level ports, 24-bit)
    // ─────────────────────────────────────────────────────────────────────
    uint32_t input_a  = 0;
    uint32_t input_b  = 0;
    uint32_t output_z = 0;

    CfgReg    cfg;
    StatusReg status;

    LSEPE_Top();
    void reset();

    /// Advance one clock cycle: sample inputs, compute, register output
    void step();

    /// Configure, drive inputs and step once (test helper)
    uint32_t execute(uint32_t a, uint32_t b, SimdMode mode);

    /// Lane `idx` of the registered output under the current mode
    uint32_t output_lane(int idx) const;

    std::string dump_status() const;

private:
    LaneLayout layout_ = LanePackUnit::layout(SimdMode::W24X1);
};
