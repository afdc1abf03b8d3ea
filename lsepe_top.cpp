// =============================================================================
// lsepe_top.cpp — Top-Level LSE PE Adder Implementation
// =============================================================================

#include "lsepe_top.h"
#include "lse_engine.h"
#include <cassert>
#include <iomanip>
#include <sstream>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Constructor / Reset — models hardware power-on reset
// ─────────────────────────────────────────────────────────────────────────────

LSEPE_Top::LSEPE_Top() {
    reset();
}

void LSEPE_Top::reset() {
    input_a = input_b = output_z = 0;
    cfg = CfgReg{};
    status = StatusReg{};
    layout_ = LanePackUnit::layout(cfg.mode);
}

// ═════════════════════════════════════════════════════════════════════════════
// step() — one clock cycle
// ═════════════════════════════════════════════════════════════════════════════
// The mode is sampled together with the operands, so a mode change takes
// effect on the same edge as the data it applies to.
// ═════════════════════════════════════════════════════════════════════════════

void LSEPE_Top::step() {
    status.cycle_cnt++;

    layout_ = LanePackUnit::layout(cfg.mode);
    const uint32_t bus_mask = (1u << LanePackUnit::WORD_WIDTH) - 1;

    std::vector<LseStatus> lanes;
    uint64_t z = LanePackUnit::apply_lanes(input_a & bus_mask, input_b & bus_mask,
                                           layout_, &lanes);

    status.neg_inf_lanes = status.correction_lanes = status.saturated_lanes = 0;
    for (int i = 0; i < layout_.lane_count; ++i) {
        uint8_t bit = static_cast<uint8_t>(1u << i);
        if (lanes[i].neg_inf_bypass)     status.neg_inf_lanes    |= bit;
        if (lanes[i].correction_applied) status.correction_lanes |= bit;
        if (lanes[i].saturated)          status.saturated_lanes  |= bit;
    }

    output_z = static_cast<uint32_t>(z) & bus_mask;
}

uint32_t LSEPE_Top::execute(uint32_t a, uint32_t b, SimdMode mode) {
    cfg.mode = mode;
    input_a  = a;
    input_b  = b;
    step();
    return output_z;
}

uint32_t LSEPE_Top::output_lane(int idx) const {
    assert(idx >= 0 && idx < layout_.lane_count);
    return LseEngine::mask(output_z >> (idx * layout_.lane_width), layout_.lane_width);
}

// ═════════════════════════════════════════════════════════════════════════════
// Debug Dump
// ═════════════════════════════════════════════════════════════════════════════

std::string LSEPE_Top::dump_status() const {
    std::ostringstream oss;
    oss << "──── LSE PE Status ────\n";
    oss << "  Cycle:      " << status.cycle_cnt << "\n";
    oss << "  Mode:       " << layout_.lane_count << "x" << layout_.lane_width << "b\n";
    oss << "  NEG_INF:    0x" << std::hex << static_cast<int>(status.neg_inf_lanes) << "\n";
    oss << "  Correction: 0x" << static_cast<int>(status.correction_lanes) << "\n";
    oss << "  Saturated:  0x" << static_cast<int>(status.saturated_lanes) << std::dec << "\n";
    oss << "  output_z:   0x" << std::hex << std::setfill('0')
        << std::setw(6) << output_z << std::dec << "\n";
    return oss.str();
}
