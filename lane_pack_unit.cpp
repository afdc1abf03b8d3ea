// =============================================================================
// lane_pack_unit.cpp — SIMD Lane Pack Unit Implementation
// =============================================================================

#include "lane_pack_unit.h"
#include "lse_engine.h"
#include <cmath>

// ═════════════════════════════════════════════════════════════════════════════
// LANE GEOMETRY — Hardware: pe_mode decoder driving the lane split muxes
// ═════════════════════════════════════════════════════════════════════════════

LaneLayout LanePackUnit::layout(SimdMode mode) {
    switch (mode) {
        case SimdMode::W24X1: return make_layout(WORD_WIDTH, 24);
        case SimdMode::W12X2: return make_layout(WORD_WIDTH, 12);
        case SimdMode::W6X4:  return make_layout(WORD_WIDTH, 6);
    }
    throw InvalidConfiguration("pe_mode", static_cast<long long>(mode),
                               "unsupported SIMD mode");
}

SimdMode LanePackUnit::decode_mode(uint32_t pe_mode) {
    switch (pe_mode) {
        case 0x0: return SimdMode::W24X1;
        case 0x1: return SimdMode::W12X2;
        case 0x2: return SimdMode::W6X4;
        default:
            throw InvalidConfiguration("pe_mode", pe_mode, "reserved SIMD mode encoding");
    }
}

void LanePackUnit::check_lane_width(int lane_width) {
    if (lane_width < 1 || lane_width > AdaptiveParameters::MAX_WIDTH) {
        throw InvalidConfiguration("lane_width", lane_width,
                                   "lane width must be in [1, 32]");
    }
}

LaneLayout LanePackUnit::make_layout(int total_width, int lane_width) {
    check_lane_width(lane_width);
    if (total_width < 1 || total_width > MAX_PACKED_WIDTH) {
        throw InvalidConfiguration("total_width", total_width,
                                   "packed word width must be in [1, 64]");
    }
    if (total_width % lane_width != 0) {
        throw InvalidConfiguration("lane_width", lane_width,
                                   "lane width must divide total width " +
                                   std::to_string(total_width));
    }
    LaneLayout l;
    l.lane_width = lane_width;
    l.lane_count = total_width / lane_width;
    return l;
}

// ═════════════════════════════════════════════════════════════════════════════
// BIT-PACKING — Concatenate lanes, lane 0 in the least-significant bits
// ═════════════════════════════════════════════════════════════════════════════

uint64_t LanePackUnit::pack(const std::vector<uint32_t> &lanes, int lane_width) {
    check_lane_width(lane_width);
    long long total = static_cast<long long>(lanes.size()) * lane_width;
    if (total > MAX_PACKED_WIDTH) {
        throw InvalidConfiguration("lane_count", static_cast<long long>(lanes.size()),
                                   "packed word exceeds 64 bits");
    }

    uint64_t word = 0;
    for (size_t i = 0; i < lanes.size(); ++i) {
        uint64_t lane = LseEngine::mask(lanes[i], lane_width);
        word |= lane << (i * lane_width);
    }
    return word;
}

std::vector<uint32_t> LanePackUnit::unpack(uint64_t word, int lane_width, int lane_count) {
    check_lane_width(lane_width);
    if (lane_count < 0 || static_cast<long long>(lane_count) * lane_width > MAX_PACKED_WIDTH) {
        throw InvalidConfiguration("lane_count", lane_count,
                                   "lane count must fit a 64-bit word");
    }

    std::vector<uint32_t> lanes(lane_count);
    for (int i = 0; i < lane_count; ++i) {
        lanes[i] = LseEngine::mask(word >> (i * lane_width), lane_width);
    }
    return lanes;
}

// ═════════════════════════════════════════════════════════════════════════════
// SIMD DATAPATH — one adaptive adder per lane, no cross-lane wiring
// ═════════════════════════════════════════════════════════════════════════════

uint64_t LanePackUnit::apply_lanes(uint64_t word_a, uint64_t word_b, const LaneLayout &layout,
                                   std::vector<LseStatus> *lane_status) {
    // Validates the layout and derives the per-lane adder parameters once
    LaneLayout l = make_layout(layout.total_width(), layout.lane_width);
    AdaptiveParameters p = AdaptiveParameters::from_width(l.lane_width);

    std::vector<uint32_t> lanes_a = unpack(word_a, l.lane_width, l.lane_count);
    std::vector<uint32_t> lanes_b = unpack(word_b, l.lane_width, l.lane_count);
    std::vector<uint32_t> lanes_z(l.lane_count);

    if (lane_status) lane_status->assign(l.lane_count, LseStatus{});

    for (int i = 0; i < l.lane_count; ++i) {
        LseStatus *st = lane_status ? &(*lane_status)[i] : nullptr;
        lanes_z[i] = LseEngine::lse_add(lanes_a[i], lanes_b[i], p, st);
    }
    return pack(lanes_z, l.lane_width);
}

uint32_t LanePackUnit::apply_simd(uint32_t word_a, uint32_t word_b, SimdMode mode) {
    uint64_t z = apply_lanes(word_a, word_b, layout(mode));
    return LseEngine::mask(z, WORD_WIDTH);
}

// ═════════════════════════════════════════════════════════════════════════════
// QUANTIZATION — rounding adder + saturation comparator/mux
// ═════════════════════════════════════════════════════════════════════════════

uint32_t LanePackUnit::saturate_unsigned(int64_t value, int bits) {
    int64_t max_val = static_cast<int64_t>((1ULL << bits) - 1);
    if (value < 0) return 0;
    if (value > max_val) return static_cast<uint32_t>(max_val);
    return static_cast<uint32_t>(value);
}

uint32_t LanePackUnit::quantize_rne(double value, int bits) {
    // NaN and anything below zero clamp to 0 before the integer conversion
    if (!(value > 0.0)) return 0;
    double max_val = static_cast<double>((1ULL << bits) - 1);
    if (value >= max_val) return static_cast<uint32_t>((1ULL << bits) - 1);

    // nearbyint honours the default FE_TONEAREST mode: ties go to even
    double rounded = std::nearbyint(value);
    return saturate_unsigned(static_cast<int64_t>(rounded), bits);
}
