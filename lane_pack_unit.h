// =============================================================================
// lane_pack_unit.h — SIMD Lane Pack Unit (Input Splitter / Output Formatter)
// =============================================================================
// Hardware Mapping: This module sits on both sides of the lane adders of the
// LSE PE. It performs:
//   1. Lane slicing   (split a packed word into W-bit lanes, lane 0 = LSBs)
//   2. Lane dispatch  (one lse_add_adaptive #(W) instance per lane)
//   3. Bit-packing    (concatenate lane results back into the packed word)
//   4. Quantization   (round-to-nearest-even + unsigned saturation, shared
//                      by the table and vector generators)
// Lanes are independent: no carry, borrow or sentinel crosses a boundary.
// =============================================================================
#pragma once

#include "lsepe_types.h"
#include <vector>

class LanePackUnit {
public:
    /// Width of the PE data bus (x_in / y_in / z_out)
    static constexpr int WORD_WIDTH = 24;

    /// Widest packed word the model can hold
    static constexpr int MAX_PACKED_WIDTH = 64;

    // ─────────────────────────────────────────────────────────────────────
    // Lane geometry
    // ─────────────────────────────────────────────────────────────────────

    /// Lane layout selected by pe_mode (24×1, 12×2, 6×4)
    static LaneLayout layout(SimdMode mode);

    /// Decode a raw 2-bit pe_mode value; throws on the reserved encoding
    static SimdMode decode_mode(uint32_t pe_mode);

    /// Split `total_width` into lanes of `lane_width`.
    /// Throws InvalidConfiguration if the width does not divide evenly.
    static LaneLayout make_layout(int total_width, int lane_width);

    // ─────────────────────────────────────────────────────────────────────
    // Bit-packing
    // ─────────────────────────────────────────────────────────────────────

    /// Place lane i at bit offset i*lane_width (values truncated to the lane)
    static uint64_t pack(const std::vector<uint32_t> &lanes, int lane_width);

    /// Exact inverse of pack(): lane i = (word >> i*W) & (2^W - 1)
    static std::vector<uint32_t> unpack(uint64_t word, int lane_width, int lane_count);

    // ─────────────────────────────────────────────────────────────────────
    // SIMD LSE datapath
    // ─────────────────────────────────────────────────────────────────────

    /// Unpack both words, lse_add each lane pair, repack.
    /// `lane_status` (optional) receives one entry per lane.
    static uint64_t apply_lanes(uint64_t word_a, uint64_t word_b, const LaneLayout &layout,
                                std::vector<LseStatus> *lane_status = nullptr);

    /// Mode-selected SIMD LSE on the 24-bit bus
    static uint32_t apply_simd(uint32_t word_a, uint32_t word_b, SimdMode mode);

    // ─────────────────────────────────────────────────────────────────────
    // Quantization: round half to even, then clamp to [0, 2^bits - 1]
    // Models the rounding adder + saturation comparator of an output stage
    // ─────────────────────────────────────────────────────────────────────
    static uint32_t saturate_unsigned(int64_t value, int bits);
    static uint32_t quantize_rne(double value, int bits);

private:
    static void check_lane_width(int lane_width);
};
