// =============================================================================
// ref_vector_gen.h — High-Precision Reference Vector Generator
// =============================================================================
// Produces the golden vectors the verification bench compares the 24-bit LSE
// adder against. Each vector carries the quantized operands, the quantized
// exact result and a symmetric tolerance band in LSBs.
//
// Fixed-point format (matches the 24-bit lse_add datapath):
//   WIDTH = 24 bits total, FRAC_BITS = 10, unsigned, NEG_INF = 0x800000
//
// Real arithmetic here is reference-only; the DUT model never sees a double.
// =============================================================================
#pragma once

#include "lsepe_types.h"
#include <string>
#include <vector>

/// One golden record consumed by the verification bench
struct ReferenceVector {
    std::string label;
    uint32_t    operand_a       = 0;
    uint32_t    operand_b       = 0;
    uint32_t    expected        = 0;
    uint32_t    min_expected    = 0;
    uint32_t    max_expected    = 0;
    double      exact_value     = 0.0;
    double      error_tolerance = 0.0;   // tolerance_lsb in real units
};

/// Curated stimulus: label plus two real base-2 log magnitudes
struct BaseCase {
    std::string label;
    double      a = 0.0;
    double      b = 0.0;
};

/// Generation run parameters
struct VectorGenConfig {
    int      random_count  = 16;
    uint64_t seed          = 2025;
    uint32_t tolerance_lsb = 64;
    double   range_min     = 0.0;
    double   range_max     = 12.0;
};

class RefVectorGen {
public:
    static constexpr int      WIDTH        = 24;
    static constexpr int      FRAC_BITS    = 10;
    static constexpr uint32_t SCALE        = 1u << FRAC_BITS;
    static constexpr uint32_t MAX_VAL      = (1u << WIDTH) - 1;
    static constexpr uint32_t NEG_INF_CODE = 1u << (WIDTH - 1);

    // ─────────────────────────────────────────────────────────────────────
    // Fixed-point conversion
    // ─────────────────────────────────────────────────────────────────────

    /// clamp(RNE(v * 2^FRAC_BITS), 0, MAX_VAL)
    static uint32_t real_to_fixed(double value);
    static double   fixed_to_real(uint32_t code);

    // ─────────────────────────────────────────────────────────────────────
    // Exact base-2 LSE: max + log2(1 + 2^(min - max)), extended precision
    // ─────────────────────────────────────────────────────────────────────
    static double compute_exact_lse(double a, double b);

    // ─────────────────────────────────────────────────────────────────────
    // Vector construction
    // ─────────────────────────────────────────────────────────────────────

    /// The always-included curated cases
    static const std::vector<BaseCase> &base_cases();

    static ReferenceVector make_vector(const std::string &label, double a, double b,
                                       uint32_t tolerance_lsb);

    /// Base cases, then `random_count` draws from [range_min, range_max),
    /// returned sorted by label. Same seed → same vector sequence.
    static std::vector<ReferenceVector> build_vectors(const std::vector<BaseCase> &cases,
                                                      int random_count, uint64_t seed,
                                                      uint32_t tolerance_lsb,
                                                      double range_min, double range_max);

    static std::vector<ReferenceVector> build_vectors(const VectorGenConfig &cfg);

    /// Fixed-width text listing of a vector set
    static std::string dump_vectors(const std::vector<ReferenceVector> &vectors);
};
