// =============================================================================
// lse_engine.h — Bit-Accurate Adaptive LSE Adder
// =============================================================================
// Hardware Mapping: This class models lse_add_adaptive #(WIDTH), the
// log-domain adder inside each SIMD lane. All arithmetic is integer-only and
// follows the RTL datapath: NEG_INF detect → magnitude comparator → signed
// subtractor → threshold comparator → correction adder with saturation mux.
//
// The result is a coarse approximation of max(a,b) + log2(1 + 2^diff): the
// correction is a single SMALL_CORRECTION quantum. The CLUT applied downstream
// restores accuracy and is not modelled here.
// =============================================================================
#pragma once

#include "lsepe_types.h"

class LseEngine {
public:
    // =====================================================================
    // Decode / encode — NEG_INF sentinel vs finite magnitude
    // =====================================================================
    static LogValue unpack_code(uint32_t code, const AdaptiveParameters &p);
    static uint32_t pack_code(const LogValue &v, const AdaptiveParameters &p);

    // =====================================================================
    // Core operation
    // =====================================================================

    /// Adaptive saturating LSE addition of two W-bit codes.
    /// Operands are truncated to W bits on entry (port width). If `status` is
    /// non-null it receives the branch taken.
    static uint32_t lse_add(uint32_t a, uint32_t b, const AdaptiveParameters &p,
                            LseStatus *status = nullptr);

    /// Convenience overload: derives the parameters from `width`.
    /// Throws InvalidConfiguration for unsupported widths.
    static uint32_t lse_add(uint32_t a, uint32_t b, int width);

    // ─────────────────────────────────────────────────────────────────────
    // Width mask — maps to the truncation of a W-bit output port
    // ─────────────────────────────────────────────────────────────────────
    static uint32_t mask(uint64_t value, int width) {
        return static_cast<uint32_t>(value & ((1ULL << width) - 1));
    }
};
