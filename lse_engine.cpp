// =============================================================================
// lse_engine.cpp — Bit-Accurate Adaptive LSE Adder Implementation
// =============================================================================
// Datapath (one combinational pass):
//   [NEG_INF detect] → bypass mux
//   [compare a,b]    → larger / smaller
//   [subtract]       → diff = smaller - larger  (W+1 bit signed, ≤ 0)
//   [diff > THRESH]  → correction adder + overflow comparator → saturation mux
//   [mask]           → W-bit output port
// =============================================================================

#include "lse_engine.h"

// ─────────────────────────────────────────────────────────────────────────────
// Parameter derivation — elaboration-time localparams
// ─────────────────────────────────────────────────────────────────────────────

AdaptiveParameters AdaptiveParameters::from_width(int width) {
    if (width < MIN_WIDTH || width > MAX_WIDTH) {
        throw InvalidConfiguration("width", width,
                                   "operand width must be in [1, 32]");
    }

    AdaptiveParameters p;
    p.width            = width;
    p.neg_inf          = static_cast<uint32_t>(1ULL << (width - 1));
    p.small_correction = static_cast<uint32_t>(width / 8);
    // -2^(W-4) is fractional below W=4; the integer cutoff there is -1
    p.diff_threshold   = (width >= 4) ? -(static_cast<int64_t>(1) << (width - 4)) : -1;
    p.max_val          = static_cast<uint32_t>((1ULL << width) - 1);
    return p;
}

// ═════════════════════════════════════════════════════════════════════════════
// DECODE / ENCODE
// ═════════════════════════════════════════════════════════════════════════════

LogValue LseEngine::unpack_code(uint32_t code, const AdaptiveParameters &p) {
    LogValue v;
    v.code       = code & p.max_val;
    v.is_neg_inf = (v.code == p.neg_inf);
    return v;
}

uint32_t LseEngine::pack_code(const LogValue &v, const AdaptiveParameters &p) {
    if (v.is_neg_inf) return p.neg_inf;
    return v.code & p.max_val;
}

// ═════════════════════════════════════════════════════════════════════════════
// ADAPTIVE LSE ADD
// ═════════════════════════════════════════════════════════════════════════════

uint32_t LseEngine::lse_add(uint32_t a, uint32_t b, const AdaptiveParameters &p,
                            LseStatus *status) {
    LseStatus st;
    LogValue va = unpack_code(a, p);
    LogValue vb = unpack_code(b, p);

    // --- NEG_INF bypass: identity of the LSE semiring ---
    if (va.is_neg_inf || vb.is_neg_inf) {
        st.neg_inf_bypass = true;
        if (status) *status = st;
        if (va.is_neg_inf && vb.is_neg_inf) return p.neg_inf;
        return va.is_neg_inf ? vb.code : va.code;
    }

    // --- Magnitude comparator (ties select a) ---
    uint32_t larger  = (va.code >= vb.code) ? va.code : vb.code;
    uint32_t smaller = (va.code >= vb.code) ? vb.code : va.code;

    // --- Signed subtractor, 64-bit so no W-bit wrap is possible ---
    int64_t diff = static_cast<int64_t>(smaller) - static_cast<int64_t>(larger);

    uint64_t result;
    if (diff > p.diff_threshold) {
        // Smaller operand still contributes: add one correction quantum,
        // clamp when the sum would leave the W-bit range.
        if (larger > p.max_val - p.small_correction) {
            result = p.max_val;
            st.saturated = true;
        } else {
            result = static_cast<uint64_t>(larger) + p.small_correction;
            st.correction_applied = true;
        }
    } else {
        result = larger;
    }

    if (status) *status = st;
    return mask(result, p.width);
}

uint32_t LseEngine::lse_add(uint32_t a, uint32_t b, int width) {
    return lse_add(a, b, AdaptiveParameters::from_width(width));
}
