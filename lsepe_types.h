// =============================================================================
// lsepe_types.h — LSE Processing Element: Type Definitions
// =============================================================================
// Hardware Mapping: These types correspond to the pe_mode selector, the
// width-derived localparams of lse_add_adaptive and the per-lane status bits
// visible at the PE boundary. Every enum value maps 1:1 to a hardware
// configuration encoding.
// =============================================================================
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// pe_mode Field Enumeration
// ─────────────────────────────────────────────────────────────────────────────

/// SIMD mode selector — maps to pe_mode[1:0]
enum class SimdMode : uint8_t {
    W24X1 = 0x0,   // 1× 24-bit lane
    W12X2 = 0x1,   // 2× 12-bit lanes
    W6X4  = 0x2,   // 4×  6-bit lanes
};

// ─────────────────────────────────────────────────────────────────────────────
// Configuration error
// ─────────────────────────────────────────────────────────────────────────────
// Raised before any computation when a width, lane split or table geometry
// cannot be realised. Carries the offending parameter so the caller can
// report it.
// ─────────────────────────────────────────────────────────────────────────────
class InvalidConfiguration : public std::invalid_argument {
public:
    InvalidConfiguration(const std::string &parameter, long long value,
                         const std::string &reason)
        : std::invalid_argument(parameter + "=" + std::to_string(value) + ": " + reason),
          parameter_(parameter), value_(value) {}

    /// For values with no integer form (NaN, inf, fractional bounds); value() is 0
    InvalidConfiguration(const std::string &parameter, const std::string &value_text,
                         const std::string &reason)
        : std::invalid_argument(parameter + "=" + value_text + ": " + reason),
          parameter_(parameter), value_(0) {}

    const std::string &parameter() const { return parameter_; }
    long long value() const { return value_; }

private:
    std::string parameter_;
    long long   value_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Adaptive parameters — the localparams of lse_add_adaptive #(WIDTH)
// ─────────────────────────────────────────────────────────────────────────────
// Derived once from the operand width and passed by value to the engine.
//   NEG_INF          = 2^(W-1)        (MSB set, others clear)
//   SMALL_CORRECTION = W / 8
//   DIFF_THRESHOLD   = -2^(W-4)       (-1 below W=4, where 2^(W-4) < 1)
//   MAX_VAL          = 2^W - 1
// ─────────────────────────────────────────────────────────────────────────────
struct AdaptiveParameters {
    static constexpr int MIN_WIDTH = 1;
    static constexpr int MAX_WIDTH = 32;

    int      width            = 0;
    uint32_t neg_inf          = 0;
    uint32_t small_correction = 0;
    int64_t  diff_threshold   = 0;
    uint32_t max_val          = 0;

    /// Throws InvalidConfiguration unless MIN_WIDTH <= width <= MAX_WIDTH
    static AdaptiveParameters from_width(int width);
};

// ─────────────────────────────────────────────────────────────────────────────
// Lane geometry of a packed word
// ─────────────────────────────────────────────────────────────────────────────
struct LaneLayout {
    int lane_width = 24;
    int lane_count = 1;

    int total_width() const { return lane_width * lane_count; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Unpacked log-domain value
// ─────────────────────────────────────────────────────────────────────────────
// Mirrors the decode stage in front of the adder: the raw code either is the
// reserved NEG_INF pattern or a finite magnitude. `code` always holds the raw
// W-bit pattern so the value can be repacked bit-exactly.
// ─────────────────────────────────────────────────────────────────────────────
struct LogValue {
    uint32_t code       = 0;
    bool     is_neg_inf = false;
};

/// Per-addition status — which datapath branch produced the result
struct LseStatus {
    bool neg_inf_bypass     = false;  // one or both operands were NEG_INF
    bool correction_applied = false;  // diff > DIFF_THRESHOLD, no saturation
    bool saturated          = false;  // diff > DIFF_THRESHOLD, clamped to MAX_VAL
};
