// =============================================================================
// clut_builder.h — Correction Look-Up Table (CLUT) Generator
// =============================================================================
// Hardware Mapping: Produces the ROM contents of the shared CLUT that sits
// after the LSE adders. The ROM is addressed by log2(entries) bits of the
// fractional difference and returns an unsigned `bit_width`-bit value; the
// consumer multiplies it by scale() to recover the additive correction.
//
//   exact  f(x) = log2(1 + 2^x),   x in [0, 1)
//   approx      = x                (first-order hardware path)
//   error  e(x) = f(x) - x
//   ROM[i]      = RNE(e(x_i) / max_error * (2^bit_width - 1)),  x_i = i/entries
// =============================================================================
#pragma once

#include "lsepe_types.h"
#include <string>
#include <vector>

/// CLUT geometry — the parameters of the ROM instance
struct ClutConfig {
    int entries   = 16;   // ROM depth, power of two
    int bit_width = 10;   // ROM word width
};

/// Generated table plus the metadata that must travel with it
struct ClutTable {
    int    entries   = 0;
    int    bit_width = 0;
    int    addr_bits = 0;      // log2(entries)
    double max_error = 0.0;    // quantization full-scale, computed once per build

    std::vector<uint32_t> quantized;      // ROM words, ordered by address
    std::vector<double>   sample_points;  // x_i
    std::vector<double>   exact_errors;   // e(x_i)

    /// Real value of one ROM LSB: max_error / (2^bit_width - 1)
    double scale() const;

    /// ROM word at `index` converted back to a real correction
    double dequantize(int index) const;

    /// |e(x_i) - dequantize(i)|
    double reconstruction_error(int index) const;

    std::string dump_summary() const;
};

class ClutBuilder {
public:
    static constexpr int MAX_BIT_WIDTH = 31;

    static double exact_correction(double x);
    static double hw_approximation(double x);
    static double correction_error(double x);

    /// Throws InvalidConfiguration if `entries` is not a power of two or
    /// `bit_width` is outside [1, 31].
    static ClutTable build(int entries, int bit_width);
    static ClutTable build(const ClutConfig &cfg);
};
