// =============================================================================
// clut_builder.cpp — CLUT Generator Implementation
// =============================================================================

#include "clut_builder.h"
#include "lane_pack_unit.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iomanip>
#include <sstream>

// ─────────────────────────────────────────────────────────────────────────────
// Reference functions (real arithmetic, generation time only)
// ─────────────────────────────────────────────────────────────────────────────

double ClutBuilder::exact_correction(double x) {
    return std::log2(1.0 + std::exp2(x));
}

double ClutBuilder::hw_approximation(double x) {
    return x;
}

double ClutBuilder::correction_error(double x) {
    return exact_correction(x) - hw_approximation(x);
}

// ═════════════════════════════════════════════════════════════════════════════
// TABLE GENERATION
// ═════════════════════════════════════════════════════════════════════════════

ClutTable ClutBuilder::build(int entries, int bit_width) {
    // Address decoder needs an exact power-of-two depth
    if (entries <= 0 || (entries & (entries - 1)) != 0) {
        throw InvalidConfiguration("entries", entries,
                                   "CLUT depth must be a power of two");
    }
    if (bit_width < 1 || bit_width > MAX_BIT_WIDTH) {
        throw InvalidConfiguration("bit_width", bit_width,
                                   "CLUT word width must be in [1, 31]");
    }

    ClutTable t;
    t.entries   = entries;
    t.bit_width = bit_width;
    while ((1 << t.addr_bits) < entries) ++t.addr_bits;

    // Uniform sample grid over [0, 1 - 1/entries]
    t.sample_points.resize(entries);
    t.exact_errors.resize(entries);
    for (int i = 0; i < entries; ++i) {
        double x = static_cast<double>(i) / entries;
        t.sample_points[i] = x;
        t.exact_errors[i]  = correction_error(x);
    }

    t.max_error = t.exact_errors[0];
    for (double e : t.exact_errors) t.max_error = std::max(t.max_error, e);

    // max_error >= e(0) = 1, so the division below is always defined
    const double full_scale = static_cast<double>((1ULL << bit_width) - 1);
    t.quantized.resize(entries);
    for (int i = 0; i < entries; ++i) {
        double scaled = t.exact_errors[i] / t.max_error * full_scale;
        t.quantized[i] = LanePackUnit::quantize_rne(scaled, bit_width);
    }
    return t;
}

ClutTable ClutBuilder::build(const ClutConfig &cfg) {
    return build(cfg.entries, cfg.bit_width);
}

// ═════════════════════════════════════════════════════════════════════════════
// TABLE ACCESSORS
// ═════════════════════════════════════════════════════════════════════════════

double ClutTable::scale() const {
    return max_error / static_cast<double>((1ULL << bit_width) - 1);
}

double ClutTable::dequantize(int index) const {
    assert(index >= 0 && index < entries);
    return quantized[index] * scale();
}

double ClutTable::reconstruction_error(int index) const {
    return std::fabs(exact_errors[index] - dequantize(index));
}

std::string ClutTable::dump_summary() const {
    std::ostringstream oss;
    oss << "──── CLUT " << entries << " x " << bit_width << "b ────\n";
    oss << "  Address bits:   " << addr_bits << "\n";
    oss << "  Sample range:   [0, " << std::fixed << std::setprecision(4)
        << (1.0 - 1.0 / entries) << "]\n";
    oss << "  Max correction: " << std::setprecision(6) << max_error << "\n";
    oss << "  Quant. scale:   " << std::setprecision(8) << scale() << "\n";

    const int hex_digits = (bit_width + 3) / 4;
    for (int i = 0; i < entries; ++i) {
        oss << "  [" << std::dec << std::setw(3) << std::setfill(' ') << i << "] "
            << "x=" << std::setprecision(4) << sample_points[i]
            << "  e=" << std::setprecision(6) << exact_errors[i]
            << "  rom=0x" << std::hex << std::uppercase << std::setfill('0')
            << std::setw(hex_digits) << quantized[i]
            << std::dec << std::nouppercase << std::setfill(' ') << "\n";
    }
    return oss.str();
}
