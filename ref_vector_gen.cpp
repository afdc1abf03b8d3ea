// =============================================================================
// ref_vector_gen.cpp — Reference Vector Generator Implementation
// =============================================================================

#include "ref_vector_gen.h"
#include "lane_pack_unit.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

static std::string real_text(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", value);
    return buf;
}

// ─────────────────────────────────────────────────────────────────────────────
// Fixed-point conversion
// ─────────────────────────────────────────────────────────────────────────────

uint32_t RefVectorGen::real_to_fixed(double value) {
    return LanePackUnit::quantize_rne(value * SCALE, WIDTH);
}

double RefVectorGen::fixed_to_real(uint32_t code) {
    return static_cast<double>(code) / SCALE;
}

// ─────────────────────────────────────────────────────────────────────────────
// Exact LSE — log1p form keeps full precision when min << max
// ─────────────────────────────────────────────────────────────────────────────

double RefVectorGen::compute_exact_lse(double a, double b) {
    long double hi = std::max(a, b);
    long double lo = std::min(a, b);
    if (std::isinf(hi)) return static_cast<double>(hi);

    long double delta = lo - hi;
    long double exact = hi + std::log1p(std::exp2(delta)) / std::log(2.0L);
    return static_cast<double>(exact);
}

// ═════════════════════════════════════════════════════════════════════════════
// VECTOR CONSTRUCTION
// ═════════════════════════════════════════════════════════════════════════════

const std::vector<BaseCase> &RefVectorGen::base_cases() {
    static const std::vector<BaseCase> cases = {
        {"equal_5",          5.0,   5.0},
        {"close_delta_0p5",  5.0,   4.5},
        {"close_delta_1",    3.0,   2.0},
        {"medium_delta_4",   8.0,   4.0},
        {"medium_delta_5",  10.0,   5.0},
        {"large_delta_18",  20.0,   2.0},
        {"zero_zero",        0.0,   0.0},
        {"zero_vs_4",        0.0,   4.0},
        {"four_vs_zero",     4.0,   0.0},
        {"fractional_0p25",  0.25, -0.75},
        {"fractional_1p5",   1.5,   0.0},
        {"fractional_2p75",  2.75,  1.125},
    };
    return cases;
}

ReferenceVector RefVectorGen::make_vector(const std::string &label, double a, double b,
                                          uint32_t tolerance_lsb) {
    ReferenceVector v;
    v.label       = label;
    v.operand_a   = real_to_fixed(a);
    v.operand_b   = real_to_fixed(b);
    v.exact_value = compute_exact_lse(a, b);
    v.expected    = real_to_fixed(v.exact_value);

    // Band edges computed in 64-bit so neither side can wrap before clamping
    int64_t lo = static_cast<int64_t>(v.expected) - tolerance_lsb;
    int64_t hi = static_cast<int64_t>(v.expected) + tolerance_lsb;
    v.min_expected = static_cast<uint32_t>(std::max<int64_t>(lo, 0));
    v.max_expected = static_cast<uint32_t>(std::min<int64_t>(hi, MAX_VAL));

    v.error_tolerance = static_cast<double>(tolerance_lsb) / SCALE;
    return v;
}

std::vector<ReferenceVector> RefVectorGen::build_vectors(const std::vector<BaseCase> &cases,
                                                         int random_count, uint64_t seed,
                                                         uint32_t tolerance_lsb,
                                                         double range_min, double range_max) {
    if (random_count < 0) {
        throw InvalidConfiguration("random_count", random_count,
                                   "random case count must be non-negative");
    }
    if (!std::isfinite(range_min)) {
        throw InvalidConfiguration("range_min", real_text(range_min),
                                   "random value range must be finite");
    }
    if (!std::isfinite(range_max)) {
        throw InvalidConfiguration("range_max", real_text(range_max),
                                   "random value range must be finite");
    }
    if (range_min > range_max) {
        throw InvalidConfiguration("range_max", real_text(range_max),
                                   "random value range must have min <= max");
    }

    std::vector<ReferenceVector> vectors;
    vectors.reserve(cases.size() + random_count);

    for (const BaseCase &c : cases) {
        vectors.push_back(make_vector(c.label, c.a, c.b, tolerance_lsb));
    }

    // mt19937_64 output is fixed by the standard; the [0,1) mapping uses the
    // top 53 bits so every library yields the same doubles.
    // max - min can overflow for finite bounds, so interpolate term by term.
    std::mt19937_64 rng(seed);
    auto draw = [&]() {
        double u = static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
        double v = (range_min + u * range_max) - u * range_min;
        return std::min(std::max(v, range_min), range_max);
    };

    for (int idx = 0; idx < random_count; ++idx) {
        double a = draw();
        double b = draw();
        char label[32];
        std::snprintf(label, sizeof(label), "random_%03d", idx);
        vectors.push_back(make_vector(label, a, b, tolerance_lsb));
    }

    std::stable_sort(vectors.begin(), vectors.end(),
                     [](const ReferenceVector &x, const ReferenceVector &y) {
                         return x.label < y.label;
                     });
    return vectors;
}

std::vector<ReferenceVector> RefVectorGen::build_vectors(const VectorGenConfig &cfg) {
    return build_vectors(base_cases(), cfg.random_count, cfg.seed, cfg.tolerance_lsb,
                         cfg.range_min, cfg.range_max);
}

std::string RefVectorGen::dump_vectors(const std::vector<ReferenceVector> &vectors) {
    std::ostringstream oss;
    oss << "──── LSE Reference Vectors (" << vectors.size() << ", Q"
        << (WIDTH - FRAC_BITS) << "." << FRAC_BITS << ") ────\n";
    for (const ReferenceVector &v : vectors) {
        oss << "  " << std::left << std::setw(18) << v.label << std::right
            << std::hex << std::uppercase << std::setfill('0')
            << " a=0x" << std::setw(6) << v.operand_a
            << " b=0x" << std::setw(6) << v.operand_b
            << " exp=0x" << std::setw(6) << v.expected
            << " [0x" << std::setw(6) << v.min_expected
            << ", 0x" << std::setw(6) << v.max_expected << "]"
            << std::dec << std::nouppercase << std::setfill(' ')
            << " exact=" << std::fixed << std::setprecision(12) << v.exact_value
            << " tol=" << v.error_tolerance << "\n";
    }
    return oss.str();
}
