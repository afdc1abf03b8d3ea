// =============================================================================
// simd_case_gen.h — SIMD Mode Test Case Generator
// =============================================================================
// Builds the curated per-mode stimulus for the PE verification bench: operand
// words on the 24-bit bus, the pe_mode selector and the expected output word.
// Expected values always come from LanePackUnit::apply_simd, so the bench and
// the model can never disagree on lane order or width.
// =============================================================================
#pragma once

#include "lsepe_types.h"
#include <string>
#include <vector>

struct SimdTestCase {
    std::string           name;
    SimdMode              mode     = SimdMode::W24X1;
    uint32_t              word_a   = 0;
    uint32_t              word_b   = 0;
    uint32_t              expected = 0;
    std::vector<uint32_t> lanes_a;          // lane 0 first
    std::vector<uint32_t> lanes_b;
    std::vector<uint32_t> lanes_expected;
};

class SimdCaseGen {
public:
    /// Case from per-lane operands (lane 0 first); packed with the mode's layout
    static SimdTestCase from_lanes(const std::string &name, SimdMode mode,
                                   const std::vector<uint32_t> &lanes_a,
                                   const std::vector<uint32_t> &lanes_b);

    /// Case from packed operand words
    static SimdTestCase from_words(const std::string &name, SimdMode mode,
                                   uint32_t word_a, uint32_t word_b);

    static std::vector<SimdTestCase> cases_2x12b();
    static std::vector<SimdTestCase> cases_4x6b();
    static std::vector<SimdTestCase> cases_unified();

    /// All of the above, in that order
    static std::vector<SimdTestCase> all_cases();

    static std::string dump_cases(const std::vector<SimdTestCase> &cases);
};
