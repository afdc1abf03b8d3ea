// =============================================================================
// lsepe_gen.cpp — Golden Artifact Generator (text front end)
// =============================================================================
// Prints the CLUT ROM contents, the LSE reference vectors and the SIMD mode
// cases as plain text. Emitting HDL includes or JSON is left to downstream
// formatters that read this output.
// =============================================================================

#include "clut_builder.h"
#include "ref_vector_gen.h"
#include "simd_case_gen.h"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// =============================================================================
// Run configuration
// =============================================================================
struct GenCfg {
    ClutConfig      clut;
    VectorGenConfig vectors;
    bool            show_clut    = true;
    bool            show_vectors = true;
    bool            show_simd    = true;
    bool            show_help    = false;
};

static GenCfg g_cfg;

void print_usage(const char* prog) {
    printf("\n  Usage: %s [options]\n\n", prog);
    printf("  Options:\n");
    printf("    --entries N          CLUT depth, power of two       (default 16)\n");
    printf("    --bits N             CLUT word width                (default 10)\n");
    printf("    --random N           Random reference vectors       (default 16)\n");
    printf("    --seed N             Random seed                    (default 2025)\n");
    printf("    --tolerance-lsb N    Tolerance band in LSBs         (default 64)\n");
    printf("    --range MIN MAX      Random log2 value range        (default 0 12)\n");
    printf("    --section S          clut | vectors | simd | all    (default all)\n");
    printf("    -h, --help           Show this message\n\n");
}

bool parse_section(const char* s) {
    g_cfg.show_clut = g_cfg.show_vectors = g_cfg.show_simd = false;
    if (strcmp(s, "clut") == 0)    { g_cfg.show_clut = true;    return true; }
    if (strcmp(s, "vectors") == 0) { g_cfg.show_vectors = true; return true; }
    if (strcmp(s, "simd") == 0)    { g_cfg.show_simd = true;    return true; }
    if (strcmp(s, "all") == 0) {
        g_cfg.show_clut = g_cfg.show_vectors = g_cfg.show_simd = true;
        return true;
    }
    fprintf(stderr, "  Error: Unknown section '%s'\n", s);
    fprintf(stderr, "  Valid: clut | vectors | simd | all\n\n");
    return false;
}

// Whole-token decimal, no sign, at most `max`
bool parse_unsigned(const char* opt, const char* s, unsigned long long max,
                    unsigned long long &out) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = (s[0] >= '0' && s[0] <= '9') ? strtoull(s, &end, 10) : 0;
    if (end == nullptr || end == s || *end != '\0' || errno == ERANGE || v > max) {
        fprintf(stderr, "  Error: %s expects an integer in [0, %llu], got '%s'\n\n", opt, max, s);
        return false;
    }
    out = v;
    return true;
}

bool parse_int(const char* opt, const char* s, int &out) {
    unsigned long long v = 0;
    if (!parse_unsigned(opt, s, INT_MAX, v)) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_real(const char* opt, const char* s, double &out) {
    char* end = nullptr;
    double v = strtod(s, &end);
    if (end == s || *end != '\0') {
        fprintf(stderr, "  Error: %s expects a number, got '%s'\n\n", opt, s);
        return false;
    }
    out = v;
    return true;
}

bool parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            g_cfg.show_help = true;
            return true;
        } else if (strcmp(argv[i], "--entries") == 0 && i + 1 < argc) {
            if (!parse_int(argv[i], argv[i + 1], g_cfg.clut.entries)) return false;
            ++i;
        } else if (strcmp(argv[i], "--bits") == 0 && i + 1 < argc) {
            if (!parse_int(argv[i], argv[i + 1], g_cfg.clut.bit_width)) return false;
            ++i;
        } else if (strcmp(argv[i], "--random") == 0 && i + 1 < argc) {
            if (!parse_int(argv[i], argv[i + 1], g_cfg.vectors.random_count)) return false;
            ++i;
        } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            unsigned long long seed = 0;
            if (!parse_unsigned(argv[i], argv[i + 1], ULLONG_MAX, seed)) return false;
            g_cfg.vectors.seed = seed;
            ++i;
        } else if (strcmp(argv[i], "--tolerance-lsb") == 0 && i + 1 < argc) {
            unsigned long long tol = 0;
            if (!parse_unsigned(argv[i], argv[i + 1], UINT32_MAX, tol)) return false;
            g_cfg.vectors.tolerance_lsb = static_cast<uint32_t>(tol);
            ++i;
        } else if (strcmp(argv[i], "--range") == 0 && i + 2 < argc) {
            if (!parse_real(argv[i], argv[i + 1], g_cfg.vectors.range_min)) return false;
            if (!parse_real(argv[i], argv[i + 2], g_cfg.vectors.range_max)) return false;
            i += 2;
        } else if (strcmp(argv[i], "--section") == 0 && i + 1 < argc) {
            if (!parse_section(argv[++i])) return false;
        } else {
            fprintf(stderr, "  Error: Unknown argument '%s'\n\n", argv[i]);
            return false;
        }
    }
    return true;
}

// =============================================================================
// Main
// =============================================================================
int main(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        print_usage(argv[0]);
        return 1;
    }
    if (g_cfg.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        if (g_cfg.show_clut) {
            ClutTable t = ClutBuilder::build(g_cfg.clut);
            printf("%s\n", t.dump_summary().c_str());
        }
        if (g_cfg.show_vectors) {
            std::vector<ReferenceVector> v = RefVectorGen::build_vectors(g_cfg.vectors);
            printf("%s\n", RefVectorGen::dump_vectors(v).c_str());
            printf("  Generated %zu reference vectors with tolerance +/-%u LSB (%.6f)\n\n",
                   v.size(), g_cfg.vectors.tolerance_lsb,
                   static_cast<double>(g_cfg.vectors.tolerance_lsb) / RefVectorGen::SCALE);
        }
        if (g_cfg.show_simd) {
            printf("%s\n", SimdCaseGen::dump_cases(SimdCaseGen::all_cases()).c_str());
        }
    } catch (const InvalidConfiguration &e) {
        fprintf(stderr, "  Error: invalid configuration (%s): %s\n\n",
                e.parameter().c_str(), e.what());
        return 2;
    }
    return 0;
}
