#include "ControllerConfig.h"
#include "Checksum.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace afc {

namespace {

struct RealField {
    const char* key;
    double ControllerConfigV1::*member;
};

// Fixed order: hash, export and parse all walk this list.
const RealField kRealFields[] = {
    {"sample_rate_hz",      &ControllerConfigV1::sample_rate_hz},
    {"lms_mu",              &ControllerConfigV1::lms_mu},
    {"eta_min",             &ControllerConfigV1::eta_min},
    {"eta_max",             &ControllerConfigV1::eta_max},
    {"eta_initial",         &ControllerConfigV1::eta_initial},
    {"eta_smoothing",       &ControllerConfigV1::eta_smoothing},
    {"shear_memory_alpha",  &ControllerConfigV1::shear_memory_alpha},
    {"shear_gain",          &ControllerConfigV1::shear_gain},
    {"shear_exponent",      &ControllerConfigV1::shear_exponent},
    {"heating_gain",        &ControllerConfigV1::heating_gain},
    {"cooling_base",        &ControllerConfigV1::cooling_base},
    {"cooling_artifact",    &ControllerConfigV1::cooling_artifact},
    {"heat_accel",          &ControllerConfigV1::heat_accel},
    {"resonance_gain",      &ControllerConfigV1::resonance_gain},
    {"artifact_threshold",  &ControllerConfigV1::artifact_threshold},
    {"drive_base",          &ControllerConfigV1::drive_base},
    {"drive_span",          &ControllerConfigV1::drive_span},
    {"drive_sigmoid_gain",  &ControllerConfigV1::drive_sigmoid_gain},
    {"amp_smoothing",       &ControllerConfigV1::amp_smoothing},
    {"freq_smoothing",      &ControllerConfigV1::freq_smoothing},
    {"freq_base_hz",        &ControllerConfigV1::freq_base_hz},
    {"freq_span_hz",        &ControllerConfigV1::freq_span_hz},
    {"observation_abs_max", &ControllerConfigV1::observation_abs_max},
};

static inline bool isFraction(double x) {
    return std::isfinite(x) && x > 0.0 && x <= 1.0;
}

static inline bool isFiniteNonNegative(double x) {
    return std::isfinite(x) && x >= 0.0;
}

static inline bool fail(std::string* why, const char* msg) {
    if (why) *why = msg;
    return false;
}

static inline std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

} // namespace

ControllerConfigV1 makePresetConfig(ControllerPreset preset) {
    ControllerConfigV1 cfg{};

    switch (preset) {
    case ControllerPreset::Gentle:
        // Earlier tuning: thick medium, weak drive. Barely moves unless shear thins it.
        cfg.eta_max = 12.0;
        cfg.drive_base = 0.2;
        cfg.drive_span = 0.8;
        break;
    case ControllerPreset::HighTorque:
    default:
        break;
    }

    cfg.fnv_hash_u32 = hashConfig(cfg);
    return cfg;
}

bool validateConfig(const ControllerConfigV1& cfg, std::string* why) {
    if (cfg.version_u32 != 1u || cfg.size_bytes_u32 != sizeof(ControllerConfigV1)) {
        return fail(why, "version/size mismatch");
    }
    for (const auto& f : kRealFields) {
        if (!std::isfinite(cfg.*f.member)) {
            if (why) *why = std::string("non-finite ") + f.key;
            return false;
        }
    }
    if (cfg.sample_rate_hz < kMinSampleRateHz) return fail(why, "sample_rate_hz below 3 Hz");
    if (cfg.sample_rate_hz > kMaxSampleRateHz) return fail(why, "sample_rate_hz above 100 kHz");
    if (cfg.filter_order_u32 < 1u || cfg.filter_order_u32 > kMaxFilterOrder) {
        return fail(why, "filter_order_u32 out of [1,64]");
    }
    if (!(cfg.eta_min > 0.0 && cfg.eta_min < cfg.eta_max)) return fail(why, "require 0 < eta_min < eta_max");

    if (!isFraction(cfg.eta_smoothing)) return fail(why, "eta_smoothing out of (0,1]");
    if (!isFraction(cfg.shear_memory_alpha)) return fail(why, "shear_memory_alpha out of (0,1]");
    if (!isFraction(cfg.amp_smoothing)) return fail(why, "amp_smoothing out of (0,1]");
    if (!isFraction(cfg.freq_smoothing)) return fail(why, "freq_smoothing out of (0,1]");

    if (!isFiniteNonNegative(cfg.lms_mu)) return fail(why, "lms_mu < 0");
    if (!isFiniteNonNegative(cfg.shear_gain)) return fail(why, "shear_gain < 0");
    if (!(cfg.shear_exponent > 0.0)) return fail(why, "shear_exponent <= 0");
    if (!isFiniteNonNegative(cfg.heating_gain)) return fail(why, "heating_gain < 0");
    if (!isFiniteNonNegative(cfg.cooling_base)) return fail(why, "cooling_base < 0");
    if (!isFiniteNonNegative(cfg.cooling_artifact)) return fail(why, "cooling_artifact < 0");
    if (!isFiniteNonNegative(cfg.heat_accel)) return fail(why, "heat_accel < 0");
    if (!isFiniteNonNegative(cfg.resonance_gain)) return fail(why, "resonance_gain < 0");
    if (!isFiniteNonNegative(cfg.artifact_threshold)) return fail(why, "artifact_threshold < 0");
    if (!(cfg.observation_abs_max > 0.0)) return fail(why, "observation_abs_max <= 0");

    return true;
}

std::uint32_t hashConfig(const ControllerConfigV1& cfg) {
    using namespace checksum;
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_u32(h, cfg.size_bytes_u32);
    h = fnv1a32_add_u32(h, cfg.filter_order_u32);
    for (const auto& f : kRealFields) {
        h = fnv1a32_add_f64(h, cfg.*f.member);
    }
    return h;
}

int exportConfigText(const ControllerConfigV1& cfg, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap - 1) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - 1 - n);
    };

    app("ControllerConfigV1\n");
    app("  version_u32=%u\n", cfg.version_u32);
    app("  size_bytes_u32=%u\n", cfg.size_bytes_u32);
    app("  filter_order_u32=%u\n", cfg.filter_order_u32);
    for (const auto& f : kRealFields) {
        app("  %s=%.17g\n", f.key, cfg.*f.member);
    }
    app("  fnv_hash_u32=0x%08X\n", hashConfig(cfg));

    // Convenience: full export hash for copy/paste audits.
    const std::uint32_t export_hash = checksum::fnv1a32_text(buf);
    app("ExportTextHash(FNV-1a32)=0x%08X\n", export_hash);

    return n;
}

bool parseConfigText(const std::string& text, ControllerConfigV1* out, std::string* why) {
    if (!out) return fail(why, "null output");

    ControllerConfigV1 tmp = *out;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) line.erase(hash_pos);

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue; // section headers, blank lines

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));

        // Derived/audit lines are recomputed, never imported.
        if (key == "fnv_hash_u32" || key.rfind("ExportTextHash", 0) == 0) continue;

        if (value.empty()) {
            if (why) *why = "line " + std::to_string(line_no) + ": empty value for " + key;
            return false;
        }

        if (key == "version_u32" || key == "size_bytes_u32" || key == "filter_order_u32") {
            errno = 0;
            char* end = nullptr;
            const unsigned long v = std::strtoul(value.c_str(), &end, 10);
            if (errno != 0 || end == value.c_str() || *end != '\0' || v > 0xFFFFFFFFul) {
                if (why) *why = "line " + std::to_string(line_no) + ": bad integer for " + key;
                return false;
            }
            const auto u = static_cast<std::uint32_t>(v);
            if (key == "version_u32") tmp.version_u32 = u;
            else if (key == "size_bytes_u32") tmp.size_bytes_u32 = u;
            else tmp.filter_order_u32 = u;
            continue;
        }

        const RealField* field = nullptr;
        for (const auto& f : kRealFields) {
            if (key == f.key) {
                field = &f;
                break;
            }
        }
        if (!field) {
            if (why) *why = "line " + std::to_string(line_no) + ": unknown key " + key;
            return false;
        }

        errno = 0;
        char* end = nullptr;
        const double v = std::strtod(value.c_str(), &end);
        if (errno != 0 || end == value.c_str() || *end != '\0' || !std::isfinite(v)) {
            if (why) *why = "line " + std::to_string(line_no) + ": bad number for " + key;
            return false;
        }
        tmp.*field->member = v;
    }

    tmp.fnv_hash_u32 = hashConfig(tmp);
    *out = tmp;
    return true;
}

} // namespace afc
