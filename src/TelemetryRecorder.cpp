#include "TelemetryRecorder.h"
#include "Checksum.h"

#include <cmath>

namespace afc {

CieuRecord makeCieuRecord(const ControllerState& s, double waveform_sample) {
    CieuRecord rec;
    rec.context.heat = s.heat;
    rec.context.viscosity = s.viscosity;
    rec.context.phase = s.phase;

    rec.action.amplitude = s.amplitude;
    rec.action.frequency_hz = s.frequency_hz;
    rec.action.waveform_sample = waveform_sample;

    rec.target_0_1 = s.target_level_0_1;
    rec.observation_0_1 = s.observed_level_0_1;
    rec.reward = -std::abs(rec.target_0_1 - rec.observation_0_1);
    return rec;
}

void recordStep(ControllerState& s, const CieuRecord& rec) {
    s.telemetry_log.push_back(rec);
}

std::uint32_t foldRecordCrc(std::uint32_t crc, const CieuRecord& rec) {
    using namespace checksum;
    crc = crc32_add_f64(crc, rec.context.heat);
    crc = crc32_add_f64(crc, rec.context.viscosity);
    crc = crc32_add_u32(crc, static_cast<std::uint32_t>(rec.context.phase));
    crc = crc32_add_f64(crc, rec.action.amplitude);
    crc = crc32_add_f64(crc, rec.action.frequency_hz);
    crc = crc32_add_f64(crc, rec.action.waveform_sample);
    crc = crc32_add_f64(crc, rec.target_0_1);
    crc = crc32_add_f64(crc, rec.observation_0_1);
    crc = crc32_add_f64(crc, rec.reward);
    return crc;
}

std::uint32_t foldStateDigest(std::uint32_t digest, const ControllerState& s) {
    using namespace checksum;
    std::uint32_t h = digest;
    h = fnv1a32_add_f64(h, s.heat);
    h = fnv1a32_add_f64(h, s.viscosity);
    for (double w : s.filter_weights) {
        h = fnv1a32_add_f64(h, w);
    }
    return h;
}

} // namespace afc
