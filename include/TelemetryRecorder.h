#pragma once

#include "ControllerState.h"

namespace afc {

// Snapshot of the just-completed step. reward = -|target - observation|.
CieuRecord makeCieuRecord(const ControllerState& s, double waveform_sample);

// Appends one record. The log grows for the whole session; rotation/export
// is the caller's concern.
void recordStep(ControllerState& s, const CieuRecord& rec);

// Signature folding (fixed field order). The state digest starts from
// checksum::fnv1a32_begin().
std::uint32_t foldRecordCrc(std::uint32_t crc, const CieuRecord& rec);
std::uint32_t foldStateDigest(std::uint32_t digest, const ControllerState& s);

} // namespace afc
