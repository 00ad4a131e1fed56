#pragma once

#include <string>
#include <vector>

namespace afc {

// One value per line; blank lines and lines starting with '#' are skipped.
// Fails (with *why) on unreadable files or unparseable lines.
bool loadObservationTrace(const std::string& path, std::vector<double>* out, std::string* why = nullptr);

// Writes one value per line at full round-trip precision.
bool writeSampleTrace(const std::string& path, const std::vector<double>& samples, std::string* why = nullptr);

// Deterministic persistent excitation: +level, -level, +level, ...
std::vector<double> alternatingTrace(double level, int steps);

} // namespace afc
