#include "Trace.h"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <utility>

namespace afc {

bool loadObservationTrace(const std::string& path, std::vector<double>* out, std::string* why) {
    if (!out) return false;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (why) *why = "cannot open " + path;
        return false;
    }

    std::vector<double> values;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') continue;
        const auto e = line.find_last_not_of(" \t\r");
        const std::string token = line.substr(b, e - b + 1);

        char* end = nullptr;
        const double v = std::strtod(token.c_str(), &end);
        // Non-finite values are kept: the controller decides what to reject.
        if (end == token.c_str() || *end != '\0') {
            if (why) *why = path + ":" + std::to_string(line_no) + ": not a number";
            return false;
        }
        values.push_back(v);
    }

    *out = std::move(values);
    return true;
}

bool writeSampleTrace(const std::string& path, const std::vector<double>& samples, std::string* why) {
    std::ofstream out(path);
    if (!out.is_open()) {
        if (why) *why = "cannot write " + path;
        return false;
    }
    out << std::setprecision(17);
    for (double v : samples) {
        out << v << '\n';
    }
    if (!out) {
        if (why) *why = "write failed for " + path;
        return false;
    }
    return true;
}

std::vector<double> alternatingTrace(double level, int steps) {
    std::vector<double> v;
    if (steps <= 0) return v;
    v.reserve(static_cast<std::size_t>(steps));
    for (int i = 0; i < steps; ++i) {
        v.push_back((i % 2 == 0) ? level : -level);
    }
    return v;
}

} // namespace afc
