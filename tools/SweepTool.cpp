#include "ParameterSweep.h"
#include "Trace.h"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <lms_mu|eta_max|heat_accel|drive_sigmoid_gain|amp_smoothing>\n"
              << "            [--trace file | --excite level --steps n] [--preset high_torque|gentle]\n"
              << "            [--min v] [--max v] [--samples n] [--out file]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string param;
    std::string trace_path;
    std::string preset = "high_torque";
    double excite = 0.5;
    int steps = 3000;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "sweep.csv";
    bool min_set = false;
    bool max_set = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = argv[++i];
            } else if (arg == "--trace" && i + 1 < argc) {
                trace_path = argv[++i];
            } else if (arg == "--excite" && i + 1 < argc) {
                excite = std::stod(argv[++i]);
            } else if (arg == "--steps" && i + 1 < argc) {
                steps = std::stoi(argv[++i]);
            } else if (arg == "--preset" && i + 1 < argc) {
                preset = argv[++i];
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Bad numeric argument: " << ex.what() << "\n";
        return 1;
    }

    afc::ParameterSweep::Parameter p;
    if (param.empty() || !afc::ParameterSweep::parseParameter(param, &p)) {
        if (!param.empty()) std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    afc::ControllerConfigV1 base;
    if (preset == "high_torque") {
        base = afc::makePresetConfig(afc::ControllerPreset::HighTorque);
    } else if (preset == "gentle") {
        base = afc::makePresetConfig(afc::ControllerPreset::Gentle);
    } else {
        std::cout << "Unknown preset: " << preset << "\n";
        printUsage();
        return 1;
    }

    std::vector<double> trace;
    if (!trace_path.empty()) {
        std::string why;
        if (!afc::loadObservationTrace(trace_path, &trace, &why)) {
            std::cerr << "Trace load failed: " << why << "\n";
            return 1;
        }
    } else {
        trace = afc::alternatingTrace(excite, steps);
    }

    afc::ParameterSweep sweep;
    sweep.setBaseConfig(base);
    sweep.setTrace(trace);

    afc::ParameterSweep::ParameterRange range;
    range.samples = samples;
    range.nominal = afc::ParameterSweep::nominalValue(base, p);
    range.min = min_set ? min_val : range.nominal * 0.75;
    range.max = max_set ? max_val : range.nominal * 1.25;

    sweep.analyze(p, range);

    for (const auto& row : sweep.results()) {
        if (!row.config_accepted) {
            std::cerr << "Warning: " << row.parameter_name << "=" << row.parameter_value
                      << " rejected by config validation (ran with defaults)\n";
        }
    }

    if (!sweep.exportCSV(out)) {
        std::cerr << "Could not write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote parameter sweep (" << sweep.results().size() << " runs, "
              << trace.size() << " steps each) to: " << out << "\n";
    return 0;
}
