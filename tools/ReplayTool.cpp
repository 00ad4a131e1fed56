// ReplayTool.cpp
// Drives one controller from a recorded observation trace and writes the
// command samples it produces. Trace replay only: there is no plant model
// here, so the observations do not react to the commands.

#include "Controller.h"
#include "Trace.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "ReplayTool usage:\n"
              << "  ReplayTool --trace file [--out file] [--preset high_torque|gentle] [--config file]\n"
              << "             [--print-config]\n";
}

bool readTextFile(const std::string& path, std::string* out) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    *out = ss.str();
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string trace_path;
    std::string out_path;
    std::string preset = "high_torque";
    std::string config_path;
    bool print_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--trace" && i + 1 < argc) {
            trace_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (trace_path.empty()) {
        printUsage();
        return 1;
    }

    afc::ControllerConfigV1 cfg;
    if (preset == "high_torque") {
        cfg = afc::makePresetConfig(afc::ControllerPreset::HighTorque);
    } else if (preset == "gentle") {
        cfg = afc::makePresetConfig(afc::ControllerPreset::Gentle);
    } else {
        std::cout << "Unknown preset: " << preset << "\n";
        printUsage();
        return 1;
    }

    // A config file overrides the preset field by field.
    if (!config_path.empty()) {
        std::string text;
        if (!readTextFile(config_path, &text)) {
            std::cerr << "Cannot read config: " << config_path << "\n";
            return 1;
        }
        std::string why;
        if (!afc::parseConfigText(text, &cfg, &why)) {
            std::cerr << "Config parse failed: " << why << "\n";
            return 1;
        }
        if (!afc::validateConfig(cfg, &why)) {
            std::cerr << "Config rejected: " << why << "\n";
            return 1;
        }
    }

    std::vector<double> trace;
    {
        std::string why;
        if (!afc::loadObservationTrace(trace_path, &trace, &why)) {
            std::cerr << "Trace load failed: " << why << "\n";
            return 1;
        }
    }

    afc::Controller ctl(cfg);

    if (print_config) {
        std::vector<char> buf(4096);
        const int n = ctl.exportConfigText(buf.data(), static_cast<int>(buf.size()));
        std::cout.write(buf.data(), n);
    }

    std::vector<double> commands;
    commands.reserve(trace.size());
    std::uint32_t events = 0u;
    for (std::size_t i = 0; i < trace.size(); ++i) {
        const afc::StepResult r = ctl.advance(trace[i]);
        if (r.status != afc::StepStatus::Ok) {
            std::cerr << "Step " << i << ": observation rejected ("
                      << (r.status == afc::StepStatus::InvalidObservation ? "non-finite" : "out of range")
                      << ")\n";
        }
        commands.push_back(r.command);
        events |= ctl.getLatestEvents();
    }

    if (!out_path.empty()) {
        std::string why;
        if (!afc::writeSampleTrace(out_path, commands, &why)) {
            std::cerr << "Output failed: " << why << "\n";
            return 1;
        }
        std::cout << "Wrote " << commands.size() << " command samples to: " << out_path << "\n";
    }

    const afc::RunSignatures sig = ctl.getRunSignatures();
    std::printf("steps=%llu rejected=%llu\n",
                static_cast<unsigned long long>(ctl.stepIndex()),
                static_cast<unsigned long long>(ctl.rejectedCount()));
    std::printf("heat=%.6f phase=%s viscosity=%.6f amplitude=%.6f frequency_hz=%.6f residual_rms=%.6f\n",
                ctl.heat(), afc::phaseName(ctl.phase()), ctl.viscosity(), ctl.amplitude(),
                ctl.frequency_hz(), ctl.residualRms());
    std::printf("events=0x%08X\n", events);
    std::printf("run_param_hash=0x%08X telemetry_crc=0x%08X state_digest=0x%08X\n",
                sig.run_param_hash_u32, sig.telemetry_crc_u32, sig.state_digest_u32);
    return 0;
}
