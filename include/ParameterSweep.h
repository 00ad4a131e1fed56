#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ControllerConfig.h"

namespace afc {

// Replays one fixed observation trace across a linear range of a single
// configuration parameter and summarizes each run.
class ParameterSweep {
public:
    enum class Parameter : int {
        LmsMu = 0,
        EtaMax,
        HeatAccel,
        DriveSigmoidGain,
        AmpSmoothing,
    };

    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct SampleResult {
        double final_heat = 0.0;
        double peak_heat = 0.0;
        double mean_reward = 0.0;
        double peak_amplitude = 0.0;
        std::int64_t first_peak_step = -1; // -1 if Peak never reached
        std::uint64_t rejected = 0;
    };

    struct SweepRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        bool config_accepted = true;
        SampleResult metrics{};
    };

    ParameterSweep();

    void setBaseConfig(const ControllerConfigV1& cfg);
    void setTrace(const std::vector<double>& observations);
    void clearResults();

    void analyze(Parameter p, const ParameterRange& range);

    bool exportCSV(const std::string& filename) const;
    const std::vector<SweepRow>& results() const;

    static const char* parameterName(Parameter p);
    static bool parseParameter(const std::string& name, Parameter* out);
    static double nominalValue(const ControllerConfigV1& cfg, Parameter p);

private:
    ControllerConfigV1 base_{};
    std::vector<double> trace_{};
    std::vector<SweepRow> results_{};

    SampleResult runTrace(const ControllerConfigV1& cfg, bool* accepted) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
    static void applyParameter(ControllerConfigV1* cfg, Parameter p, double value);
};

} // namespace afc
