#include "ParameterSweep.h"

#include "Controller.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>

namespace afc {

ParameterSweep::ParameterSweep()
    : base_(makePresetConfig(ControllerPreset::HighTorque)) {}

void ParameterSweep::setBaseConfig(const ControllerConfigV1& cfg) {
    base_ = cfg;
}

void ParameterSweep::setTrace(const std::vector<double>& observations) {
    trace_ = observations;
}

void ParameterSweep::clearResults() {
    results_.clear();
}

const char* ParameterSweep::parameterName(Parameter p) {
    switch (p) {
    case Parameter::LmsMu:            return "lms_mu";
    case Parameter::EtaMax:           return "eta_max";
    case Parameter::HeatAccel:        return "heat_accel";
    case Parameter::DriveSigmoidGain: return "drive_sigmoid_gain";
    case Parameter::AmpSmoothing:     return "amp_smoothing";
    default:                          return "unknown";
    }
}

bool ParameterSweep::parseParameter(const std::string& name, Parameter* out) {
    if (!out) return false;
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    const Parameter all[] = {Parameter::LmsMu, Parameter::EtaMax, Parameter::HeatAccel,
                             Parameter::DriveSigmoidGain, Parameter::AmpSmoothing};
    for (Parameter p : all) {
        if (v == parameterName(p)) {
            *out = p;
            return true;
        }
    }
    // Short aliases
    if (v == "mu") { *out = Parameter::LmsMu; return true; }
    if (v == "k") { *out = Parameter::HeatAccel; return true; }
    return false;
}

double ParameterSweep::nominalValue(const ControllerConfigV1& cfg, Parameter p) {
    switch (p) {
    case Parameter::LmsMu:            return cfg.lms_mu;
    case Parameter::EtaMax:           return cfg.eta_max;
    case Parameter::HeatAccel:        return cfg.heat_accel;
    case Parameter::DriveSigmoidGain: return cfg.drive_sigmoid_gain;
    case Parameter::AmpSmoothing:     return cfg.amp_smoothing;
    default:                          return 0.0;
    }
}

void ParameterSweep::applyParameter(ControllerConfigV1* cfg, Parameter p, double value) {
    switch (p) {
    case Parameter::LmsMu:            cfg->lms_mu = value; break;
    case Parameter::EtaMax:           cfg->eta_max = value; break;
    case Parameter::HeatAccel:        cfg->heat_accel = value; break;
    case Parameter::DriveSigmoidGain: cfg->drive_sigmoid_gain = value; break;
    case Parameter::AmpSmoothing:     cfg->amp_smoothing = value; break;
    default: break;
    }
}

std::vector<double> ParameterSweep::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

ParameterSweep::SampleResult ParameterSweep::runTrace(const ControllerConfigV1& cfg, bool* accepted) const {
    Controller ctl(cfg);
    if (accepted) *accepted = ctl.configAccepted();

    SampleResult m{};
    for (double y : trace_) {
        const StepResult r = ctl.advance(y);
        if (r.status != StepStatus::Ok) continue;

        m.peak_heat = std::max(m.peak_heat, ctl.heat());
        m.peak_amplitude = std::max(m.peak_amplitude, ctl.amplitude());
        if (m.first_peak_step < 0 && ctl.phase() == Phase::Peak) {
            m.first_peak_step = static_cast<std::int64_t>(ctl.stepIndex()) - 1;
        }
    }

    m.final_heat = ctl.heat();
    m.rejected = ctl.rejectedCount();

    const auto& log = ctl.telemetry();
    if (!log.empty()) {
        double sum = 0.0;
        for (const auto& rec : log) sum += rec.reward;
        m.mean_reward = sum / static_cast<double>(log.size());
    }
    return m;
}

void ParameterSweep::analyze(Parameter p, const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ControllerConfigV1 cfg = base_;
        applyParameter(&cfg, p, value);
        bool accepted = true;
        const auto metrics = runTrace(cfg, &accepted);
        results_.push_back({parameterName(p), value, accepted, metrics});
    }
}

bool ParameterSweep::exportCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,config_accepted,final_heat,peak_heat,mean_reward,peak_amplitude,first_peak_step,rejected\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << (row.config_accepted ? 1 : 0) << ','
            << row.metrics.final_heat << ','
            << row.metrics.peak_heat << ','
            << row.metrics.mean_reward << ','
            << row.metrics.peak_amplitude << ','
            << row.metrics.first_peak_step << ','
            << row.metrics.rejected << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<ParameterSweep::SweepRow>& ParameterSweep::results() const {
    return results_;
}

} // namespace afc
