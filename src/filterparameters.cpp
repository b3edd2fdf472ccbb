#include "filterparameters.h"
#include "keyframeerrors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace {

bool isFiniteNonNegative(double value)
{
    return std::isfinite(value) && value >= 0.0;
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}

void FilterParameters::validate() const
{
    if (!std::isfinite(boundarySensitivity) || boundarySensitivity <= 0.0) {
        throw InvalidParameters("boundary_sensitivity must be > 0");
    }
    if (minBoundaryGapFrames < 1) {
        throw InvalidParameters("min_boundary_gap_frames must be >= 1");
    }
    if (!isFiniteNonNegative(staticThreshold)) {
        throw InvalidParameters("static_threshold must be >= 0");
    }
    if (!isFiniteNonNegative(duplicateThreshold)) {
        throw InvalidParameters("duplicate_threshold must be >= 0");
    }
    if (!isFiniteNonNegative(minTimeGap)) {
        throw InvalidParameters("min_time_gap must be >= 0");
    }
    if (!isFiniteNonNegative(maxTimeGap)) {
        throw InvalidParameters("max_time_gap must be >= 0");
    }
    if (!isFiniteNonNegative(fillInterval)) {
        throw InvalidParameters("fill_interval must be >= 0");
    }
    if (gapFillingEnabled() && fillInterval < minTimeGap) {
        throw InvalidParameters("fill_interval must be >= min_time_gap when gap filling is enabled");
    }
}

std::string FilterParameters::summary() const
{
    std::ostringstream out;
    out << "th=" << boundarySensitivity
        << " min=" << minBoundaryGapFrames
        << " static=" << staticThreshold
        << " dup=" << duplicateThreshold
        << " gap=" << minTimeGap
        << " max_gap=" << maxTimeGap
        << " fill=" << fillInterval;
    return out.str();
}

FilterParameters FilterParameters::forPreset(ParameterPreset preset, const FilterParameters& custom)
{
    switch (preset) {
        case ParameterPreset::Default:
            return FilterParameters(12.0, 5, 2.0, 1.5, 0.5, 45.0, 15.0);
        case ParameterPreset::Sensitive:
            return FilterParameters(8.0, 3, 0.0, 0.0, 0.5, 45.0, 15.0);
        case ParameterPreset::Medium:
            return FilterParameters(10.0, 5, 0.0, 0.0, 0.5, 45.0, 15.0);
        case ParameterPreset::LowFilter:
            return FilterParameters(12.0, 5, 0.0, 0.0, 0.5, 45.0, 15.0);
        case ParameterPreset::Conservative:
            return FilterParameters(18.0, 8, 5.0, 3.0, 1.0, 0.0, 15.0);
        case ParameterPreset::VerySensitive:
            return FilterParameters(6.0, 3, 0.0, 0.0, 0.3, 45.0, 15.0);
        case ParameterPreset::FillAggressive:
            return FilterParameters(10.0, 5, 0.0, 0.0, 0.5, 30.0, 10.0);
        case ParameterPreset::NoFill:
            return FilterParameters(10.0, 5, 0.0, 0.0, 0.5, 0.0, 15.0);
        case ParameterPreset::Custom:
            return custom;
        default:
            return FilterParameters();
    }
}

std::string FilterParameters::presetName(ParameterPreset preset)
{
    switch (preset) {
        case ParameterPreset::Default:
            return "Default";
        case ParameterPreset::Sensitive:
            return "Sensitive";
        case ParameterPreset::Medium:
            return "Medium";
        case ParameterPreset::LowFilter:
            return "LowFilter";
        case ParameterPreset::Conservative:
            return "Conservative";
        case ParameterPreset::VerySensitive:
            return "VerySensitive";
        case ParameterPreset::FillAggressive:
            return "FillAggressive";
        case ParameterPreset::NoFill:
            return "NoFill";
        case ParameterPreset::Custom:
            return "Custom";
        default:
            return "Default";
    }
}

ParameterPreset FilterParameters::presetFromName(const std::string& name, bool* ok)
{
    const std::string key = toLower(name);
    const ParameterPreset all[] = {
        ParameterPreset::Default, ParameterPreset::Sensitive, ParameterPreset::Medium,
        ParameterPreset::LowFilter, ParameterPreset::Conservative, ParameterPreset::VerySensitive,
        ParameterPreset::FillAggressive, ParameterPreset::NoFill, ParameterPreset::Custom
    };

    for (ParameterPreset preset : all) {
        if (toLower(presetName(preset)) == key) {
            if (ok) *ok = true;
            return preset;
        }
    }

    if (ok) *ok = false;
    return ParameterPreset::Default;
}

std::vector<ParameterPreset> FilterParameters::sweepPresets()
{
    return {
        ParameterPreset::Default,
        ParameterPreset::Sensitive,
        ParameterPreset::Medium,
        ParameterPreset::LowFilter,
        ParameterPreset::Conservative,
        ParameterPreset::VerySensitive,
        ParameterPreset::FillAggressive,
        ParameterPreset::NoFill
    };
}
