#ifndef FILTERPARAMETERS_H
#define FILTERPARAMETERS_H

#include <string>
#include <vector>

/**
 * Named parameter sets for slide keyframe selection
 */
enum class ParameterPreset {
    Default,
    Sensitive,
    Medium,
    LowFilter,
    Conservative,
    VerySensitive,
    FillAggressive,
    NoFill,
    Custom
};

/**
 * Immutable configuration of one keyframe selection run
 */
struct FilterParameters {
    double boundarySensitivity;   // detector threshold, lower = more candidates
    int minBoundaryGapFrames;     // minimum frame count of a detector-internal scene
    double staticThreshold;       // sharpness cutoff for noise frames, 0 disables
    double duplicateThreshold;    // dissimilarity cutoff for repeated frames, 0 disables
    double minTimeGap;            // minimum seconds between two kept candidates
    double maxTimeGap;            // seconds beyond which gap filling activates, 0 disables
    double fillInterval;          // seconds between synthetic fill points

    FilterParameters() :
        boundarySensitivity(12.0),
        minBoundaryGapFrames(5),
        staticThreshold(2.0),
        duplicateThreshold(1.5),
        minTimeGap(0.5),
        maxTimeGap(45.0),
        fillInterval(15.0)
    {}

    FilterParameters(double sensitivity, int minSceneLen, double staticCutoff,
                     double duplicateCutoff, double minGap, double maxGap, double fill) :
        boundarySensitivity(sensitivity),
        minBoundaryGapFrames(minSceneLen),
        staticThreshold(staticCutoff),
        duplicateThreshold(duplicateCutoff),
        minTimeGap(minGap),
        maxTimeGap(maxGap),
        fillInterval(fill)
    {}

    /**
     * Check every field against its documented domain
     * @throws InvalidParameters naming the first offending field
     */
    void validate() const;

    /**
     * Whether gap filling is active for these parameters
     */
    bool gapFillingEnabled() const { return maxTimeGap > 0.0 && fillInterval > 0.0; }

    /**
     * Human readable one-line summary for logs
     */
    std::string summary() const;

    /**
     * Get parameter set for a preset
     * @param preset Preset type
     * @param custom Parameters returned when preset is Custom
     * @return Parameter set
     */
    static FilterParameters forPreset(ParameterPreset preset,
                                      const FilterParameters& custom = FilterParameters());

    /**
     * Get preset name as string
     */
    static std::string presetName(ParameterPreset preset);

    /**
     * Get preset from string name (case-insensitive)
     * @param name Preset name
     * @param ok Set to false when the name is unknown (Default is returned)
     */
    static ParameterPreset presetFromName(const std::string& name, bool* ok = nullptr);

    /**
     * Presets exercised by a parameter sweep, in sweep order
     */
    static std::vector<ParameterPreset> sweepPresets();
};

#endif // FILTERPARAMETERS_H
