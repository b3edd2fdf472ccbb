#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QDir>
#include "boundarydetector.h"
#include "filterparameters.h"
#include "keyframetypes.h"

struct AppConfig {
    QString outputDirectory;
    DetectorBackend detectorBackend;
    double pageSimilarity;
    RepresentativePolicy representativePolicy;
    ParameterPreset preset;
    FilterParameters customParameters;   // used when preset is Custom

    // Time window, "HH:MM:SS" or empty for the stream bounds
    QString startTime;
    QString endTime;

    // Slide area, "left,top,width,height" fractions or empty for the full frame
    QString crop;

    // Outputs
    bool outputSlidesOnly;
    bool outputFullScreen;
    bool extractImages;
    bool writePdf;

    // Default values
    AppConfig() :
        outputDirectory(QDir::homePath() + "/Downloads/SlideKeyframes"),
        detectorBackend(DetectorBackend::SceneContent),
        pageSimilarity(0.45),
        representativePolicy(RepresentativePolicy::Midpoint),
        preset(ParameterPreset::Default),
        outputSlidesOnly(true),
        outputFullScreen(false),
        extractImages(true),
        writePdf(true)
    {}

    /**
     * Filter parameters selected by the preset
     */
    FilterParameters effectiveParameters() const
    {
        return FilterParameters::forPreset(preset, customParameters);
    }
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the platform's native settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file
     * @param iniPath Settings file path
     */
    explicit ConfigManager(const QString& iniPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Path of the underlying settings store
     */
    QString fileName() const;

    static QString getBackendName(DetectorBackend backend);
    static DetectorBackend getBackendFromName(const QString& name);

    static QString getPolicyName(RepresentativePolicy policy);
    static RepresentativePolicy getPolicyFromName(const QString& name, bool* ok = nullptr);

    static QString getPresetName(ParameterPreset preset);
    static ParameterPreset getPresetFromName(const QString& name);

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_OUTPUT_DIR;
    static const QString KEY_DETECTOR_BACKEND;
    static const QString KEY_PAGE_SIMILARITY;
    static const QString KEY_REPRESENTATIVE_POLICY;
    static const QString KEY_PRESET;
    static const QString KEY_BOUNDARY_SENSITIVITY;
    static const QString KEY_MIN_BOUNDARY_GAP_FRAMES;
    static const QString KEY_STATIC_THRESHOLD;
    static const QString KEY_DUPLICATE_THRESHOLD;
    static const QString KEY_MIN_TIME_GAP;
    static const QString KEY_MAX_TIME_GAP;
    static const QString KEY_FILL_INTERVAL;
    static const QString KEY_START_TIME;
    static const QString KEY_END_TIME;
    static const QString KEY_CROP;
    static const QString KEY_OUTPUT_SLIDES_ONLY;
    static const QString KEY_OUTPUT_FULL_SCREEN;
    static const QString KEY_EXTRACT_IMAGES;
    static const QString KEY_WRITE_PDF;
};

#endif // CONFIGMANAGER_H
