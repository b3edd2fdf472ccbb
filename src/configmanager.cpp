#include "configmanager.h"
#include <QDir>

// Configuration keys
const QString ConfigManager::KEY_OUTPUT_DIR = "outputDirectory";
const QString ConfigManager::KEY_DETECTOR_BACKEND = "detectorBackend";
const QString ConfigManager::KEY_PAGE_SIMILARITY = "pageSimilarity";
const QString ConfigManager::KEY_REPRESENTATIVE_POLICY = "representativePolicy";
const QString ConfigManager::KEY_PRESET = "preset";
const QString ConfigManager::KEY_BOUNDARY_SENSITIVITY = "custom/boundarySensitivity";
const QString ConfigManager::KEY_MIN_BOUNDARY_GAP_FRAMES = "custom/minBoundaryGapFrames";
const QString ConfigManager::KEY_STATIC_THRESHOLD = "custom/staticThreshold";
const QString ConfigManager::KEY_DUPLICATE_THRESHOLD = "custom/duplicateThreshold";
const QString ConfigManager::KEY_MIN_TIME_GAP = "custom/minTimeGap";
const QString ConfigManager::KEY_MAX_TIME_GAP = "custom/maxTimeGap";
const QString ConfigManager::KEY_FILL_INTERVAL = "custom/fillInterval";
const QString ConfigManager::KEY_START_TIME = "startTime";
const QString ConfigManager::KEY_END_TIME = "endTime";
const QString ConfigManager::KEY_CROP = "crop";
const QString ConfigManager::KEY_OUTPUT_SLIDES_ONLY = "outputSlidesOnly";
const QString ConfigManager::KEY_OUTPUT_FULL_SCREEN = "outputFullScreen";
const QString ConfigManager::KEY_EXTRACT_IMAGES = "extractImages";
const QString ConfigManager::KEY_WRITE_PDF = "writePdf";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("SlideKeyframes", "SlideKeyframes", this);
}

ConfigManager::ConfigManager(const QString& iniPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(iniPath, QSettings::IniFormat, this);
}

QString ConfigManager::fileName() const
{
    return m_settings->fileName();
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.outputDirectory = m_settings->value(KEY_OUTPUT_DIR, config.outputDirectory).toString();
    config.detectorBackend = getBackendFromName(
        m_settings->value(KEY_DETECTOR_BACKEND, getBackendName(config.detectorBackend)).toString());
    config.pageSimilarity = m_settings->value(KEY_PAGE_SIMILARITY, config.pageSimilarity).toDouble();
    config.representativePolicy = getPolicyFromName(
        m_settings->value(KEY_REPRESENTATIVE_POLICY, getPolicyName(config.representativePolicy)).toString());
    config.preset = getPresetFromName(m_settings->value(KEY_PRESET, getPresetName(config.preset)).toString());

    // Custom parameter set, used by the Custom preset
    FilterParameters& custom = config.customParameters;
    custom.boundarySensitivity = m_settings->value(KEY_BOUNDARY_SENSITIVITY, custom.boundarySensitivity).toDouble();
    custom.minBoundaryGapFrames = m_settings->value(KEY_MIN_BOUNDARY_GAP_FRAMES, custom.minBoundaryGapFrames).toInt();
    custom.staticThreshold = m_settings->value(KEY_STATIC_THRESHOLD, custom.staticThreshold).toDouble();
    custom.duplicateThreshold = m_settings->value(KEY_DUPLICATE_THRESHOLD, custom.duplicateThreshold).toDouble();
    custom.minTimeGap = m_settings->value(KEY_MIN_TIME_GAP, custom.minTimeGap).toDouble();
    custom.maxTimeGap = m_settings->value(KEY_MAX_TIME_GAP, custom.maxTimeGap).toDouble();
    custom.fillInterval = m_settings->value(KEY_FILL_INTERVAL, custom.fillInterval).toDouble();

    config.startTime = m_settings->value(KEY_START_TIME, config.startTime).toString();
    config.endTime = m_settings->value(KEY_END_TIME, config.endTime).toString();
    config.crop = m_settings->value(KEY_CROP, config.crop).toString();

    config.outputSlidesOnly = m_settings->value(KEY_OUTPUT_SLIDES_ONLY, config.outputSlidesOnly).toBool();
    config.outputFullScreen = m_settings->value(KEY_OUTPUT_FULL_SCREEN, config.outputFullScreen).toBool();
    config.extractImages = m_settings->value(KEY_EXTRACT_IMAGES, config.extractImages).toBool();
    config.writePdf = m_settings->value(KEY_WRITE_PDF, config.writePdf).toBool();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_OUTPUT_DIR, config.outputDirectory);
    m_settings->setValue(KEY_DETECTOR_BACKEND, getBackendName(config.detectorBackend));
    m_settings->setValue(KEY_PAGE_SIMILARITY, config.pageSimilarity);
    m_settings->setValue(KEY_REPRESENTATIVE_POLICY, getPolicyName(config.representativePolicy));
    m_settings->setValue(KEY_PRESET, getPresetName(config.preset));

    const FilterParameters& custom = config.customParameters;
    m_settings->setValue(KEY_BOUNDARY_SENSITIVITY, custom.boundarySensitivity);
    m_settings->setValue(KEY_MIN_BOUNDARY_GAP_FRAMES, custom.minBoundaryGapFrames);
    m_settings->setValue(KEY_STATIC_THRESHOLD, custom.staticThreshold);
    m_settings->setValue(KEY_DUPLICATE_THRESHOLD, custom.duplicateThreshold);
    m_settings->setValue(KEY_MIN_TIME_GAP, custom.minTimeGap);
    m_settings->setValue(KEY_MAX_TIME_GAP, custom.maxTimeGap);
    m_settings->setValue(KEY_FILL_INTERVAL, custom.fillInterval);

    m_settings->setValue(KEY_START_TIME, config.startTime);
    m_settings->setValue(KEY_END_TIME, config.endTime);
    m_settings->setValue(KEY_CROP, config.crop);

    m_settings->setValue(KEY_OUTPUT_SLIDES_ONLY, config.outputSlidesOnly);
    m_settings->setValue(KEY_OUTPUT_FULL_SCREEN, config.outputFullScreen);
    m_settings->setValue(KEY_EXTRACT_IMAGES, config.extractImages);
    m_settings->setValue(KEY_WRITE_PDF, config.writePdf);

    m_settings->sync();
}

QString ConfigManager::getBackendName(DetectorBackend backend)
{
    return QString::fromStdString(BoundaryDetector::backendName(backend));
}

DetectorBackend ConfigManager::getBackendFromName(const QString& name)
{
    return BoundaryDetector::backendFromName(name.toStdString());
}

QString ConfigManager::getPolicyName(RepresentativePolicy policy)
{
    switch (policy) {
        case RepresentativePolicy::Midpoint:
            return "midpoint";
        case RepresentativePolicy::IntervalStart:
            return "start";
        default:
            return "midpoint";
    }
}

RepresentativePolicy ConfigManager::getPolicyFromName(const QString& name, bool* ok)
{
    const QString key = name.trimmed().toLower();

    if (ok) *ok = true;
    if (key == "midpoint" || key == "middle") {
        return RepresentativePolicy::Midpoint;
    } else if (key == "start" || key == "begin") {
        return RepresentativePolicy::IntervalStart;
    }

    if (ok) *ok = false;
    return RepresentativePolicy::Midpoint;
}

QString ConfigManager::getPresetName(ParameterPreset preset)
{
    return QString::fromStdString(FilterParameters::presetName(preset));
}

ParameterPreset ConfigManager::getPresetFromName(const QString& name)
{
    return FilterParameters::presetFromName(name.toStdString());
}
