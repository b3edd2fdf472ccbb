#include "cropregion.h"
#include "keyframeerrors.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

bool CropRegion::isFullFrame() const
{
    return left <= 0.0 && top <= 0.0 && width >= 1.0 && height >= 1.0;
}

cv::Rect CropRegion::toRect(const cv::Size& frameSize) const
{
    int x1 = static_cast<int>(left * frameSize.width);
    int y1 = static_cast<int>(top * frameSize.height);
    int x2 = static_cast<int>((left + width) * frameSize.width);
    int y2 = static_cast<int>((top + height) * frameSize.height);

    x1 = std::clamp(x1, 0, frameSize.width);
    y1 = std::clamp(y1, 0, frameSize.height);
    x2 = std::clamp(x2, x1, frameSize.width);
    y2 = std::clamp(y2, y1, frameSize.height);

    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

cv::Mat CropRegion::apply(const cv::Mat& frame) const
{
    if (frame.empty() || isFullFrame()) {
        return frame;
    }

    cv::Rect rect = toRect(frame.size());
    if (rect.width <= 0 || rect.height <= 0) {
        return cv::Mat();
    }

    return frame(rect).clone();
}

CropRegion CropRegion::parse(const std::string& text)
{
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        parts.push_back(item);
    }

    if (parts.size() != 4) {
        throw InvalidParameters("crop must be \"left,top,width,height\", e.g. \"0.35,0,0.65,1\"");
    }

    double values[4];
    for (int i = 0; i < 4; ++i) {
        try {
            size_t consumed = 0;
            values[i] = std::stod(parts[i], &consumed);
            // Only trailing whitespace may follow the number
            if (parts[i].find_first_not_of(" \t", consumed) != std::string::npos) {
                throw std::invalid_argument(parts[i]);
            }
        } catch (const std::logic_error&) {
            throw InvalidParameters("crop item " + std::to_string(i + 1) + " is not a number: " + parts[i]);
        }
        if (!std::isfinite(values[i]) || values[i] < 0.0 || values[i] > 1.0) {
            throw InvalidParameters("crop values must lie in [0, 1]: " + text);
        }
    }

    CropRegion region;
    region.left = values[0];
    region.top = values[1];
    region.width = values[2];
    region.height = values[3];

    if (region.width <= 0.0 || region.height <= 0.0) {
        throw InvalidParameters("crop width and height must be > 0");
    }
    if (region.left + region.width > 1.0 + 1e-9 || region.top + region.height > 1.0 + 1e-9) {
        throw InvalidParameters("crop left+width and top+height must not exceed 1");
    }

    return region;
}

std::string CropRegion::toString() const
{
    std::ostringstream out;
    out << left << "," << top << "," << width << "," << height;
    return out.str();
}
