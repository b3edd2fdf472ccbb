#include "timecode.h"
#include "keyframeerrors.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <vector>

namespace {

std::string trimmed(const std::string& text)
{
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool isDigits(const std::string& text)
{
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

}

double Timecode::parse(const std::string& text)
{
    const std::string value = trimmed(text);
    if (value.empty()) {
        return -1.0;
    }

    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ':')) {
        parts.push_back(item);
    }

    if (parts.size() != 3 || !isDigits(parts[0]) || !isDigits(parts[1]) || !isDigits(parts[2])) {
        throw InvalidParameters("timecode must be HH:MM:SS: " + value);
    }

    int hours = std::stoi(parts[0]);
    int minutes = std::stoi(parts[1]);
    int seconds = std::stoi(parts[2]);

    if (minutes >= 60 || seconds >= 60) {
        throw InvalidParameters("timecode minutes and seconds must be below 60: " + value);
    }

    return hours * 3600.0 + minutes * 60.0 + seconds;
}

std::string Timecode::format(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }

    long long totalMillis = std::llround(seconds * 1000.0);
    long long hours = totalMillis / 3600000;
    long long minutes = (totalMillis / 60000) % 60;
    long long secs = (totalMillis / 1000) % 60;
    long long millis = totalMillis % 1000;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld.%03lld", hours, minutes, secs, millis);
    return std::string(buffer);
}
