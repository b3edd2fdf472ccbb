#ifndef TIMECODE_H
#define TIMECODE_H

#include <string>

class Timecode
{
public:
    /**
     * Parse "HH:MM:SS" into seconds
     * @param text Timecode; empty or blank means "not set"
     * @return Seconds, or -1 when the text is empty
     * @throws InvalidParameters for malformed input
     */
    static double parse(const std::string& text);

    /**
     * Format seconds as "HH:MM:SS.mmm"
     */
    static std::string format(double seconds);
};

#endif // TIMECODE_H
