#ifndef KEYFRAMEERRORS_H
#define KEYFRAMEERRORS_H

#include <stdexcept>
#include <string>

/**
 * Base class of the fatal conditions raised by the keyframe engine
 */
class KeyframeError : public std::runtime_error
{
public:
    explicit KeyframeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thresholds, gaps or user input outside their documented domains.
 * Raised before any frame is sampled.
 */
class InvalidParameters : public KeyframeError
{
public:
    explicit InvalidParameters(const std::string& message)
        : KeyframeError("Invalid parameters: " + message) {}
};

/**
 * The consolidated keyframe set is empty; nothing can be assembled
 */
class NoKeyframesFound : public KeyframeError
{
public:
    explicit NoKeyframesFound(const std::string& message = "No keyframes found")
        : KeyframeError(message) {}
};

/**
 * The caller's cancellation or deadline check fired before a frame sample
 */
class SelectionCancelled : public KeyframeError
{
public:
    explicit SelectionCancelled(const std::string& message = "Keyframe selection cancelled")
        : KeyframeError(message) {}
};

#endif // KEYFRAMEERRORS_H
