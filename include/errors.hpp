/**
 * @file errors.hpp
 * @brief Exception types reported by the detection pipeline.
 *
 * All errors derive from ScareCamError so callers can handle the whole family
 * in one place, or pick out the specific condition they care about.
 */

#pragma once

#include <stdexcept>
#include <string>

/// Base class for all pipeline errors
class ScareCamError : public std::runtime_error {
public:
    explicit ScareCamError(const std::string& what) : std::runtime_error(what) {}
};

/// Frame source could not be opened, or dropped mid-stream
class ConnectionError : public ScareCamError {
public:
    explicit ConnectionError(const std::string& what) : ScareCamError(what) {}
};

/// Tuning value outside its declared range (previous value stays in effect)
class InvalidParameterError : public ScareCamError {
public:
    explicit InvalidParameterError(const std::string& what) : ScareCamError(what) {}
};

/// Command not valid for the current detection state (no state change)
class InvalidStateTransitionError : public ScareCamError {
public:
    explicit InvalidStateTransitionError(const std::string& what) : ScareCamError(what) {}
};

/// Malformed frame; the frame is skipped, the pipeline keeps running
class InvalidFrameError : public ScareCamError {
public:
    explicit InvalidFrameError(const std::string& what) : ScareCamError(what) {}
};
