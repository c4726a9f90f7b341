/**
 * @file detection_parameters.hpp
 * @brief Live-tunable detection parameters with validated setters.
 *
 * The parameters may be changed from any thread at any time. The detection
 * controller takes one snapshot at the start of each cycle so a change never
 * becomes visible halfway through processing a frame.
 */

#pragma once

#include <mutex>

/**
 * @class DetectionParameters
 * @brief Thread-safe holder for sensitivity, cooldown and minimum motion area.
 *
 * Every setter validates its argument against the declared range and throws
 * InvalidParameterError when it is out of range, leaving the previous value
 * in effect.
 */
class DetectionParameters {
public:
    static constexpr double MIN_SENSITIVITY = 10.0;
    static constexpr double MAX_SENSITIVITY = 100.0;
    static constexpr double MIN_COOLDOWN_SECONDS = 1.0;
    static constexpr double MAX_COOLDOWN_SECONDS = 30.0;
    static constexpr int MIN_MOTION_AREA = 100;
    static constexpr int MAX_MOTION_AREA = 2000;

    static constexpr double DEFAULT_SENSITIVITY = 25.0;
    static constexpr double DEFAULT_COOLDOWN_SECONDS = 5.0;
    static constexpr int DEFAULT_MIN_MOTION_AREA = 500;

    /// Plain copy of all values, taken atomically
    struct Snapshot {
        double sensitivityThreshold;
        double cooldownSeconds;
        int minMotionArea;
    };

    DetectionParameters();
    DetectionParameters(double sensitivity, double cooldownSeconds, int minMotionArea);

    DetectionParameters(const DetectionParameters&) = delete;
    DetectionParameters& operator=(const DetectionParameters&) = delete;

    double getSensitivityThreshold() const;
    double getCooldownSeconds() const;
    int getMinMotionArea() const;

    void setSensitivityThreshold(double value);
    void setCooldownSeconds(double value);
    void setMinMotionArea(int value);

    Snapshot snapshot() const;

    // Range checks, usable without an instance (e.g. config validation)
    static bool isValidSensitivity(double value);
    static bool isValidCooldown(double value);
    static bool isValidMotionArea(int value);

private:
    mutable std::mutex paramMutex;
    double sensitivityThreshold;
    double cooldownSeconds;
    int minMotionArea;
};
