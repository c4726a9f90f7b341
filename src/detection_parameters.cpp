#include "detection_parameters.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

DetectionParameters::DetectionParameters()
    : sensitivityThreshold(DEFAULT_SENSITIVITY),
      cooldownSeconds(DEFAULT_COOLDOWN_SECONDS),
      minMotionArea(DEFAULT_MIN_MOTION_AREA) {
}

DetectionParameters::DetectionParameters(double sensitivity, double cooldown, int minArea)
    : DetectionParameters() {
    setSensitivityThreshold(sensitivity);
    setCooldownSeconds(cooldown);
    setMinMotionArea(minArea);
}

bool DetectionParameters::isValidSensitivity(double value) {
    return std::isfinite(value) && value >= MIN_SENSITIVITY && value <= MAX_SENSITIVITY;
}

bool DetectionParameters::isValidCooldown(double value) {
    return std::isfinite(value) && value >= MIN_COOLDOWN_SECONDS && value <= MAX_COOLDOWN_SECONDS;
}

bool DetectionParameters::isValidMotionArea(int value) {
    return value >= MIN_MOTION_AREA && value <= MAX_MOTION_AREA;
}

double DetectionParameters::getSensitivityThreshold() const {
    std::lock_guard<std::mutex> lock(paramMutex);
    return sensitivityThreshold;
}

double DetectionParameters::getCooldownSeconds() const {
    std::lock_guard<std::mutex> lock(paramMutex);
    return cooldownSeconds;
}

int DetectionParameters::getMinMotionArea() const {
    std::lock_guard<std::mutex> lock(paramMutex);
    return minMotionArea;
}

void DetectionParameters::setSensitivityThreshold(double value) {
    if (!isValidSensitivity(value)) {
        throw InvalidParameterError("sensitivity threshold " + std::to_string(value) +
                                    " outside [10, 100]");
    }
    std::lock_guard<std::mutex> lock(paramMutex);
    sensitivityThreshold = value;
}

void DetectionParameters::setCooldownSeconds(double value) {
    if (!isValidCooldown(value)) {
        throw InvalidParameterError("cooldown " + std::to_string(value) +
                                    "s outside [1, 30]");
    }
    std::lock_guard<std::mutex> lock(paramMutex);
    cooldownSeconds = value;
}

void DetectionParameters::setMinMotionArea(int value) {
    if (!isValidMotionArea(value)) {
        throw InvalidParameterError("min motion area " + std::to_string(value) +
                                    " outside [100, 2000]");
    }
    std::lock_guard<std::mutex> lock(paramMutex);
    minMotionArea = value;
}

DetectionParameters::Snapshot DetectionParameters::snapshot() const {
    std::lock_guard<std::mutex> lock(paramMutex);
    return Snapshot{sensitivityThreshold, cooldownSeconds, minMotionArea};
}
