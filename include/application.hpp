/**
 * @file application.hpp
 * @brief Main application class for the ScareCam motion-triggered scare system.
 *
 * Loads the configuration, builds the detection pipeline around a
 * VideoCapture frame source and an asynchronous trigger sink, and drives it
 * from console commands. The console is a pure external caller: it only uses
 * the monitor's control, parameter and observation interfaces.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "detection_parameters.hpp"
#include "scare_monitor.hpp"
#include "trigger_sink.hpp"

/**
 * @class Application
 * @brief Command-line front end for ScareMonitor.
 */
class Application {
public:
    Application();
    ~Application();

    bool init(int argc, char** argv);
    int run();

    // Execute one console command; returns false when the user asked to quit
    bool handleCommand(const std::string& line);

private:
    void printStatus() const;
    void printHelp() const;
    void startMonitoring(const std::string& source);
    void togglePause();

    template <typename T>
    void applySetting(const std::string& name, const std::string& value, void (DetectionParameters::*setter)(T));

    Config config;
    std::string videoSource;

    std::unique_ptr<DetectionParameters> parameters;
    std::unique_ptr<AsyncTriggerSink> triggerSink;
    std::unique_ptr<ScareMonitor> monitor;
};
