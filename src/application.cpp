/**
 * @file application.cpp
 * @brief Implementation of the main Application class.
 *
 * Handles configuration loading, pipeline construction, and console
 * commands for starting, pausing and tuning motion detection.
 */

#include "application.hpp"
#include "errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

// ============================================================================
// Constructor / Destructor
// ============================================================================

Application::Application() {
}

Application::~Application() {
    // Monitor first: its threads may still hand events to the sink
    monitor.reset();
    if (triggerSink) {
        triggerSink->shutdown();
    }
}

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize the application.
 * @param argc Command line argument count
 * @param argv Command line arguments: [video_source] [config_file]
 * @return true if initialization successful, false otherwise
 */
bool Application::init(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        std::cerr << "Usage: " << argv[0] << " [video_source] [config_file]" << std::endl;
        std::cerr << "  video_source: stream URL, video file, or camera index (e.g. '0')" << std::endl;
        return false;
    }

    // Explicit config file, or look for config in common locations
    bool configLoaded = false;
    if (argc > 2) {
        configLoaded = config.loadFromFile(argv[2]);
        if (!configLoaded) {
            std::cerr << "Error: Cannot load config file: " << argv[2] << std::endl;
            return false;
        }
    } else {
        std::vector<std::string> configPaths = {
            "config/scarecam.yaml",
            "../config/scarecam.yaml",
            "scarecam.yaml"
        };
        for (const auto& path : configPaths) {
            if (config.loadFromFile(path)) {
                configLoaded = true;
                break;
            }
        }
    }
    if (!configLoaded) {
        std::cout << "No config file found, using defaults" << std::endl;
    }
    config.validate();

    // Command line overrides config
    videoSource = argc > 1 ? argv[1] : config.videoSource;

    config.print();

    parameters = std::make_unique<DetectionParameters>(
        config.sensitivity, config.cooldownSeconds, config.minMotionArea);
    triggerSink = std::make_unique<AsyncTriggerSink>(
        logScareEvent, static_cast<size_t>(config.triggerQueueSize));

    VideoCaptureSource::CaptureSettings captureSettings = config.captureSettings();
    FrameSourceFactory factory = [captureSettings]() -> std::unique_ptr<FrameSource> {
        return std::make_unique<VideoCaptureSource>(captureSettings);
    };
    monitor = std::make_unique<ScareMonitor>(factory, *parameters, *triggerSink,
                                             config.backgroundSettings());

    if (!videoSource.empty()) {
        try {
            startMonitoring(videoSource);
        } catch (const ConnectionError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return false;
        }
    } else {
        std::cout << "No video source given; use 'start <source>'" << std::endl;
    }

    printHelp();
    return true;
}

// ============================================================================
// Main Loop
// ============================================================================

/**
 * @brief Read console commands until the user quits or input ends.
 * @return Exit code (0 for success)
 */
int Application::run() {
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        if (!handleCommand(line)) break;
        std::cout << "> " << std::flush;
    }

    if (monitor && monitor->getState() != DetectionState::Idle) {
        try {
            monitor->stop();
        } catch (const InvalidStateTransitionError&) {
            // Stream ended between the check and the stop
        }
    }
    printStatus();
    return 0;
}

// ============================================================================
// Command Handling
// ============================================================================

/**
 * @brief Handle one console command.
 *
 * Commands:
 * - q / quit: Quit
 * - start [source]: Start monitoring (default: configured source)
 * - stop: Stop monitoring
 * - p: Pause/resume detection
 * - s: Show status and statistics
 * - t: Fire a test scare
 * - sens N / cool N / area N: Adjust sensitivity, cooldown, minimum area
 * - h: Help
 */
bool Application::handleCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd, arg;
    iss >> cmd >> arg;

    if (cmd.empty()) return true;

    try {
        if (cmd == "q" || cmd == "quit") {
            return false;
        } else if (cmd == "start") {
            startMonitoring(arg.empty() ? videoSource : arg);
        } else if (cmd == "stop") {
            monitor->stop();
        } else if (cmd == "p" || cmd == "pause") {
            togglePause();
        } else if (cmd == "s" || cmd == "status") {
            printStatus();
        } else if (cmd == "t" || cmd == "test") {
            monitor->testTrigger();
        } else if (cmd == "sens") {
            applySetting<double>("Sensitivity", arg, &DetectionParameters::setSensitivityThreshold);
        } else if (cmd == "cool") {
            applySetting<double>("Cooldown", arg, &DetectionParameters::setCooldownSeconds);
        } else if (cmd == "area") {
            applySetting<int>("Min motion area", arg, &DetectionParameters::setMinMotionArea);
        } else if (cmd == "h" || cmd == "help") {
            printHelp();
        } else {
            std::cout << "Unknown command: " << cmd << " (h for help)" << std::endl;
        }
    } catch (const ScareCamError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    return true;
}

void Application::startMonitoring(const std::string& source) {
    if (source.empty()) {
        std::cerr << "Error: no video source (use 'start <source>')" << std::endl;
        return;
    }
    monitor->start(source);
    videoSource = source;
    std::cout << "Monitoring for motion..." << std::endl;
}

void Application::togglePause() {
    if (monitor->getState() == DetectionState::Paused) {
        monitor->resume();
        std::cout << "Detection resumed" << std::endl;
    } else {
        monitor->pause();
        std::cout << "Detection paused" << std::endl;
    }
}

template <typename T>
void Application::applySetting(const std::string& name, const std::string& value,
                               void (DetectionParameters::*setter)(T)) {
    std::istringstream iss(value);
    T parsed;
    if (value.empty() || !(iss >> parsed)) {
        std::cerr << "Error: " << name << " needs a numeric value" << std::endl;
        return;
    }
    (parameters.get()->*setter)(parsed);
    std::cout << name << ": " << parsed << std::endl;
}

// ============================================================================
// Output
// ============================================================================

void Application::printStatus() const {
    if (!monitor) return;

    ScareMonitor::Snapshot snap = monitor->snapshot();
    DetectionParameters::Snapshot params = parameters->snapshot();

    std::cout << "Status: " << toString(snap.state);
    if (snap.state != DetectionState::Idle && !snap.modelConverged) {
        std::cout << " (background model warming up)";
    }
    if (snap.cooldownRemaining > 0.0) {
        std::cout << " | Cooldown: " << std::fixed << std::setprecision(1)
                  << snap.cooldownRemaining << "s" << std::defaultfloat;
    }
    std::cout << std::endl;

    std::cout << "Total Detections: " << snap.totalDetections << std::endl;
    std::cout << "Last Detection: " << snap.lastDetectionText << std::endl;
    std::cout << "Frames: " << snap.framesProcessed << " processed, "
              << snap.framesDropped << " dropped, " << snap.framesSkipped << " skipped" << std::endl;
    std::cout << "Settings: sensitivity " << params.sensitivityThreshold
              << ", cooldown " << params.cooldownSeconds << "s"
              << ", min area " << params.minMotionArea << std::endl;

    std::optional<std::string> error = monitor->getLastError();
    if (error) {
        std::cout << "Last error: " << *error << std::endl;
    }
}

void Application::printHelp() const {
    std::cout << "Commands: start [source], stop, p (pause/resume), s (status), t (test scare)," << std::endl;
    std::cout << "          sens N [10-100], cool N [1-30], area N [100-2000], q (quit)" << std::endl;
}
