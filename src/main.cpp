#include "app/graceful_shutdown.h"
#include "app/stdin_trigger_source.h"
#include "capture/alsa_capture_source.h"
#include "control/control_plane.h"
#include "core/config_loader.h"
#include "denoiser/inference_backend.h"
#include "logging/logger.h"
#include "output/wav_encoder.h"
#include "pipeline/capture_pipeline.h"
#include "recording/recording_coordinator.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string configPath = voxcap::core::DEFAULT_CONFIG_FILE;
    std::string device;
    bool listen = false;
    bool noWav = false;
};

void printUsage(const char* programName) {
    std::cout << "voxcap - voice capture daemon" << std::endl;
    std::cout << "Usage: " << programName << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <path>    JSON config file (default: voxcap.json)" << std::endl;
    std::cout << "  --device <name>    ALSA capture device (overrides capture.device)" << std::endl;
    std::cout << "  --listen           Start in listening mode" << std::endl;
    std::cout << "  --no-wav           Do not write finished recordings to disk" << std::endl;
    std::cout << "  --help             Show this help message" << std::endl;
}

void printCommands() {
    std::cout << "Commands: start | stop | cancel | toggle | tap | listen on | listen off | "
                 "status | quit"
              << std::endl;
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            options.device = argv[++i];
        } else if (arg == "--listen") {
            options.listen = true;
        } else if (arg == "--no-wav") {
            options.noWav = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

nlohmann::json buildStatus(const voxcap::recording::RecordingCoordinator& coordinator) {
    nlohmann::json status;
    status["state"] = voxcap::recording::recordingStateToString(coordinator.state());
    status["listening_mode"] = coordinator.listeningMode();

    auto snapshot = coordinator.diagnostics();
    status["diagnostics"] = voxcap::metrics::toJson(snapshot);

    auto last = coordinator.lastRecording();
    if (last) {
        status["last_recording"] = voxcap::recording::toJson(last->metadata);
    } else {
        status["last_recording"] = nullptr;
    }
    return status;
}

void printResult(const char* what, const voxcap::recording::RecordingResult& result) {
    if (result.ok()) {
        return;
    }
    std::cout << what << ": " << voxcap::core::errorCodeToString(result.code) << " ("
              << voxcap::core::errorCodeToHex(result.code) << ") " << result.message;
    if (voxcap::core::isRetryable(result.code)) {
        std::cout << " [retry]";
    }
    std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace voxcap;

    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    logging::initializeEarly();

    core::AppConfig config;
    if (!core::loadAppConfig(options.configPath, config)) {
        LOG_WARN("Config {} not loaded, using defaults", options.configPath);
    }
    if (!logging::initialize(config.logging)) {
        std::cerr << "Failed to initialize logging" << std::endl;
        return 1;
    }
    if (!options.device.empty()) {
        config.capture.device = options.device;
    }
    if (options.listen) {
        config.recording.listeningMode = true;
    }

    LOG_INFO("voxcap starting: device={} native={} Hz -> {} Hz", config.capture.device,
             config.capture.sampleRate, config.pipeline.targetSampleRate);

    app::installSignalHandlers();

    capture::AlsaCaptureSource source;
    pipeline::CapturePipeline capturePipeline(config, denoiser::createInferenceStages(config.denoiser));
    recording::RecordingCoordinator coordinator(config, source, capturePipeline);

    if (!options.noWav) {
        coordinator.addSink(std::make_shared<output::WavEncoder>(config.recording.outputDirectory));
    }
    coordinator.events().subscribe([](const recording::LifecycleEvent& event) {
        std::cout << recording::toJson(event).dump() << std::endl;
        if (event.type == recording::LifecycleEventType::Error &&
            core::isCaptureError(event.errorCode)) {
            logging::dumpRecent();
        }
    });

    control::ControlPlane controlPlane(coordinator, source, capturePipeline,
                                       std::chrono::milliseconds(config.hotkey.doubleTapWindowMs));
    controlPlane.setResultHandler(
        [](control::Intent intent, const recording::RecordingResult& result) {
            printResult(control::intentToString(intent), result);
        });
    controlPlane.start();

    app::ShutdownController shutdown;
    shutdown.setSignalState(&app::getGlobalSignalState());
    shutdown.setFinalizeCallback([&]() {
        controlPlane.stop();
        if (coordinator.state() == recording::RecordingState::Recording) {
            LOG_INFO("Finalizing active recording before exit");
            printResult("stop", coordinator.stop(recording::StopReason::User));
        }
    });

    app::StdinTriggerSource triggers;
    shutdown.setQuitCallback([&triggers]() { triggers.close(); });

    printCommands();
    std::vector<std::string> lines;
    while (shutdown.isRunning()) {
        lines.clear();
        bool open = triggers.poll(std::chrono::milliseconds(200), lines);
        shutdown.processPendingSignals();
        if (!shutdown.isRunning()) {
            break;
        }

        for (const auto& line : lines) {
            if (!shutdown.isRunning()) {
                break;
            }
            auto cmd = app::parseTriggerCommand(line);
            switch (cmd.kind) {
            case app::TriggerCommand::Kind::Intent:
                controlPlane.post(cmd.intent, control::ControlPlane::Clock::now());
                break;
            case app::TriggerCommand::Kind::ListenOn:
                printResult("listen", coordinator.setListeningMode(true));
                break;
            case app::TriggerCommand::Kind::ListenOff:
                printResult("listen", coordinator.setListeningMode(false));
                break;
            case app::TriggerCommand::Kind::Status:
                std::cout << buildStatus(coordinator).dump(2) << std::endl;
                break;
            case app::TriggerCommand::Kind::Help:
                printCommands();
                break;
            case app::TriggerCommand::Kind::Quit:
                shutdown.requestShutdown();
                break;
            case app::TriggerCommand::Kind::Invalid:
                if (!cmd.text.empty()) {
                    std::cout << "Unknown command: " << cmd.text << std::endl;
                }
                break;
            }
        }

        if (!open && shutdown.isRunning()) {
            LOG_INFO("stdin closed");
            shutdown.requestShutdown();
        }
    }

    LOG_INFO("voxcap stopped");
    logging::shutdown();
    return 0;
}
