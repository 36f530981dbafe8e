#include "headers.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

struct CliParams {
    bool listDevices = false;
    bool synthetic = false;
    std::optional<int> device;
    double duration = 0.0;           // seconds, 0 = until Ctrl+C

    std::string endpoint = "wss://stt-rt.soniox.com/transcribe-websocket";
    std::string apiKey;
    std::string model = "stt-rt-v3";
    std::string language;
    bool diarization = false;

    int sampleRate = 16000;
    int chunkSize = 256;
    int queueCapacity = 32;
    int drainGraceMs = 5000;

    int controlPort = 0;             // 0 = no intent listener
    std::string bindIp = "127.0.0.1";
    bool insecure = false;
};

static std::atomic<bool> g_interrupted{false};

static void onSignal(int) { g_interrupted.store(true); }

static void printUsage(const char* argv0, const CliParams& p) {
    std::cerr << "\n"
              << "usage: " << argv0 << " [options]\n"
              << "\n"
              << "options:\n"
              << "  -h,       --help            show this help message and exit\n"
              << "  -l,       --list-devices    list input devices and exit\n"
              << "  -d N,     --device N        input device index (default: host default)\n"
              << "  -t S,     --duration S      stop after S seconds of audio (default: until Ctrl+C)\n"
              << "  -e URL,   --endpoint URL    recognition endpoint (default: " << p.endpoint << ")\n"
              << "  -k KEY,   --api-key KEY     API key (default: $SONIOX_API_KEY)\n"
              << "  -m NAME,  --model NAME      model (default: " << p.model << ")\n"
              << "  -L LANG,  --language LANG   language hint (default: auto)\n"
              << "            --diarization     label tokens with speaker ids\n"
              << "  -r HZ,    --sample-rate HZ  sample rate sent to the backend (default: " << p.sampleRate << ")\n"
              << "  -c N,     --chunk-size N    frames per chunk (default: " << p.chunkSize << ")\n"
              << "  -q N,     --queue N         chunks buffered before dropping (default: " << p.queueCapacity << ")\n"
              << "  -g MS,    --grace MS        wait for final tokens after stop (default: " << p.drainGraceMs << ")\n"
              << "  -p PORT,  --control-port P  accept UDP intents on PORT instead of starting immediately\n"
              << "  -b IP,    --bind-ip IP      address for the intent listener (default: " << p.bindIp << ")\n"
              << "            --synthetic       use a generated tone instead of a microphone\n"
              << "            --insecure        do not verify the TLS certificate\n"
              << "\n";
}

static bool parseParams(int argc, char** argv, CliParams& params) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") { printUsage(argv[0], params); std::exit(0); }
        else if (arg == "-l" || arg == "--list-devices") { params.listDevices = true; }
        else if (arg == "-d" || arg == "--device")       { params.device = std::stoi(value()); }
        else if (arg == "-t" || arg == "--duration")     { params.duration = std::stod(value()); }
        else if (arg == "-e" || arg == "--endpoint")     { params.endpoint = value(); }
        else if (arg == "-k" || arg == "--api-key")      { params.apiKey = value(); }
        else if (arg == "-m" || arg == "--model")        { params.model = value(); }
        else if (arg == "-L" || arg == "--language")     { params.language = value(); }
        else if (                arg == "--diarization") { params.diarization = true; }
        else if (arg == "-r" || arg == "--sample-rate")  { params.sampleRate = std::stoi(value()); }
        else if (arg == "-c" || arg == "--chunk-size")   { params.chunkSize = std::stoi(value()); }
        else if (arg == "-q" || arg == "--queue")        { params.queueCapacity = std::stoi(value()); }
        else if (arg == "-g" || arg == "--grace")        { params.drainGraceMs = std::stoi(value()); }
        else if (arg == "-p" || arg == "--control-port") { params.controlPort = std::stoi(value()); }
        else if (arg == "-b" || arg == "--bind-ip")      { params.bindIp = value(); }
        else if (                arg == "--synthetic")   { params.synthetic = true; }
        else if (                arg == "--insecure")    { params.insecure = true; }
        else {
            std::cerr << "error: unknown argument: " << arg << "\n";
            printUsage(argv[0], params);
            return false;
        }
    }
    return true;
}

static int listDevices(AudioBackend& backend) {
    DeviceRegistry registry(backend);
    const std::vector<Device> devices = registry.listDevices();
    if (devices.empty()) {
        std::cout << "No input devices found.\n";
        return 0;
    }

    const std::optional<Device> def = registry.defaultDevice();
    for (const auto& d : devices) {
        const bool isDefault = def && def->index == d.index;
        std::cout << (isDefault ? " * " : "   ") << d.index << ": " << d.name << " ("
                  << d.channelCount << " ch, " << d.defaultSampleRate << " Hz)\n";
    }
    return 0;
}

static void printSummary(const SessionSnapshot& s) {
    std::cout << "\n\n[Main] [INFO] session " << toString(s.state) << "\n";
    if (!s.lastError.empty()) {
        std::cout << "[Main] [INFO] last error: " << s.lastError << "\n";
    }
    std::cout << "\nTranscript:\n" << s.finalText << "\n\n"
              << "Elapsed: " << s.stats.elapsedSeconds << " s | Words: " << s.stats.wordCount
              << " | Sent: " << s.stats.bytesSent << " bytes\n";
}

// Runs one session from the terminal until Ctrl+C or the duration bound.
static int runLive(SessionController& controller, const CliParams& params) {
    controller.setUpdateCallback([](const SessionSnapshot& s) {
        if (s.state == SessionState::Streaming || s.state == SessionState::Stopping) {
            std::cout << "\33[2K\r" << s.transcript << std::flush;
        }
    });

    try {
        controller.start();
    } catch (const std::exception& e) {
        std::cerr << "[Main] [ERROR] could not start: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[Main] [INFO] listening... press Ctrl+C to stop.\n";

    const auto startedAt = std::chrono::steady_clock::now();
    while (!g_interrupted.load() && controller.state() == SessionState::Streaming) {
        if (params.duration > 0.0) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startedAt;
            if (elapsed.count() >= params.duration) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    controller.stop();
    controller.setUpdateCallback(nullptr);

    const SessionSnapshot s = controller.snapshot();
    printSummary(s);
    return s.state == SessionState::Failed ? 1 : 0;
}

// Leaves session control to whoever sends intents.
static int runControlled(SessionController& controller, const CliParams& params) {
    IntentListener listener(params.bindIp, params.controlPort,
        [&controller](const std::string& msg, const std::string&, uint16_t) {
            return intent::handle(controller, msg);
        });

    std::atomic<bool> live{false};
    controller.setUpdateCallback([&listener, &live](const SessionSnapshot& s) {
        if (s.state == SessionState::Streaming) {
            live.store(true);
        } else if ((s.state == SessionState::Stopped || s.state == SessionState::Failed) && live.exchange(false)) {
            listener.sendSessionEnded(toString(s.state));
        }
    });

    try {
        listener.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Main] [ERROR] intent listener: " << e.what() << "\n";
        return 1;
    }
    std::cout << "[Main] [INFO] waiting for intents... press Ctrl+C to quit.\n";

    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    listener.stop();
    controller.stop();
    controller.setUpdateCallback(nullptr);
    return 0;
}

int main(int argc, char** argv) {
    CliParams params;
    try {
        if (!parseParams(argc, argv, params)) return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        printUsage(argv[0], params);
        return 2;
    }

    std::unique_ptr<AudioBackend> backend;
    if (params.synthetic) {
        backend = std::make_unique<SyntheticBackend>();
    } else {
        backend = std::make_unique<PortAudioBackend>();
    }

    try {
        if (params.listDevices) return listDevices(*backend);
    } catch (const StreamError& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << "\n";
        return 1;
    }

    if (params.apiKey.empty()) {
        if (const char* key = std::getenv("SONIOX_API_KEY")) params.apiKey = key;
    }
    if (params.apiKey.empty()) {
        std::cerr << "[Main] [ERROR] no API key: pass --api-key or set SONIOX_API_KEY\n";
        return 2;
    }

    SessionController::Config config;
    config.endpoint = params.endpoint;
    config.capture.sampleRate = params.sampleRate;
    config.capture.chunkSize = params.chunkSize;
    config.capture.queueCapacity = (size_t)params.queueCapacity;
    config.capture.maxDuration = params.duration;
    config.transport.recognition.apiKey = params.apiKey;
    config.transport.recognition.model = params.model;
    config.transport.recognition.language = params.language;
    config.transport.recognition.speakerDiarization = params.diarization;
    config.drainGraceMs = params.drainGraceMs;

    WebSocketChannel::Options channelOptions;
    channelOptions.verifyPeer = !params.insecure;

    SessionController controller(*backend,
        [channelOptions]() -> std::unique_ptr<MessageChannel> {
            return std::make_unique<WebSocketChannel>(channelOptions);
        },
        config);
    controller.selectDevice(params.device);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    if (params.controlPort > 0) return runControlled(controller, params);
    return runLive(controller, params);
}
