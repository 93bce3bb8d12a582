#include <QCoreApplication>
#include <QTimer>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include "LookoutLogging.hpp"
#include "telemetry/TelemetryClient.hpp"
#include "telemetry/auth/InMemoryCredentialSource.hpp"
#include "telemetry/config/TelemetryConfig.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json> [--seconds N] [--owner STREAMER_ID]\n";
}

void printProjection(const Projection& p) {
    std::cout << "[" << p.size() << " active downloads]" << std::endl;
    for (const auto& d : p) {
        std::cout << "  " << std::left << std::setw(24) << d.id
                  << " streamer=" << d.ownerId
                  << " " << toString(d.status)
                  << " " << d.metrics.bytesDownloaded << "B"
                  << " @" << d.metrics.speedBytesPerSec << "B/s"
                  << " segs=" << d.metrics.segmentsCompleted
                  << " x" << std::fixed << std::setprecision(2) << d.metrics.playbackRatio
                  << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    int seconds = 0;
    std::optional<std::string> owner;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::atoi(argv[++i]);
        } else if (arg == "--owner" && i + 1 < argc) {
            owner = argv[++i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    TelemetryConfig config;
    std::optional<std::string> token;
    try {
        config = loadTelemetryConfig(argv[1]);
        token = resolveToken(config);
    } catch (const std::exception& ex) {
        std::cerr << "lookout: " << ex.what() << std::endl;
        return 1;
    }
    if (owner) config.ownerFilter = owner;
    if (!token) {
        lLog_Warning("No token configured; waiting without connecting");
    }

    InMemoryCredentialSource credentials(token);
    TelemetryClient client(config, credentials);

    ConnectionManager& mgr = client.manager();
    QObject::connect(&mgr, &ConnectionManager::statusChanged, &app, [](ConnectionStatus s) {
        std::cout << "[status] " << toString(s) << std::endl;
    });
    QObject::connect(&mgr, &ConnectionManager::projectionChanged, &app, [&mgr]() {
        printProjection(mgr.projection());
    });
    QObject::connect(&mgr, &ConnectionManager::reconnectScheduled, &app, [](qint64 ms, int attempt) {
        std::cout << "[reconnect] attempt " << attempt + 1 << " in " << ms << " ms" << std::endl;
    });
    QObject::connect(&mgr, &ConnectionManager::errorOccurred, &app, [](const QString& msg) {
        std::cerr << "[error] " << msg.toStdString() << std::endl;
    });

    std::signal(SIGINT, [](int) { g_interrupted = 1; });
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &app, []() {
        if (g_interrupted) QCoreApplication::quit();
    });
    interruptPoll.start(200);
    if (seconds > 0) {
        QTimer::singleShot(seconds * 1000, &app, &QCoreApplication::quit);
    }

    client.start();
    const int rc = app.exec();
    client.stop();
    return rc;
}
