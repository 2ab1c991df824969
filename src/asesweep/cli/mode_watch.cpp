#include "modes.hpp"

#include "asesweep/core/Args.hpp"
#include "asesweep/io/RunLog.hpp"
#include "asesweep/preview/LatestSlot.hpp"
#include "asesweep/preview/PreviewClient.hpp"
#include "asesweep/preview/SpectrumPlot.hpp"

#include <opencv2/core.hpp>

#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

int run_watch(int argc, char** argv)
{
    using namespace asesweep;

    std::string serverAddr;
    std::string savePath;
    bool withView = false;
    try {
        if (const auto bad = argUnknown(argc, argv, {"server", "view", "save", "quiet"}); !bad.empty()) {
            throw ConfigError("unknown option " + bad);
        }
        serverAddr = argValue(argc, argv, "server", "localhost:50051");
        savePath   = argValue(argc, argv, "save", "preview.png");
        withView   = argHas(argc, argv, "view");
    } catch (const ConfigError& e) {
        std::cerr << "[watch] " << e.what() << "\n";
        return 1;
    }

    RunLog log;
    LatestSlot<PreviewUpdate> latest;

    PreviewClient::Options co{};
    co.printHeartbeat = !argHas(argc, argv, "quiet");
    PreviewClient client(serverAddr, co);

    std::cout << "[watch] server=" << serverAddr << (withView ? ", view=on" : ", view=off") << "\n";
    client.start([&](const PreviewUpdate& u) {
        std::ostringstream os;
        os << "[watch] #" << (u.index + 1) << "/" << u.total
           << " angle=" << std::fixed << std::setprecision(2) << u.angleDeg
           << " t=" << std::defaultfloat << u.integrationTimeS << "s"
           << " max=" << std::fixed << std::setprecision(0) << u.maxCount
           << " bg=" << (u.backgroundFromCache ? "cached" : "acquired");
        std::cout << os.str() << "\n";
        latest.put(u);
    });

    PreviewUpdate last;
    bool haveLast = false;

    if (!withView) {
        std::cout << "[watch] press Enter to stop.\n";
        std::cin.get();
    } else {
        try {
            PreviewWindow window("ASE sweep (watch)");
            cv::Mat shown = renderSpectra(PreviewUpdate{});
            window.show(shown);
            for (;;) {
                PreviewUpdate u;
                if (latest.take(u, std::chrono::milliseconds(30))) {
                    last = u;
                    haveLast = true;
                    shown = renderSpectra(u);
                    window.show(shown);
                }
                int key = window.poll(1);
                if (key < 0) continue;
                key = std::tolower(key);
                if (key == 'q' || key == 27) break; // ESC
                if (key == 's' && haveLast) savePreviewPng(shown, savePath, log);
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[watch] failed to create window (" << e.what() << "); press Enter to stop.\n";
            std::cin.get();
        }
    }

    client.shutdown();
    if (!haveLast) haveLast = latest.tryTake(last);
    if (haveLast && argHas(argc, argv, "save")) savePreviewPng(renderSpectra(last), savePath, log);

    std::cout << "[watch] received " << client.received() << " update(s), rejected " << client.rejected() << "\n";
    return 0;
}
