#include "app/application.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace {
constexpr std::chrono::milliseconds kPollInterval{100};
}

Application::Application(AppSettings settings) : settings(std::move(settings)) {
    std::vector<IPublishSurface *> surfacePtrs;
    for (const auto &channelId : this->settings.channelIds) {
        surfaces.push_back(std::make_unique<DiscordChannelSurface>(
            this->settings.discordApiBase, this->settings.discordToken, channelId));
        surfacePtrs.push_back(surfaces.back().get());
    }

    discovery = CreateDiscoveryProvider(this->settings.discovery);
    cycle = std::make_unique<UpdateCycle>(transport, discovery.get(), std::move(surfacePtrs), this->settings.cycle);
}

Application::~Application() {
    if (worker.joinable()) {
        worker.join();
    }
}

bool Application::initialize() {
    if (!discovery) {
        return false;
    }

    spdlog::info("Discovering servers via {}", discovery->describe());
    cycle->refreshServers();
    spdlog::info("Watching {} servers", cycle->servers().size());

    cycle->clearSurfaces();
    return true;
}

void Application::run(const std::atomic<bool> &running) {
    spdlog::info("Updating {} channels every {} ms", surfaces.size(), settings.cycleInterval.count());

    auto nextTick = std::chrono::steady_clock::now() + settings.cycleInterval;
    while (running) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= nextTick) {
            requestCycle();
            nextTick += settings.cycleInterval;
            if (nextTick <= now) {
                nextTick = now + settings.cycleInterval;
            }
            continue;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(nextTick - now, kPollInterval));
    }

    if (worker.joinable()) {
        worker.join();
    }
}

void Application::runOnce() {
    cycle->runCycleIfIdle();
}

void Application::requestCycle() {
    bool expected = false;
    if (!working.compare_exchange_strong(expected, true)) {
        spdlog::info("Application: Previous update still running, skipping this tick");
        return;
    }

    if (worker.joinable()) {
        worker.join();
    }

    worker = std::thread(&Application::workerProc, this);
}

void Application::workerProc() {
    cycle->runCycleIfIdle();
    working = false;
}
