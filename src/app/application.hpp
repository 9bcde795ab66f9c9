#pragma once

#include "app/app_config.hpp"
#include "app/update_cycle.hpp"
#include "publish/discord_channel_surface.hpp"
#include "query/a2s_transport.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

class Application {
public:
    explicit Application(AppSettings settings);
    ~Application();

    // Discovers the server set and clears the configured channels. Returns false when the
    // discovery source is unusable.
    bool initialize();

    // Ticks every cycleInterval until running turns false. The first update fires after one interval.
    void run(const std::atomic<bool> &running);

    // Runs one update on the calling thread.
    void runOnce();

    // Starts an update on the worker thread unless one is still in progress.
    void requestCycle();

private:
    void workerProc();

    AppSettings settings;
    A2SQueryTransport transport;
    std::unique_ptr<IDiscoveryProvider> discovery;
    std::vector<std::unique_ptr<DiscordChannelSurface>> surfaces;
    std::unique_ptr<UpdateCycle> cycle;

    std::thread worker;
    std::atomic<bool> working{false};
};
