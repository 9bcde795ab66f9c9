#include "discovery/steam_directory_discovery.hpp"

#include "common/http_client.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

bool containsUpper(const std::string &upperName, const std::string &marker) {
    return !marker.empty() && upperName.find(toUpper(marker)) != std::string::npos;
}

std::optional<ServerRef> splitAddress(const std::string &addr) {
    const auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= addr.size()) {
        return std::nullopt;
    }

    ServerRef server;
    server.address = addr.substr(0, colon);
    try {
        const long port = std::stol(addr.substr(colon + 1));
        if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
            return std::nullopt;
        }
        server.port = static_cast<uint16_t>(port);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    return server;
}

} // namespace

bool ServerNameFilter::accepts(const std::string &serverName) const {
    const std::string upperName = toUpper(serverName);

    const bool required = requireAny.empty() ||
        std::any_of(requireAny.begin(), requireAny.end(),
                    [&](const std::string &marker) { return containsUpper(upperName, marker); });
    if (!required) {
        return false;
    }

    return std::none_of(rejectAny.begin(), rejectAny.end(),
                        [&](const std::string &marker) { return containsUpper(upperName, marker); });
}

SteamDirectoryDiscovery::SteamDirectoryDiscovery(SteamDirectoryOptions options) : options(std::move(options)) {}

std::string SteamDirectoryDiscovery::describe() const {
    return "Steam directory (app " + std::to_string(options.appId) + ")";
}

std::optional<std::vector<ServerRef>> SteamDirectoryDiscovery::discover() {
    if (options.apiKey.empty()) {
        spdlog::error("SteamDirectoryDiscovery: No Steam API key configured");
        return std::nullopt;
    }

    statusboard::net::HttpRequest request;
    request.url = options.apiUrl +
        "?key=" + statusboard::net::UrlEncode(options.apiKey) +
        "&filter=" + statusboard::net::UrlEncode("\\appid\\" + std::to_string(options.appId)) +
        "&limit=" + std::to_string(options.limit);
    request.timeoutSeconds = 15;

    const auto response = statusboard::net::Perform(request);
    if (!response.ok()) {
        spdlog::error("SteamDirectoryDiscovery: Error fetching server list from Steam: {}", response.describeFailure());
        return std::nullopt;
    }

    std::optional<std::vector<ServerRef>> servers;
    try {
        servers = parseServerList(statusboard::json::Parse(response.body), options.nameFilter);
    } catch (const std::exception &ex) {
        spdlog::error("SteamDirectoryDiscovery: Failed to parse server list: {}", ex.what());
        return std::nullopt;
    }

    if (!servers) {
        spdlog::error("SteamDirectoryDiscovery: Server list response is missing 'response.servers'");
        return std::nullopt;
    }

    spdlog::info("Fetched {} servers from Steam", servers->size());
    return servers;
}

std::optional<std::vector<ServerRef>> SteamDirectoryDiscovery::parseServerList(const statusboard::json::Value &jsonData,
                                                                               const ServerNameFilter &filter) {
    if (!jsonData.is_object()) {
        return std::nullopt;
    }
    const auto responseIt = jsonData.find("response");
    if (responseIt == jsonData.end() || !responseIt->is_object()) {
        return std::nullopt;
    }

    std::vector<ServerRef> servers;
    const auto serversIt = responseIt->find("servers");
    if (serversIt == responseIt->end()) {
        // Steam omits the array entirely when nothing matches the app id.
        return servers;
    }
    if (!serversIt->is_array()) {
        return std::nullopt;
    }

    for (const auto &entry : *serversIt) {
        if (!entry.is_object()) {
            continue;
        }
        const std::string name = entry.value("name", std::string{});
        if (!filter.accepts(name)) {
            continue;
        }
        const auto server = splitAddress(entry.value("addr", std::string{}));
        if (!server) {
            spdlog::warn("SteamDirectoryDiscovery: Skipping '{}' with malformed address", name);
            continue;
        }
        servers.push_back(*server);
    }
    return servers;
}
