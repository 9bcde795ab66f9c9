#include "discovery/static_list_discovery.hpp"

#include "spdlog/spdlog.h"

#include <fstream>
#include <limits>

StaticListDiscovery::StaticListDiscovery(std::filesystem::path path) : path(std::move(path)) {}

bool StaticListDiscovery::available() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string StaticListDiscovery::describe() const {
    return "file " + path.string();
}

std::optional<std::vector<ServerRef>> StaticListDiscovery::discover() {
    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("StaticListDiscovery: Failed to open {}", path.string());
        return std::nullopt;
    }

    statusboard::json::Value jsonData;
    try {
        stream >> jsonData;
    } catch (const std::exception &ex) {
        spdlog::error("StaticListDiscovery: Error reading or parsing {}: {}", path.string(), ex.what());
        return std::nullopt;
    }

    auto servers = parseServerList(jsonData);
    if (!servers) {
        spdlog::error("StaticListDiscovery: {} is not an array of server records", path.string());
        return std::nullopt;
    }

    spdlog::info("Loaded {} servers from {}", servers->size(), path.filename().string());
    return servers;
}

std::optional<std::vector<ServerRef>> StaticListDiscovery::parseServerList(const statusboard::json::Value &jsonData) {
    if (!jsonData.is_array()) {
        return std::nullopt;
    }

    std::vector<ServerRef> servers;
    servers.reserve(jsonData.size());
    for (const auto &record : jsonData) {
        if (!record.is_object()) {
            spdlog::warn("StaticListDiscovery: Skipping non-object server record");
            continue;
        }

        ServerRef server;
        server.address = record.value("address", std::string{});

        long long port = -1;
        if (auto portIt = record.find("port"); portIt != record.end()) {
            if (portIt->is_number_integer()) {
                port = portIt->get<long long>();
            } else if (portIt->is_string()) {
                try {
                    port = std::stoll(portIt->get<std::string>());
                } catch (const std::exception &) {
                    port = -1;
                }
            }
        }

        if (server.address.empty() || port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
            spdlog::warn("StaticListDiscovery: Skipping invalid server record {}", record.dump());
            continue;
        }
        server.port = static_cast<uint16_t>(port);
        servers.push_back(std::move(server));
    }
    return servers;
}
