#pragma once

#include "discovery/provider.hpp"

#include "common/json.hpp"

#include <string>
#include <vector>

// Name rule applied to directory entries: the upper-cased name must contain at least one of
// requireAny and none of rejectAny.
struct ServerNameFilter {
    std::vector<std::string> requireAny;
    std::vector<std::string> rejectAny;

    bool accepts(const std::string &serverName) const;
};

struct SteamDirectoryOptions {
    std::string apiUrl = "https://api.steampowered.com/IGameServersService/GetServerList/v1/";
    std::string apiKey;
    int appId = 0;
    int limit = 20000;
    ServerNameFilter nameFilter;
};

class SteamDirectoryDiscovery : public IDiscoveryProvider {
public:
    explicit SteamDirectoryDiscovery(SteamDirectoryOptions options);

    std::optional<std::vector<ServerRef>> discover() override;
    std::string describe() const override;

    // Extracts and filters response.servers[] from a GetServerList body.
    static std::optional<std::vector<ServerRef>> parseServerList(const statusboard::json::Value &jsonData,
                                                                 const ServerNameFilter &filter);

private:
    SteamDirectoryOptions options;
};
