#pragma once

#include "query/types.hpp"

#include <optional>
#include <string>
#include <vector>

// Source of the candidate server set. std::nullopt signals that the source could not be read, as
// opposed to a source that is readable but lists no servers.
class IDiscoveryProvider {
public:
    virtual ~IDiscoveryProvider() = default;

    virtual std::optional<std::vector<ServerRef>> discover() = 0;
    virtual std::string describe() const = 0;
};
