#pragma once

#include "app/update_cycle.hpp"
#include "discovery/provider_factory.hpp"
#include "publish/discord_channel_surface.hpp"
#include "publish/slot_reconciler.hpp"
#include "query/a2s_transport.hpp"
#include "query/resilient_query_client.hpp"
#include "snapshot/snapshot_builder.hpp"
