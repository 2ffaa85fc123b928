#pragma once

/// Umbrella header for the toolbridge tool-server client library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "correlator.hpp"
#include "handshake.hpp"
#include "server_connection.hpp"
#include "connection_manager.hpp"
#include "tool_catalog.hpp"
#include "tool_hub.hpp"
#include "transport/transport.hpp"
#include "transport/pipe_transport.hpp"
#include "transport/process_transport.hpp"
