#pragma once

/// Umbrella header for the markitdown MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "capability.hpp"
#include "converter.hpp"
#include "router.hpp"
#include "session.hpp"
#include "channel.hpp"
#include "convert_endpoint.hpp"
#include "cli.hpp"
#include "env.hpp"
#include "logging.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/sse_transport.hpp"
