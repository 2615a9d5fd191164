#pragma once

/// Umbrella header for the rapidmcp library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include "codec.hpp"
#include "template.hpp"
#include "validator.hpp"
#include "registry.hpp"
#include "loader.hpp"
#include "tool_invoker.hpp"
#include "router.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "server.hpp"
