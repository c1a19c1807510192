#pragma once

#include "server-context.h"

#include <httplib.h>

void register_routes(httplib::Server & server, server_context & ctx);

// Thread pool, payload limit, CORS and JSON error pages.
void configure_server(httplib::Server & server, const server_config & cfg);
