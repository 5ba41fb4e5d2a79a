#pragma once

/*
===============================================================================
cirisstream: Public API Entry Point
===============================================================================

    cirisstream::Client     self-healing CIRIS v1 stream client
    cirisstream::Message    inbound data message
    cirisstream::Filter     per-channel subscription criteria
    cirisstream::Config     runtime configuration

Example:

    cirisstream::Client client(cirisstream::Config{
        .endpoint = "https://agent.local:8080",
        .api_key  = token,
    });
    (void)client.connect();
    (void)client.subscribe("telemetry");
    cirisstream::Message msg;
    while (client.pop(msg)) { ... }
===============================================================================
*/

#include "cirisstream/core.hpp"
#include "cirisstream/stream/client.hpp"


namespace cirisstream {

using Client  = stream::Client<core::transport::beast::WebSocket>;
using Message = core::protocol::ciris::schema::Message;
using Filter  = core::protocol::ciris::schema::Filter;
using Config  = core::config::Client;
using Error   = stream::Error;

} // namespace cirisstream
