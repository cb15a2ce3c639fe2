#pragma once

/*
===============================================================================
wiregate public API entry point
===============================================================================

wiregate is a client for JSON-over-WebSocket pub/sub gateways: it keeps one
persistent connection, correlates connect / subscribe / unsubscribe requests
with their replies and routes server publications to caller-chosen handles.

Only symbols declared directly in the wiregate namespace are part of the
public API contract. wiregate::core is available to advanced users (custom
transports, deterministic poll-driven sessions) without stability guarantees.
===============================================================================
*/

#include <wiregate/version.hpp>
#include <wiregate/client.hpp>
