#pragma once

/*
===============================================================================
roomsync - Public API Entry Point
===============================================================================

Applications join collaborative measurement sessions through roomsync::Client.
It owns the relay connection, the replicated session state and the event
subscriptions, and exposes them through core::Error returns and callbacks.

Only symbols declared directly in the roomsync namespace are part of the
public API contract. roomsync::core is the engine underneath.
===============================================================================
*/

#include "roomsync/version.hpp"
#include "roomsync/client.hpp"
