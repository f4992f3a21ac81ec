#pragma once

#include <string>

#include "roomsync/core/protocol/message.hpp"
#include "roomsync/core/model/session.hpp"


namespace roomsync::core::protocol::codec {

// -----------------------------------------------------------------------------
// Wire encoding
// -----------------------------------------------------------------------------
//
// Messages are written by hand into a std::string (no DOM, no intermediate
// allocation per field). Field names follow the wire contract:
//
//   {"type":"measurement","sessionId":"...","participantId":"...",
//    "data":{...},"timestamp":1700000000000,"sequence":7}
//
// Doubles use the shortest round-trip representation, so decode(encode(m))
// reproduces every field exactly.
// -----------------------------------------------------------------------------

// Appends the JSON envelope of msg to out
void encode_to(std::string& out, const Message& msg);

[[nodiscard]] std::string encode(const Message& msg);

// Full session document (local snapshots)
[[nodiscard]] std::string encode_session(const Session& session);

} // namespace roomsync::core::protocol::codec
