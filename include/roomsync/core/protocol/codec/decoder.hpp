#pragma once

#include <string_view>

#include "roomsync/core/protocol/message.hpp"
#include "roomsync/core/protocol/codec/result.hpp"
#include "roomsync/core/model/session.hpp"

#include "simdjson.h"


namespace roomsync::core::protocol::codec {

/*
================================================================================
 codec::Decoder
================================================================================

Parses inbound wire envelopes and local session documents into domain types.

  • JSON structure is validated through codec::helper primitives
  • Schema rules (required vs optional, enum names, non-empty ids) live here
  • Failures are logged with the offending message and reported as a Result
  • Unknown message types yield Result::Ignored, never an error
  • Output is only meaningful when the result is Result::Parsed

The simdjson parser buffer is reused across calls, so a Decoder is meant to be
long-lived and owned by a single thread.
================================================================================
*/
class Decoder {
public:
    Decoder() = default;

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    [[nodiscard]]
    Result decode(std::string_view raw, Message& out) noexcept;

    [[nodiscard]]
    Result decode_session(std::string_view raw, Session& out) noexcept;

private:
    simdjson::dom::parser parser_;
};

} // namespace roomsync::core::protocol::codec
