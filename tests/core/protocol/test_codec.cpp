/*
===============================================================================
 protocol::codec - Group A Unit Tests
===============================================================================

Scope:
------
Wire envelope encoding and decoding.

A1. Measurement envelope survives encode → decode unchanged
A2. Join payload keeps the optional room code
A3. Leave carries null data, sync request carries {"request":true}
A4. Unknown message types are ignored, not failed
A5. Malformed JSON and missing envelope fields are rejected
A6. Zero sequence and version-0 measurements are invalid values
A7. Session documents round-trip through encode_session/decode_session
===============================================================================
*/

#include <iostream>
#include <string>

#include "roomsync/core/protocol/codec/encoder.hpp"
#include "roomsync/core/protocol/codec/decoder.hpp"
#include "common/test_check.hpp"

using namespace roomsync::core;
using namespace roomsync::core::protocol;
using namespace roomsync::core::protocol::codec;


static Message make_envelope(Payload data, std::uint64_t sequence = 1) {
    Message msg;
    msg.session_id = "session_1700000000000_1";
    msg.participant_id = "participant_u1";
    msg.data = std::move(data);
    msg.timestamp = 1'700'000'000'123ULL;
    msg.sequence = sequence;
    return msg;
}

// -----------------------------------------------------------------------------
// A1
// -----------------------------------------------------------------------------
void test_measurement_envelope() {
    std::cout << "[TEST] Group A1: measurement envelope encode/decode\n";

    SharedMeasurement m;
    m.id = "m1";
    m.author_id = "participant_u1";
    m.points = {Point3{0.0, 0.0, 0.0}, Point3{1.5, -2.0, 3.25}};
    m.distance = 4.5;
    m.unit = "cm";
    m.label = std::string("edge \"A\"");
    m.timestamp = 1'700'000'000'000ULL;
    m.version = 3;
    m.locked = true;

    const Message sent = make_envelope(m, 7);
    const std::string wire = encode(sent);
    TEST_CHECK(wire.find("\"type\":\"measurement\"") != std::string::npos);

    Decoder decoder;
    Message received;
    TEST_CHECK(decoder.decode(wire, received) == Result::Parsed);
    TEST_CHECK(received.type() == MessageType::Measurement);
    TEST_CHECK(received == sent);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2
// -----------------------------------------------------------------------------
void test_join_room_code() {
    std::cout << "[TEST] Group A2: join keeps optional room code\n";

    Participant p;
    p.id = "participant_u1";
    p.user_id = "u1";
    p.name = "Ana";
    p.role = Role::Host;
    p.color = "#FF6B6B";
    p.joined_at = 10;
    p.last_seen = 20;

    JoinPayload with_code;
    with_code.participant = p;
    with_code.room_code = std::string("AB12CD");

    Decoder decoder;
    Message received;
    TEST_CHECK(decoder.decode(encode(make_envelope(with_code)), received) == Result::Parsed);
    const auto* join = std::get_if<JoinPayload>(&received.data);
    TEST_CHECK(join != nullptr);
    TEST_CHECK(join->room_code.has());
    TEST_CHECK(join->room_code.value() == "AB12CD");
    TEST_CHECK(join->participant == p);

    JoinPayload without_code;
    without_code.participant = p;
    TEST_CHECK(decoder.decode(encode(make_envelope(without_code)), received) == Result::Parsed);
    TEST_CHECK(!std::get<JoinPayload>(received.data).room_code.has());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3
// -----------------------------------------------------------------------------
void test_leave_and_sync_request() {
    std::cout << "[TEST] Group A3: leave null data, sync request\n";

    const std::string leave = encode(make_envelope(LeavePayload{}));
    TEST_CHECK(leave.find("\"data\":null") != std::string::npos);

    SyncPayload request;
    request.request = true;
    const std::string sync = encode(make_envelope(request));
    TEST_CHECK(sync.find("\"data\":{\"request\":true}") != std::string::npos);

    Decoder decoder;
    Message received;
    TEST_CHECK(decoder.decode(leave, received) == Result::Parsed);
    TEST_CHECK(received.type() == MessageType::Leave);
    TEST_CHECK(decoder.decode(sync, received) == Result::Parsed);
    TEST_CHECK(std::get<SyncPayload>(received.data).request);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4
// -----------------------------------------------------------------------------
void test_unknown_type_ignored() {
    std::cout << "[TEST] Group A4: unknown type is ignored\n";

    Decoder decoder;
    Message received;
    const std::string raw =
        R"({"type":"voice","sessionId":"s","participantId":"p","data":{},"timestamp":1,"sequence":1})";
    TEST_CHECK(decoder.decode(raw, received) == Result::Ignored);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5
// -----------------------------------------------------------------------------
void test_malformed_rejected() {
    std::cout << "[TEST] Group A5: malformed envelopes rejected\n";

    Decoder decoder;
    Message received;
    TEST_CHECK(decoder.decode("{not json", received) == Result::InvalidJson);
    TEST_CHECK(decoder.decode("[1,2,3]", received) == Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"sessionId":"s"})", received) == Result::InvalidSchema);
    // Missing participantId
    TEST_CHECK(decoder.decode(
        R"({"type":"chat","sessionId":"s","data":{"message":"hi","author":"a","color":"#fff"},"timestamp":1,"sequence":1})",
        received) != Result::Parsed);
    // Chat without author
    TEST_CHECK(decoder.decode(
        R"({"type":"chat","sessionId":"s","participantId":"p","data":{"message":"hi","color":"#fff"},"timestamp":1,"sequence":1})",
        received) != Result::Parsed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A6
// -----------------------------------------------------------------------------
void test_invalid_values() {
    std::cout << "[TEST] Group A6: zero sequence and version 0 are invalid\n";

    Decoder decoder;
    Message received;
    TEST_CHECK(decoder.decode(encode(make_envelope(LeavePayload{}, 0)), received) == Result::InvalidValue);

    SharedMeasurement m;
    m.id = "m1";
    m.author_id = "participant_u1";
    m.unit = "m";
    m.version = 0;
    TEST_CHECK(decoder.decode(encode(make_envelope(m)), received) == Result::InvalidValue);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A7
// -----------------------------------------------------------------------------
void test_session_document() {
    std::cout << "[TEST] Group A7: session document round trip\n";

    Session s;
    s.id = "session_1700000000000_4";
    s.room_code = "Q7W2ZK";
    s.host_id = "participant_h";
    Participant host;
    host.id = "participant_h";
    host.user_id = "h";
    host.name = "Host";
    host.role = Role::Host;
    host.color = "#4ECDC4";
    s.participants.push_back(host);
    SharedMeasurement m;
    m.id = "m9";
    m.author_id = host.id;
    m.unit = "mm";
    m.points = {Point3{1, 2, 3}};
    s.measurements.push_back(m);
    s.cursors["participant_h"] = CursorPosition{"participant_h", 1.0, 2.0, 3.0, 99};
    Annotation a;
    a.id = "annotation_1";
    a.author_id = host.id;
    a.type = AnnotationType::Arrow;
    a.style.color = "#4ECDC4";
    s.annotations.push_back(a);
    s.created_at = 100;
    s.updated_at = 200;
    s.settings.allow_editing = false;
    s.settings.max_participants = 3;

    Decoder decoder;
    Session restored;
    TEST_CHECK(decoder.decode_session(encode_session(s), restored) == Result::Parsed);
    TEST_CHECK(restored == s);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Error);

    test_measurement_envelope();
    test_join_room_code();
    test_leave_and_sync_request();
    test_unknown_type_ignored();
    test_malformed_rejected();
    test_invalid_values();
    test_session_document();

    std::cout << "\n[GROUP A - CODEC TESTS PASSED]\n";
    return 0;
}
