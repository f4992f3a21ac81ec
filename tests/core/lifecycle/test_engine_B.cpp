/*
===============================================================================
 lifecycle::Engine - Group B Unit Tests
===============================================================================

Scope:
------
Shared content flowing between two participants.

B1. Shared measurements reach the room as remote inserts and updates
B2. Measurement updates bump the version on every replica
B3. Editing permissions: allow_editing=false and locked measurements
B4. Annotations default to the author's colour and standard sizes
B5. Chat messages carry the author's name and colour
B6. Cursor broadcasts are throttled to one per interval
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>

#include "common/harness/engine.hpp"

using namespace std::chrono_literals;
using namespace roomsync::test::harness;


static MeasurementInput make_input(const std::string& id, double distance) {
    MeasurementInput input;
    input.id = id;
    input.points = {Point3{0, 0, 0}, Point3{distance, 0, 0}};
    input.distance = distance;
    input.unit = "m";
    return input;
}

void test_share_measurement() {
    std::cout << "[TEST] Group B1: shared measurement reaches the room\n";
    reset_environment();
    Room room;

    SharedMeasurement m;
    TEST_CHECK(room.host->share_measurement(make_input("m1", 2.5), m) == Error::None);
    TEST_CHECK(m.version == 1);
    TEST_CHECK(m.author_id == "participant_host");
    TEST_CHECK(room.host.shared.size() == 1);
    TEST_CHECK(room.host.shared[0].origin == events::Origin::Local);

    // Duplicate ids are refused locally
    SharedMeasurement dup;
    TEST_CHECK(room.host->share_measurement(make_input("m1", 1.0), dup) == Error::InvalidArgument);

    pump({&room.host, &room.guest});
    TEST_CHECK(room.guest.shared.size() == 1);
    TEST_CHECK(room.guest.shared[0].origin == events::Origin::Remote);
    TEST_CHECK(room.guest.shared[0].measurement == m);
    TEST_CHECK(room.guest.updated.size() == 1);
    TEST_CHECK(room.guest.updated[0].origin == events::Origin::Remote);
    TEST_CHECK(room.guest.updated[0].measurement == m);
    TEST_CHECK(room.guest->session()->measurements.size() == 1);

    // No echo back to the author
    TEST_CHECK(room.host.shared.size() == 1);
    TEST_CHECK(room.host.updated.empty());

    std::cout << "[TEST] OK\n";
}

void test_update_measurement() {
    std::cout << "[TEST] Group B2: updates bump the version everywhere\n";
    reset_environment();
    Room room;

    SharedMeasurement m;
    TEST_CHECK(room.host->share_measurement(make_input("m1", 2.5), m) == Error::None);
    pump({&room.host, &room.guest});

    MeasurementPatch patch;
    patch.distance = 3.0;
    patch.label = std::string("door");
    SharedMeasurement updated;
    TEST_CHECK(room.guest->update_measurement("m1", patch, updated) == Error::None);
    TEST_CHECK(updated.version == 2);
    TEST_CHECK(updated.distance == 3.0);
    TEST_CHECK(updated.author_id == "participant_host");
    TEST_CHECK(room.guest.updated.size() == 1);
    TEST_CHECK(room.guest.updated[0].origin == events::Origin::Local);

    TEST_CHECK(room.guest->update_measurement("missing", patch, updated) == Error::InvalidArgument);
    TEST_CHECK(room.guest->update_measurement("m1", MeasurementPatch{}, updated) == Error::InvalidArgument);

    pump({&room.host, &room.guest});
    TEST_CHECK(room.host.updated.size() == 1);
    TEST_CHECK(room.host.updated[0].origin == events::Origin::Remote);
    TEST_CHECK(room.host.updated[0].measurement.version == 2);
    TEST_CHECK(room.host->session()->measurements[0].label.value_or("") == "door");

    std::cout << "[TEST] OK\n";
}

void test_permissions() {
    std::cout << "[TEST] Group B3: editing permissions\n";
    {
        reset_environment();
        Settings readonly;
        readonly.allow_editing = false;
        Room room(readonly);

        SharedMeasurement m;
        Annotation a;
        TEST_CHECK(room.guest->share_measurement(make_input("g1", 1.0), m) == Error::PermissionDenied);
        TEST_CHECK(room.guest->add_annotation(AnnotationType::Arrow, Point3{}, "", AnnotationStylePatch{}, a) == Error::PermissionDenied);
        TEST_CHECK(room.guest.shared.empty());
        TEST_CHECK(room.guest.annotations.empty());

        // The host still edits, and chat stays open to everyone
        TEST_CHECK(room.host->share_measurement(make_input("h1", 1.0), m) == Error::None);
        TEST_CHECK(room.guest->send_chat("can I measure?") == Error::None);
        pump({&room.host, &room.guest});
        TEST_CHECK(room.guest.shared.size() == 1);
        TEST_CHECK(room.host.chats.size() == 1);
    }
    {
        reset_environment();
        Room room;

        SharedMeasurement m;
        TEST_CHECK(room.host->share_measurement(make_input("m1", 1.0), m) == Error::None);
        pump({&room.host, &room.guest});

        // Only the host may toggle the lock
        MeasurementPatch lock;
        lock.locked = true;
        TEST_CHECK(room.guest->update_measurement("m1", lock, m) == Error::PermissionDenied);
        TEST_CHECK(room.host->update_measurement("m1", lock, m) == Error::None);
        pump({&room.host, &room.guest});
        TEST_CHECK(room.guest->session()->measurements[0].locked);

        MeasurementPatch move;
        move.distance = 9.0;
        TEST_CHECK(room.guest->update_measurement("m1", move, m) == Error::PermissionDenied);
        TEST_CHECK(room.host->update_measurement("m1", move, m) == Error::None);
        TEST_CHECK(m.version == 3);
    }
    std::cout << "[TEST] OK\n";
}

void test_annotation_defaults() {
    std::cout << "[TEST] Group B4: annotation style defaults\n";
    reset_environment();
    Room room;

    const std::string color = room.guest->local_participant()->color;
    Annotation a;
    TEST_CHECK(room.guest->add_annotation(AnnotationType::Text, Point3{1, 2, 3}, "Look here", AnnotationStylePatch{}, a) == Error::None);
    TEST_CHECK(a.id.rfind("annotation_", 0) == 0);
    TEST_CHECK(a.author_id == "participant_guest");
    TEST_CHECK(a.style.color == color);
    TEST_CHECK(a.style.font_size == 14.0);
    TEST_CHECK(a.style.stroke_width == 2.0);

    AnnotationStylePatch bold;
    bold.font_size = 20.0;
    Annotation b;
    ClockUnderTest::advance(1ms);
    TEST_CHECK(room.guest->add_annotation(AnnotationType::Circle, Point3{}, "", bold, b) == Error::None);
    TEST_CHECK(b.style.font_size == 20.0);
    TEST_CHECK(b.style.color == color);

    // Text without content is refused
    Annotation c;
    TEST_CHECK(room.guest->add_annotation(AnnotationType::Text, Point3{}, "", AnnotationStylePatch{}, c) == Error::InvalidArgument);

    pump({&room.host, &room.guest});
    TEST_CHECK(room.host.annotations.size() == 2);
    TEST_CHECK(room.host.annotations[0].origin == events::Origin::Remote);
    TEST_CHECK(room.host.annotations[0].annotation == a);
    TEST_CHECK(room.host->session()->annotations.size() == 2);

    std::cout << "[TEST] OK\n";
}

void test_chat() {
    std::cout << "[TEST] Group B5: chat carries author name and colour\n";
    reset_environment();
    Room room;

    TEST_CHECK(room.guest->send_chat("") == Error::InvalidArgument);
    TEST_CHECK(room.guest->send_chat("hello") == Error::None);
    TEST_CHECK(room.guest.chats.size() == 1);
    TEST_CHECK(room.guest.chats[0].origin == events::Origin::Local);

    pump({&room.host, &room.guest});
    TEST_CHECK(room.host.chats.size() == 1);
    TEST_CHECK(room.host.chats[0].message == "hello");
    TEST_CHECK(room.host.chats[0].author == "Gabriel");
    TEST_CHECK(room.host.chats[0].color == room.guest->local_participant()->color);
    TEST_CHECK(room.host.chats[0].origin == events::Origin::Remote);

    std::cout << "[TEST] OK\n";
}

void test_cursor_throttle() {
    std::cout << "[TEST] Group B6: cursor throttling\n";
    reset_environment();
    Room room;
    WebSocketUnderTest::clear_sent();

    // Ten moves inside 50ms: one broadcast
    for (int i = 0; i < 10; ++i) {
        TEST_CHECK(room.guest->update_cursor(i, 0, 0) == Error::None);
        ClockUnderTest::advance(5ms);
    }
    TEST_CHECK(count_sent("\"type\":\"cursor\"") == 1);

    ClockUnderTest::advance(49ms);
    TEST_CHECK(room.guest->update_cursor(42, 0, 0) == Error::None);
    TEST_CHECK(count_sent("\"type\":\"cursor\"") == 1);

    ClockUnderTest::advance(1ms);
    TEST_CHECK(room.guest->update_cursor(43, 1, 2) == Error::None);
    TEST_CHECK(count_sent("\"type\":\"cursor\"") == 2);

    pump({&room.host, &room.guest});
    TEST_CHECK(room.host.cursors.size() == 2);
    TEST_CHECK(room.host.cursors[0].cursor.participant_id == "participant_guest");
    TEST_CHECK(room.host.cursors[0].cursor.x == 0.0);
    TEST_CHECK(room.host.cursors[1].cursor.x == 43.0);
    TEST_CHECK(room.host->session()->cursors.at("participant_guest").z == 2.0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_share_measurement();
    test_update_measurement();
    test_permissions();
    test_annotation_defaults();
    test_chat();
    test_cursor_throttle();

    std::cout << "\n[GROUP B - ENGINE CONTENT TESTS PASSED]\n";
    return 0;
}
