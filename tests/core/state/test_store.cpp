/*
===============================================================================
 state::Store - Group S Unit Tests
===============================================================================

S1. install() enforces a single host and unique participant ids
S2. add_participant() reactivates returning participants and demotes a second host
S3. deactivate_participant() keeps the roster entry and drops the cursor
S4. share_measurement() starts at version 1 and rejects duplicate ids
S5. update_measurement() bumps version by one and is atomic on rejection
S6. locked measurements and lock changes are host-only
S7. viewers and allow_editing=false restrict editing
S8. apply_measurement() outcomes: Inserted, Overwritten, Stale, Duplicate, Rejected
S9. annotations: validation, duplicates, inbound overwrite
S10. replace_content() overwrites shared content and keeps updated_at monotonic
S11. a participant reactivated after leaving keeps its colour
===============================================================================
*/

#include <iostream>
#include <string>

#include "roomsync/core/state/store.hpp"
#include "common/test_check.hpp"

using namespace roomsync::core;
using namespace roomsync::core::state;


static Participant make_participant(const std::string& user, Role role) {
    Participant p;
    p.id = "participant_" + user;
    p.user_id = user;
    p.name = user;
    p.role = role;
    p.color = "#45B7D1";
    return p;
}

static Session make_session(Settings settings = Settings{}) {
    Session s;
    s.id = "session_1_1";
    s.room_code = "ABC123";
    s.host_id = "participant_host";
    s.participants.push_back(make_participant("host", Role::Host));
    s.created_at = 1000;
    s.updated_at = 1000;
    s.settings = settings;
    return s;
}

static MeasurementInput make_input(const std::string& id) {
    MeasurementInput in;
    in.id = id;
    in.points = {Point3{0, 0, 0}, Point3{1, 0, 0}};
    in.distance = 1.0;
    in.unit = "m";
    return in;
}

// -----------------------------------------------------------------------------
void test_install_invariants() {
    std::cout << "[TEST] Group S1: install() roster invariants\n";
    Store store;
    TEST_CHECK(!store.has_session());

    Session two_hosts = make_session();
    two_hosts.participants.push_back(make_participant("other", Role::Host));
    TEST_CHECK(store.install(two_hosts) == Error::InvalidArgument);
    TEST_CHECK(!store.has_session());

    Session dup = make_session();
    dup.participants.push_back(make_participant("host", Role::Editor));
    TEST_CHECK(store.install(dup) == Error::InvalidArgument);

    Session backwards = make_session();
    backwards.updated_at = 10;
    TEST_CHECK(store.install(backwards) == Error::None);
    TEST_CHECK(store.session().updated_at == store.session().created_at);

    store.clear();
    TEST_CHECK(!store.has_session());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_add_participant() {
    std::cout << "[TEST] Group S2: add / reactivate / host demotion\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);

    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 2000) == Error::None);
    TEST_CHECK(store.active_participants() == 2);
    TEST_CHECK(store.role_of("participant_bob") == Role::Editor);

    // A second host claim is demoted
    TEST_CHECK(store.add_participant(make_participant("eve", Role::Host), 2100) == Error::None);
    TEST_CHECK(store.role_of("participant_eve") == Role::Editor);
    TEST_CHECK(store.session().host_id == "participant_host");

    // Returning participant: no duplicate entry
    TEST_CHECK(store.deactivate_participant("participant_bob", 2200));
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 2300) == Error::None);
    TEST_CHECK(store.session().participants.size() == 3);
    TEST_CHECK(store.session().find_participant("participant_bob")->is_active);
    TEST_CHECK(store.session().updated_at == 2300);

    TEST_CHECK(store.role_of("participant_nobody") == Role::Unknown);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_deactivate() {
    std::cout << "[TEST] Group S3: deactivate keeps roster entry\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 2000) == Error::None);
    store.set_cursor(CursorPosition{"participant_bob", 1, 2, 3, 2000});
    TEST_CHECK(store.session().cursors.count("participant_bob") == 1);

    TEST_CHECK(store.deactivate_participant("participant_bob", 3000));
    TEST_CHECK(!store.deactivate_participant("participant_bob", 3001));
    TEST_CHECK(!store.deactivate_participant("participant_ghost", 3002));

    const Participant* bob = store.session().find_participant("participant_bob");
    TEST_CHECK(bob != nullptr);
    TEST_CHECK(!bob->is_active);
    TEST_CHECK(store.session().cursors.count("participant_bob") == 0);
    TEST_CHECK(store.active_participants() == 1);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_share_measurement() {
    std::cout << "[TEST] Group S4: share_measurement\n";
    Store store;
    SharedMeasurement out;
    TEST_CHECK(store.share_measurement("participant_host", make_input("m1"), 1, out) == Error::NoActiveSession);

    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.share_measurement("participant_host", make_input("m1"), 1500, out) == Error::None);
    TEST_CHECK(out.version == 1);
    TEST_CHECK(!out.locked);
    TEST_CHECK(out.author_id == "participant_host");
    TEST_CHECK(out.timestamp == 1500);
    TEST_CHECK(store.find_measurement("m1") != nullptr);

    TEST_CHECK(store.share_measurement("participant_host", make_input("m1"), 1600, out) == Error::InvalidArgument);
    TEST_CHECK(store.share_measurement("participant_host", make_input(""), 1600, out) == Error::InvalidArgument);
    TEST_CHECK(store.session().measurements.size() == 1);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_update_measurement() {
    std::cout << "[TEST] Group S5: update_measurement version and atomicity\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 1100) == Error::None);
    SharedMeasurement out;
    TEST_CHECK(store.share_measurement("participant_host", make_input("m1"), 1200, out) == Error::None);

    MeasurementPatch patch;
    patch.distance = 2.5;
    patch.label = std::string("door");
    TEST_CHECK(store.update_measurement("participant_bob", "m1", patch, 1300, out) == Error::None);
    TEST_CHECK(out.version == 2);
    TEST_CHECK(out.distance == 2.5);
    TEST_CHECK(out.label.value() == "door");
    TEST_CHECK(out.unit == "m");
    TEST_CHECK(*store.find_measurement("m1") == out);

    TEST_CHECK(store.update_measurement("participant_bob", "missing", patch, 1400, out) == Error::InvalidArgument);
    TEST_CHECK(store.update_measurement("participant_bob", "m1", MeasurementPatch{}, 1400, out) == Error::InvalidArgument);

    // Rejected patch leaves the measurement untouched
    MeasurementPatch lock_and_move;
    lock_and_move.locked = true;
    lock_and_move.distance = 99.0;
    TEST_CHECK(store.update_measurement("participant_bob", "m1", lock_and_move, 1500, out) == Error::PermissionDenied);
    TEST_CHECK(store.find_measurement("m1")->distance == 2.5);
    TEST_CHECK(store.find_measurement("m1")->version == 2);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_locking() {
    std::cout << "[TEST] Group S6: locked measurements are host-only\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 1100) == Error::None);
    SharedMeasurement out;
    TEST_CHECK(store.share_measurement("participant_bob", make_input("m1"), 1200, out) == Error::None);

    MeasurementPatch lock;
    lock.locked = true;
    TEST_CHECK(store.update_measurement("participant_host", "m1", lock, 1300, out) == Error::None);
    TEST_CHECK(out.locked);
    TEST_CHECK(out.version == 2);

    MeasurementPatch move;
    move.distance = 7.0;
    TEST_CHECK(store.update_measurement("participant_bob", "m1", move, 1400, out) == Error::PermissionDenied);
    TEST_CHECK(store.update_measurement("participant_host", "m1", move, 1400, out) == Error::None);
    TEST_CHECK(out.version == 3);

    // Inbound newer version of a locked measurement from a non-host
    SharedMeasurement remote = *store.find_measurement("m1");
    remote.version = 10;
    remote.distance = 1.0;
    TEST_CHECK(store.apply_measurement("participant_bob", remote, 1500) == Apply::Rejected);
    TEST_CHECK(store.apply_measurement("participant_host", remote, 1500) == Apply::Overwritten);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_edit_permissions() {
    std::cout << "[TEST] Group S7: viewer and allow_editing\n";
    Settings restricted;
    restricted.allow_editing = false;
    Store store;
    TEST_CHECK(store.install(make_session(restricted)) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 1100) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("vic", Role::Viewer), 1100) == Error::None);

    TEST_CHECK(store.can_edit("participant_host"));
    TEST_CHECK(!store.can_edit("participant_bob"));
    TEST_CHECK(!store.can_edit("participant_vic"));

    SharedMeasurement out;
    TEST_CHECK(store.share_measurement("participant_bob", make_input("m1"), 1200, out) == Error::PermissionDenied);
    TEST_CHECK(store.session().measurements.empty());

    Store open;
    TEST_CHECK(open.install(make_session()) == Error::None);
    TEST_CHECK(open.add_participant(make_participant("vic", Role::Viewer), 1100) == Error::None);
    TEST_CHECK(!open.can_edit("participant_vic"));
    TEST_CHECK(open.can_edit("participant_stranger"));
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_apply_measurement() {
    std::cout << "[TEST] Group S8: apply_measurement outcomes\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("vic", Role::Viewer), 1100) == Error::None);

    SharedMeasurement m;
    m.id = "m1";
    m.author_id = "participant_bob";
    m.unit = "m";
    m.distance = 1.0;
    m.version = 2;
    m.timestamp = 1200;

    TEST_CHECK(store.apply_measurement("participant_bob", m, 1200) == Apply::Inserted);
    TEST_CHECK(store.apply_measurement("participant_bob", m, 1201) == Apply::Duplicate);

    SharedMeasurement older = m;
    older.version = 1;
    older.distance = 5.0;
    TEST_CHECK(store.apply_measurement("participant_bob", older, 1202) == Apply::Stale);
    TEST_CHECK(store.find_measurement("m1")->distance == 1.0);

    SharedMeasurement newer = m;
    newer.version = 3;
    newer.distance = 3.0;
    TEST_CHECK(store.apply_measurement("participant_bob", newer, 1203) == Apply::Overwritten);
    TEST_CHECK(store.find_measurement("m1")->version == 3);

    SharedMeasurement from_viewer = m;
    from_viewer.version = 9;
    TEST_CHECK(store.apply_measurement("participant_vic", from_viewer, 1204) == Apply::Rejected);
    TEST_CHECK(store.find_measurement("m1")->version == 3);

    SharedMeasurement rebased;
    TEST_CHECK(!store.rebase_measurement("m1", 3, 1300, rebased));
    TEST_CHECK(store.rebase_measurement("m1", 7, 1300, rebased));
    TEST_CHECK(rebased.version == 7);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_annotations() {
    std::cout << "[TEST] Group S9: annotations\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);

    Annotation a;
    a.id = "annotation_1";
    a.type = AnnotationType::Text;
    a.content = "";
    TEST_CHECK(store.add_annotation("participant_host", a, 1100) == Error::InvalidArgument);
    a.content = "Check this";
    TEST_CHECK(store.add_annotation("participant_host", a, 1100) == Error::None);
    TEST_CHECK(store.session().annotations.front().author_id == "participant_host");
    TEST_CHECK(store.add_annotation("participant_host", a, 1101) == Error::InvalidArgument);

    Annotation arrow;
    arrow.id = "annotation_2";
    arrow.type = AnnotationType::Arrow;
    TEST_CHECK(store.add_annotation("participant_host", arrow, 1102) == Error::None);

    Annotation remote = store.session().annotations.front();
    TEST_CHECK(store.apply_annotation("participant_bob", remote, 1200) == Apply::Duplicate);
    remote.content = "Edited";
    TEST_CHECK(store.apply_annotation("participant_bob", remote, 1201) == Apply::Overwritten);
    remote.id = "annotation_3";
    TEST_CHECK(store.apply_annotation("participant_bob", remote, 1202) == Apply::Inserted);
    TEST_CHECK(store.session().annotations.size() == 3);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_replace_content() {
    std::cout << "[TEST] Group S10: replace_content\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    SharedMeasurement out;
    TEST_CHECK(store.share_measurement("participant_host", make_input("old"), 5000, out) == Error::None);

    SharedMeasurement incoming;
    incoming.id = "new";
    incoming.author_id = "participant_bob";
    incoming.unit = "ft";
    store.replace_content({incoming}, {}, 4000);

    TEST_CHECK(store.session().measurements.size() == 1);
    TEST_CHECK(store.find_measurement("old") == nullptr);
    TEST_CHECK(store.find_measurement("new") != nullptr);
    TEST_CHECK(store.session().annotations.empty());
    TEST_CHECK(store.session().updated_at == 5000);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
void test_rejoin_keeps_color() {
    std::cout << "[TEST] Group S11: rejoin keeps colour\n";
    Store store;
    TEST_CHECK(store.install(make_session()) == Error::None);
    TEST_CHECK(store.add_participant(make_participant("bob", Role::Editor), 2000) == Error::None);
    TEST_CHECK(store.deactivate_participant("participant_bob", 2100));

    Participant again = make_participant("bob", Role::Editor);
    again.color = "#FD79A8";
    TEST_CHECK(store.add_participant(again, 2200) == Error::None);
    const Participant* bob = store.session().find_participant("participant_bob");
    TEST_CHECK(bob->is_active);
    TEST_CHECK(bob->color == "#45B7D1");
    TEST_CHECK(store.session().participants.size() == 2);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_install_invariants();
    test_add_participant();
    test_deactivate();
    test_share_measurement();
    test_update_measurement();
    test_locking();
    test_edit_permissions();
    test_apply_measurement();
    test_annotations();
    test_replace_content();
    test_rejoin_keeps_color();

    std::cout << "\n[GROUP S - STORE TESTS PASSED]\n";
    return 0;
}
