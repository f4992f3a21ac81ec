#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "roomsync.hpp"
#include "common/cli/params.hpp"

using namespace roomsync;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    lcr::log::Logger::instance().enable_color(true);

    const auto params = examples::cli::configure(argc, argv, "RoomSync two-participant session example");
    params.dump("=== RoomSync CLI Parameters ===", std::cout);

    core::lifecycle::directory::Registry directory;

    Client host(client_config{
        .endpoint     = params.url,
        .user_id      = "host",
        .display_name = params.host_name,
        .snapshot_dir = params.snapshot_dir
    }, directory);

    Client guest(client_config{
        .endpoint     = params.url,
        .user_id      = "guest",
        .display_name = params.guest_name
    }, directory);

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------
    host.on_participant_joined([](const core::events::ParticipantJoined& ev) {
        std::cout << " -> [host] joined: " << ev.participant << std::endl;
    });
    host.on_chat_message([](const core::events::ChatMessage& ev) {
        std::cout << " -> [host] chat from " << ev.author << ": " << ev.message << std::endl;
    });
    host.on_connection_lost([](const core::events::ConnectionLost& ev) {
        std::cout << " -> [host] connection lost after " << ev.attempts << " attempt(s)" << std::endl;
    });
    guest.on_measurement_shared([](const core::events::MeasurementShared& ev) {
        std::cout << " -> [guest] measurement: " << ev.measurement << std::endl;
    });
    guest.on_session_synced([](const core::events::SessionSynced& ev) {
        std::cout << " -> [guest] synced " << ev.measurements << " measurement(s), "
                  << ev.annotations << " annotation(s)" << std::endl;
    });
    guest.on_notification([](const core::events::Notification& ev) {
        std::cout << " -> [guest] " << ev.title << ": " << ev.body << std::endl;
    });

    if (host.connect() != core::Error::None || guest.connect() != core::Error::None) {
        std::cerr << "Invalid relay URL: " << params.url << std::endl;
        return -1;
    }

    // -------------------------------------------------------------------------
    // Session
    // -------------------------------------------------------------------------
    core::Settings settings;
    settings.max_participants = static_cast<std::uint32_t>(params.max_participants);

    core::Session created;
    if (auto err = host.create_session(settings, created); err != core::Error::None) {
        std::cerr << "create_session failed: " << core::to_string(err) << std::endl;
        return -1;
    }
    std::cout << "[roomsync] Room code: " << created.room_code << std::endl;

    core::Session joined;
    if (auto err = guest.join_session(created.room_code, joined); err != core::Error::None) {
        std::cerr << "join_session failed: " << core::to_string(err) << std::endl;
        return -1;
    }

    core::SharedMeasurement shared;
    core::MeasurementInput input;
    input.id = "m-1";
    input.points = {core::Point3{0.0, 0.0, 0.0}, core::Point3{3.0, 4.0, 0.0}};
    input.distance = 5.0;
    input.unit = "m";
    input.label = std::string("diagonal");
    if (auto err = host.share_measurement(input, shared); err != core::Error::None) {
        std::cerr << "share_measurement failed: " << core::to_string(err) << std::endl;
    }
    if (auto err = guest.send_chat("hello from " + params.guest_name); err != core::Error::None) {
        std::cerr << "send_chat failed: " << core::to_string(err) << std::endl;
    }

    // -------------------------------------------------------------------------
    // Main loop
    // -------------------------------------------------------------------------
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.duration_sec);
    double t = 0.0;
    while (running.load() && std::chrono::steady_clock::now() < deadline) {
        host.poll();
        guest.poll();
        t += 0.01;
        (void)guest.update_cursor(t, t * 0.5, 0.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    (void)guest.leave_session();
    (void)host.leave_session();
    host.poll();
    guest.poll();

    std::cout << "\n[roomsync] Done" << std::endl;
    return 0;
}
