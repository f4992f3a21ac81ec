#include "roomsync/core/model/session.hpp"

#include <algorithm>
#include <ostream>


namespace roomsync::core {

std::uint64_t Session::expires_at() const noexcept {
    return created_at + static_cast<std::uint64_t>(settings.expires_in) * 60'000ULL;
}

bool Session::is_expired(std::uint64_t now_ms) const noexcept {
    return now_ms >= expires_at();
}

const Participant* Session::find_participant(const std::string& participant_id) const noexcept {
    auto it = std::find_if(participants.begin(), participants.end(),
        [&](const Participant& p) { return p.id == participant_id; });
    return (it == participants.end()) ? nullptr : &*it;
}

std::size_t Session::active_participants() const noexcept {
    return static_cast<std::size_t>(std::count_if(participants.begin(), participants.end(),
        [](const Participant& p) { return p.is_active; }));
}

std::ostream& operator<<(std::ostream& os, const Session& s) {
    os << "[Session] {"
       << "id=" << s.id
       << ", room=" << s.room_code
       << ", host=" << s.host_id
       << ", participants=" << s.active_participants() << "/" << s.participants.size()
       << ", measurements=" << s.measurements.size()
       << ", annotations=" << s.annotations.size()
       << ", cursors=" << s.cursors.size()
       << "}";
    return os;
}

} // namespace roomsync::core
