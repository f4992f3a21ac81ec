#include "roomsync/core/model/participant.hpp"

#include <ostream>


namespace roomsync::core {

bool Participant::is_host() const noexcept {
    return role == Role::Host;
}

bool Participant::can_edit() const noexcept {
    return role == Role::Host || role == Role::Editor;
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Participant& p) {
    os << "[Participant] {"
       << "id=" << p.id
       << ", name=" << p.name
       << ", role=" << to_string(p.role)
       << ", color=" << p.color
       << ", active=" << (p.is_active ? "yes" : "no")
       << "}";
    return os;
}

} // namespace roomsync::core
