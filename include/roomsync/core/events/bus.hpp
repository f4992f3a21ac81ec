#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <tuple>
#include <type_traits>
#include <vector>
#include <algorithm>

#include "roomsync/core/events/events.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::events {

using SubscriptionId = std::uint64_t;

/*
================================================================================
 Bus<Events...>
================================================================================

Typed dispatch table: one handler list per event type, resolved at compile time.

  • subscribe<E>(cb) returns an id unique across all event types
  • unsubscribe(id) removes that handler wherever it lives
  • publish(ev) invokes every handler registered for decltype(ev), in
    subscription order

Handler isolation:
  Each invocation is wrapped on its own. A handler that throws is logged (with
  what() when available) and delivery continues with the next handler.

Re-entrancy:
  publish() iterates a snapshot of the handler list, so handlers may subscribe
  or unsubscribe while an event is being delivered. Changes take effect on the
  next publish().
================================================================================
*/
template<class... Events>
class Bus {
public:
    template<class E>
    using Handler = std::function<void(const E&)>;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    template<class E>
    inline SubscriptionId subscribe(Handler<E> cb) {
        static_assert(contains_<E>(), "Event type not handled by this bus");
        const SubscriptionId id = next_id_++;
        table_<E>().push_back(Entry<E>{
            .id       = id,
            .callback = std::move(cb)
        });
        return id;
    }

    // Returns false for unknown ids
    inline bool unsubscribe(SubscriptionId id) {
        bool removed = false;
        std::apply([&](auto&... tables) {
            ((removed = remove_(tables, id) || removed), ...);
        }, tables_);
        return removed;
    }

    inline void clear() noexcept {
        std::apply([](auto&... tables) { (tables.clear(), ...); }, tables_);
    }

    // -------------------------------------------------------------------------
    // Dispatch
    // -------------------------------------------------------------------------

    // Returns the number of handlers that completed without throwing
    template<class E>
    inline std::size_t publish(const E& ev) const {
        static_assert(contains_<E>(), "Event type not handled by this bus");
        const auto snapshot = table_<E>();
        std::size_t delivered = 0;
        for (const Entry<E>& e : snapshot) {
            try {
                e.callback(ev);
                ++delivered;
            }
            catch (const std::exception& ex) {
                RS_ERROR("[BUS] Handler #" << e.id << " for '" << E::name << "' threw: " << ex.what());
            }
            catch (...) {
                RS_ERROR("[BUS] Handler #" << e.id << " for '" << E::name << "' threw an unknown exception");
            }
        }
        return delivered;
    }

    template<class E>
    [[nodiscard]]
    inline std::size_t subscribers() const noexcept {
        return table_<E>().size();
    }

private:
    template<class E>
    struct Entry {
        SubscriptionId id;
        Handler<E> callback;
    };

    std::tuple<std::vector<Entry<Events>>...> tables_;
    SubscriptionId next_id_{1};

private:
    template<class E>
    static constexpr bool contains_() noexcept {
        return (std::is_same_v<E, Events> || ...);
    }

    template<class E>
    inline std::vector<Entry<E>>& table_() noexcept {
        return std::get<std::vector<Entry<E>>>(tables_);
    }

    template<class E>
    inline const std::vector<Entry<E>>& table_() const noexcept {
        return std::get<std::vector<Entry<E>>>(tables_);
    }

    template<class Table>
    static inline bool remove_(Table& table, SubscriptionId id) {
        auto it = std::remove_if(table.begin(), table.end(), [id](const auto& e) { return e.id == id; });
        if (it == table.end()) {
            return false;
        }
        table.erase(it, table.end());
        return true;
    }
};


// The engine's event surface
using EventBus = Bus<
    ParticipantJoined,
    ParticipantLeft,
    MeasurementShared,
    MeasurementUpdated,
    AnnotationUpdated,
    CursorUpdated,
    ChatMessage,
    SessionSynced,
    ConnectionLost,
    Notification
>;

} // namespace roomsync::core::events
