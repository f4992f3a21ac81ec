#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "roomsync/core/state/store.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::state {

/*
===============================================================================
 roomsync::core::state::ConflictResolver
===============================================================================

Gate between inbound measurement updates and the Store.

    admit()   → forwards the update to Store::apply_measurement(). A Stale
                outcome (incoming version <= local, different content) keeps the
                local copy and queues the incoming value per measurement id.

    resolve() → for every id with a non-empty queue:
                    new_version = max(local.version, max(queued versions)) + 1
                the local copy is rebased to new_version and returned so the
                caller re-broadcasts it. Queues are emptied.

The local value always wins a conflict. The rebroadcast at a version above every
value seen lets peers holding the losing value converge on the next round.
Queued ids whose measurement disappeared (sync replaced the content) are
dropped without output.
===============================================================================
*/
class ConflictResolver {
public:
    [[nodiscard]]
    inline Apply admit(Store& store, const std::string& sender_id, const SharedMeasurement& incoming, std::uint64_t now_ms) {
        const Apply outcome = store.apply_measurement(sender_id, incoming, now_ms);
        if (outcome == Apply::Stale) {
            RS_DEBUG("[RESOLVER] Queued conflicting '" << incoming.id << "' v" << incoming.version << " from '" << sender_id << "'");
            queues_[incoming.id].push_back(incoming);
            ++pending_;
        }
        return outcome;
    }

    // Appends every rebased measurement to out. Returns the number appended.
    inline std::size_t resolve(Store& store, std::uint64_t now_ms, std::vector<SharedMeasurement>& out) {
        std::size_t resolved = 0;
        for (auto& [id, queued] : queues_) {
            const SharedMeasurement* local = store.find_measurement(id);
            if (!local) {
                RS_DEBUG("[RESOLVER] Dropping " << queued.size() << " queued update(s) for vanished '" << id << "'");
                continue;
            }
            std::uint64_t top = local->version;
            for (const auto& q : queued) {
                top = std::max(top, q.version);
            }
            SharedMeasurement rebased;
            if (store.rebase_measurement(id, top + 1, now_ms, rebased)) {
                RS_INFO("[RESOLVER] Resolved '" << id << "' over " << queued.size() << " conflicting update(s) at v" << rebased.version);
                out.push_back(std::move(rebased));
                ++resolved;
            }
        }
        clear();
        return resolved;
    }

    // Number of queued conflicting updates
    [[nodiscard]]
    inline std::size_t pending() const noexcept {
        return pending_;
    }

    inline void clear() noexcept {
        queues_.clear();
        pending_ = 0;
    }

private:
    std::map<std::string, std::vector<SharedMeasurement>> queues_;   // ordered for deterministic output
    std::size_t pending_{0};
};

} // namespace roomsync::core::state
