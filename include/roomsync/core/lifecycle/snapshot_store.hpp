#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "roomsync/core/error.hpp"
#include "roomsync/core/model/session.hpp"
#include "roomsync/core/protocol/codec/decoder.hpp"


namespace roomsync::core::lifecycle {

/*
===============================================================================
 SnapshotStore
===============================================================================

Local persistence of the active session, one file per session id:

    <dir>/<session_id>.rss

File layout (all integers little-endian):

    offset  size  field
    ------  ----  ---------------------------------------------
       0     4    magic "RSS1"
       4     2    format version (1)
       6     2    reserved (0)
       8     4    raw size (bytes of session JSON)
      12     4    compressed size
      16     8    XXH64 of the raw JSON (seed 0)
      24     …    LZ4 block-compressed session JSON

Writes go to a temporary file that is renamed into place. On load, a file
failing any header, decompression or checksum check is deleted, as is any
session whose expiry has passed. An empty directory path disables the store.
===============================================================================
*/
class SnapshotStore {
public:
    static constexpr char MAGIC[4] = {'R', 'S', 'S', '1'};
    static constexpr std::uint16_t FORMAT_VERSION = 1;
    static constexpr std::size_t HEADER_SIZE = 24;
    static constexpr const char* EXTENSION = ".rss";

    explicit SnapshotStore(std::string dir);

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    [[nodiscard]]
    inline bool enabled() const noexcept {
        return !dir_.empty();
    }

    [[nodiscard]]
    Error save(const Session& session);

    // Valid, unexpired snapshots, most recently updated first
    [[nodiscard]]
    Error load_all(std::uint64_t now_ms, std::vector<Session>& out);

    [[nodiscard]]
    Error remove(const std::string& session_id);

    [[nodiscard]]
    std::string path_for(const std::string& session_id) const;

private:
    std::string dir_;
    protocol::codec::Decoder decoder_;

    [[nodiscard]]
    bool read_file_(const std::string& path, Session& out);
};

} // namespace roomsync::core::lifecycle
