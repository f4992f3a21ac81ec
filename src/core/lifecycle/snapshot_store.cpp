#include "roomsync/core/lifecycle/snapshot_store.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <lz4.h>
#include <xxhash.h>

#include "roomsync/core/protocol/codec/encoder.hpp"
#include "lcr/endian.hpp"
#include "lcr/log/logger.hpp"


namespace roomsync::core::lifecycle {

namespace fs = std::filesystem;

namespace {

// Session ids come off the wire, only plain file name characters are accepted
[[nodiscard]]
bool is_safe_file_stem(const std::string& id) noexcept {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace


SnapshotStore::SnapshotStore(std::string dir)
    : dir_(std::move(dir))
{
}

std::string SnapshotStore::path_for(const std::string& session_id) const {
    return (fs::path(dir_) / (session_id + EXTENSION)).string();
}

Error SnapshotStore::save(const Session& session) {
    if (!enabled()) {
        return Error::None;
    }
    if (!is_safe_file_stem(session.id)) {
        RS_ERROR("[SNAPSHOT] Refusing to persist session with id '" << session.id << "'");
        return Error::StorageFailure;
    }
    const std::string raw = protocol::codec::encode_session(session);
    if (raw.size() > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE)) {
        RS_ERROR("[SNAPSHOT] Session " << session.id << " too large to persist (" << raw.size() << " bytes)");
        return Error::StorageFailure;
    }

    // Allocate worst-case compressed size
    const int max_dst_size = LZ4_compressBound(static_cast<int>(raw.size()));
    std::string compressed(static_cast<std::size_t>(max_dst_size), '\0');
    const int compressed_size = LZ4_compress_default(
        raw.data(),
        compressed.data(),
        static_cast<int>(raw.size()),
        max_dst_size
    );
    if (compressed_size <= 0) {
        RS_ERROR("[SNAPSHOT] LZ4 compression failed for session " << session.id);
        return Error::StorageFailure;
    }
    compressed.resize(static_cast<std::size_t>(compressed_size));

    std::string header;
    header.reserve(HEADER_SIZE);
    header.append(MAGIC, sizeof(MAGIC));
    lcr::append_le<std::uint16_t>(header, FORMAT_VERSION);
    lcr::append_le<std::uint16_t>(header, 0);
    lcr::append_le<std::uint32_t>(header, static_cast<std::uint32_t>(raw.size()));
    lcr::append_le<std::uint32_t>(header, static_cast<std::uint32_t>(compressed.size()));
    lcr::append_le<std::uint64_t>(header, XXH64(raw.data(), raw.size(), 0));

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        RS_ERROR("[SNAPSHOT] Cannot create directory '" << dir_ << "': " << ec.message());
        return Error::StorageFailure;
    }
    const std::string path = path_for(session.id);
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        out.write(header.data(), static_cast<std::streamsize>(header.size()));
        out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
        // Explicitly close to catch flush/close errors
        out.close();
        if (!out) {
            RS_ERROR("[SNAPSHOT] Write failed: " << tmp_path);
            fs::remove(tmp_path, ec);
            return Error::StorageFailure;
        }
    }
    fs::rename(tmp_path, path, ec);
    if (ec) {
        RS_ERROR("[SNAPSHOT] Rename to '" << path << "' failed: " << ec.message());
        fs::remove(tmp_path, ec);
        return Error::StorageFailure;
    }
    RS_DEBUG("[SNAPSHOT] Saved " << session.id << " (" << raw.size() << " -> " << compressed.size() << " bytes)");
    return Error::None;
}

Error SnapshotStore::load_all(std::uint64_t now_ms, std::vector<Session>& out) {
    out.clear();
    if (!enabled()) {
        return Error::None;
    }
    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        return ec ? Error::StorageFailure : Error::None;
    }
    std::vector<std::string> discard;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().extension() != EXTENSION) {
            continue;
        }
        const std::string path = it->path().string();
        Session s;
        if (!read_file_(path, s)) {
            RS_WARN("[SNAPSHOT] Discarding corrupt snapshot " << path);
            discard.push_back(path);
            continue;
        }
        if (s.is_expired(now_ms)) {
            RS_INFO("[SNAPSHOT] Discarding expired session " << s.id);
            discard.push_back(path);
            continue;
        }
        out.push_back(std::move(s));
    }
    if (ec) {
        RS_ERROR("[SNAPSHOT] Cannot list '" << dir_ << "': " << ec.message());
        return Error::StorageFailure;
    }
    for (const auto& path : discard) {
        std::error_code rm_ec;
        fs::remove(path, rm_ec);
        if (rm_ec) {
            RS_WARN("[SNAPSHOT] Cannot remove " << path << ": " << rm_ec.message());
        }
    }
    std::sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
        return a.updated_at > b.updated_at;
    });
    return Error::None;
}

Error SnapshotStore::remove(const std::string& session_id) {
    if (!enabled() || !is_safe_file_stem(session_id)) {
        return Error::None;
    }
    std::error_code ec;
    fs::remove(path_for(session_id), ec);
    if (ec) {
        RS_ERROR("[SNAPSHOT] Cannot remove snapshot of " << session_id << ": " << ec.message());
        return Error::StorageFailure;
    }
    return Error::None;
}

bool SnapshotStore::read_file_(const std::string& path, Session& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() < HEADER_SIZE || std::memcmp(bytes.data(), MAGIC, sizeof(MAGIC)) != 0) {
        RS_TRACE("[SNAPSHOT] Invalid magic in " << path);
        return false;
    }
    const char* h = bytes.data();
    const auto version         = lcr::read_le<std::uint16_t>(h + 4);
    const auto raw_size        = lcr::read_le<std::uint32_t>(h + 8);
    const auto compressed_size = lcr::read_le<std::uint32_t>(h + 12);
    const auto checksum        = lcr::read_le<std::uint64_t>(h + 16);
    if (version != FORMAT_VERSION) {
        RS_TRACE("[SNAPSHOT] Unsupported format version " << version << " in " << path);
        return false;
    }
    if (bytes.size() - HEADER_SIZE != compressed_size || raw_size > static_cast<std::uint32_t>(LZ4_MAX_INPUT_SIZE)) {
        RS_TRACE("[SNAPSHOT] Size mismatch in " << path);
        return false;
    }
    std::string raw(raw_size, '\0');
    const int n = LZ4_decompress_safe(
        h + HEADER_SIZE,
        raw.data(),
        static_cast<int>(compressed_size),
        static_cast<int>(raw_size)
    );
    if (n < 0 || static_cast<std::uint32_t>(n) != raw_size) {
        RS_TRACE("[SNAPSHOT] LZ4 decompression failed for " << path);
        return false;
    }
    if (XXH64(raw.data(), raw.size(), 0) != checksum) {
        RS_TRACE("[SNAPSHOT] Checksum mismatch in " << path);
        return false;
    }
    return decoder_.decode_session(raw, out) == protocol::codec::Result::Parsed;
}

} // namespace roomsync::core::lifecycle
