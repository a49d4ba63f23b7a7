#include "hash_store.hpp"
#include "transfer_error.hpp"
#include "bencode.hpp"
#include "bdecode.hpp"

#include <algorithm>
#include <iterator>
#include <fstream>
#include <sstream>

namespace shoal {

bool hash_store::lookup(const file_id& file, const int64_t offset,
    const int64_t length, sha256_hash& digest) const
{
    std::lock_guard<std::mutex> l(digests_mutex_);
    auto it = digests_.find(key{file.key(), offset, length});
    if(it == digests_.end()) {
        return false;
    }
    digest = it->second;
    return true;
}

std::error_code hash_store::record(const file_id& file, const int64_t offset,
    const int64_t length, const sha256_hash& digest)
{
    std::lock_guard<std::mutex> l(digests_mutex_);
    auto r = digests_.emplace(key{file.key(), offset, length}, digest);
    if(!r.second && (r.first->second != digest)) {
        return transfer_errc::verification_mismatch;
    }
    return {};
}

int hash_store::size() const
{
    std::lock_guard<std::mutex> l(digests_mutex_);
    return digests_.size();
}

void hash_store::clear()
{
    std::lock_guard<std::mutex> l(digests_mutex_);
    digests_.clear();
}

void hash_store::save(const path& path, std::error_code& error) const
{
    error.clear();
    // the snapshot is a list of [file key, offset, length, digest] entries
    blist_encoder entries;
    {
        std::lock_guard<std::mutex> l(digests_mutex_);
        for(const auto& e : digests_) {
            blist_encoder entry;
            entry.push_back(e.first.file);
            entry.push_back(e.first.offset);
            entry.push_back(e.first.length);
            entry.push_back(std::string_view(
                reinterpret_cast<const char*>(e.second.data()), e.second.size()));
            entries.push_back(entry);
        }
    }
    bmap_encoder snapshot;
    snapshot["version"] = 1;
    snapshot["digests"] = entries;

    const auto tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if(!file) {
            error = std::make_error_code(std::errc::io_error);
            return;
        }
        const auto encoded = snapshot.encode();
        file.write(encoded.data(), encoded.size());
        if(!file) {
            error = std::make_error_code(std::errc::io_error);
            return;
        }
    }
    fs::rename(tmp_path, path, error);
}

void hash_store::load(const path& path, std::error_code& error)
{
    error.clear();
    if(!fs::exists(path, error)) {
        return;
    }

    std::ifstream file(path, std::ios::binary);
    if(!file) {
        error = std::make_error_code(std::errc::io_error);
        return;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    const bmap snapshot = decode_bmap(ss.str(), error);
    if(error) {
        return;
    }

    blist entries;
    if(!snapshot.try_find_blist("digests", entries)) {
        error = bencode_errc::unexpected_type;
        return;
    }

    std::lock_guard<std::mutex> l(digests_mutex_);
    for(const auto& entry : entries.all_blists()) {
        if(entry.size() != 4
                || entry[0].type() != btype::string
                || entry[1].type() != btype::number
                || entry[2].type() != btype::number
                || entry[3].type() != btype::string) {
            continue;
        }
        const auto& digest_str = static_cast<const bstring&>(entry[3]).value;
        if(digest_str.length() != sha256_hash().size()) {
            continue;
        }
        sha256_hash digest;
        std::copy(digest_str.begin(), digest_str.end(), digest.begin());
        digests_.emplace(key{static_cast<const bstring&>(entry[0]).value,
            static_cast<const bnumber&>(entry[1]).value,
            static_cast<const bnumber&>(entry[2]).value}, digest);
    }
}

} // namespace shoal
