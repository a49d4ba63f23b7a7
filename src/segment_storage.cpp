#include "segment_storage.hpp"
#include "transfer_error.hpp"
#include "sha256_hasher.hpp"
#include "log.hpp"

#include <algorithm>
#include <sstream>

namespace shoal {

std::error_code verify_assembly(
    const std::vector<segment_scheduler::segment>& segments, const int64_t file_size)
{
    std::vector<const segment_scheduler::segment*> sorted;
    sorted.reserve(segments.size());
    for(const auto& s : segments) {
        sorted.push_back(&s);
    }
    std::sort(sorted.begin(), sorted.end(),
        [](const auto* a, const auto* b) { return a->offset < b->offset; });

    int64_t end = 0;
    for(const auto* s : sorted) {
        if(s->state != segment_scheduler::segment_state::verified) {
            return transfer_errc::corrupt_assembly;
        }
        if(s->offset != end || s->length <= 0) {
            return transfer_errc::corrupt_assembly;
        }
        end += s->length;
    }
    if(end != file_size) {
        return transfer_errc::corrupt_assembly;
    }
    return {};
}

segment_storage::segment_storage(path save_path, path resume_data_path,
    const int64_t size)
    : save_path_(std::move(save_path))
    , resume_data_path_(std::move(resume_data_path))
    , size_(size)
{
    part_path_ = save_path_;
    part_path_ += ".part";
}

void segment_storage::allocate(std::error_code& error)
{
    error.clear();
    std::lock_guard<std::mutex> l(file_mutex_);
    if(file_.is_open()) {
        return;
    }
    try {
        if(part_path_.has_parent_path()) {
            fs::create_directories(part_path_.parent_path());
        }
        if(!fs::exists(part_path_)) {
            std::ofstream create(part_path_, std::ios::binary);
        }
        if(int64_t(fs::file_size(part_path_)) != size_) {
            fs::resize_file(part_path_, size_);
        }
    } catch(const fs::filesystem_error& e) {
        log::log_engine("STORAGE", std::string("allocate failed: ") + e.what(),
            log::priority::high);
        error = transfer_errc::storage_error;
        return;
    }
    file_.open(part_path_, std::ios::in | std::ios::out | std::ios::binary);
    if(!file_.is_open()) {
        error = transfer_errc::storage_error;
    }
}

bool segment_storage::is_allocated() const
{
    std::error_code ec;
    return fs::exists(part_path_, ec);
}

void segment_storage::write(const int64_t offset, const uint8_t* data,
    const int length, std::error_code& error)
{
    error.clear();
    if(offset < 0 || offset + length > size_) {
        error = transfer_errc::storage_error;
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        error = transfer_errc::storage_error;
        return;
    }
    file_.seekp(offset);
    file_.write(reinterpret_cast<const char*>(data), length);
    if(!file_) {
        file_.clear();
        error = transfer_errc::storage_error;
    }
}

void segment_storage::read(const int64_t offset, uint8_t* data, const int length,
    std::error_code& error)
{
    error.clear();
    if(offset < 0 || offset + length > size_) {
        error = transfer_errc::storage_error;
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        error = transfer_errc::storage_error;
        return;
    }
    file_.seekg(offset);
    file_.read(reinterpret_cast<char*>(data), length);
    if(file_.gcount() != length) {
        file_.clear();
        error = transfer_errc::storage_error;
    }
}

sha256_hash segment_storage::hash_part_file(std::error_code& error) const
{
    std::ifstream in(part_path_, std::ios::binary);
    if(!in) {
        error = transfer_errc::storage_error;
        return {};
    }
    sha256_hasher hasher;
    std::vector<char> buffer(1024 * 1024);
    int64_t num_left = size_;
    while(num_left > 0) {
        const auto n = std::min<int64_t>(buffer.size(), num_left);
        in.read(buffer.data(), n);
        if(in.gcount() != n) {
            error = transfer_errc::storage_error;
            return {};
        }
        hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), n);
        num_left -= n;
    }
    return hasher.finish();
}

void segment_storage::finalize(const std::vector<segment_scheduler::segment>& segments,
    const file_id& file, std::error_code& error)
{
    error = verify_assembly(segments, size_);
    if(error) {
        return;
    }

    std::lock_guard<std::mutex> l(file_mutex_);
    if(file_.is_open()) {
        file_.flush();
        file_.close();
        if(file_.fail()) {
            file_.clear();
            error = transfer_errc::storage_error;
            return;
        }
    } else if(!fs::exists(part_path_)) {
        // an empty file never has any segments written
        std::ofstream create(part_path_, std::ios::binary);
    }

    if(file.has_digest) {
        const auto digest = hash_part_file(error);
        if(error) {
            return;
        }
        if(digest != file.digest) {
            error = transfer_errc::file_digest_mismatch;
            return;
        }
    }

    fs::rename(part_path_, save_path_, error);
    if(error) {
        log::log_engine("STORAGE", "rename of " + part_path_.string() + " failed: "
            + error.message(), log::priority::high);
        error = transfer_errc::storage_error;
    }
}

std::string segment_storage::read_resume_data(std::error_code& error) const
{
    error.clear();
    if(!fs::exists(resume_data_path_, error)) {
        return {};
    }
    std::ifstream in(resume_data_path_, std::ios::binary);
    if(!in) {
        error = transfer_errc::storage_error;
        return {};
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void segment_storage::write_resume_data(const std::string& encoded,
    std::error_code& error)
{
    error.clear();
    try {
        if(resume_data_path_.has_parent_path()) {
            fs::create_directories(resume_data_path_.parent_path());
        }
    } catch(const fs::filesystem_error&) {
        error = transfer_errc::storage_error;
        return;
    }
    auto tmp_path = resume_data_path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        out.write(encoded.data(), encoded.size());
        if(!out) {
            error = transfer_errc::storage_error;
            return;
        }
    }
    fs::rename(tmp_path, resume_data_path_, error);
    if(error) {
        error = transfer_errc::storage_error;
    }
}

void segment_storage::erase_resume_data()
{
    std::error_code ec;
    fs::remove(resume_data_path_, ec);
}

} // namespace shoal
