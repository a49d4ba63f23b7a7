#ifndef SHOAL_TEST_PEERS_HEADER
#define SHOAL_TEST_PEERS_HEADER

#include <shoal/source_discovery.hpp>
#include <shoal/sha256_hasher.hpp>
#include <shoal/peer_client.hpp>
#include <shoal/peer_error.hpp>
#include <shoal/file_id.hpp>
#include <shoal/source.hpp>
#include <shoal/time.hpp>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace shoal_test {

using namespace shoal;

inline std::string make_content(const int64_t size, const int seed = 0)
{
    std::string content(size, '\0');
    for(int64_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>((i * 131 + i / 7 + seed) & 0xff);
    }
    return content;
}

inline std::vector<sha256_hash> make_segment_digests(const std::string& content,
    const int segment_size)
{
    std::vector<sha256_hash> digests;
    for(size_t offset = 0; offset < content.size(); offset += segment_size) {
        const auto length = std::min<size_t>(segment_size, content.size() - offset);
        digests.push_back(create_sha256_digest(
            reinterpret_cast<const uint8_t*>(content.data() + offset), length));
    }
    return digests;
}

inline std::string read_file(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file),
        std::istreambuf_iterator<char>());
}

/** Polls pred every few milliseconds until it's true or timeout elapses. */
inline bool run_until(const std::function<bool()>& pred,
    const std::chrono::milliseconds timeout = std::chrono::seconds(20))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(std::chrono::steady_clock::now() < deadline) {
        if(pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/** How a scripted peer misbehaves. */
struct peer_script
{
    bool refuse_connect = false;
    // Every nth request is cut short with peer_disconnected.
    int fail_every_nth = 0;
    // So are the first n requests.
    int fail_first_n = 0;
    // Flips a byte in every range served.
    bool corrupt = false;
    // Never answers range requests.
    bool is_silent = false;
    std::chrono::milliseconds delay{0};
};

/**
 * An in-memory peer_client. Every peer shares the same files, and serves them according
 * to its script. Handlers are invoked on the client's own threads, the way a real
 * client's would be.
 */
class scripted_peer_client : public peer_client
{
    struct connection : public peer_connection
    {
        source_id id;
        explicit connection(source_id i) : id(std::move(i)) {}
        const source_id& peer() const noexcept override { return id; }
    };

    struct peer_counters
    {
        int num_requests = 0;
        int num_injected_failures = 0;
        int num_in_flight = 0;
        int peak_in_flight = 0;
    };

    asio::io_context ios_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::vector<std::thread> threads_;

    std::map<std::string, std::string> files_;
    std::map<source_id, peer_script> scripts_;
    std::map<source_id, peer_counters> counters_;
    int num_in_flight_ = 0;
    int peak_in_flight_ = 0;
    // Handlers of silent peers are parked here.
    std::vector<completion_handler> parked_handlers_;
    mutable std::mutex mutex_;

public:

    static constexpr int chunk_size = 64 * 1024;

    explicit scripted_peer_client(const int num_threads = 2)
        : work_(asio::make_work_guard(ios_))
    {
        for(auto i = 0; i < num_threads; ++i) {
            threads_.emplace_back([this] { ios_.run(); });
        }
    }

    ~scripted_peer_client() override
    {
        work_.reset();
        ios_.stop();
        for(auto& t : threads_) {
            t.join();
        }
    }

    void add_file(const file_id& file, std::string content)
    {
        std::lock_guard<std::mutex> l(mutex_);
        files_[file.key()] = std::move(content);
    }

    void set_script(const source_id& peer, peer_script script)
    {
        std::lock_guard<std::mutex> l(mutex_);
        scripts_[peer] = script;
    }

    int num_requests(const source_id& peer) const
    {
        std::lock_guard<std::mutex> l(mutex_);
        auto it = counters_.find(peer);
        return it != counters_.end() ? it->second.num_requests : 0;
    }

    int num_injected_failures(const source_id& peer) const
    {
        std::lock_guard<std::mutex> l(mutex_);
        auto it = counters_.find(peer);
        return it != counters_.end() ? it->second.num_injected_failures : 0;
    }

    int peak_in_flight(const source_id& peer) const
    {
        std::lock_guard<std::mutex> l(mutex_);
        auto it = counters_.find(peer);
        return it != counters_.end() ? it->second.peak_in_flight : 0;
    }

    int peak_in_flight() const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return peak_in_flight_;
    }

    int num_in_flight() const
    {
        std::lock_guard<std::mutex> l(mutex_);
        return num_in_flight_;
    }

    void async_connect(const source_id& peer, connect_handler handler) override
    {
        peer_script script;
        {
            std::lock_guard<std::mutex> l(mutex_);
            script = scripts_[peer];
        }
        asio::post(ios_, [peer, script, handler = std::move(handler)] {
            if(script.refuse_connect) {
                handler(peer_errc::connect_failed, nullptr);
            } else {
                handler(std::error_code(), std::make_shared<connection>(peer));
            }
        });
    }

    void async_request_range(std::shared_ptr<peer_connection> conn, const file_id& file,
        const int64_t offset, const int length, chunk_handler on_chunk,
        completion_handler handler) override
    {
        const source_id peer = conn->peer();
        peer_script script;
        std::string data;
        bool should_fail = false;
        {
            std::lock_guard<std::mutex> l(mutex_);
            script = scripts_[peer];
            auto& counters = counters_[peer];
            ++counters.num_requests;
            if(script.is_silent) {
                parked_handlers_.emplace_back(std::move(handler));
                return;
            }
            should_fail = ((script.fail_every_nth > 0)
                    && (counters.num_requests % script.fail_every_nth == 0))
                || (counters.num_requests <= script.fail_first_n);
            if(should_fail) {
                ++counters.num_injected_failures;
            }
            counters.peak_in_flight = std::max(counters.peak_in_flight,
                ++counters.num_in_flight);
            peak_in_flight_ = std::max(peak_in_flight_, ++num_in_flight_);

            auto it = files_.find(file.key());
            if(it != files_.end() && offset + length <= int64_t(it->second.size())) {
                data = it->second.substr(offset, length);
            }
        }

        asio::post(ios_, [this, peer, script, should_fail, data = std::move(data),
            on_chunk = std::move(on_chunk), handler = std::move(handler)]() mutable {
            if(script.delay.count() > 0) {
                std::this_thread::sleep_for(script.delay);
            }
            std::error_code error;
            if(data.empty()) {
                error = peer_errc::request_failed;
            } else {
                if(script.corrupt) {
                    data[data.size() / 2] ^= 0x5a;
                }
                const int num_bytes = should_fail ? int(data.size()) / 2 : int(data.size());
                for(int i = 0; i < num_bytes; i += chunk_size) {
                    on_chunk(reinterpret_cast<const uint8_t*>(data.data()) + i,
                        std::min(chunk_size, num_bytes - i));
                }
                if(should_fail) {
                    error = peer_errc::peer_disconnected;
                }
            }
            {
                std::lock_guard<std::mutex> l(mutex_);
                --counters_[peer].num_in_flight;
                --num_in_flight_;
            }
            handler(error);
        });
    }
};

/** Returns whatever sources were set for a file, and counts the queries. */
class scripted_discovery : public source_discovery
{
    std::map<std::string, std::vector<discovered_source>> sources_;
    std::atomic<int> num_queries_{0};
    mutable std::mutex mutex_;

public:

    void set_sources(const file_id& file, std::vector<discovered_source> sources)
    {
        std::lock_guard<std::mutex> l(mutex_);
        sources_[file.key()] = std::move(sources);
    }

    int num_queries() const noexcept { return num_queries_; }

    void async_discover(const file_id& file, discover_handler handler) override
    {
        ++num_queries_;
        std::vector<discovered_source> result;
        {
            std::lock_guard<std::mutex> l(mutex_);
            auto it = sources_.find(file.key());
            if(it != sources_.end()) {
                result = it->second;
            }
        }
        handler(std::move(result));
    }
};

inline std::vector<discovered_source> whole_file_sources(
    const std::vector<source_id>& ids)
{
    std::vector<discovered_source> result;
    for(const auto& id : ids) {
        discovered_source s;
        s.id = id;
        result.push_back(std::move(s));
    }
    return result;
}

/** A fresh directory under the system's temporary directory, removed on destruction. */
class temp_dir
{
    std::filesystem::path path_;

public:

    explicit temp_dir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("shoal-test-" + name + "-"
            + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
    {
        std::filesystem::create_directories(path_);
    }

    ~temp_dir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }
};

} // namespace shoal_test

#endif // SHOAL_TEST_PEERS_HEADER
