#include "log.hpp"

#include <fstream>
#include <map>
#include <mutex>
#ifdef SHOAL_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // SHOAL_ENABLE_STREAM_DEBUGGING

namespace shoal {
namespace log {
namespace detail {

#define SHOAL_FLUSH(f)                                                                   \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

/**
 * Logs everything into a single file. Both the engine and the governor are used from
 * several threads (the user's and the network threads), so this logger is thread-safe.
 */
class file_logger
{
    const char* name_;
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    explicit file_logger(const char* name) : name_(name) {}
    void log(const std::string& header, const std::string& log, const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        SHOAL_FLUSH(file_);
    }
};

/**
 * Each transfer gets its own log file. Transfers run on strands that may be executed by
 * different network threads, so the file map is protected by a mutex.
 */
class transfer_logger
{
    std::map<transfer_id_t, std::ofstream> files_;
    std::mutex files_mutex_;

public:
    void log(const transfer_id_t transfer, const std::string& header,
            const std::string& log, const priority priority);
    void flush()
    {
        std::lock_guard<std::mutex> l(files_mutex_);
        for(auto& e : files_) {
            SHOAL_FLUSH(e.second);
        }
    }
};

// global logger instances

file_logger engine_logger("engine");
file_logger governor_logger("governor");
transfer_logger transfer_logger;

#ifndef SHOAL_MIN_LOG_PRIORITY
#define SHOAL_MIN_LOG_PRIORITY priority::low
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

template <typename String>
std::string make_log_path(const String& name)
{
#ifdef SHOAL_LOG_PATH
    return std::string(SHOAL_LOG_PATH) + '/' + name + "-log.txt";
#else
    return std::string(name) + "-log.txt";
#endif
}

#ifdef SHOAL_ENABLE_LOGGING

#define SHOAL_PRIORITY_CHAR(p)                                                           \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define SHOAL_LOG(priority, stream, header, log)                                         \
    stream << '[' << SHOAL_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

#ifdef SHOAL_ENABLE_STREAM_DEBUGGING
#define SHOAL_STREAM std::clog
#define SHOAL_CLOG(priority, file, header, log)                                          \
    do {                                                                                 \
        SHOAL_LOG(priority, file, header, log);                                          \
        SHOAL_LOG(priority, SHOAL_STREAM, header, log);                                  \
    } while(0)
#else // SHOAL_ENABLE_STREAM_DEBUGGING
#define SHOAL_CLOG(p, f, h, l) SHOAL_LOG(p, f, h, l)
#endif // SHOAL_ENABLE_STREAM_DEBUGGING

#endif // SHOAL_ENABLE_LOGGING

void file_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef SHOAL_ENABLE_LOGGING
    if(priority < SHOAL_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path(name_), g_open_mode);
    }
    SHOAL_CLOG(priority, file_, header, log);
#endif // SHOAL_ENABLE_LOGGING
}

void transfer_logger::log(const transfer_id_t transfer, const std::string& header,
        const std::string& log, const priority priority)
{
#ifdef SHOAL_ENABLE_LOGGING
    if(priority < SHOAL_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(files_mutex_);
    auto it = files_.find(transfer);
    if(it == files_.end()) {
        const auto path = make_log_path("transfer#" + std::to_string(transfer));
        it = files_.emplace(transfer, std::ofstream(path.c_str(), g_open_mode)).first;
    }
    SHOAL_CLOG(priority, it->second, header, log);
#endif // SHOAL_ENABLE_LOGGING
}

} // detail

void log_transfer(const transfer_id_t transfer, const std::string& header,
        const std::string& log, const priority priority)
{
    detail::transfer_logger.log(transfer, header, log, priority);
}

void log_engine(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::engine_logger.log(header, log, priority);
}

void log_governor(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::governor_logger.log(header, log, priority);
}

void flush()
{
    detail::transfer_logger.flush();
    detail::engine_logger.flush();
    detail::governor_logger.flush();
}

} // log
} // shoal
