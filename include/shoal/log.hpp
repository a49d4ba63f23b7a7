#ifndef SHOAL_LOG_HEADER
#define SHOAL_LOG_HEADER

#include "types.hpp"

#include <string>

namespace shoal {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

void log_transfer(const transfer_id_t transfer, const std::string& header,
        const std::string& log, const priority priority = priority::normal);
void log_engine(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_governor(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // log
} // shoal

#endif // SHOAL_LOG_HEADER
