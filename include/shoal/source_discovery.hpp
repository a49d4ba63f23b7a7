#ifndef SHOAL_SOURCE_DISCOVERY_HEADER
#define SHOAL_SOURCE_DISCOVERY_HEADER

#include "file_id.hpp"
#include "source.hpp"

#include <functional>
#include <vector>

namespace shoal {

/**
 * Finds peers that share a file, e.g. by running a Soulseek search and filtering the
 * results by name and size.
 */
class source_discovery
{
public:

    using discover_handler = std::function<void(std::vector<discovered_source>)>;

    virtual ~source_discovery() = default;

    /**
     * Invokes handler, on any thread, with the sources found for file. The search must
     * be bounded in time by the implementation, and an empty list is passed if nothing
     * was found.
     */
    virtual void async_discover(const file_id& file, discover_handler handler) = 0;
};

} // namespace shoal

#endif // SHOAL_SOURCE_DISCOVERY_HEADER
