#ifndef SHOAL_PEER_CLIENT_HEADER
#define SHOAL_PEER_CLIENT_HEADER

#include "file_id.hpp"
#include "types.hpp"

#include <system_error>
#include <functional>
#include <cstdint>
#include <memory>

namespace shoal {

/** An established transfer connection to a peer, as handed out by peer_client. */
class peer_connection
{
public:
    virtual ~peer_connection() = default;
    virtual const source_id& peer() const noexcept = 0;
};

/**
 * The boundary to the Soulseek client that actually talks to peers. The engine never
 * touches sockets itself: it asks this interface to connect to a peer and to stream a
 * byte range of a file.
 *
 * Handlers may be invoked on any thread. Implementations must invoke exactly one of
 * the completion handlers for every initiated operation, and must not invoke the chunk
 * handler after the completion handler.
 */
class peer_client
{
public:

    using connect_handler = std::function<void(const std::error_code&,
        std::shared_ptr<peer_connection>)>;
    using chunk_handler = std::function<void(const uint8_t*, int)>;
    using completion_handler = std::function<void(const std::error_code&)>;

    virtual ~peer_client() = default;

    /**
     * Establishes a transfer connection to peer. Fails with peer_errc::connect_failed
     * if the peer can't be reached.
     */
    virtual void async_connect(const source_id& peer, connect_handler handler) = 0;

    /**
     * Requests length bytes of file starting at offset. The bytes are passed to
     * on_chunk in order as they arrive, then handler is invoked. If the peer refuses
     * the request, handler gets peer_errc::request_failed, and if the stream ends early
     * peer_errc::peer_disconnected.
     */
    virtual void async_request_range(std::shared_ptr<peer_connection> connection,
        const file_id& file, const int64_t offset, const int length,
        chunk_handler on_chunk, completion_handler handler) = 0;
};

} // namespace shoal

#endif // SHOAL_PEER_CLIENT_HEADER
