#ifndef SHOAL_TYPES_HEADER
#define SHOAL_TYPES_HEADER

#include <array>
#include <cstdint>
#include <string>

namespace shoal {

using transfer_id_t = int;
using segment_index_t = int;

/** Soulseek peers are identified by their username. */
using source_id = std::string;

/** A SHA-256 digest. */
using sha256_hash = std::array<uint8_t, 32>;

} // namespace shoal

#endif // SHOAL_TYPES_HEADER
