#include "piecenet/transport.hpp"
#include <limits>

namespace piecenet::transport
{
/// initial capacity, grown by doubling up to limit + 1
constexpr u64 read_chunk_size = 16 * 1024;

socket_buffer_t stream_t::read_to_end(u64 limit)
{
    // one byte over the limit tells an oversized stream apart
    if (limit == std::numeric_limits<u64>::max())
        limit--;
    u64 capacity = limit + 1 < read_chunk_size ? limit + 1 : read_chunk_size;
    socket_buffer_t buffer(capacity);
    u64 total = 0;
    while (1)
    {
        if (total == capacity)
        {
            if (capacity > limit)
                throw net_protocol_exception("stream " + std::to_string(id()) + " exceeds " + std::to_string(limit) +
                                                 " bytes",
                                             protocol_error::framing);
            capacity = capacity * 2 > limit + 1 ? limit + 1 : capacity * 2;
            buffer.resize(capacity);
        }
        buffer.expect().length(capacity);
        buffer.walk_step(total);
        auto n = read(buffer);
        if (n == 0)
            break;
        total += n;
    }
    if (total > limit)
        throw net_protocol_exception("stream " + std::to_string(id()) + " exceeds " + std::to_string(limit) + " bytes",
                                     protocol_error::framing);
    buffer.expect().length(total);
    return buffer;
}

} // namespace piecenet::transport
