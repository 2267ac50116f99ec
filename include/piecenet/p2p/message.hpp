/**
* \file message.hpp
* \author piecenet authors
* \brief Message envelope exchanged once per stream.
* [u32 le header length][header][u32 le payload length][payload]. Header and payload are protobuf messages.
* \version 0.1
* \date 2026-10-18
*
* @copyright Copyright (c) 2026.
This file is part of piecenet.

piecenet is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as
published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.

piecenet is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with piecenet. If not, see <http: //www.gnu.org/licenses/>.
*
*/
#pragma once
#include "../net.hpp"
#include "../socket_buffer.hpp"
#include "piecenet.pb.h"

namespace piecenet::p2p
{
using payload_case_t = proto::MessagePayload::PayloadCase;

/// bytes of a length prefix
constexpr u64 length_prefix_size = 4;

class message_t
{
    proto::MessageHeader header;
    proto::MessagePayload payload;

  public:
    message_t() = default;
    message_t(proto::MessageHeader header, proto::MessagePayload payload);

    /// build an envelope whose header is derived from payload
    static message_t make(proto::MessagePayload payload);

    const proto::MessageHeader &get_header() const { return header; }
    const proto::MessagePayload &get_payload() const { return payload; }
    payload_case_t payload_case() const { return payload.payload_case(); }
};

/// serialize the envelope, message_size is set to the real payload length
socket_buffer_t encode(const message_t &message);

///\throw net_protocol_exception framing, bad_header, bad_payload or size_mismatch
message_t decode(const byte *data, u64 length);

/// decode the data from the current offset of buffer
inline message_t decode(const socket_buffer_t &buffer) { return decode(buffer.get(), buffer.get_length()); }

/// header type of a payload variant
proto::MessageType type_of(payload_case_t payload_case);

/// the response variant answering request, PAYLOAD_NOT_SET for non-requests
payload_case_t expected_response(payload_case_t request);

bool is_request(payload_case_t payload_case);

/// readable name for logs
const char *payload_name(payload_case_t payload_case);

} // namespace piecenet::p2p
