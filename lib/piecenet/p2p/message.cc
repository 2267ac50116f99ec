#include "piecenet/p2p/message.hpp"
#include "piecenet/endian.hpp"
#include "piecenet/net_exception.hpp"
#include <chrono>
#include <glog/logging.h>

namespace piecenet::p2p
{

message_t::message_t(proto::MessageHeader header, proto::MessagePayload payload)
    : header(std::move(header))
    , payload(std::move(payload))
{
}

message_t message_t::make(proto::MessagePayload payload)
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    proto::MessageHeader header;
    header.set_message_type(type_of(payload.payload_case()));
    header.set_message_id(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
    header.set_timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    header.set_message_size(payload.ByteSizeLong());
    return message_t(std::move(header), std::move(payload));
}

socket_buffer_t encode(const message_t &message)
{
    auto payload_size = message.get_payload().ByteSizeLong();
    if (payload_size > 0xFFFFFFFFUL)
        throw net_protocol_exception("payload of " + std::to_string(payload_size) + " bytes is too large",
                                     protocol_error::framing);

    proto::MessageHeader header = message.get_header();
    header.set_message_size(payload_size);
    auto header_size = header.ByteSizeLong();

    socket_buffer_t buffer(length_prefix_size * 2 + header_size + payload_size);
    buffer.expect().origin_length();
    byte *ptr = buffer.get_base_ptr();

    endian::store_le32(ptr, header_size);
    ptr += length_prefix_size;
    if (!header.SerializeToArray(ptr, header_size))
        throw net_protocol_exception("failed to serialize header", protocol_error::bad_header);
    ptr += header_size;

    endian::store_le32(ptr, payload_size);
    ptr += length_prefix_size;
    if (!message.get_payload().SerializeToArray(ptr, payload_size))
        throw net_protocol_exception("failed to serialize payload", protocol_error::bad_payload);
    return buffer;
}

message_t decode(const byte *data, u64 length)
{
    u64 offset = 0;
    if (length < length_prefix_size)
        throw net_protocol_exception("message truncated before header length", protocol_error::framing);
    u32 header_size = endian::load_le32(data);
    offset += length_prefix_size;
    if (header_size > length - offset)
        throw net_protocol_exception("header length " + std::to_string(header_size) + " exceeds " +
                                         std::to_string(length - offset) + " remaining bytes",
                                     protocol_error::framing);

    proto::MessageHeader header;
    if (!header.ParseFromArray(data + offset, header_size))
        throw net_protocol_exception("failed to parse message header", protocol_error::bad_header);
    offset += header_size;

    if (length - offset < length_prefix_size)
        throw net_protocol_exception("message truncated before payload length", protocol_error::framing);
    u32 payload_size = endian::load_le32(data + offset);
    offset += length_prefix_size;
    if (payload_size > length - offset)
        throw net_protocol_exception("payload length " + std::to_string(payload_size) + " exceeds " +
                                         std::to_string(length - offset) + " remaining bytes",
                                     protocol_error::framing);
    if (payload_size != length - offset)
        throw net_protocol_exception(std::to_string(length - offset - payload_size) + " trailing bytes after payload",
                                     protocol_error::framing);

    proto::MessagePayload payload;
    if (!payload.ParseFromArray(data + offset, payload_size))
        throw net_protocol_exception("failed to parse message payload", protocol_error::bad_payload);

    if (header.message_size() != payload_size)
        throw net_protocol_exception("header message_size " + std::to_string(header.message_size()) +
                                         " but payload has " + std::to_string(payload_size) + " bytes",
                                     protocol_error::size_mismatch);

    auto expect_type = type_of(payload.payload_case());
    if (header.message_type() != expect_type)
    {
        LOG(WARNING) << "message " << header.message_id() << " header type "
                     << proto::MessageType_Name(header.message_type()) << " disagrees with payload "
                     << payload_name(payload.payload_case());
    }
    return message_t(std::move(header), std::move(payload));
}

proto::MessageType type_of(payload_case_t payload_case)
{
    switch (payload_case)
    {
        case proto::MessagePayload::kDownloadPieceRequest:
            return proto::DOWNLOAD_PIECE;
        case proto::MessagePayload::kDownloadPieceResponse:
            return proto::DOWNLOAD_PIECE_RESPONSE;
        case proto::MessagePayload::kDownloadTaskRequest:
            return proto::DOWNLOAD_TASK;
        case proto::MessagePayload::kDownloadTaskResponse:
            return proto::DOWNLOAD_TASK_RESPONSE;
        case proto::MessagePayload::kSyncPiecesRequest:
            return proto::SYNC_PIECES;
        case proto::MessagePayload::kSyncPiecesResponse:
            return proto::SYNC_PIECES_RESPONSE;
        case proto::MessagePayload::kDownloadPersistentCachePieceRequest:
            return proto::DOWNLOAD_PERSISTENT_CACHE_PIECE;
        case proto::MessagePayload::kDownloadPersistentCachePieceResponse:
            return proto::DOWNLOAD_PERSISTENT_CACHE_PIECE_RESPONSE;
        case proto::MessagePayload::kHealthCheck:
            return proto::HEALTH_CHECK;
        case proto::MessagePayload::kHealthCheckResponse:
            return proto::HEALTH_CHECK_RESPONSE;
        case proto::MessagePayload::PAYLOAD_NOT_SET:
            return proto::MESSAGE_TYPE_UNSPECIFIED;
    }
    return proto::MESSAGE_TYPE_UNSPECIFIED;
}

payload_case_t expected_response(payload_case_t request)
{
    switch (request)
    {
        case proto::MessagePayload::kDownloadPieceRequest:
            return proto::MessagePayload::kDownloadPieceResponse;
        case proto::MessagePayload::kDownloadTaskRequest:
            return proto::MessagePayload::kDownloadTaskResponse;
        case proto::MessagePayload::kSyncPiecesRequest:
            return proto::MessagePayload::kSyncPiecesResponse;
        case proto::MessagePayload::kDownloadPersistentCachePieceRequest:
            return proto::MessagePayload::kDownloadPersistentCachePieceResponse;
        case proto::MessagePayload::kHealthCheck:
            return proto::MessagePayload::kHealthCheckResponse;
        default:
            return proto::MessagePayload::PAYLOAD_NOT_SET;
    }
}

bool is_request(payload_case_t payload_case)
{
    return expected_response(payload_case) != proto::MessagePayload::PAYLOAD_NOT_SET;
}

const char *payload_name(payload_case_t payload_case)
{
    switch (payload_case)
    {
        case proto::MessagePayload::kDownloadPieceRequest:
            return "download piece request";
        case proto::MessagePayload::kDownloadPieceResponse:
            return "download piece response";
        case proto::MessagePayload::kDownloadTaskRequest:
            return "download task request";
        case proto::MessagePayload::kDownloadTaskResponse:
            return "download task response";
        case proto::MessagePayload::kSyncPiecesRequest:
            return "sync pieces request";
        case proto::MessagePayload::kSyncPiecesResponse:
            return "sync pieces response";
        case proto::MessagePayload::kDownloadPersistentCachePieceRequest:
            return "download persistent cache piece request";
        case proto::MessagePayload::kDownloadPersistentCachePieceResponse:
            return "download persistent cache piece response";
        case proto::MessagePayload::kHealthCheck:
            return "health check";
        case proto::MessagePayload::kHealthCheckResponse:
            return "health check response";
        case proto::MessagePayload::PAYLOAD_NOT_SET:
            return "empty payload";
    }
    return "unknown payload";
}

} // namespace piecenet::p2p
