#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace BlockSync {

    /**
     * @brief Block-sync extension commands carried in the first byte of a request
     *
     * Values sit in the vendor range of the SFTP type space so ordinary file
     * transfer messages can share the stream.
     */
    enum class Command : uint8_t {
        BlockChecksum = 0xD0,
        Delta = 0xD1,
        Patch = 0xD2
    };

    constexpr uint8_t STATUS_RESPONSE = 101;

    enum class StatusCode : uint32_t {
        Ok = 0,
        NoSuchFile = 2,
        PermissionDenied = 3,
        Failure = 4,
        BadMessage = 5,
        OpUnsupported = 8,
        InvalidDelta = 64
    };

    std::optional<Command> commandFromByte(uint8_t byte);
    const char* commandName(Command command);
    const char* statusCodeName(StatusCode code);

    struct Request {
        Command command = Command::BlockChecksum;
        uint32_t requestId = 0;
        std::string path;
        std::vector<uint8_t> payload;
    };

    struct Response {
        uint8_t type = STATUS_RESPONSE;
        uint32_t requestId = 0;
        std::vector<uint8_t> payload;        // data responses
        StatusCode status = StatusCode::Ok;  // status responses
        std::string message;

        bool isStatus() const { return type == STATUS_RESPONSE; }
    };

    /**
     * @brief Big-endian field writer
     */
    class WireWriter {
    public:
        void putU8(uint8_t value);
        void putU32(uint32_t value);
        void putBytes(const uint8_t* data, size_t len);  // uint32 length prefix, std::length_error above 4 GiB
        void putBytes(const std::vector<uint8_t>& data) { putBytes(data.data(), data.size()); }
        void putString(const std::string& value);

        std::vector<uint8_t> take() { return std::move(buffer_); }

    private:
        std::vector<uint8_t> buffer_;
    };

    /**
     * @brief Big-endian field reader; every getter fails instead of reading past the end
     */
    class WireReader {
    public:
        explicit WireReader(const std::vector<uint8_t>& data) : data_(data) {}

        bool getU8(uint8_t& value);
        bool getU32(uint32_t& value);
        bool getBytes(std::vector<uint8_t>& value);
        bool getString(std::string& value);

        size_t remaining() const { return data_.size() - offset_; }

    private:
        const std::vector<uint8_t>& data_;
        size_t offset_ = 0;
    };

    /// Bytes a request frame needs besides its path and payload.
    constexpr size_t REQUEST_HEADER_SIZE = 1 + 4 + 4 + 4;

    std::vector<uint8_t> encodeRequest(const Request& request);

    /// MalformedFrame for truncated frames, trailing bytes or an unknown command byte.
    bsync::Result<Request> decodeRequest(const std::vector<uint8_t>& frame);

    /// Request id of a frame that may not fully decode; 0 if too short.
    uint32_t peekRequestId(const std::vector<uint8_t>& frame);

    std::vector<uint8_t> encodeDataResponse(Command command, uint32_t requestId,
                                            const std::vector<uint8_t>& payload);
    std::vector<uint8_t> encodeStatusResponse(uint32_t requestId, StatusCode code,
                                              const std::string& message);

    bsync::Result<Response> decodeResponse(const std::vector<uint8_t>& frame);

    /// Status code a failed request is answered with.
    StatusCode statusCodeFor(const bsync::Error& error);

    /// "<Kind>: <message>"
    std::string statusMessageFor(const bsync::Error& error);

    /// Client side: turn a non-OK status back into an Error.
    bsync::Error errorFromStatus(StatusCode code, const std::string& message);

}
