#include "SyncProtocol.h"
#include <arpa/inet.h>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;
    using bsync::ErrorKind;

    std::optional<Command> commandFromByte(uint8_t byte) {
        switch (byte) {
            case static_cast<uint8_t>(Command::BlockChecksum): return Command::BlockChecksum;
            case static_cast<uint8_t>(Command::Delta): return Command::Delta;
            case static_cast<uint8_t>(Command::Patch): return Command::Patch;
            default: return std::nullopt;
        }
    }

    const char* commandName(Command command) {
        switch (command) {
            case Command::BlockChecksum: return "BLOCKCHK";
            case Command::Delta: return "DELTA";
            case Command::Patch: return "PATCH";
        }
        return "UNKNOWN";
    }

    const char* statusCodeName(StatusCode code) {
        switch (code) {
            case StatusCode::Ok: return "OK";
            case StatusCode::NoSuchFile: return "NO_SUCH_FILE";
            case StatusCode::PermissionDenied: return "PERMISSION_DENIED";
            case StatusCode::Failure: return "FAILURE";
            case StatusCode::BadMessage: return "BAD_MESSAGE";
            case StatusCode::OpUnsupported: return "OP_UNSUPPORTED";
            case StatusCode::InvalidDelta: return "INVALID_DELTA";
        }
        return "UNKNOWN";
    }

    void WireWriter::putU8(uint8_t value) {
        buffer_.push_back(value);
    }

    void WireWriter::putU32(uint32_t value) {
        uint32_t net = htonl(value);
        const auto* p = reinterpret_cast<const uint8_t*>(&net);
        buffer_.insert(buffer_.end(), p, p + sizeof(net));
    }

    void WireWriter::putBytes(const uint8_t* data, size_t len) {
        if (len > std::numeric_limits<uint32_t>::max()) {
            throw std::length_error("Field of " + std::to_string(len) + " bytes does not fit a uint32 length");
        }
        putU32(static_cast<uint32_t>(len));
        buffer_.insert(buffer_.end(), data, data + len);
    }

    void WireWriter::putString(const std::string& value) {
        putBytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    }

    bool WireReader::getU8(uint8_t& value) {
        if (remaining() < 1) return false;
        value = data_[offset_++];
        return true;
    }

    bool WireReader::getU32(uint32_t& value) {
        if (remaining() < 4) return false;
        uint32_t net;
        std::memcpy(&net, data_.data() + offset_, 4);
        value = ntohl(net);
        offset_ += 4;
        return true;
    }

    bool WireReader::getBytes(std::vector<uint8_t>& value) {
        uint32_t len;
        if (!getU32(len)) return false;
        if (remaining() < len) return false;
        value.assign(data_.begin() + offset_, data_.begin() + offset_ + len);
        offset_ += len;
        return true;
    }

    bool WireReader::getString(std::string& value) {
        uint32_t len;
        if (!getU32(len)) return false;
        if (remaining() < len) return false;
        value.assign(reinterpret_cast<const char*>(data_.data()) + offset_, len);
        offset_ += len;
        return true;
    }

    std::vector<uint8_t> encodeRequest(const Request& request) {
        WireWriter writer;
        writer.putU8(static_cast<uint8_t>(request.command));
        writer.putU32(request.requestId);
        writer.putString(request.path);
        writer.putBytes(request.payload);
        return writer.take();
    }

    bsync::Result<Request> decodeRequest(const std::vector<uint8_t>& frame) {
        WireReader reader(frame);
        uint8_t type;
        if (!reader.getU8(type)) {
            return Error{ErrorCode::MalformedFrame, "Empty frame"};
        }
        auto command = commandFromByte(type);
        if (!command) {
            return Error{ErrorCode::MalformedFrame, "Unknown command byte " + std::to_string(type)};
        }

        Request request;
        request.command = *command;
        if (!reader.getU32(request.requestId) ||
            !reader.getString(request.path) ||
            !reader.getBytes(request.payload)) {
            return Error{ErrorCode::MalformedFrame, std::string("Truncated ") + commandName(*command) + " request"};
        }
        if (reader.remaining() != 0) {
            return Error{ErrorCode::MalformedFrame,
                         std::to_string(reader.remaining()) + " trailing bytes after " + commandName(*command) + " request"};
        }
        return request;
    }

    uint32_t peekRequestId(const std::vector<uint8_t>& frame) {
        WireReader reader(frame);
        uint8_t type;
        uint32_t id = 0;
        if (!reader.getU8(type) || !reader.getU32(id)) {
            return 0;
        }
        return id;
    }

    std::vector<uint8_t> encodeDataResponse(Command command, uint32_t requestId,
                                            const std::vector<uint8_t>& payload) {
        WireWriter writer;
        writer.putU8(static_cast<uint8_t>(command));
        writer.putU32(requestId);
        writer.putBytes(payload);
        return writer.take();
    }

    std::vector<uint8_t> encodeStatusResponse(uint32_t requestId, StatusCode code,
                                              const std::string& message) {
        WireWriter writer;
        writer.putU8(STATUS_RESPONSE);
        writer.putU32(requestId);
        writer.putU32(static_cast<uint32_t>(code));
        writer.putString(message);
        writer.putString("");
        return writer.take();
    }

    bsync::Result<Response> decodeResponse(const std::vector<uint8_t>& frame) {
        WireReader reader(frame);
        Response response;
        if (!reader.getU8(response.type) || !reader.getU32(response.requestId)) {
            return Error{ErrorCode::MalformedFrame, "Truncated response header"};
        }

        if (response.isStatus()) {
            uint32_t code;
            std::string language;
            if (!reader.getU32(code) || !reader.getString(response.message) || !reader.getString(language)) {
                return Error{ErrorCode::MalformedFrame, "Truncated status response"};
            }
            response.status = static_cast<StatusCode>(code);
        } else {
            if (!commandFromByte(response.type)) {
                return Error{ErrorCode::UnexpectedResponse,
                             "Unexpected response type " + std::to_string(response.type)};
            }
            if (!reader.getBytes(response.payload)) {
                return Error{ErrorCode::MalformedFrame, "Truncated data response"};
            }
        }

        if (reader.remaining() != 0) {
            return Error{ErrorCode::MalformedFrame, "Trailing bytes after response"};
        }
        return response;
    }

    StatusCode statusCodeFor(const Error& error) {
        switch (error.kind()) {
            case ErrorKind::None:
                return StatusCode::Ok;
            case ErrorKind::IOError:
                if (error.code == ErrorCode::FileNotFound || error.code == ErrorCode::DirectoryNotFound) {
                    return StatusCode::NoSuchFile;
                }
                if (error.code == ErrorCode::FileAccessDenied) {
                    return StatusCode::PermissionDenied;
                }
                return StatusCode::Failure;
            case ErrorKind::ProtocolError:
                return StatusCode::BadMessage;
            case ErrorKind::AlgorithmError:
                return StatusCode::InvalidDelta;
            case ErrorKind::InternalError:
                if (error.code == ErrorCode::InvalidArgument) {
                    return StatusCode::BadMessage;
                }
                return StatusCode::Failure;
        }
        return StatusCode::Failure;
    }

    std::string statusMessageFor(const Error& error) {
        return std::string(bsync::errorKindToString(error.kind())) + ": " + error.message;
    }

    Error errorFromStatus(StatusCode code, const std::string& message) {
        switch (code) {
            case StatusCode::NoSuchFile:
                return Error{ErrorCode::FileNotFound, "Remote: " + message};
            case StatusCode::PermissionDenied:
                return Error{ErrorCode::FileAccessDenied, "Remote: " + message};
            case StatusCode::BadMessage:
                return Error{ErrorCode::ProtocolError, "Remote: " + message};
            case StatusCode::InvalidDelta:
                return Error{ErrorCode::DeltaApplyFailed, "Remote: " + message};
            case StatusCode::Ok:
            case StatusCode::Failure:
            case StatusCode::OpUnsupported:
                break;
        }
        return Error{ErrorCode::RemoteFailure, std::string("Remote ") + statusCodeName(code) + ": " + message};
    }

}
