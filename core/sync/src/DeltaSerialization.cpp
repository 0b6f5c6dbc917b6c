#include "DeltaSerialization.h"
#include <json/json.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <memory>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;

    namespace {

        std::vector<uint8_t> toBytes(const Json::Value& root) {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "";
            std::string text = Json::writeString(builder, root);
            return std::vector<uint8_t>(text.begin(), text.end());
        }

        bsync::Result<Json::Value> parseArray(const std::vector<uint8_t>& data, const char* what) {
            Json::CharReaderBuilder builder;
            Json::CharReaderBuilder::strictMode(&builder.settings_);
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

            Json::Value root;
            std::string errors;
            const char* begin = reinterpret_cast<const char*>(data.data());
            if (!reader->parse(begin, begin + data.size(), &root, &errors)) {
                return Error{ErrorCode::MalformedPayload, std::string("Invalid ") + what + " JSON: " + errors};
            }
            if (!root.isArray()) {
                return Error{ErrorCode::MalformedPayload, std::string(what) + " must be a JSON array"};
            }
            return root;
        }

        bool isBase64Char(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                   c == '+' || c == '/';
        }

    }

    std::vector<uint8_t> DeltaSerialization::serializeSignature(const SignatureSet& signatures) {
        Json::Value root(Json::arrayValue);
        for (const auto& sig : signatures) {
            Json::Value entry(Json::objectValue);
            entry["index"] = static_cast<Json::UInt>(sig.index);
            entry["weak"] = static_cast<Json::UInt>(sig.weak);
            entry["strong"] = sig.strong;
            root.append(entry);
        }
        return toBytes(root);
    }

    bsync::Result<SignatureSet> DeltaSerialization::deserializeSignature(const std::vector<uint8_t>& data) {
        auto parsed = parseArray(data, "signature");
        if (!parsed) {
            return parsed.error();
        }

        SignatureSet signatures;
        signatures.reserve(parsed->size());
        for (Json::ArrayIndex i = 0; i < parsed->size(); ++i) {
            const Json::Value& entry = (*parsed)[i];
            if (!entry.isObject() ||
                !entry.isMember("index") || !entry["index"].isUInt() ||
                !entry.isMember("weak") || !entry["weak"].isUInt() ||
                !entry.isMember("strong") || !entry["strong"].isString()) {
                return Error{ErrorCode::MalformedPayload, "Bad signature entry at position " + std::to_string(i)};
            }
            BlockSignature sig;
            sig.index = entry["index"].asUInt();
            sig.weak = entry["weak"].asUInt();
            sig.strong = entry["strong"].asString();
            signatures.push_back(std::move(sig));
        }
        return signatures;
    }

    std::vector<uint8_t> DeltaSerialization::serializeDelta(const DeltaOps& ops) {
        Json::Value root(Json::arrayValue);
        for (const auto& op : ops) {
            Json::Value entry(Json::objectValue);
            if (const auto* copy = std::get_if<CopyOp>(&op)) {
                entry["c"] = static_cast<Json::UInt>(copy->blockIndex);
            } else {
                entry["l"] = base64Encode(std::get<LiteralOp>(op).data);
            }
            root.append(entry);
        }
        return toBytes(root);
    }

    bsync::Result<DeltaOps> DeltaSerialization::deserializeDelta(const std::vector<uint8_t>& data) {
        auto parsed = parseArray(data, "delta");
        if (!parsed) {
            return parsed.error();
        }

        DeltaOps ops;
        ops.reserve(parsed->size());
        for (Json::ArrayIndex i = 0; i < parsed->size(); ++i) {
            const Json::Value& entry = (*parsed)[i];
            const std::string position = " at position " + std::to_string(i);
            if (!entry.isObject()) {
                return Error{ErrorCode::MalformedPayload, "Delta op is not an object" + position};
            }

            bool hasCopy = entry.isMember("c");
            bool hasLiteral = entry.isMember("l");
            if (hasCopy == hasLiteral) {
                return Error{ErrorCode::MalformedPayload, "Delta op needs exactly one of c or l" + position};
            }

            if (hasCopy) {
                if (!entry["c"].isUInt()) {
                    return Error{ErrorCode::MalformedPayload, "Copy index is not an unsigned integer" + position};
                }
                ops.push_back(CopyOp{entry["c"].asUInt()});
            } else {
                if (!entry["l"].isString()) {
                    return Error{ErrorCode::MalformedPayload, "Literal is not a string" + position};
                }
                auto bytes = base64Decode(entry["l"].asString());
                if (!bytes) {
                    return Error{ErrorCode::MalformedPayload, bytes.error().message + position};
                }
                ops.push_back(LiteralOp{std::move(*bytes)});
            }
        }
        return ops;
    }

    std::string DeltaSerialization::base64Encode(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            return std::string();
        }

        BIO* bio = BIO_new(BIO_s_mem());
        BIO* b64 = BIO_new(BIO_f_base64());
        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        bio = BIO_push(b64, bio);

        BIO_write(bio, data.data(), static_cast<int>(data.size()));
        BIO_flush(bio);

        BUF_MEM* bufPtr;
        BIO_get_mem_ptr(bio, &bufPtr);

        std::string result(bufPtr->data, bufPtr->length);
        BIO_free_all(bio);

        return result;
    }

    bsync::Result<std::vector<uint8_t>> DeltaSerialization::base64Decode(const std::string& text) {
        if (text.empty()) {
            return std::vector<uint8_t>();
        }
        if (text.size() % 4 != 0) {
            return Error{ErrorCode::MalformedPayload, "Base64 length is not a multiple of 4"};
        }

        size_t padding = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '=') {
                if (i + 2 < text.size()) {
                    return Error{ErrorCode::MalformedPayload, "Base64 padding in the middle of the data"};
                }
                ++padding;
            } else if (padding > 0 || !isBase64Char(c)) {
                return Error{ErrorCode::MalformedPayload, "Invalid base64 character"};
            }
        }

        const size_t expected = text.size() / 4 * 3 - padding;
        std::vector<uint8_t> result(expected);

        BIO* bio = BIO_new_mem_buf(text.data(), static_cast<int>(text.size()));
        BIO* b64 = BIO_new(BIO_f_base64());
        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        bio = BIO_push(b64, bio);

        size_t total = 0;
        while (total < expected) {
            int n = BIO_read(bio, result.data() + total, static_cast<int>(expected - total));
            if (n <= 0) {
                break;
            }
            total += static_cast<size_t>(n);
        }
        BIO_free_all(bio);

        if (total != expected) {
            return Error{ErrorCode::MalformedPayload, "Base64 decoding failed"};
        }
        return result;
    }

}
