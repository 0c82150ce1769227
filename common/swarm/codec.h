#pragma once

#include "message.h"

#include <memory>
#include <string>

namespace swarm {

// zlib CRC-32 as 8 lowercase hex digits
std::string crc32_hex(const std::string & data);

std::string base64_encode(const std::string & data);
std::string base64_decode(const std::string & data);

// gzip framing (RFC 1952); both throw swarm_error(ERROR_TYPE_CODEC) on zlib failure
std::string gzip_compress(const std::string & data, int level = 6);
std::string gzip_decompress(const std::string & data);

// symmetric payload cipher; no implementation ships with the library
class payload_cipher {
public:
    virtual ~payload_cipher() = default;

    virtual std::string name() const = 0;
    virtual std::string encrypt(const std::string & plaintext, const std::string & key_id) = 0;
    virtual std::string decrypt(const std::string & ciphertext, const std::string & key_id) = 0;
};

// Returns the payload with data replaced by base64(gzip(data.dump())) when the serialized
// data reaches the threshold. Below the threshold, or on codec failure, the payload is returned unchanged.
message_payload compress_payload(const message_payload & payload, size_t threshold, int level);

// inverse of compress_payload; untouched payloads pass through
message_payload decompress_payload(const message_payload & payload);

message_payload encrypt_payload(const message_payload & payload, const encryption_config & cfg, payload_cipher & cipher);
message_payload decrypt_payload(const message_payload & payload, payload_cipher & cipher);

inline bool payload_is_compressed(const message_payload & payload) {
    return payload.metadata.value("compressed", false);
}

inline bool payload_is_encrypted(const message_payload & payload) {
    return payload.metadata.value("encrypted", false);
}

} // namespace swarm
