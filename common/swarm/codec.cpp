#include "codec.h"

#include "log.h"

#include <zlib.h>

#include <cstdio>

namespace swarm {

std::string crc32_hex(const std::string & data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size()));

    char buf[9];
    snprintf(buf, sizeof(buf), "%08lx", static_cast<unsigned long>(crc & 0xffffffffUL));
    return buf;
}

// ============================================================================
// Base64
// ============================================================================

static const char * b64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string & data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = (uint8_t(data[i]) << 16) | (uint8_t(data[i + 1]) << 8) | uint8_t(data[i + 2]);
        out += b64_chars[(n >> 18) & 63];
        out += b64_chars[(n >> 12) & 63];
        out += b64_chars[(n >> 6) & 63];
        out += b64_chars[n & 63];
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint8_t(data[i]) << 16;
        out += b64_chars[(n >> 18) & 63];
        out += b64_chars[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint8_t(data[i]) << 16) | (uint8_t(data[i + 1]) << 8);
        out += b64_chars[(n >> 18) & 63];
        out += b64_chars[(n >> 12) & 63];
        out += b64_chars[(n >> 6) & 63];
        out += '=';
    }

    return out;
}

static int b64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64_decode(const std::string & data) {
    if (data.size() % 4 != 0) {
        throw swarm_error(ERROR_TYPE_CODEC, "base64 input length is not a multiple of 4");
    }

    std::string out;
    out.reserve(data.size() / 4 * 3);

    for (size_t i = 0; i < data.size(); i += 4) {
        int v[4];
        int pad = 0;
        for (int k = 0; k < 4; k++) {
            const char c = data[i + k];
            if (c == '=' && i + 4 == data.size() && k >= 2) {
                v[k] = 0;
                pad++;
                continue;
            }
            v[k] = b64_index(c);
            if (v[k] < 0 || pad > 0) {
                throw swarm_error(ERROR_TYPE_CODEC, "invalid base64 character");
            }
        }

        uint32_t n = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
        out += char((n >> 16) & 0xff);
        if (pad < 2) out += char((n >> 8) & 0xff);
        if (pad < 1) out += char(n & 0xff);
    }

    return out;
}

// ============================================================================
// gzip
// ============================================================================

std::string gzip_compress(const std::string & data, int level) {
    z_stream strm = {};
    // 15 window bits + 16 selects the gzip wrapper
    if (deflateInit2(&strm, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw swarm_error(ERROR_TYPE_CODEC, "deflateInit2 failed");
    }

    strm.next_in  = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buf[16384];
    int ret;
    do {
        strm.next_out  = reinterpret_cast<Bytef *>(buf);
        strm.avail_out = sizeof(buf);
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            throw swarm_error(ERROR_TYPE_CODEC, "deflate failed");
        }
        out.append(buf, sizeof(buf) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return out;
}

std::string gzip_decompress(const std::string & data) {
    z_stream strm = {};
    if (inflateInit2(&strm, 15 + 16) != Z_OK) {
        throw swarm_error(ERROR_TYPE_CODEC, "inflateInit2 failed");
    }

    strm.next_in  = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buf[16384];
    int ret;
    do {
        strm.next_out  = reinterpret_cast<Bytef *>(buf);
        strm.avail_out = sizeof(buf);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw swarm_error(ERROR_TYPE_CODEC, std::string("inflate failed: ") + (strm.msg ? strm.msg : "corrupt stream"));
        }
        out.append(buf, sizeof(buf) - strm.avail_out);
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw swarm_error(ERROR_TYPE_CODEC, "inflate failed: truncated stream");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return out;
}

// ============================================================================
// Payload transforms
// ============================================================================

message_payload compress_payload(const message_payload & payload, size_t threshold, int level) {
    const std::string serialized = payload.data.dump();
    if (serialized.size() < threshold) {
        return payload;
    }

    try {
        message_payload out = payload;
        out.data = base64_encode(gzip_compress(serialized, level));
        out.metadata["compressed"]    = true;
        out.metadata["compression"]   = "gzip";
        out.metadata["original_size"] = serialized.size();
        return out;
    } catch (const swarm_error & e) {
        LOG_WRN("compression skipped: %s\n", e.what());
        return payload;
    }
}

message_payload decompress_payload(const message_payload & payload) {
    if (!payload_is_compressed(payload)) {
        return payload;
    }
    if (!payload.data.is_string()) {
        throw swarm_error(ERROR_TYPE_CODEC, "compressed payload data is not a string");
    }

    const std::string raw = gzip_decompress(base64_decode(payload.data.get<std::string>()));

    message_payload out = payload;
    try {
        out.data = json::parse(raw);
    } catch (const json::parse_error & e) {
        throw swarm_error(ERROR_TYPE_CODEC, std::string("decompressed payload is not JSON: ") + e.what());
    }
    out.metadata.erase("compressed");
    out.metadata.erase("compression");
    out.metadata.erase("original_size");
    return out;
}

message_payload encrypt_payload(const message_payload & payload, const encryption_config & cfg, payload_cipher & cipher) {
    message_payload out = payload;
    out.data = base64_encode(cipher.encrypt(payload.data.dump(), cfg.key_id));
    out.metadata["encrypted"] = true;
    out.metadata["cipher"]    = cipher.name();
    out.metadata["key_id"]    = cfg.key_id;
    return out;
}

message_payload decrypt_payload(const message_payload & payload, payload_cipher & cipher) {
    if (!payload_is_encrypted(payload)) {
        return payload;
    }
    if (!payload.data.is_string()) {
        throw swarm_error(ERROR_TYPE_CODEC, "encrypted payload data is not a string");
    }

    const std::string key_id = payload.metadata.value("key_id", "");
    const std::string plain  = cipher.decrypt(base64_decode(payload.data.get<std::string>()), key_id);

    message_payload out = payload;
    try {
        out.data = json::parse(plain);
    } catch (const json::parse_error & e) {
        throw swarm_error(ERROR_TYPE_CODEC, std::string("decrypted payload is not JSON: ") + e.what());
    }
    out.metadata.erase("encrypted");
    out.metadata.erase("cipher");
    out.metadata.erase("key_id");
    return out;
}

} // namespace swarm
