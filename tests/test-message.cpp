// Envelope, checksum and payload codec tests

#include "test-helpers.h"

#include "codec.h"
#include "message.h"

using namespace swarm;

// reversible test cipher: xor with a repeating key byte
class xor_cipher : public payload_cipher {
public:
    std::string name() const override { return "xor"; }

    std::string encrypt(const std::string & plaintext, const std::string & key_id) override {
        return apply(plaintext, key_id);
    }

    std::string decrypt(const std::string & ciphertext, const std::string & key_id) override {
        return apply(ciphertext, key_id);
    }

private:
    static std::string apply(const std::string & in, const std::string & key_id) {
        const char k = key_id.empty() ? 0x5a : key_id[0];
        std::string out = in;
        for (auto & c : out) {
            c ^= k;
        }
        return out;
    }
};

static swarm_message sample_message() {
    swarm_message msg;
    msg.id           = "msg-1";
    msg.type         = MSG_TYPE_MULTICAST;
    msg.sender       = "node-a";
    msg.recipients   = {"node-b", "node-c"};
    msg.payload.data = {{"task", "index"}, {"shards", 4}};
    msg.timestamp    = 1700000000000;
    msg.ttl_ms       = 30000;
    return msg;
}

static bool test_crc32_known_vector() {
    TEST_ASSERT(crc32_hex("123456789") == "cbf43926", "CRC-32 check value should match");
    TEST_ASSERT(crc32_hex("").size() == 8, "empty input should still give 8 hex digits");
    return true;
}

static bool test_checksum_deterministic() {
    swarm_message a = sample_message();
    swarm_message b = sample_message();
    TEST_ASSERT(compute_checksum(a) == compute_checksum(b), "same fields should give the same checksum");

    // id, priority and routing are not covered
    b.id = "msg-2";
    b.priority = MSG_PRIORITY_LOW;
    TEST_ASSERT(compute_checksum(a) == compute_checksum(b), "checksum should ignore id and priority");
    return true;
}

static bool test_checksum_field_sensitivity() {
    const std::string base = compute_checksum(sample_message());

    swarm_message m = sample_message();
    m.sender = "node-x";
    TEST_ASSERT(compute_checksum(m) != base, "sender change should alter checksum");

    m = sample_message();
    m.recipients.push_back("node-d");
    TEST_ASSERT(compute_checksum(m) != base, "recipient change should alter checksum");

    m = sample_message();
    m.payload.data["shards"] = 5;
    TEST_ASSERT(compute_checksum(m) != base, "payload change should alter checksum");

    m = sample_message();
    m.timestamp += 1;
    TEST_ASSERT(compute_checksum(m) != base, "timestamp change should alter checksum");
    return true;
}

static bool test_verify_checksum() {
    swarm_message m = sample_message();
    TEST_ASSERT(!verify_checksum(m), "empty checksum should not verify");

    m.checksum = compute_checksum(m);
    TEST_ASSERT(verify_checksum(m), "fresh checksum should verify");

    m.payload.data["task"] = "tampered";
    TEST_ASSERT(!verify_checksum(m), "tampered payload should fail verification");
    return true;
}

static bool test_message_json_round_trip() {
    swarm_message m = sample_message();
    m.priority = MSG_PRIORITY_HIGH;
    m.routing.strategy = ROUTING_MULTIPATH;
    m.routing.max_hops = 3;
    m.checksum = compute_checksum(m);

    swarm_message back = swarm_message::from_json(json::parse(m.to_json().dump()));
    TEST_ASSERT(back.id == m.id, "id should survive serialization");
    TEST_ASSERT(back.type == MSG_TYPE_MULTICAST, "type should survive serialization");
    TEST_ASSERT(back.priority == MSG_PRIORITY_HIGH, "priority should survive serialization");
    TEST_ASSERT(back.routing.strategy == ROUTING_MULTIPATH, "routing strategy should survive serialization");
    TEST_ASSERT(back.recipients.size() == 2, "recipients should survive serialization");
    TEST_ASSERT(verify_checksum(back), "checksum should still verify after serialization");
    return true;
}

static bool test_message_expiry() {
    swarm_message m = sample_message();
    TEST_ASSERT(!m.expired(m.timestamp + 30000), "message at exactly its TTL is still live");
    TEST_ASSERT(m.expired(m.timestamp + 30001), "message past its TTL is expired");

    m.ttl_ms = 0;
    TEST_ASSERT(!m.expired(m.timestamp + 1000000), "zero TTL never expires");
    return true;
}

static bool test_enum_strings() {
    TEST_ASSERT(message_type_to_str(MSG_TYPE_HEARTBEAT) == "heartbeat", "heartbeat string");
    TEST_ASSERT(str_to_message_type("consensus") == MSG_TYPE_CONSENSUS, "consensus parse");
    TEST_ASSERT(message_priority_to_str(MSG_PRIORITY_EMERGENCY) == "emergency", "emergency string");
    TEST_ASSERT(str_to_message_priority("background") == MSG_PRIORITY_BACKGROUND, "background parse");
    TEST_ASSERT(MSG_PRIORITY_EMERGENCY < MSG_PRIORITY_BACKGROUND, "emergency drains first");
    return true;
}

static bool test_base64() {
    TEST_ASSERT(base64_encode("hello") == "aGVsbG8=", "base64 of hello");
    TEST_ASSERT(base64_encode("") == "", "base64 of empty string");
    TEST_ASSERT(base64_decode("aGVsbG8=") == "hello", "base64 decode of hello");

    bool threw = false;
    try {
        base64_decode("a$b=");
    } catch (const swarm_error & e) {
        threw = e.type() == ERROR_TYPE_CODEC;
    }
    TEST_ASSERT(threw, "invalid base64 should raise a codec error");
    return true;
}

static bool test_gzip_round_trip() {
    std::string text;
    for (int i = 0; i < 200; i++) {
        text += "swarm coordination payload ";
    }
    const std::string packed = gzip_compress(text, 6);
    TEST_ASSERT(packed.size() < text.size(), "repetitive text should shrink");
    TEST_ASSERT((unsigned char) packed[0] == 0x1f && (unsigned char) packed[1] == 0x8b, "gzip magic bytes");
    TEST_ASSERT(gzip_decompress(packed) == text, "gzip round trip should restore the input");

    bool threw = false;
    try {
        gzip_decompress(packed.substr(0, packed.size() / 2));
    } catch (const swarm_error & e) {
        threw = e.type() == ERROR_TYPE_CODEC;
    }
    TEST_ASSERT(threw, "truncated gzip stream should raise a codec error");
    return true;
}

static bool test_compress_payload_threshold() {
    message_payload small;
    small.data = {{"k", "v"}};
    message_payload same = compress_payload(small, 1024, 6);
    TEST_ASSERT(!payload_is_compressed(same), "payload below threshold should stay uncompressed");
    TEST_ASSERT(same.data == small.data, "payload below threshold should be unchanged");

    message_payload big;
    big.data = json::array();
    for (int i = 0; i < 100; i++) {
        big.data.push_back({{"index", i}, {"text", "repeated filler text"}});
    }
    message_payload packed = compress_payload(big, 1024, 6);
    TEST_ASSERT(payload_is_compressed(packed), "payload above threshold should be compressed");
    TEST_ASSERT(packed.data.is_string(), "compressed data should be a base64 string");
    TEST_ASSERT(packed.metadata["compression"] == "gzip", "metadata should name the codec");
    TEST_ASSERT(packed.metadata["original_size"] == big.data.dump().size(), "metadata should record the original size");

    message_payload restored = decompress_payload(packed);
    TEST_ASSERT(restored.data == big.data, "decompression should restore the data");
    TEST_ASSERT(!payload_is_compressed(restored), "restored payload should not be flagged");
    return true;
}

static bool test_encrypt_payload() {
    xor_cipher cipher;
    encryption_config cfg;
    cfg.enabled = true;
    cfg.key_id  = "k1";

    message_payload p;
    p.data = {{"secret", 42}};
    message_payload sealed = encrypt_payload(p, cfg, cipher);
    TEST_ASSERT(payload_is_encrypted(sealed), "payload should be flagged encrypted");
    TEST_ASSERT(sealed.metadata["cipher"] == "xor", "metadata should name the cipher");
    TEST_ASSERT(sealed.data.is_string(), "ciphertext should be a base64 string");

    message_payload opened = decrypt_payload(sealed, cipher);
    TEST_ASSERT(opened.data == p.data, "decryption should restore the data");
    TEST_ASSERT(!payload_is_encrypted(opened), "opened payload should not be flagged");
    return true;
}

static bool test_consensus_records() {
    consensus_proposal p;
    p.id       = "proposal-1";
    p.type     = PROPOSAL_LEADER;
    p.proposer = "node-a";
    p.value    = {{"leader", "node-b"}};
    p.timestamp = 5;

    consensus_proposal back = consensus_proposal::from_json(p.to_json());
    TEST_ASSERT(back.type == PROPOSAL_LEADER, "proposal type should survive");
    TEST_ASSERT(back.round == 1, "proposals are single-round");
    TEST_ASSERT(back.value["leader"] == "node-b", "proposal value should survive");

    consensus_vote v;
    v.proposal_id = "proposal-1";
    v.voter       = "node-b";
    v.decision    = VOTE_REJECT;
    consensus_vote vb = consensus_vote::from_json(v.to_json());
    TEST_ASSERT(vb.decision == VOTE_REJECT, "vote decision should survive");
    TEST_ASSERT(str_to_vote_decision("abstain") == VOTE_ABSTAIN, "abstain parse");
    return true;
}

int main() {
    quiet_logs();

    std::cout << "=== Message and Codec Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Checksums
    RUN_TEST(test_crc32_known_vector);
    RUN_TEST(test_checksum_deterministic);
    RUN_TEST(test_checksum_field_sensitivity);
    RUN_TEST(test_verify_checksum);

    // Envelope
    RUN_TEST(test_message_json_round_trip);
    RUN_TEST(test_message_expiry);
    RUN_TEST(test_enum_strings);
    RUN_TEST(test_consensus_records);

    // Codecs
    RUN_TEST(test_base64);
    RUN_TEST(test_gzip_round_trip);
    RUN_TEST(test_compress_payload_threshold);
    RUN_TEST(test_encrypt_payload);

    return report_results(total, passed, failed);
}
