// Gossip anti-entropy and quorum consensus tests

#include "test-helpers.h"

#include "codec.h"
#include "consensus.h"
#include "gossip.h"

using namespace swarm;

static gossip_state make_state(const std::string & key, int64_t version, const json & data) {
    gossip_state s;
    s.key       = key;
    s.version   = version;
    s.data      = data;
    s.timestamp = version;
    s.checksum  = crc32_hex(data.dump());
    return s;
}

// ============================================================================
// Gossip
// ============================================================================

static bool test_gossip_version_ordering() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    gossip_engine & g = a->get_gossip();

    TEST_ASSERT(g.apply(make_state("leader", 7, json{{"id", "n7"}})), "first version is adopted");
    TEST_ASSERT(!g.apply(make_state("leader", 5, json{{"id", "n5"}})), "older version is ignored");
    TEST_ASSERT(!g.apply(make_state("leader", 7, json{{"id", "other"}})), "equal version is ignored");

    gossip_state s;
    TEST_ASSERT(g.get("leader", s) && s.version == 7 && s.data["id"] == "n7", "v7 is kept");

    TEST_ASSERT(g.apply(make_state("leader", 9, json{{"id", "n9"}})), "newer version replaces");
    TEST_ASSERT(g.get("leader", s) && s.data["id"] == "n9", "v9 is now current");
    TEST_ASSERT(g.size() == 1, "one key tracked");
    return true;
}

static bool test_gossip_checksum_rejected() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);

    gossip_state bad = make_state("config", 3, json{{"fanout", 3}});
    bad.data["fanout"] = 4;
    TEST_ASSERT(!a->get_gossip().apply(bad), "state with a stale checksum is rejected");
    TEST_ASSERT(a->get_gossip().size() == 0, "nothing was stored");
    return true;
}

static bool test_gossip_local_versioning() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);

    const gossip_state first = a->start_gossip("members", json{{"n", 1}});
    TEST_ASSERT(first.version == clock.get(), "first version is the current time");

    const gossip_state second = a->start_gossip("members", json{{"n", 2}});
    TEST_ASSERT(second.version == first.version + 1, "same-instant update bumps the version");

    clock.advance(500);
    const gossip_state third = a->start_gossip("members", json{{"n", 3}});
    TEST_ASSERT(third.version == clock.get(), "later update takes the clock value");

    bool threw = false;
    try {
        a->start_gossip("", json{});
    } catch (const swarm_error & e) {
        threw = e.type() == ERROR_TYPE_VALIDATION;
    }
    TEST_ASSERT(threw, "empty key is rejected");
    return true;
}

static bool test_gossip_unserializable_data() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);

    bool threw = false;
    try {
        a->start_gossip("bad", json{{"name", std::string("\xff")}});
    } catch (const swarm_error & e) {
        threw = e.type() == ERROR_TYPE_VALIDATION;
    }
    TEST_ASSERT(threw, "invalid UTF-8 data is a validation error");
    TEST_ASSERT(a->get_gossip().size() == 0, "nothing stored");

    gossip_state incoming;
    incoming.key      = "bad";
    incoming.version  = 1;
    incoming.data     = json{{"name", std::string("\xff")}};
    incoming.checksum = "00000000";
    TEST_ASSERT(!a->get_gossip().apply(incoming), "unserializable remote state is ignored");
    return true;
}

static bool test_gossip_propagation() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});

    event_recorder rec(a.bus);
    const gossip_state s = a->start_gossip("leader", json{{"id", "a"}});
    TEST_ASSERT(rec.count(EVENT_GOSSIP_STARTED) == 1, "gossip:started is emitted");
    pump({&a, &b, &c});

    gossip_state got;
    TEST_ASSERT(b->get_gossip().get("leader", got) && got.version == s.version, "b learned the state");
    TEST_ASSERT(c->get_gossip().get("leader", got) && got.data["id"] == "a", "c learned the state");

    // a late joiner catches up on the next round
    sim_node d("d", net, clock);
    connect_all({&a, &b, &c, &d});
    TEST_ASSERT(!d->get_gossip().get("leader", got), "d starts empty");

    TEST_ASSERT(b->gossip_round() == 1, "b gossips its single key");
    pump({&a, &b, &c, &d});
    TEST_ASSERT(d->get_gossip().get("leader", got) && got.version == s.version, "d caught up from b");
    return true;
}

// ============================================================================
// Consensus
// ============================================================================

static bool test_quorum_size() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    TEST_ASSERT(a->get_consensus().quorum() == 1, "lone node needs one vote");

    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});
    TEST_ASSERT(a->get_consensus().quorum() == 2, "floor(3 * 0.67) = 2");
    return true;
}

static bool test_consensus_accepted() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});

    event_recorder rec(a.bus);
    const std::string id = a->initiate_consensus(PROPOSAL_LEADER, json{{"leader", "b"}});
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_INITIATED) == 1, "initiation is announced");
    TEST_ASSERT(a->get_consensus().active() == 1, "proposal is pending");

    pump({&a, &b, &c});

    const auto * reached = rec.last_payload<consensus_event>(EVENT_CONSENSUS_REACHED);
    TEST_ASSERT(reached != nullptr, "two peer accepts reach quorum");
    TEST_ASSERT(reached->proposal_id == id, "event names the proposal");
    TEST_ASSERT(reached->result == "accepted", "proposal accepted");
    TEST_ASSERT(reached->votes == 2, "both votes counted");
    TEST_ASSERT(reached->value["leader"] == "b", "event carries the value");
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 1, "resolved exactly once");
    TEST_ASSERT(a->get_consensus().active() == 0, "resolved proposal is removed");
    return true;
}

static bool test_consensus_rejected() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});

    b->set_consensus_evaluator(consensus_evaluator::always_reject());
    c->set_consensus_evaluator(consensus_evaluator::always_reject());

    event_recorder rec(a.bus);
    a->initiate_consensus(PROPOSAL_VALUE, json{{"x", 1}});
    pump({&a, &b, &c});

    const auto * reached = rec.last_payload<consensus_event>(EVENT_CONSENSUS_REACHED);
    TEST_ASSERT(reached != nullptr && reached->result == "rejected", "quorum of rejects resolves as rejected");
    return true;
}

static bool test_proposer_vote_counts() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});

    event_recorder rec(a.bus);
    const std::string id = a->initiate_consensus(PROPOSAL_CONFIGURATION, json{{"fanout", 4}}, {"b"});
    a->vote(id, VOTE_ACCEPT, "self");
    TEST_ASSERT(a->get_consensus().vote_count(id) == 1, "proposer vote is recorded");
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 0, "one vote is below quorum");
    TEST_ASSERT(rec.count(EVENT_VOTE_CAST) == 1, "vote:cast is emitted");

    pump({&a, &b, &c});
    const auto * reached = rec.last_payload<consensus_event>(EVENT_CONSENSUS_REACHED);
    TEST_ASSERT(reached != nullptr && reached->result == "accepted", "self vote plus b reaches quorum");

    consensus_proposal p;
    TEST_ASSERT(!c->get_consensus().get_proposal(id, p), "non-participant never saw the proposal");
    return true;
}

static bool test_forged_votes_dropped() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    sim_node d("d", net, clock);
    sim_node e("e", net, clock);
    connect_all({&a, &b, &c, &d, &e});
    TEST_ASSERT(a->get_consensus().quorum() == 3, "floor(5 * 0.67) = 3");

    event_recorder rec(a.bus);
    const std::string id = a->initiate_consensus(PROPOSAL_VALUE, json{{"x", 1}}, {"b"});
    pump({&a, &b, &c, &d, &e});
    TEST_ASSERT(a->get_consensus().vote_count(id) == 1, "b voted once for itself");

    // b casts extra accepts under other identities
    for (const std::string voter : {"ghost-1", "ghost-2", "c"}) {
        consensus_vote v;
        v.proposal_id = id;
        v.voter       = voter;
        v.decision    = VOTE_ACCEPT;
        v.timestamp   = clock.get();
        b->send(MSG_TYPE_CONSENSUS, {"a"}, json{{"kind", "vote"}, {"vote", v.to_json()}}, MSG_PRIORITY_HIGH);
    }
    pump({&a, &b, &c, &d, &e});

    TEST_ASSERT(a->get_consensus().vote_count(id) == 1, "votes under other identities are dropped");
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 0, "one node cannot reach quorum alone");

    a->vote(id, VOTE_ACCEPT);
    TEST_ASSERT(a->get_consensus().vote_count(id) == 2, "proposer vote still counts");
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 0, "two real votes stay below quorum");
    return true;
}

static bool test_consensus_timeout_is_silent() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);
    sim_node b("b", net, clock);
    sim_node c("c", net, clock);
    connect_all({&a, &b, &c});

    net.set_link_down("b", true);
    net.set_link_down("c", true);

    event_recorder rec(a.bus);
    const std::string id = a->initiate_consensus(PROPOSAL_VALUE, json{{"x", 1}});
    pump({&a, &b, &c});
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 0, "no votes means no decision");
    TEST_ASSERT(a->get_consensus().vote_count(id) == 0, "no votes recorded");

    clock.advance(a->get_config().consensus_timeout_ms);
    TEST_ASSERT(a->get_consensus().sweep() == 0, "proposal at exactly the timeout survives");

    clock.advance(1);
    TEST_ASSERT(a->get_consensus().sweep() == 1, "proposal past the timeout is purged");
    TEST_ASSERT(rec.count(EVENT_CONSENSUS_REACHED) == 0, "timeout does not emit a decision");
    TEST_ASSERT(a->get_consensus().active() == 0, "nothing left pending");
    return true;
}

static bool test_vote_unknown_proposal() {
    manual_clock clock;
    local_network net;
    sim_node a("a", net, clock);

    bool threw = false;
    try {
        a->vote("proposal-missing", VOTE_ACCEPT);
    } catch (const swarm_error & e) {
        threw = e.type() == ERROR_TYPE_VALIDATION;
    }
    TEST_ASSERT(threw, "vote on an unknown proposal is rejected");
    return true;
}

static bool test_field_threshold_evaluator() {
    const consensus_evaluator e = consensus_evaluator::field_threshold("score", 0.5);

    consensus_proposal p;
    p.value = {{"score", 0.8}};
    TEST_ASSERT(e.evaluate(p) == VOTE_ACCEPT, "value above threshold is accepted");

    p.value = {{"score", 0.5}};
    TEST_ASSERT(e.evaluate(p) == VOTE_ACCEPT, "value at threshold is accepted");

    p.value = {{"score", 0.3}};
    TEST_ASSERT(e.evaluate(p) == VOTE_REJECT, "value below threshold is rejected");

    p.value = {{"other", 1}};
    TEST_ASSERT(e.evaluate(p) == VOTE_ABSTAIN, "missing field abstains");

    const consensus_evaluator c = consensus_evaluator::custom([](const consensus_proposal & prop) {
        return prop.type == PROPOSAL_LEADER ? VOTE_ACCEPT : VOTE_REJECT;
    });
    p.type = PROPOSAL_LEADER;
    TEST_ASSERT(c.evaluate(p) == VOTE_ACCEPT, "custom evaluator is consulted");
    TEST_ASSERT(c.get_kind() == consensus_evaluator::EVALUATOR_CUSTOM, "custom kind");
    return true;
}

int main() {
    quiet_logs();

    std::cout << "=== Gossip and Consensus Tests ===" << std::endl << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Gossip
    RUN_TEST(test_gossip_version_ordering);
    RUN_TEST(test_gossip_checksum_rejected);
    RUN_TEST(test_gossip_local_versioning);
    RUN_TEST(test_gossip_unserializable_data);
    RUN_TEST(test_gossip_propagation);

    // Consensus
    RUN_TEST(test_quorum_size);
    RUN_TEST(test_consensus_accepted);
    RUN_TEST(test_consensus_rejected);
    RUN_TEST(test_proposer_vote_counts);
    RUN_TEST(test_forged_votes_dropped);
    RUN_TEST(test_consensus_timeout_is_silent);
    RUN_TEST(test_vote_unknown_proposal);
    RUN_TEST(test_field_threshold_evaluator);

    return report_results(total, passed, failed);
}
