#include "consensus.h"

#include "codec.h"
#include "log.h"

#include <algorithm>
#include <cmath>

namespace swarm {

// ============================================================================
// Evaluators
// ============================================================================

consensus_evaluator consensus_evaluator::always_accept() {
    consensus_evaluator e;
    e.k = EVALUATOR_ALWAYS_ACCEPT;
    return e;
}

consensus_evaluator consensus_evaluator::always_reject() {
    consensus_evaluator e;
    e.k = EVALUATOR_ALWAYS_REJECT;
    return e;
}

consensus_evaluator consensus_evaluator::field_threshold(const std::string & field, double threshold) {
    consensus_evaluator e;
    e.k         = EVALUATOR_FIELD_THRESHOLD;
    e.field     = field;
    e.threshold = threshold;
    return e;
}

consensus_evaluator consensus_evaluator::custom(std::function<vote_decision(const consensus_proposal &)> fn) {
    consensus_evaluator e;
    e.k  = EVALUATOR_CUSTOM;
    e.fn = std::move(fn);
    return e;
}

vote_decision consensus_evaluator::evaluate(const consensus_proposal & proposal) const {
    switch (k) {
        case EVALUATOR_ALWAYS_ACCEPT:
            return VOTE_ACCEPT;
        case EVALUATOR_ALWAYS_REJECT:
            return VOTE_REJECT;
        case EVALUATOR_FIELD_THRESHOLD: {
            const json & v = proposal.value;
            if (!v.is_object() || !v.contains(field) || !v[field].is_number()) {
                return VOTE_ABSTAIN;
            }
            return v[field].get<double>() >= threshold ? VOTE_ACCEPT : VOTE_REJECT;
        }
        case EVALUATOR_CUSTOM:
            return fn ? fn(proposal) : VOTE_ABSTAIN;
    }
    return VOTE_ABSTAIN;
}

// ============================================================================
// Consensus Engine Implementation
// ============================================================================

consensus_engine::consensus_engine(double quorum_ratio, int64_t timeout_ms, message_router & router,
                                   node_registry & registry, event_bus & bus, clock_fn clock, std::mt19937 & rng)
    : quorum_ratio(quorum_ratio), timeout_ms(timeout_ms), router(router), registry(registry),
      bus(bus), clock(std::move(clock)), rng(rng) {}

int consensus_engine::quorum() const {
    const int q = (int) std::floor((double) registry.size() * quorum_ratio);
    return std::max(1, q);
}

std::string consensus_engine::initiate(proposal_type type, const json & value,
                                       const std::vector<std::string> & participants) {
    const int64_t now = clock();

    pending_proposal pending;
    pending.proposal.id        = generate_id("proposal", now, rng);
    pending.proposal.type      = type;
    pending.proposal.proposer  = registry.local_node_id();
    pending.proposal.value     = value;
    pending.proposal.round     = 1;
    pending.proposal.timestamp = now;
    pending.participants       = participants.empty() ? registry.reachable_peer_ids() : participants;

    const std::string id = pending.proposal.id;
    const json wire = {{"kind", "proposal"}, {"proposal", pending.proposal.to_json()}};
    const auto recipients = pending.participants;
    proposals[id] = std::move(pending);

    if (!recipients.empty()) {
        router.send(MSG_TYPE_CONSENSUS, recipients, wire, MSG_PRIORITY_HIGH);
    }

    LOG_INF("consensus initiated: %s (%s) with %zu participant(s), quorum %d\n",
            id.c_str(), proposal_type_to_str(type).c_str(), recipients.size(), quorum());

    consensus_event ev;
    ev.proposal_id = id;
    ev.type        = type;
    ev.value       = value;
    bus.publish(EVENT_CONSENSUS_INITIATED, now, ev);

    return id;
}

void consensus_engine::vote(const std::string & proposal_id, vote_decision decision, const std::string & reasoning) {
    auto it = proposals.find(proposal_id);
    if (it == proposals.end()) {
        throw swarm_error(ERROR_TYPE_VALIDATION, "Unknown proposal: " + proposal_id);
    }

    const int64_t now = clock();
    const std::string & local = registry.local_node_id();

    consensus_vote v;
    v.proposal_id = proposal_id;
    v.voter       = local;
    v.decision    = decision;
    v.reasoning   = reasoning;
    v.timestamp   = now;
    v.signature   = crc32_hex(proposal_id + "|" + local + "|" + vote_decision_to_str(decision));

    it->second.votes[local] = v;
    const std::string proposer = it->second.proposal.proposer;

    bus.publish(EVENT_VOTE_CAST, now, vote_event{proposal_id, local, decision});

    if (proposer == local) {
        tally(proposal_id);
    } else {
        router.send(MSG_TYPE_CONSENSUS, {proposer}, json{{"kind", "vote"}, {"vote", v.to_json()}}, MSG_PRIORITY_HIGH);
    }
}

void consensus_engine::on_message(const swarm_message & msg) {
    const json & data = msg.payload.data;
    const std::string kind = data.is_object() ? data.value("kind", "") : "";

    if (kind == "proposal" && data.contains("proposal")) {
        on_proposal(consensus_proposal::from_json(data["proposal"]));
    } else if (kind == "vote" && data.contains("vote")) {
        on_vote(consensus_vote::from_json(data["vote"]), msg.sender);
    } else {
        LOG_WRN("malformed consensus message %s from %s\n", msg.id.c_str(), msg.sender.c_str());
    }
}

void consensus_engine::on_proposal(const consensus_proposal & proposal) {
    if (proposal.id.empty() || proposal.proposer == registry.local_node_id()) {
        return;
    }
    if (proposals.count(proposal.id) > 0) {
        return;
    }

    pending_proposal pending;
    pending.proposal = proposal;
    proposals[proposal.id] = pending;

    const vote_decision decision = evaluator.evaluate(proposal);
    LOG_DBG("voting %s on proposal %s from %s\n",
            vote_decision_to_str(decision).c_str(), proposal.id.c_str(), proposal.proposer.c_str());
    vote(proposal.id, decision, "evaluated locally");
}

void consensus_engine::on_vote(const consensus_vote & v, const std::string & sender) {
    // a node votes only for itself
    if (v.voter != sender || !registry.contains(v.voter)) {
        LOG_WRN("dropping vote for %s cast as %s by %s\n", v.proposal_id.c_str(), v.voter.c_str(), sender.c_str());
        return;
    }

    auto it = proposals.find(v.proposal_id);
    if (it == proposals.end()) {
        LOG_DBG("vote from %s for unknown or resolved proposal %s\n", v.voter.c_str(), v.proposal_id.c_str());
        return;
    }
    if (it->second.proposal.proposer != registry.local_node_id()) {
        return;
    }

    // a repeat vote replaces the earlier one
    it->second.votes[v.voter] = v;
    tally(v.proposal_id);
}

void consensus_engine::tally(const std::string & proposal_id) {
    auto it = proposals.find(proposal_id);
    if (it == proposals.end()) {
        return;
    }

    const int q = quorum();
    const int total = (int) it->second.votes.size();
    if (total < q) {
        return;
    }

    int accepts = 0;
    for (const auto & [_, v] : it->second.votes) {
        if (v.decision == VOTE_ACCEPT) accepts++;
    }

    consensus_event ev;
    ev.proposal_id = proposal_id;
    ev.type        = it->second.proposal.type;
    ev.result      = accepts >= q ? "accepted" : "rejected";
    ev.votes       = total;
    ev.value       = it->second.proposal.value;

    proposals.erase(it);

    LOG_INF("consensus reached on %s: %s (%d/%d accept, quorum %d)\n",
            proposal_id.c_str(), ev.result.c_str(), accepts, total, q);
    bus.publish(EVENT_CONSENSUS_REACHED, clock(), ev);
}

size_t consensus_engine::sweep() {
    const int64_t now = clock();
    size_t purged = 0;

    for (auto it = proposals.begin(); it != proposals.end();) {
        if (now - it->second.proposal.timestamp > timeout_ms) {
            if (it->second.proposal.proposer == registry.local_node_id()) {
                LOG_WRN("consensus on %s timed out with %zu of %d vote(s)\n",
                        it->first.c_str(), it->second.votes.size(), quorum());
            }
            it = proposals.erase(it);
            purged++;
        } else {
            ++it;
        }
    }

    return purged;
}

bool consensus_engine::get_proposal(const std::string & proposal_id, consensus_proposal & proposal) const {
    auto it = proposals.find(proposal_id);
    if (it == proposals.end()) {
        return false;
    }
    proposal = it->second.proposal;
    return true;
}

size_t consensus_engine::vote_count(const std::string & proposal_id) const {
    auto it = proposals.find(proposal_id);
    return it == proposals.end() ? 0 : it->second.votes.size();
}

} // namespace swarm
