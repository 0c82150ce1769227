#pragma once

#include "event-bus.h"
#include "message.h"
#include "node-registry.h"
#include "router.h"

#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace swarm {

// Decides how the local node votes on an incoming proposal
class consensus_evaluator {
public:
    enum kind {
        EVALUATOR_ALWAYS_ACCEPT,
        EVALUATOR_ALWAYS_REJECT,
        EVALUATOR_FIELD_THRESHOLD,  // accept when value[field] >= threshold
        EVALUATOR_CUSTOM
    };

private:
    kind k = EVALUATOR_ALWAYS_ACCEPT;
    std::string field;
    double threshold = 0.0;
    std::function<vote_decision(const consensus_proposal &)> fn;

public:
    static consensus_evaluator always_accept();
    static consensus_evaluator always_reject();
    static consensus_evaluator field_threshold(const std::string & field, double threshold);
    static consensus_evaluator custom(std::function<vote_decision(const consensus_proposal &)> fn);

    kind get_kind() const { return k; }

    vote_decision evaluate(const consensus_proposal & proposal) const;
};

// ============================================================================
// Consensus Engine
// ============================================================================

// Single-shot quorum voting. Only the proposer tallies; a proposal resolves once
// votes >= quorum and is accepted iff accept votes >= quorum.
class consensus_engine {
private:
    struct pending_proposal {
        consensus_proposal proposal;
        std::vector<std::string> participants;
        std::map<std::string, consensus_vote> votes;  // one per voter
    };

    std::map<std::string, pending_proposal> proposals;
    double quorum_ratio;
    int64_t timeout_ms;
    consensus_evaluator evaluator = consensus_evaluator::always_accept();

    message_router & router;
    node_registry & registry;
    event_bus & bus;
    clock_fn clock;
    std::mt19937 & rng;

    void on_proposal(const consensus_proposal & proposal);
    void on_vote(const consensus_vote & vote, const std::string & sender);
    void tally(const std::string & proposal_id);

public:
    consensus_engine(double quorum_ratio, int64_t timeout_ms, message_router & router, node_registry & registry,
                     event_bus & bus, clock_fn clock, std::mt19937 & rng);

    // participants default to every reachable peer; returns the proposal id
    std::string initiate(proposal_type type, const json & value, const std::vector<std::string> & participants = {});

    // throws swarm_error(ERROR_TYPE_VALIDATION) for an unknown proposal
    void vote(const std::string & proposal_id, vote_decision decision, const std::string & reasoning = "");

    // system handler for consensus messages
    void on_message(const swarm_message & msg);

    // purge proposals older than the consensus timeout; returns the number purged
    size_t sweep();

    // max(1, floor(known nodes * ratio))
    int quorum() const;

    size_t active() const { return proposals.size(); }
    bool get_proposal(const std::string & proposal_id, consensus_proposal & proposal) const;
    size_t vote_count(const std::string & proposal_id) const;

    void set_evaluator(const consensus_evaluator & e) { evaluator = e; }
};

} // namespace swarm
