#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "concord/decision_registry.hpp"
#include "test_support.hpp"
#include <atomic>
#include <optional>
#include <thread>

using namespace concord;
using namespace concord::testing;

namespace {
    struct Fixture {
        FakeClock clock;
        std::shared_ptr<ReputationLedger> ledger = std::make_shared<ReputationLedger>();
        std::shared_ptr<InMemoryDecisionStore> store = std::make_shared<InMemoryDecisionStore>();
        std::shared_ptr<RecordingMessenger> messenger = std::make_shared<RecordingMessenger>();
        std::shared_ptr<RecordingExecutor> executor = std::make_shared<RecordingExecutor>();
        std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();

        Collaborators collaborators() const {
            Collaborators c;
            c.store = store;
            c.messenger = messenger;
            c.executor = executor;
            c.events = events;
            c.now = clock.fn();
            return c;
        }

        DecisionRegistry make_registry() const {
            return DecisionRegistry(EngineSettings{}, ledger, collaborators());
        }
    };

    DecisionResult result_of(const DecisionRegistry &registry, const std::string &id) {
        auto status = registry.get_status(id);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<DecisionResult>(*status));
        return std::get<DecisionResult>(*status);
    }

    LiveStatus live_of(const DecisionRegistry &registry, const std::string &id) {
        auto status = registry.get_status(id);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<LiveStatus>(*status));
        return std::get<LiveStatus>(*status);
    }
}

TEST_CASE("Created decision opens for voting and requests votes", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();

    auto request = make_request({"market", "risk"});
    request.optional_agents = {"news"};
    request.priority = Priority::Critical;
    auto id = registry.create(request);
    REQUIRE(id.has_value());
    REQUIRE(id->size() == 36);

    auto live = live_of(registry, *id);
    REQUIRE(live.decision.status == DecisionStatus::Voting);
    REQUIRE(live.decision.minimum_votes == 1);
    REQUIRE(live.decision.expires_at - live.decision.created_at == std::chrono::seconds(60));
    REQUIRE(live.non_voting_agents.size() == 3);

    REQUIRE(f.messenger->sent.size() == 3);
    const auto &first = f.messenger->sent[0];
    REQUIRE(first.agent_id == "market");
    REQUIRE(first.required);
    REQUIRE(first.expires_in == std::chrono::seconds(60));
    REQUIRE(first.payload["subject"] == "Consensus Required: Rebalance portfolio");
    REQUIRE(first.payload["priority"] == "high");
    REQUIRE(first.payload["options"] == nlohmann::json::array({"yes", "no"}));

    const auto &optional = f.messenger->sent[2];
    REQUIRE(optional.agent_id == "news");
    REQUIRE_FALSE(optional.required);
    REQUIRE(optional.payload["subject"] == "Optional Vote: Rebalance portfolio");
    REQUIRE(optional.payload["optional"] == true);
    REQUIRE(optional.payload["priority"] == "medium");

    REQUIRE(f.store->decisions.at(*id).status == DecisionStatus::Voting);
    REQUIRE(f.events->count(event_types::kDecisionCreated) == 1);
}

TEST_CASE("Default timeout follows priority", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();

    auto request = make_request({"a"});
    request.timeout_seconds.reset();
    request.priority = Priority::High;
    auto id = registry.create(request);
    REQUIRE(id.has_value());
    REQUIRE(live_of(registry, *id).decision.timeout_seconds == 180);

    request.priority = Priority::Low;
    id = registry.create(request);
    REQUIRE(live_of(registry, *id).decision.timeout_seconds == 300);
}

TEST_CASE("Messenger failures do not block creation", "[registry]")
{
    Fixture f;
    f.messenger->fail = true;
    auto registry = f.make_registry();

    auto id = registry.create(make_request({"a", "b"}));
    REQUIRE(id.has_value());
    REQUIRE(live_of(registry, *id).decision.status == DecisionStatus::Voting);
}

TEST_CASE("Invalid requests are rejected without side effects", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();

    auto no_agents = registry.create(make_request({}));
    REQUIRE_FALSE(no_agents.has_value());
    REQUIRE(no_agents.error().code == ErrorCode::InvalidDecision);

    auto duplicated = make_request({"a", "b"});
    duplicated.optional_agents = {"a"};
    REQUIRE(registry.create(duplicated).error().code == ErrorCode::InvalidDecision);

    auto bad_timeout = make_request({"a"});
    bad_timeout.timeout_seconds = 0;
    REQUIRE(registry.create(bad_timeout).error().code == ErrorCode::InvalidDecision);

    auto bad_threshold = make_request({"a"});
    bad_threshold.consensus_threshold = 1.5;
    REQUIRE(registry.create(bad_threshold).error().code == ErrorCode::InvalidDecision);

    REQUIRE(registry.active_count() == 0);
    REQUIRE(f.messenger->sent.empty());
    REQUIRE(f.store->decisions.empty());
    REQUIRE(f.events->events.empty());
}

TEST_CASE("Vote validation errors", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b", "c", "d"}));

    SECTION("unknown decision")
    {
        auto res = registry.cast_vote("missing", "a", VoteType::Approve, 0.9, "");
        REQUIRE(res.error().code == ErrorCode::NotFound);
    }

    SECTION("ineligible agent")
    {
        auto res = registry.cast_vote(id, "mallory", VoteType::Approve, 0.9, "");
        REQUIRE(res.error().code == ErrorCode::IneligibleAgent);
    }

    SECTION("duplicate vote")
    {
        REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "first").value());
        auto res = registry.cast_vote(id, "a", VoteType::Reject, 0.9, "second");
        REQUIRE(res.error().code == ErrorCode::DuplicateVote);
        REQUIRE(live_of(registry, id).total_votes == 1);
    }

    SECTION("confidence out of range")
    {
        auto res = registry.cast_vote(id, "a", VoteType::Approve, 1.2, "");
        REQUIRE(res.error().code == ErrorCode::InvalidInput);
        REQUIRE(live_of(registry, id).total_votes == 0);
    }

    SECTION("resolved decision")
    {
        REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "").has_value());
        REQUIRE(registry.cast_vote(id, "b", VoteType::Approve, 0.9, "").has_value());
        auto res = registry.cast_vote(id, "c", VoteType::Approve, 0.9, "");
        REQUIRE(res.error().code == ErrorCode::InvalidState);
    }
}

TEST_CASE("Simple majority resolves and executes the approved action", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b", "c"}));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "momentum").value());
    REQUIRE(registry.active_count() == 1);
    REQUIRE(registry.cast_vote(id, "b", VoteType::Approve, 0.8, "agree").value());

    REQUIRE(registry.active_count() == 0);
    REQUIRE(registry.history_count() == 1);

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Approved);
    REQUIRE(result.consensus_reached);
    REQUIRE(result.vote_count == 2);
    REQUIRE(result.approval_percentage == Catch::Approx(100.0));
    REQUIRE(result.non_participating_agents == std::vector<std::string>{"c"});
    REQUIRE(result.execution_status == ExecutionStatus::Completed);
    REQUIRE(result.execution_details["executed"] == "trading_strategy");

    REQUIRE(f.executor->calls == std::vector<std::string>{id});
    REQUIRE(f.store->decisions.at(id).status == DecisionStatus::ConsensusReached);
    REQUIRE(f.store->results.count(id) == 1);
    REQUIRE(f.store->votes.size() == 2);
    REQUIRE(f.store->agents.count("c") == 1);

    REQUIRE(f.events->events.size() == 4);
    REQUIRE(f.events->events[0].event_type == event_types::kDecisionCreated);
    REQUIRE(f.events->events[1].event_type == event_types::kVoteCast);
    REQUIRE(f.events->events[2].event_type == event_types::kVoteCast);
    REQUIRE(f.events->events[3].event_type == event_types::kDecisionCompleted);
}

TEST_CASE("Rejected decisions are not executed", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b"}));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Reject, 0.7, "too risky").value());

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Rejected);
    REQUIRE(result.consensus_reached);
    REQUIRE(result.execution_status == ExecutionStatus::Pending);
    REQUIRE(f.executor->calls.empty());
    REQUIRE(f.store->decisions.at(id).status == DecisionStatus::Rejected);
}

TEST_CASE("Failed execution keeps the consensus outcome", "[registry]")
{
    Fixture f;
    f.executor->fail = true;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a"}));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 1.0, "").value());

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Approved);
    REQUIRE(result.consensus_reached);
    REQUIRE(result.execution_status == ExecutionStatus::Failed);
    REQUIRE(result.execution_details["error"] == "exchange rejected order");
}

TEST_CASE("Unanimous with a dissenting vote waits for timeout", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b", "c"}, ConsensusAlgorithm::Unanimous));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "").value());
    REQUIRE(registry.cast_vote(id, "b", VoteType::Approve, 0.9, "").value());
    REQUIRE(registry.cast_vote(id, "c", VoteType::Reject, 0.9, "").value());

    auto live = live_of(registry, id);
    REQUIRE(live.decision.status == DecisionStatus::Voting);
    REQUIRE(live.participation_rate == Catch::Approx(1.0));

    REQUIRE(registry.sweep_expired() == 0);
    f.clock.advance(std::chrono::seconds(61));
    REQUIRE(registry.sweep_expired() == 1);

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Timeout);
    REQUIRE_FALSE(result.consensus_reached);
    REQUIRE(f.executor->calls.empty());
    REQUIRE(f.store->decisions.at(id).status == DecisionStatus::Timeout);
}

TEST_CASE("Split vote stays open until the deadline", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b", "c", "d"}));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "").value());
    REQUIRE(registry.cast_vote(id, "b", VoteType::Reject, 0.9, "").value());
    REQUIRE(live_of(registry, id).decision.status == DecisionStatus::Voting);

    f.clock.advance(std::chrono::seconds(61));
    auto late = registry.cast_vote(id, "c", VoteType::Approve, 0.9, "");
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().code == ErrorCode::Expired);

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Timeout);
    REQUIRE(result.vote_count == 2);

    // already resolved by the late vote
    REQUIRE(registry.sweep_expired() == 0);
}

TEST_CASE("Weighted majority end to end", "[registry]")
{
    Fixture f;
    f.ledger->seed("c", 0.0);
    auto registry = f.make_registry();
    auto id = *registry.create(make_request({"a", "b", "c"}, ConsensusAlgorithm::WeightedMajority));

    REQUIRE(registry.cast_vote(id, "a", VoteType::Approve, 0.9, "").value());
    REQUIRE(live_of(registry, id).weighted_votes.at(VoteType::Approve) == Catch::Approx(1.0));

    REQUIRE(registry.cast_vote(id, "b", VoteType::Approve, 0.9, "").value());

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Approved);
    REQUIRE(result.votes.size() == 2);
    REQUIRE(result.votes[0].weight == Catch::Approx(1.0));
    REQUIRE(result.votes[1].weight == Catch::Approx(1.0));

    // c did not vote: 0.0 stays clamped at the floor
    REQUIRE(f.ledger->get_weight("c") == Catch::Approx(0.5));
}

TEST_CASE("Cast votes keep their weight snapshot", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();

    auto first = *registry.create(make_request({"a", "b", "c", "d"}, ConsensusAlgorithm::WeightedMajority));
    REQUIRE(registry.cast_vote(first, "a", VoteType::Approve, 0.9, "").value());

    // a misses the second decision and loses reputation
    auto second = *registry.create(make_request({"a", "e"}));
    REQUIRE(registry.cast_vote(second, "e", VoteType::Approve, 0.9, "").value());
    REQUIRE(f.ledger->get_reputation("a") == Catch::Approx(0.9));

    auto live = live_of(registry, first);
    REQUIRE(live.weighted_votes.at(VoteType::Approve) == Catch::Approx(1.0));

    REQUIRE(registry.cast_vote(first, "b", VoteType::Approve, 0.9, "").value());
    auto result = result_of(registry, first);
    REQUIRE(result.votes[0].agent_id == "a");
    REQUIRE(result.votes[0].weight == Catch::Approx(1.0));
}

TEST_CASE("Concurrent decisive vote and sweep resolve once", "[registry][concurrency]")
{
    for (int round = 0; round < 50; ++round)
    {
        Fixture f;
        auto registry = f.make_registry();
        auto id = *registry.create(make_request({"a"}));

        // The deadline passes while the vote and the sweep are in flight.
        std::atomic<bool> go{false};
        auto wait_for_go = [&go] {
            while (!go.load())
                std::this_thread::yield();
        };
        std::thread voter([&] {
            wait_for_go();
            (void)registry.cast_vote(id, "a", VoteType::Approve, 1.0, "");
        });
        std::thread ticker([&] {
            wait_for_go();
            f.clock.advance(std::chrono::seconds(61));
        });
        std::thread sweeper([&] {
            wait_for_go();
            for (int i = 0; i < 20; ++i)
                (void)registry.sweep_expired();
        });
        go = true;
        voter.join();
        ticker.join();
        sweeper.join();
        (void)registry.sweep_expired();

        REQUIRE(registry.history_count() == 1);
        REQUIRE(registry.active_count() == 0);
        REQUIRE(f.store->result_writes == 1);
        REQUIRE(f.events->count(event_types::kDecisionCompleted) == 1);

        auto result = result_of(registry, id);
        if (result.final_decision == Outcome::Approved)
        {
            REQUIRE(result.consensus_reached);
            REQUIRE(f.executor->calls.size() == 1);
            REQUIRE(f.ledger->get_reputation("a") == Catch::Approx(1.0));
        }
        else
        {
            REQUIRE(result.final_decision == Outcome::Timeout);
            REQUIRE(result.vote_count == 0);
            REQUIRE(f.executor->calls.empty());
            REQUIRE(f.ledger->get_reputation("a") == Catch::Approx(0.9));
        }
    }
}

TEST_CASE("Collaborators may call back into the registry", "[registry][concurrency]")
{
    Fixture f;
    auto registry = f.make_registry();

    // The agent answers from inside the vote request, and the executor reads
    // the decision it is executing. Both would deadlock under the entry lock.
    std::vector<Result<bool>> answers;
    f.messenger->on_send = [&](const std::string &decision_id, const std::string &agent_id) {
        answers.push_back(registry.cast_vote(decision_id, agent_id, VoteType::Approve, 0.9, "auto"));
    };
    std::optional<DecisionStatusView> seen_by_executor;
    f.executor->on_execute = [&](const std::string &decision_id) {
        if (auto status = registry.get_status(decision_id))
            seen_by_executor = *status;
    };

    auto id = registry.create(make_request({"a"}));
    REQUIRE(id.has_value());

    REQUIRE(answers.size() == 1);
    REQUIRE(answers[0].has_value());
    REQUIRE(f.executor->calls == std::vector<std::string>{*id});

    REQUIRE(seen_by_executor.has_value());
    REQUIRE(std::holds_alternative<DecisionResult>(*seen_by_executor));
    REQUIRE(std::get<DecisionResult>(*seen_by_executor).final_decision == Outcome::Approved);

    auto result = result_of(registry, *id);
    REQUIRE(result.execution_status == ExecutionStatus::Completed);
    REQUIRE(f.store->results.at(*id).execution_status == ExecutionStatus::Completed);
    REQUIRE(f.store->decisions.at(*id).status == DecisionStatus::ConsensusReached);

    REQUIRE(f.events->events.size() == 3);
    REQUIRE(f.events->events[0].event_type == event_types::kDecisionCreated);
    REQUIRE(f.events->events[1].event_type == event_types::kVoteCast);
    REQUIRE(f.events->events[2].event_type == event_types::kDecisionCompleted);
}

TEST_CASE("Concurrent voters on one decision", "[registry][concurrency]")
{
    Fixture f;
    auto registry = f.make_registry();

    std::vector<std::string> agents;
    for (int i = 0; i < 16; ++i)
        agents.push_back("agent-" + std::to_string(i));
    auto id = *registry.create(make_request(agents, ConsensusAlgorithm::Unanimous));

    std::vector<std::thread> threads;
    for (const auto &agent : agents)
        threads.emplace_back([&registry, &id, agent] {
            (void)registry.cast_vote(id, agent, VoteType::Approve, 0.5, "");
        });
    for (auto &t : threads)
        t.join();

    auto result = result_of(registry, id);
    REQUIRE(result.final_decision == Outcome::Approved);
    REQUIRE(result.vote_count == agents.size());
    REQUIRE(f.executor->calls.size() == 1);
}

TEST_CASE("Metrics aggregate history and participation", "[registry]")
{
    Fixture f;
    auto registry = f.make_registry();

    auto approved = *registry.create(make_request({"a", "b"}));
    f.clock.advance(std::chrono::seconds(10));
    REQUIRE(registry.cast_vote(approved, "a", VoteType::Approve, 0.9, "").value());

    auto pending = *registry.create(make_request({"a", "b", "c", "d"}));
    REQUIRE(registry.cast_vote(pending, "b", VoteType::Approve, 0.9, "").value());

    auto m = registry.get_metrics();
    REQUIRE(m.total_decisions == 1);
    REQUIRE(m.successful_decisions == 1);
    REQUIRE(m.success_rate == Catch::Approx(1.0));
    REQUIRE(m.active_decisions == 1);
    REQUIRE(m.average_decision_time_seconds == Catch::Approx(10.0));
    REQUIRE(m.agent_participation.at("a") == 1);
    REQUIRE(m.agent_participation.at("b") == 1);
    REQUIRE(m.agent_weights.count("b") == 1);

    auto j = m.to_json();
    REQUIRE(j["active_decisions"] == 1);
    REQUIRE(j.contains("agent_reputation"));
}

TEST_CASE("Recovery reopens unresolved decisions", "[registry][recovery]")
{
    Fixture f;
    std::string open_id;
    std::string closed_id;
    {
        auto registry = f.make_registry();
        open_id = *registry.create(make_request({"a", "b", "c", "d"}));
        REQUIRE(registry.cast_vote(open_id, "a", VoteType::Approve, 0.9, "").value());
        closed_id = *registry.create(make_request({"a"}));
        REQUIRE(registry.cast_vote(closed_id, "a", VoteType::Reject, 0.9, "").value());
    }

    auto ledger = std::make_shared<ReputationLedger>();
    DecisionRegistry restarted(EngineSettings{}, ledger, f.collaborators());
    auto reopened = restarted.recover();
    REQUIRE(reopened.has_value());
    REQUIRE(*reopened == 1);
    REQUIRE(restarted.history_count() == 1);
    REQUIRE(ledger->get_reputation("a") == Catch::Approx(f.ledger->get_reputation("a")));

    auto live = live_of(restarted, open_id);
    REQUIRE(live.total_votes == 1);

    auto dup = restarted.cast_vote(open_id, "a", VoteType::Approve, 0.9, "");
    REQUIRE(dup.error().code == ErrorCode::DuplicateVote);
    REQUIRE(restarted.cast_vote(open_id, "b", VoteType::Approve, 0.9, "").value());
    REQUIRE(result_of(restarted, open_id).final_decision == Outcome::Approved);

    REQUIRE(result_of(restarted, closed_id).final_decision == Outcome::Rejected);
}
