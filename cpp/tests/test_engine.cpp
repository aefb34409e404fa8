#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "concord/engine.hpp"
#include "concord/web_server.hpp"
#include "test_support.hpp"

using namespace concord;
using namespace concord::testing;

namespace {
    EngineConfig seeded_config() {
        EngineConfig cfg;
        cfg.reputation.seed = {{"market", 0.8}, {"risk", 0.8}};
        return cfg;
    }
}

TEST_CASE("Engine seeds reputation and shuts down cleanly", "[engine]")
{
    auto store = std::make_shared<InMemoryDecisionStore>();
    Collaborators c;
    c.store = store;

    ConsensusEngine engine(seeded_config(), c);
    REQUIRE_FALSE(engine.initialized());
    REQUIRE(engine.initialize().has_value());
    REQUIRE(engine.initialized());
    REQUIRE(engine.ledger().get_weight("market") == Catch::Approx(0.9));

    engine.decay_reputation();
    REQUIRE(engine.ledger().get_reputation("market") == Catch::Approx(0.76));
    REQUIRE(store->agents.at("risk").reputation == Catch::Approx(0.76));

    engine.shutdown();
    REQUIRE_FALSE(engine.initialized());
    engine.shutdown();
}

TEST_CASE("Stored reputation overrides configured seed", "[engine]")
{
    auto store = std::make_shared<InMemoryDecisionStore>();
    store->agents["market"] = AgentReputation::make("market", 0.3);
    Collaborators c;
    c.store = store;

    ConsensusEngine engine(seeded_config(), c);
    REQUIRE(engine.initialize().has_value());
    REQUIRE(engine.ledger().get_reputation("market") == Catch::Approx(0.3));
    REQUIRE(engine.ledger().get_reputation("risk") == Catch::Approx(0.8));
}

TEST_CASE("Engine API end to end", "[engine]")
{
    auto events = std::make_shared<RecordingEventSink>();
    Collaborators c;
    c.events = events;
    ConsensusEngine engine(EngineConfig{}, c);
    REQUIRE(engine.initialize().has_value());

    auto id = engine.create_decision(make_request({"a", "b"}, ConsensusAlgorithm::Unanimous));
    REQUIRE(id.has_value());
    REQUIRE(engine.cast_vote(*id, "a", VoteType::Approve, 0.9, "ok").value());
    REQUIRE(engine.cast_vote(*id, "b", VoteType::Approve, 0.9, "ok").value());

    auto status = engine.get_decision_status(*id);
    REQUIRE(status.has_value());
    auto result = std::get<DecisionResult>(*status);
    REQUIRE(result.final_decision == Outcome::Approved);
    // no executor wired
    REQUIRE(result.execution_details["status"] == "executed");

    REQUIRE(engine.get_metrics().successful_decisions == 1);
    REQUIRE(events->count(event_types::kDecisionCompleted) == 1);
}

TEST_CASE("HTTP routes map to engine operations", "[engine][http]")
{
    ConsensusEngine engine(EngineConfig{}, Collaborators{});
    REQUIRE(engine.initialize().has_value());

    nlohmann::json create = {
        {"decision_type", "trading_strategy"},
        {"title", "Hedge"},
        {"required_agents", {"a", "b", "c", "d"}},
        {"timeout_seconds", 60}};
    auto created = handle_api_request(engine, "POST", "/decisions", create.dump());
    REQUIRE(created.status == 201);
    auto id = created.body["decision_id"].get<std::string>();

    auto live = handle_api_request(engine, "GET", "/decisions/" + id, "");
    REQUIRE(live.status == 200);
    REQUIRE(live.body["status"] == "voting");
    REQUIRE(live.body["required_votes"] == 2);

    nlohmann::json vote = {{"agent_id", "a"}, {"vote_type", "approve"}, {"confidence", 0.9}};
    auto accepted = handle_api_request(engine, "POST", "/decisions/" + id + "/votes", vote.dump());
    REQUIRE(accepted.status == 200);
    REQUIRE(accepted.body["accepted"] == true);

    auto duplicate = handle_api_request(engine, "POST", "/decisions/" + id + "/votes", vote.dump());
    REQUIRE(duplicate.status == 409);
    REQUIRE(duplicate.body["code"] == "duplicate_vote");

    nlohmann::json outsider = {{"agent_id", "z"}, {"vote_type", "approve"}, {"confidence", 0.9}};
    REQUIRE(handle_api_request(engine, "POST", "/decisions/" + id + "/votes", outsider.dump()).status == 403);

    nlohmann::json bad_type = {{"agent_id", "b"}, {"vote_type", "maybe"}, {"confidence", 0.9}};
    REQUIRE(handle_api_request(engine, "POST", "/decisions/" + id + "/votes", bad_type.dump()).status == 400);

    vote["agent_id"] = "b";
    REQUIRE(handle_api_request(engine, "POST", "/decisions/" + id + "/votes", vote.dump()).status == 200);

    auto done = handle_api_request(engine, "GET", "/decisions/" + id, "");
    REQUIRE(done.body["status"] == "completed");
    REQUIRE(done.body["result"]["final_decision"] == "approved");

    vote["agent_id"] = "c";
    REQUIRE(handle_api_request(engine, "POST", "/decisions/" + id + "/votes", vote.dump()).status == 409);

    REQUIRE(handle_api_request(engine, "GET", "/decisions/unknown", "").status == 404);
    REQUIRE(handle_api_request(engine, "POST", "/decisions", "{not json").status == 400);
    REQUIRE(handle_api_request(engine, "POST", "/decisions", R"({"title":"x"})").status == 400);
    REQUIRE(handle_api_request(engine, "DELETE", "/decisions/" + id, "").status == 405);
    REQUIRE(handle_api_request(engine, "GET", "/nowhere", "").status == 404);

    auto metrics = handle_api_request(engine, "GET", "/metrics?verbose=1", "");
    REQUIRE(metrics.status == 200);
    REQUIRE(metrics.body["successful_decisions"] == 1);

    REQUIRE(handle_api_request(engine, "GET", "/health", "").body["status"] == "ok");
}

TEST_CASE("Error codes map to HTTP statuses", "[http]")
{
    REQUIRE(http_status_for(ErrorCode::NotFound) == 404);
    REQUIRE(http_status_for(ErrorCode::InvalidState) == 409);
    REQUIRE(http_status_for(ErrorCode::DuplicateVote) == 409);
    REQUIRE(http_status_for(ErrorCode::Expired) == 410);
    REQUIRE(http_status_for(ErrorCode::IneligibleAgent) == 403);
    REQUIRE(http_status_for(ErrorCode::InvalidDecision) == 400);
    REQUIRE(http_status_for(ErrorCode::ParsingError) == 400);
    REQUIRE(http_status_for(ErrorCode::StorageError) == 500);
}

TEST_CASE("Responses echoing non-UTF-8 ids still serialize", "[engine][http]")
{
    ConsensusEngine engine(EngineConfig{}, Collaborators{});
    REQUIRE(engine.initialize().has_value());

    const std::string raw_id = "\xff\xfe";
    auto missing = handle_api_request(engine, "GET", "/decisions/" + raw_id, "");
    REQUIRE(missing.status == 404);
    REQUIRE_THROWS(missing.body.dump());

    std::string text;
    REQUIRE_NOTHROW(text = missing.serialize());
    auto parsed = nlohmann::json::parse(text);
    REQUIRE(parsed["code"] == "not_found");
    REQUIRE(parsed["error"].get<std::string>().find("\xef\xbf\xbd") != std::string::npos);

    nlohmann::json vote = {{"agent_id", "a"}, {"vote_type", "approve"}, {"confidence", 0.9}};
    auto rejected = handle_api_request(engine, "POST", "/decisions/" + raw_id + "/votes", vote.dump());
    REQUIRE(rejected.status == 404);
    REQUIRE_NOTHROW(rejected.serialize());
}

TEST_CASE("Vote body fields must have the right JSON types", "[engine][http]")
{
    ConsensusEngine engine(EngineConfig{}, Collaborators{});
    REQUIRE(engine.initialize().has_value());

    nlohmann::json create = {
        {"decision_type", "trading_strategy"},
        {"title", "Hedge"},
        {"required_agents", {"a", "b"}},
        {"timeout_seconds", 60}};
    auto id = handle_api_request(engine, "POST", "/decisions", create.dump()).body["decision_id"].get<std::string>();
    auto path = "/decisions/" + id + "/votes";

    nlohmann::json numeric_reasoning = {{"agent_id", "a"}, {"vote_type", "approve"}, {"confidence", 0.9}, {"reasoning", 42}};
    auto bad_reasoning = handle_api_request(engine, "POST", path, numeric_reasoning.dump());
    REQUIRE(bad_reasoning.status == 400);
    REQUIRE(bad_reasoning.body["code"] == "invalid_input");

    nlohmann::json list_metadata = {{"agent_id", "a"}, {"vote_type", "approve"}, {"confidence", 0.9}, {"metadata", {1, 2}}};
    REQUIRE(handle_api_request(engine, "POST", path, list_metadata.dump()).status == 400);

    // Nothing was recorded, so a well-formed vote from the same agent is accepted.
    nlohmann::json vote = {{"agent_id", "a"}, {"vote_type", "approve"}, {"confidence", 0.9}, {"reasoning", "hedge now"}};
    REQUIRE(handle_api_request(engine, "POST", path, vote.dump()).status == 200);
}
