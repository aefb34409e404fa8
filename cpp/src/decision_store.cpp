#include "concord/decision_store.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace concord
{

    namespace
    {
        constexpr const char *kDecisionPrefix = "decision:";
        constexpr const char *kVotePrefix = "vote:";
        constexpr const char *kResultPrefix = "result:";
        constexpr const char *kAgentPrefix = "agent:";
    } // namespace

    class RocksDbDecisionStore::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw std::runtime_error("RocksDB open failed: " + status.ToString());
            }
        }

        ~Impl()
        {
            delete db;
        }

        Result<void> put(const std::string &key, const nlohmann::json &value)
        {
            auto status = db->Put(rocksdb::WriteOptions(), key, value.dump());
            if (!status.ok())
            {
                return std::unexpected(ConcordError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

        /** Parse every value under prefix with parse; malformed entries are skipped with a warning */
        template <typename T, typename Parse>
        Result<std::vector<T>> scan(const std::string &prefix, Parse parse)
        {
            std::vector<T> out;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                auto parsed_json = nlohmann::json::parse(it->value().ToString(), nullptr, false);
                if (parsed_json.is_discarded())
                {
                    spdlog::warn("storage: skipping unparsable value at {}", it->key().ToString());
                    continue;
                }
                auto rec = parse(parsed_json);
                if (!rec)
                {
                    spdlog::warn("storage: skipping {}: {}", it->key().ToString(), rec.error().what());
                    continue;
                }
                out.push_back(std::move(*rec));
            }
            if (!it->status().ok())
            {
                return std::unexpected(ConcordError::storage("RocksDB iteration failed: " + it->status().ToString()));
            }
            return out;
        }

    private:
        rocksdb::DB *db{nullptr};
    };

    RocksDbDecisionStore::RocksDbDecisionStore(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbDecisionStore::~RocksDbDecisionStore() = default;

    Result<void> RocksDbDecisionStore::upsert_decision(const Decision &decision)
    {
        return impl_->put(kDecisionPrefix + decision.decision_id, decision.to_json());
    }

    Result<void> RocksDbDecisionStore::upsert_vote(const Vote &vote)
    {
        return impl_->put(std::string(kVotePrefix) + vote.decision_id + ":" + vote.agent_id, vote.to_json());
    }

    Result<void> RocksDbDecisionStore::upsert_result(const DecisionResult &result)
    {
        return impl_->put(kResultPrefix + result.decision_id, result.to_json());
    }

    Result<void> RocksDbDecisionStore::upsert_agent(const AgentReputation &agent)
    {
        return impl_->put(kAgentPrefix + agent.agent_id, agent.to_json());
    }

    Result<std::vector<Decision>> RocksDbDecisionStore::list_decisions()
    {
        return impl_->scan<Decision>(kDecisionPrefix, Decision::from_json);
    }

    Result<std::vector<Vote>> RocksDbDecisionStore::list_votes(const std::string &decision_id)
    {
        return impl_->scan<Vote>(std::string(kVotePrefix) + decision_id + ":", Vote::from_json);
    }

    Result<std::vector<DecisionResult>> RocksDbDecisionStore::list_results()
    {
        return impl_->scan<DecisionResult>(kResultPrefix, DecisionResult::from_json);
    }

    Result<std::vector<AgentReputation>> RocksDbDecisionStore::list_agents()
    {
        return impl_->scan<AgentReputation>(kAgentPrefix, AgentReputation::from_json);
    }

} // namespace concord
