#include "concord/collaborators.hpp"
#include <spdlog/spdlog.h>

namespace concord
{

    Result<void> LoggingMessenger::send_vote_request(const std::string &decision_id,
                                                     const std::string &agent_id,
                                                     const nlohmann::json &payload,
                                                     bool required,
                                                     std::chrono::seconds expires_in)
    {
        spdlog::info("vote request -> {} [{}] decision {} (expires in {}s): {}",
                     agent_id, required ? "required" : "optional", decision_id,
                     expires_in.count(), payload.value("subject", ""));
        ++sent_;
        return {};
    }

} // namespace concord
