#pragma once

#include <memory>

#include "internal/core/collaborators.hpp"
#include "internal/db/api/repository.hpp"

namespace warehouse::db {

/*
  Serves the controller's bin source, usage sink and event sink from a
  Repository. Every call runs in its own transaction; a failed write
  rolls back and throws (the controller logs and carries on).
*/
class RepositoryCollaborators final : public core::BinSource, public core::UsageSink, public core::EventSink {
 public:
  explicit RepositoryCollaborators(std::shared_ptr<Repository> repository);

  std::vector<warehouse::model::StorageBin> FetchBins() override;

  void RecordUsage(std::int64_t bin_id, std::int64_t used_space) override;

  void RecordEvent(const warehouse::model::ShipmentEvent& event) override;

 private:
  std::shared_ptr<Repository> repository_;
};

// Throws util::NotFound / util::AlreadyExists / std::runtime_error for a failed Result.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace warehouse::db
