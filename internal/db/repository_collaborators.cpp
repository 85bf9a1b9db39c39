#include "repository_collaborators.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace warehouse::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + std::string(ToString(result.code)) + "]";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

RepositoryCollaborators::RepositoryCollaborators(std::shared_ptr<Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("RepositoryCollaborators requires a repository");
  }
}

std::vector<warehouse::model::StorageBin> RepositoryCollaborators::FetchBins() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBins(*tx);
  tx->Commit();

  std::vector<warehouse::model::StorageBin> bins;
  bins.reserve(records.size());
  for (auto& r : records) {
    bins.emplace_back(r.bin_id, r.capacity, std::move(r.location_code), r.current_usage);
  }
  return bins;
}

void RepositoryCollaborators::RecordUsage(std::int64_t bin_id, std::int64_t used_space) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateBinUsage(*tx, bin_id, used_space), "update usage of bin " + std::to_string(bin_id));
  tx->Commit();
}

void RepositoryCollaborators::RecordEvent(const warehouse::model::ShipmentEvent& event) {
  model::ShipmentLogRecord record;
  record.tracking_id = event.tracking_id;
  record.bin_id      = event.bin_id;
  record.timestamp   = util::ToIsoString(event.timestamp);
  record.status      = std::string(warehouse::model::ToString(event.status));

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertShipmentLog(*tx, record), "log " + record.status + " for " + record.tracking_id);
  tx->Commit();
}

} // namespace warehouse::db
