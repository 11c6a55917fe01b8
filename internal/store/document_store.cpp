#include "document_store.hpp"

#include <stdexcept>
#include <utility>

#include "document_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace tending::store {

namespace {

constexpr int         kCreateAttempts   = 2;
constexpr const char* kDefaultChoreName = "Water the plants";
constexpr const char* kDefaultChoreIcon = "🪴";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageFailure(message + " (" + db::ToString(result.code) + ")");
  }
}

} // namespace

DocumentStore::DocumentStore(std::shared_ptr<db::Repository> repository, util::MillisClock clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("DocumentStore requires a repository");
  }
  if (!clock_) {
    throw std::invalid_argument("DocumentStore requires a clock");
  }
}

model::InstanceDocument DocumentStore::DefaultDocument(const std::string& sync_id, int64_t now_ms) {
  model::InstanceDocument document;
  document.sync_id = sync_id;
  document.chores.push_back(model::Chore{util::GenerateId(util::kChoreIdPrefix, now_ms), kDefaultChoreName, kDefaultChoreIcon});
  return document;
}

model::InstanceDocument DocumentStore::GetOrCreate(const std::string& sync_id) {
  for (int attempt = 1; attempt <= kCreateAttempts; ++attempt) {
    try {
      auto created = TryCreate(sync_id);
      if (created.has_value()) {
        return std::move(*created);
      }
    } catch (const db::TransactionConflict&) {
      // Lost the seeding race; the next attempt reads the winner's row.
      TENDING_LOG_DEBUG("instance seed conflict", {observability::SyncIdField(sync_id), observability::IntField("attempt", attempt)});
    } catch (const util::StorageFailure&) {
      throw;
    } catch (const std::exception& e) {
      throw util::StorageFailure("get or create instance '" + sync_id + "': " + e.what());
    }
  }

  throw util::StorageFailure("get or create instance '" + sync_id + "': seeding kept conflicting");
}

// Returns nullopt when another writer created the row first.
std::optional<model::InstanceDocument> DocumentStore::TryCreate(const std::string& sync_id) {
  auto tx       = repository_->Begin();
  auto existing = repository_->GetInstance(*tx, sync_id);
  if (existing.has_value()) {
    tx->Commit();
    return FromRecord(*existing);
  }

  auto       document = DefaultDocument(sync_id, clock_());
  const auto inserted = repository_->InsertInstance(*tx, ToRecord(document));
  if (inserted.Retryable()) {
    tx->Rollback();
    return std::nullopt;
  }
  ThrowIfDbError(inserted, "create instance '" + sync_id + "'");
  tx->Commit();

  observability::Metrics::Instance().RecordInstanceCreated();
  TENDING_LOG_INFO("instance created", {observability::SyncIdField(sync_id)});
  return document;
}

void DocumentStore::Replace(const std::string& sync_id, const model::InstanceDocument& document) {
  auto record    = ToRecord(document);
  record.sync_id = sync_id;

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpdateInstance(*tx, record), "replace instance '" + sync_id + "'");
    tx->Commit();
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::StorageFailure&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StorageFailure("replace instance '" + sync_id + "': " + e.what());
  }
}

std::size_t DocumentStore::VerifyAll() {
  std::vector<db::model::InstanceRecord> records;
  try {
    auto tx = repository_->Begin();
    for (const auto& sync_id : repository_->ListSyncIds(*tx)) {
      auto record = repository_->GetInstance(*tx, sync_id);
      if (record.has_value()) {
        records.push_back(std::move(*record));
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::StorageFailure(std::string("verify instances: ") + e.what());
  }

  for (const auto& record : records) {
    FromRecord(record);
  }
  return records.size();
}

} // namespace tending::store
