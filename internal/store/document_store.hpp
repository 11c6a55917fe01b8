#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/instance.hpp"
#include "internal/util/time.hpp"

namespace tending::store {

/*
  Durable keyed storage of one InstanceDocument per sync id.

  GetOrCreate seeds a missing document with the default chore. Two callers
  racing on the same unseen sync id both end up with the document that won
  the insert. Replace overwrites the whole document in one transaction.

  Backend failures surface as util::StorageFailure.
*/
class DocumentStore {
 public:
  explicit DocumentStore(std::shared_ptr<db::Repository> repository, util::MillisClock clock = util::SystemMillisClock());

  model::InstanceDocument GetOrCreate(const std::string& sync_id);

  // util::NotFound if the sync id was never created.
  void Replace(const std::string& sync_id, const model::InstanceDocument& document);

  // Decodes every stored document; throws on the first one that fails.
  std::size_t VerifyAll();

  static model::InstanceDocument DefaultDocument(const std::string& sync_id, int64_t now_ms);

 private:
  std::optional<model::InstanceDocument> TryCreate(const std::string& sync_id);

  std::shared_ptr<db::Repository> repository_;
  util::MillisClock               clock_;
};

} // namespace tending::store
