#include "tending_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include "internal/core/instance_manager.hpp"
#include "internal/core/merge_import.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "tending/manager/v1.hpp"

namespace tending::service {

using namespace tending::manager::v1;

namespace {

Tender ToProto(const tending::model::Tender& tender) {
  Tender out;
  out.set_id(tender.id);
  out.set_name(tender.name);
  return out;
}

Chore ToProto(const tending::model::Chore& chore) {
  Chore out;
  out.set_id(chore.id);
  out.set_name(chore.name);
  out.set_icon(chore.icon);
  return out;
}

HistoryEntry ToProto(const tending::model::HistoryEntry& entry) {
  HistoryEntry out;
  out.set_id(entry.id);
  out.set_timestamp_ms(entry.timestamp_ms);
  out.set_person(entry.person);
  out.set_chore_id(entry.chore_id);
  if (entry.notes.has_value()) {
    out.set_notes(*entry.notes);
  }
  return out;
}

LastTended ToProto(const tending::model::LastTended& last) {
  LastTended out;
  if (last.timestamp_ms.has_value()) {
    out.set_timestamp_ms(*last.timestamp_ms);
  }
  if (last.tender.has_value()) {
    out.set_tender(*last.tender);
  }
  return out;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& sync_id, Fn&& fn) {
  tending::observability::SpanScope span(route);
  span.SetAttribute("tending.sync_id", sync_id);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      tending::observability::Metrics::Instance().RecordRequest(route, true);
      tending::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return;
    } else {
      auto result = fn();
      tending::observability::Metrics::Instance().RecordRequest(route, true);
      tending::observability::Metrics::Instance().ObserveRequestLatencyMs(
          route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    if (dynamic_cast<const tending::util::InvalidArgument*>(&ex) || dynamic_cast<const tending::util::NotFound*>(&ex)) {
      TENDING_LOG_WARN("RPC rejected", {tending::observability::StringField("route", route), tending::observability::SyncIdField(sync_id),
                                        tending::observability::StringField("error", ex.what())});
    } else {
      TENDING_LOG_ERROR("RPC failed", {tending::observability::StringField("route", route), tending::observability::SyncIdField(sync_id),
                                       tending::observability::StringField("error", ex.what())});
    }
    tending::observability::Metrics::Instance().RecordRequest(route, false);
    tending::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

TendingService::TendingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager) {
    throw std::invalid_argument("TendingService requires an instance manager");
  }
}

// ---------------------------------------------------------------------
// Tenders
// ---------------------------------------------------------------------

ListTendersResponse TendingService::ListTenders(const ListTendersRequest& req) {
  return ObserveRpc("TendingService.ListTenders", req.sync_id(), [&] {
    ListTendersResponse resp;
    for (const auto& tender : ctx_.manager->ListTenders(req.sync_id())) {
      *resp.add_tenders() = ToProto(tender);
    }
    return resp;
  });
}

Tender TendingService::AddTender(const AddTenderRequest& req) {
  return ObserveRpc("TendingService.AddTender", req.sync_id(), [&] { return ToProto(ctx_.manager->AddTender(req.sync_id(), req.name())); });
}

Tender TendingService::RenameTender(const RenameTenderRequest& req) {
  return ObserveRpc("TendingService.RenameTender", req.sync_id(),
                    [&] { return ToProto(ctx_.manager->RenameTender(req.sync_id(), req.tender_id(), req.name())); });
}

void TendingService::DeleteTender(const DeleteTenderRequest& req) {
  ObserveRpc("TendingService.DeleteTender", req.sync_id(), [&] { ctx_.manager->DeleteTender(req.sync_id(), req.tender_id()); });
}

// ---------------------------------------------------------------------
// Chores
// ---------------------------------------------------------------------

ListChoresResponse TendingService::ListChores(const ListChoresRequest& req) {
  return ObserveRpc("TendingService.ListChores", req.sync_id(), [&] {
    ListChoresResponse resp;
    for (const auto& chore : ctx_.manager->ListChores(req.sync_id())) {
      *resp.add_chores() = ToProto(chore);
    }
    return resp;
  });
}

Chore TendingService::AddChore(const AddChoreRequest& req) {
  return ObserveRpc("TendingService.AddChore", req.sync_id(),
                    [&] { return ToProto(ctx_.manager->AddChore(req.sync_id(), req.name(), req.icon())); });
}

Chore TendingService::UpdateChore(const UpdateChoreRequest& req) {
  return ObserveRpc("TendingService.UpdateChore", req.sync_id(), [&] {
    const auto name = req.has_name() ? std::optional<std::string>(req.name()) : std::nullopt;
    const auto icon = req.has_icon() ? std::optional<std::string>(req.icon()) : std::nullopt;
    return ToProto(ctx_.manager->UpdateChore(req.sync_id(), req.chore_id(), name, icon));
  });
}

void TendingService::DeleteChore(const DeleteChoreRequest& req) {
  ObserveRpc("TendingService.DeleteChore", req.sync_id(), [&] { ctx_.manager->DeleteChore(req.sync_id(), req.chore_id()); });
}

// ---------------------------------------------------------------------
// History
// ---------------------------------------------------------------------

HistoryEntry TendingService::RecordTending(const RecordTendingRequest& req) {
  return ObserveRpc("TendingService.RecordTending", req.sync_id(), [&] {
    const auto notes = req.has_notes() ? std::optional<std::string>(req.notes()) : std::nullopt;
    return ToProto(ctx_.manager->RecordTending(req.sync_id(), req.tender(), req.chore_id(), notes));
  });
}

ListHistoryResponse TendingService::ListHistory(const ListHistoryRequest& req) {
  return ObserveRpc("TendingService.ListHistory", req.sync_id(), [&] {
    ListHistoryResponse resp;
    for (const auto& entry : ctx_.manager->ListHistory(req.sync_id())) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

void TendingService::DeleteHistoryEntry(const DeleteHistoryEntryRequest& req) {
  ObserveRpc("TendingService.DeleteHistoryEntry", req.sync_id(), [&] { ctx_.manager->DeleteHistoryEntry(req.sync_id(), req.entry_id()); });
}

LastTended TendingService::GetLastTended(const GetLastTendedRequest& req) {
  return ObserveRpc("TendingService.GetLastTended", req.sync_id(), [&] { return ToProto(ctx_.manager->GetLastTended(req.sync_id())); });
}

// ---------------------------------------------------------------------
// Whole-instance transfer
// ---------------------------------------------------------------------

ImportSummary TendingService::ImportInstance(const ImportInstanceRequest& req) {
  return ObserveRpc("TendingService.ImportInstance", req.sync_id(), [&] {
    const auto incoming = tending::core::ParseExternalDocument(req.document());
    const auto summary  = ctx_.manager->Import(req.sync_id(), incoming);
    tending::observability::Metrics::Instance().RecordImport(summary.tenders, summary.chores, summary.history_entries);

    TENDING_LOG_INFO("instance imported", {tending::observability::SyncIdField(req.sync_id()),
                                           tending::observability::IntField("tenders", static_cast<int64_t>(summary.tenders)),
                                           tending::observability::IntField("chores", static_cast<int64_t>(summary.chores)),
                                           tending::observability::IntField("history_entries", static_cast<int64_t>(summary.history_entries))});

    ImportSummary resp;
    resp.set_tenders(summary.tenders);
    resp.set_chores(summary.chores);
    resp.set_history_entries(summary.history_entries);
    return resp;
  });
}

ExportInstanceResponse TendingService::ExportInstance(const ExportInstanceRequest& req) {
  return ObserveRpc("TendingService.ExportInstance", req.sync_id(), [&] {
    ExportInstanceResponse resp;
    *resp.mutable_document() = tending::core::ToExternalStruct(ctx_.manager->Export(req.sync_id()));
    return resp;
  });
}

}
