#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "tending/manager/services/v1/tending_service.grpc.pb.h"
#include "tending/manager/v1.hpp"

using namespace tending::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tendingctl <addr> <sync_id> tenders\n"
            << "  tendingctl <addr> <sync_id> add-tender <name>\n"
            << "  tendingctl <addr> <sync_id> rename-tender <tender_id> <name>\n"
            << "  tendingctl <addr> <sync_id> delete-tender <tender_id>\n"
            << "  tendingctl <addr> <sync_id> chores\n"
            << "  tendingctl <addr> <sync_id> add-chore <name> <icon>\n"
            << "  tendingctl <addr> <sync_id> update-chore <chore_id> [name=<name>] [icon=<icon>]\n"
            << "  tendingctl <addr> <sync_id> delete-chore <chore_id>\n"
            << "  tendingctl <addr> <sync_id> tend <tender> <chore_id> [notes]\n"
            << "  tendingctl <addr> <sync_id> history\n"
            << "  tendingctl <addr> <sync_id> delete-entry <entry_id>\n"
            << "  tendingctl <addr> <sync_id> last\n"
            << "  tendingctl <addr> <sync_id> import <file.json>\n"
            << "  tendingctl <addr> <sync_id> export\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static std::string FormatMillis(int64_t ms) {
  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm           tm{};
  gmtime_r(&secs, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static void Print(const Tender& tender) {
  std::cout << tender.id() << "\t" << tender.name() << "\n";
}

static void Print(const Chore& chore) {
  std::cout << chore.id() << "\t" << chore.icon() << "\t" << chore.name() << "\n";
}

static void Print(const HistoryEntry& entry) {
  std::cout << entry.id() << "\t" << FormatMillis(entry.timestamp_ms()) << "\t" << entry.person() << "\t" << entry.chore_id();
  if (entry.has_notes()) {
    std::cout << "\t" << entry.notes();
  }
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string sync_id = argv[2];
  std::string cmd     = argv[3];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TendingService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "tenders") {
    ListTendersRequest req;
    req.set_sync_id(sync_id);

    ListTendersResponse resp;
    auto                status = stub->ListTenders(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& tender : resp.tenders()) Print(tender);
    return 0;
  }

  if (cmd == "add-tender") {
    if (argc < 5) return 1;

    AddTenderRequest req;
    req.set_sync_id(sync_id);
    req.set_name(argv[4]);

    Tender resp;
    auto   status = stub->AddTender(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "rename-tender") {
    if (argc < 6) return 1;

    RenameTenderRequest req;
    req.set_sync_id(sync_id);
    req.set_tender_id(argv[4]);
    req.set_name(argv[5]);

    Tender resp;
    auto   status = stub->RenameTender(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "delete-tender") {
    if (argc < 5) return 1;

    DeleteTenderRequest req;
    req.set_sync_id(sync_id);
    req.set_tender_id(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteTender(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "chores") {
    ListChoresRequest req;
    req.set_sync_id(sync_id);

    ListChoresResponse resp;
    auto               status = stub->ListChores(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& chore : resp.chores()) Print(chore);
    return 0;
  }

  if (cmd == "add-chore") {
    if (argc < 6) return 1;

    AddChoreRequest req;
    req.set_sync_id(sync_id);
    req.set_name(argv[4]);
    req.set_icon(argv[5]);

    Chore resp;
    auto  status = stub->AddChore(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "update-chore") {
    if (argc < 6) return 1;

    UpdateChoreRequest req;
    req.set_sync_id(sync_id);
    req.set_chore_id(argv[4]);
    for (int i = 5; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg.rfind("name=", 0) == 0) {
        req.set_name(arg.substr(5));
      } else if (arg.rfind("icon=", 0) == 0) {
        req.set_icon(arg.substr(5));
      } else {
        std::cerr << "unsupported field: " << arg << "\n";
        return 1;
      }
    }

    Chore resp;
    auto  status = stub->UpdateChore(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "delete-chore") {
    if (argc < 5) return 1;

    DeleteChoreRequest req;
    req.set_sync_id(sync_id);
    req.set_chore_id(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteChore(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tend") {
    if (argc < 6) return 1;

    RecordTendingRequest req;
    req.set_sync_id(sync_id);
    req.set_tender(argv[4]);
    req.set_chore_id(argv[5]);
    if (argc >= 7) {
      req.set_notes(argv[6]);
    }

    HistoryEntry resp;
    auto         status = stub->RecordTending(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  if (cmd == "history") {
    ListHistoryRequest req;
    req.set_sync_id(sync_id);

    ListHistoryResponse resp;
    auto                status = stub->ListHistory(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) Print(entry);
    return 0;
  }

  if (cmd == "delete-entry") {
    if (argc < 5) return 1;

    DeleteHistoryEntryRequest req;
    req.set_sync_id(sync_id);
    req.set_entry_id(argv[4]);

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteHistoryEntry(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  if (cmd == "last") {
    GetLastTendedRequest req;
    req.set_sync_id(sync_id);

    LastTended resp;
    auto       status = stub->GetLastTended(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.has_timestamp_ms()) {
      std::cout << "never tended\n";
      return 0;
    }
    std::cout << FormatMillis(resp.timestamp_ms()) << "\t" << (resp.has_tender() ? resp.tender() : "") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 5) return 1;

    std::ifstream in(argv[4]);
    if (!in) {
      std::cerr << "cannot open " << argv[4] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ImportInstanceRequest req;
    req.set_sync_id(sync_id);
    auto parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), req.mutable_document());
    if (!parsed.ok()) {
      std::cerr << "invalid JSON in " << argv[4] << ": " << parsed.message() << "\n";
      return 1;
    }

    ImportSummary resp;
    auto          status = stub->ImportInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "tenders=" << resp.tenders() << " chores=" << resp.chores() << " history_entries=" << resp.history_entries() << "\n";
    return 0;
  }

  if (cmd == "export") {
    ExportInstanceRequest req;
    req.set_sync_id(sync_id);

    ExportInstanceResponse resp;
    auto                   status = stub->ExportInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::string                                json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    auto printed           = google::protobuf::util::MessageToJsonString(resp.document(), &json, options);
    if (!printed.ok()) {
      std::cerr << "cannot render export: " << printed.message() << "\n";
      return 2;
    }
    std::cout << json << "\n";
    return 0;
  }

  Usage();
  return 1;
}
