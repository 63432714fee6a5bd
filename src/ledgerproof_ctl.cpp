#include "archive/LocalArchive.h"
#include "hashing/canonical_hasher.h"
#include "ledger/errors.h"
#include "ledger/json_codec.h"
#include "service/ToolService.h"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/time_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace ledgerproof;
using nlohmann::json;

static void usage() {
  std::cout
      << "Usage: ledgerproof_ctl [--archive DIR] <command>\n"
         "  verify <record.json> [hint.json]\n"
         "  get-batch <batch_id>\n"
         "  list [limit] [offset]\n"
         "  search <criteria-json>\n"
         "  seal <batch_id> <database> <table> <records.json>\n";
}

static json readJsonFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw InvalidRequest("cannot open " + path);
  try {
    return json::parse(in);
  } catch (const json::parse_error &e) {
    throw InvalidRequest(path + ": " + e.what());
  }
}

static int printResult(const json &result) {
  std::cout << result.dump(2, ' ', false, json::error_handler_t::replace)
            << std::endl;
  return result.is_object() && result.contains("error") ? 1 : 0;
}

static int verify_command(ToolService &tools, const std::string &recordFile,
                          const std::string &hintFile) {
  json args = {{"transaction_data", readJsonFile(recordFile)}};
  if (!hintFile.empty())
    args["hints"] = readJsonFile(hintFile);
  json result = tools.call("verify_transaction", args);
  if (printResult(result) != 0)
    return 1;
  return result.value("verified", false) ? 0 : 2;
}

static int seal_command(LocalArchive &archive, const std::string &batchId,
                        const std::string &database, const std::string &table,
                        const std::string &recordsFile) {
  json records = readJsonFile(recordsFile);
  if (!records.is_array() || records.empty())
    throw InvalidRequest(recordsFile + " must hold a non-empty JSON array");

  std::vector<BatchLeaf> leaves;
  leaves.reserve(records.size());
  for (const auto &r : records) {
    TransactionRecord record = recordFromJson(r);
    leaves.push_back({CanonicalHasher::digest(record), record.operation()});
  }
  auto now = std::chrono::time_point_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now());
  BatchDescriptor sealed =
      archive.seal(batchId, database, {table}, leaves, now);
  return printResult(descriptorToJson(sealed));
}

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string archiveDir;
  if (args.size() >= 2 && args[0] == "--archive") {
    archiveDir = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::ERROR);

  try {
    const char *path = std::getenv("LEDGERPROOF_CONFIG");
    Config cfg = loadConfigFile(path ? path : "ledgerproof.yaml");
    applyEnvironment(cfg);
    if (!archiveDir.empty())
      cfg.archiveDir = archiveDir;
    if (cfg.organization.empty())
      cfg.organization = "local";
    validate(cfg);

    const std::string &cmd = args[0];
    if (cmd == "seal" && args.size() == 5) {
      LocalArchive archive(cfg.archiveDir);
      return seal_command(archive, args[1], args[2], args[3], args[4]);
    }

    Engine engine(cfg);
    ToolService tools(engine);
    if (cmd == "verify" && (args.size() == 2 || args.size() == 3)) {
      return verify_command(tools, args[1], args.size() == 3 ? args[2] : "");
    } else if (cmd == "get-batch" && args.size() == 2) {
      json result = tools.call("get_batch", {{"batch_id", args[1]}});
      if (result.is_null()) {
        std::cout << "Batch not found" << std::endl;
        return 2;
      }
      return printResult(result);
    } else if (cmd == "list" && args.size() <= 3) {
      json a = json::object();
      if (args.size() >= 2)
        a["limit"] = std::stoul(args[1]);
      if (args.size() == 3)
        a["offset"] = std::stoul(args[2]);
      return printResult(tools.call("list_batches", a));
    } else if (cmd == "search" && args.size() == 2) {
      return printResult(
          tools.call("search_batches", {{"criteria", json::parse(args[1])}}));
    }
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  } catch (const LedgerProofError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const json::exception &e) {
    std::cerr << "Invalid JSON argument: " << e.what() << std::endl;
    return 1;
  } catch (const std::logic_error &e) {
    std::cerr << "Invalid argument: " << e.what() << std::endl;
    return 1;
  }

  usage();
  return 1;
}
