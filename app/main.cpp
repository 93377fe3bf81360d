#include "../service/LedgerService.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using json = nlohmann::json;

static int printError(const std::string &message) {
  std::cerr << "Error: " << message << "\n";
  return 1;
}

static int runSubmit(cl::LedgerService &service, const std::string &reportFile) {
  auto document = cl::utl::loadJsonFile(reportFile);
  if (!document) {
    return printError(document.error().message);
  }
  auto submission = cl::ReportSubmission::fromJson(document.value());
  if (!submission) {
    return printError(submission.error().message);
  }
  auto receipt = service.submit(submission.value());
  if (!receipt) {
    return printError(receipt.error().message);
  }
  std::cout << receipt.value().toJson().dump(2) << "\n";
  return 0;
}

static int runVerify(const cl::LedgerService &service, const std::string &reportId) {
  auto result = service.verify(reportId);
  if (!result) {
    return printError(result.error().message);
  }
  std::cout << result.value().toJson().dump(2) << "\n";
  return 0;
}

static int runHealth(cl::LedgerService &service) {
  auto report = service.health();
  if (!report) {
    return printError(report.error().message);
  }
  std::cout << report.value().toJson().dump(2) << "\n";
  // A compromised chain is reported and signalled through the exit code
  return report.value().healthy ? 0 : 2;
}

static int runStatus(cl::LedgerService &service, const std::string &reportId,
                     const std::string &statusName, const std::string &actor) {
  cl::ReportStatus status;
  if (!cl::statusFromString(statusName, status)) {
    return printError("Invalid status: " + statusName);
  }
  auto record = service.updateStatus(reportId, status, actor);
  if (!record) {
    return printError(record.error().message);
  }
  std::cout << record.value().toJson().dump(2) << "\n";
  return 0;
}

static int runList(const cl::LedgerService &service, const std::string &statusName,
                   const std::string &urgencyName, size_t limit, size_t offset) {
  cl::ReportFilter filter;
  filter.limit = limit;
  filter.offset = offset;
  if (!statusName.empty()) {
    cl::ReportStatus status;
    if (!cl::statusFromString(statusName, status)) {
      return printError("Invalid status: " + statusName);
    }
    filter.status = status;
  }
  if (!urgencyName.empty()) {
    cl::Urgency urgency;
    if (!cl::urgencyFromString(urgencyName, urgency)) {
      return printError("Invalid urgency: " + urgencyName);
    }
    filter.urgency = urgency;
  }

  auto records = service.listReports(filter);
  if (!records) {
    return printError(records.error().message);
  }
  json output;
  output["count"] = records.value().size();
  output["data"] = json::array();
  for (const auto &record : records.value()) {
    output["data"].push_back(record.toJson());
  }
  std::cout << output.dump(2) << "\n";
  return 0;
}

static int runExport(const cl::LedgerService &service) {
  auto chain = service.exportChain();
  if (!chain) {
    return printError(chain.error().message);
  }
  std::cout << chain.value().dump(2) << "\n";
  return 0;
}

int main(int argc, char *argv[]) {
  CLI::App app{"civic-ledger - Tamper-evident ledger of civic incident reports"};
  app.require_subcommand(1);

  // Global options
  std::string workDir = ".";
  app.add_option("-d,--work-dir", workDir, "Work directory holding config and data files");

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  auto *submit_cmd = app.add_subcommand("submit", "Seal a report from a JSON file");
  std::string reportFile;
  submit_cmd->add_option("file", reportFile, "Report JSON file")
      ->required()
      ->check(CLI::ExistingFile);

  auto *verify_cmd = app.add_subcommand("verify", "Locate a report on the chain");
  std::string verifyId;
  verify_cmd->add_option("reportId", verifyId, "Report ID")->required();

  auto *health_cmd = app.add_subcommand("health", "Check chain integrity");

  auto *status_cmd = app.add_subcommand("status", "Update the review status of a report");
  std::string statusId;
  std::string statusName;
  std::string actor = "ADMIN";
  status_cmd->add_option("reportId", statusId, "Report ID")->required();
  status_cmd->add_option("status", statusName, "UNDER_REVIEW, RESOLVED or DISMISSED")
      ->required();
  status_cmd->add_option("--actor", actor, "Recorded in the audit trail (default: ADMIN)");

  auto *list_cmd = app.add_subcommand("list", "List registered reports, newest first");
  std::string listStatus;
  std::string listUrgency;
  size_t limit = 50;
  size_t offset = 0;
  list_cmd->add_option("--status", listStatus, "Only reports with this status");
  list_cmd->add_option("--urgency", listUrgency, "Only reports with this urgency");
  list_cmd->add_option("--limit", limit, "Maximum number of reports (default: 50)");
  list_cmd->add_option("--offset", offset, "Reports to skip (default: 0)");

  auto *export_cmd = app.add_subcommand("export", "Print the full chain as JSON");

  CLI11_PARSE(app, argc, argv);

  auto config = cl::LedgerService::loadConfig(workDir);
  if (!config) {
    return printError(config.error().message);
  }
  // --debug wins over logLevel from config.json, from the first startup line
  if (debug) {
    config.value().logLevel = cl::logging::Level::DEBUG;
  }

  cl::LedgerService service;
  auto started = service.init(workDir, config.value());
  if (!started) {
    return printError(started.error().message);
  }

  if (submit_cmd->parsed()) {
    return runSubmit(service, reportFile);
  }
  if (verify_cmd->parsed()) {
    return runVerify(service, verifyId);
  }
  if (health_cmd->parsed()) {
    return runHealth(service);
  }
  if (status_cmd->parsed()) {
    return runStatus(service, statusId, statusName, actor);
  }
  if (list_cmd->parsed()) {
    return runList(service, listStatus, listUrgency, limit, offset);
  }
  if (export_cmd->parsed()) {
    return runExport(service);
  }
  return 0;
}
