#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "appconfig.hpp"
#include "auditlogger.hpp"
#include "consoleui.hpp"
#include "criticalpathguard.hpp"
#include "errors.hpp"
#include "fileoperations.hpp"
#include "filescanner.hpp"
#include "log.hpp"
#include "pathcanonicalizer.hpp"
#include "recoverymanager.hpp"
#include "safedeleter.hpp"
#include "securitypolicy.hpp"
#include "sha256.hpp"
#include "trash.hpp"

namespace fs = std::filesystem;

/**
 * @class Application
 * @brief Command dispatcher of the lazyscan executable
 *
 * Commands:
 *  - scan [PATH] [-n N] [-r]          largest files below PATH
 *  - clean --category C [--execute] [--permanent] [--force] PATH...
 *                                     guarded deletion, dry-run by default
 *  - recovery list [--days N]
 *  - recovery restore --operation-id ID [--overwrite]
 *  - recovery purge --operation-id ID
 *  - audit [--hours N]                summary of the audit trail
 *
 * Global options: --policy FILE, --verbose.
 *
 * Every command returns an ExitCode. The security policy is loaded before
 * `clean` touches any path; a policy error ends the process with
 * ExitCode::ConfigError.
 */
class Application {
private:
  AppConfig m_config;
  std::optional<fs::path> m_policyOverride;

public:
  int run(int argc, char *argv[]) {
    std::vector<std::string> args;
    bool verbose = false;

    // Global options may appear anywhere
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--verbose" || arg == "-v") {
        verbose = true;
      } else if (arg == "--policy") {
        if (i + 1 >= argc) {
          return usage("--policy requires a file");
        }
        m_policyOverride = fs::path(argv[++i]);
      } else {
        args.push_back(arg);
      }
    }

    m_config = loadAppConfig();
    Log::setLevel(verbose ? LogLevel::Debug : m_config.logLevel);

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
      printHelp();
      return args.empty() ? code(ExitCode::Usage) : code(ExitCode::Success);
    }

    std::string command = args[0];
    args.erase(args.begin());

    if (command == "scan")
      return runScan(args);
    if (command == "clean")
      return runClean(args);
    if (command == "recovery")
      return runRecovery(args);
    if (command == "audit")
      return runAudit(args);

    return usage("unknown command '" + command + "'");
  }

private:
  static int code(ExitCode exitCode) { return static_cast<int>(exitCode); }

  int usage(const std::string &message) const {
    std::cerr << "lazyscan: " << message << "\n";
    std::cerr << "Try 'lazyscan --help'.\n";
    return code(ExitCode::Usage);
  }

  void printHelp() const {
    std::cout
        << "Usage: lazyscan [--policy FILE] [--verbose] COMMAND\n\n"
        << "  scan [PATH] [-n N] [-r]                   largest files\n"
        << "  clean --category C [--execute] [--permanent] [--force] PATH...\n"
        << "                                            delete cache paths "
           "(dry-run by default)\n"
        << "  recovery list [--days N]                  recoverable backups\n"
        << "  recovery restore --operation-id ID [--overwrite]\n"
        << "  recovery purge --operation-id ID\n"
        << "  audit [--hours N]                         audit summary\n\n"
        << "Categories: unity, unreal, chrome, system, other\n"
        << "Set LAZYSCAN_DISABLE_DELETIONS=1 to block all deletions.\n";
  }

  static std::optional<int> parseCount(const std::string &value) {
    try {
      size_t used = 0;
      int n = std::stoi(value, &used);
      if (used != value.size() || n < 0)
        return std::nullopt;
      return n;
    } catch (const std::logic_error &) {
      return std::nullopt;
    }
  }

  fs::path policyFile() const {
    return m_policyOverride ? *m_policyOverride : m_config.policyFile;
  }

  // --------------------------------------------------------------------------
  // scan
  // --------------------------------------------------------------------------

  int runScan(const std::vector<std::string> &args) {
    fs::path startPath = fs::current_path();
    bool isRecursive = false;
    int topN = 20;

    for (size_t i = 0; i < args.size(); ++i) {
      const std::string &arg = args[i];
      if (arg == "-r" || arg == "--recursive") {
        isRecursive = true;
      } else if (arg == "-n" || arg == "--top") {
        if (i + 1 >= args.size())
          return usage(arg + " requires a number");
        auto n = parseCount(args[++i]);
        if (!n)
          return usage("invalid number '" + args[i] + "'");
        topN = *n;
      } else if (!arg.empty() && arg[0] == '-') {
        return usage("unknown option '" + arg + "'");
      } else {
        startPath = arg;
      }
    }

    std::error_code ec;
    if (!fs::is_directory(startPath, ec)) {
      std::cerr << "lazyscan: not a directory: " << startPath.string() << "\n";
      return code(ExitCode::PathError);
    }

    FileScanner scanner;
    auto files = scanner.scanDirectory(startPath, isRecursive, [](int count) {
      Log::debug("Scanned " + std::to_string(count) + " entries");
    });

    std::uintmax_t total = 0;
    for (const auto &file : files) {
      if (!file.isDirectory())
        total += file.getFileSize();
    }

    consoleui::printScanReport(startPath,
                               FileScanner::largestFiles(files, topN),
                               files.size(), total);
    return code(ExitCode::Success);
  }

  // --------------------------------------------------------------------------
  // clean
  // --------------------------------------------------------------------------

  int runClean(const std::vector<std::string> &args) {
    std::optional<Category> category;
    bool execute = false;
    bool permanent = false;
    bool force = false;
    std::vector<std::string> paths;

    for (size_t i = 0; i < args.size(); ++i) {
      const std::string &arg = args[i];
      if (arg == "--category" || arg == "-c") {
        if (i + 1 >= args.size())
          return usage("--category requires a value");
        category = categoryFromString(args[++i]);
        if (!category)
          return usage("unknown category '" + args[i] + "'");
      } else if (arg == "--execute") {
        execute = true;
      } else if (arg == "--permanent") {
        permanent = true;
      } else if (arg == "--force") {
        force = true;
      } else if (!arg.empty() && arg[0] == '-') {
        return usage("unknown option '" + arg + "'");
      } else {
        paths.push_back(arg);
      }
    }

    if (!category)
      return usage("clean requires --category");
    if (paths.empty())
      return usage("clean requires at least one path");

    PathCanonicalizer canonicalizer(m_config.homeDir);

    Policy loaded;
    try {
      loaded = SecurityPolicy::load(policyFile(), canonicalizer);
    } catch (const SecurityPolicyError &e) {
      std::cerr << "lazyscan: " << e.what() << "\n"
                << "lazyscan: no deletions performed\n";
      return code(e.exitCode());
    }

    CriticalPathGuard guard(m_config.homeDir, loaded.denyList);
    SecurityPolicy policy(loaded, guard);
    AuditLogger audit(m_config.auditLogFile);
    Sha256 hasher;
    RecoveryManager recovery(m_config.backupDir, hasher,
                             policy.policy().backupRetentionDays);

    TrashBackend backend = probeTrashBackend(
        currentPlatform(), m_config.homeDir, m_config.trashDataHome);
    Log::debug("Trash backend: " + trashBackendName(backend));
    Trash trash(backend, m_config.homeDir, m_config.trashDataHome);
    FileOperations files(trash);
    FtxuiConfirmationPrompt prompt;

    if (m_config.killSwitchEngaged) {
      Log::warn("LAZYSCAN_DISABLE_DELETIONS is set; only dry runs will succeed");
    }

    SafeDeleter deleter(policy, canonicalizer, audit, recovery, files, prompt,
                        m_config.killSwitchEngaged);

    std::vector<DeletionRequest> requests;
    for (const auto &path : paths) {
      DeletionRequest request;
      request.target.path = path;
      request.target.category = *category;
      request.target.discoveredBy = "cli";
      request.mode = permanent ? DeletionMode::Permanent : DeletionMode::Trash;
      request.dryRun = !execute;
      request.force = force;
      requests.push_back(request);
    }

    BatchSummary summary = deleter.deleteAll(requests);
    consoleui::printDeletionResults(summary, !execute);
    return code(summary.exitCode());
  }

  // --------------------------------------------------------------------------
  // recovery
  // --------------------------------------------------------------------------

  /**
   * @brief Retention window from the policy, 30 days if it cannot be loaded
   *
   * Recovery stays usable with a broken policy so that backups can still be
   * restored.
   */
  int retentionDays() const {
    try {
      PathCanonicalizer canonicalizer(m_config.homeDir);
      return SecurityPolicy::load(policyFile(), canonicalizer)
          .backupRetentionDays;
    } catch (const SecurityPolicyError &e) {
      Log::warn(std::string(e.what()) + "; using 30 day backup retention");
      return 30;
    }
  }

  int runRecovery(const std::vector<std::string> &args) {
    if (args.empty())
      return usage("recovery requires list, restore or purge");

    const std::string &action = args[0];
    int days = 7;
    bool overwrite = false;
    std::string operationId;

    for (size_t i = 1; i < args.size(); ++i) {
      const std::string &arg = args[i];
      if (arg == "--days") {
        if (i + 1 >= args.size())
          return usage("--days requires a number");
        auto n = parseCount(args[++i]);
        if (!n)
          return usage("invalid number '" + args[i] + "'");
        days = *n;
      } else if (arg == "--operation-id") {
        if (i + 1 >= args.size())
          return usage("--operation-id requires a value");
        operationId = args[++i];
      } else if (arg == "--overwrite") {
        overwrite = true;
      } else {
        return usage("unknown option '" + arg + "'");
      }
    }

    Sha256 hasher;
    RecoveryManager recovery(m_config.backupDir, hasher, retentionDays());

    if (action == "list") {
      consoleui::printBackups(recovery.listRecoverable(days), days);
      return code(ExitCode::Success);
    }

    if (operationId.empty())
      return usage("recovery " + action + " requires --operation-id");

    if (action == "restore") {
      consoleui::printRestoreResult(recovery.restore(operationId, overwrite));
      return code(ExitCode::Success);
    }

    if (action == "purge") {
      if (!recovery.purge(operationId)) {
        std::cerr << "lazyscan: no backup for operation " << operationId
                  << "\n";
        return code(ExitCode::RecoveryError);
      }
      std::cout << "Purged backup " << operationId << std::endl;
      return code(ExitCode::Success);
    }

    return usage("unknown recovery action '" + action + "'");
  }

  // --------------------------------------------------------------------------
  // audit
  // --------------------------------------------------------------------------

  int runAudit(const std::vector<std::string> &args) {
    int hours = 24;
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--hours") {
        if (i + 1 >= args.size())
          return usage("--hours requires a number");
        auto n = parseCount(args[++i]);
        if (!n)
          return usage("invalid number '" + args[i] + "'");
        hours = *n;
      } else {
        return usage("unknown option '" + args[i] + "'");
      }
    }

    AuditLogger audit(m_config.auditLogFile);
    consoleui::printAuditSummary(audit.summary(hours));
    return code(ExitCode::Success);
  }
};

int main(int argc, char *argv[]) {
  try {
    Application app;
    return app.run(argc, argv);
  } catch (const LazyScanError &e) {
    std::cerr << "lazyscan: " << e.what() << std::endl;
    return static_cast<int>(e.exitCode());
  } catch (const std::exception &e) {
    Log::error(e.what());
    return static_cast<int>(ExitCode::GeneralError);
  }
}
