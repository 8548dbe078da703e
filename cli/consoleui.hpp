/**
 * @file consoleui.hpp
 * @brief FTXUI rendering of lazyscan reports and the DELETE confirmation
 *
 * Reports are rendered once to stdout (no full-screen loop); only the
 * confirmation dialog is interactive.
 */

#ifndef CONSOLEUI_HPP
#define CONSOLEUI_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "auditlogger.hpp"
#include "confirmation.hpp"
#include "fileinfo.hpp"
#include "recoverymanager.hpp"
#include "safedeleter.hpp"

/**
 * @brief Asks for the literal DELETE in an FTXUI input dialog
 *
 * Return submits the typed text, ESC cancels (returns an empty string).
 */
class FtxuiConfirmationPrompt : public IConfirmationPrompt {
public:
  bool isInteractive() const override { return stdinIsTerminal(); }
  std::string ask(const std::string &path, std::uintmax_t bytes) override;
};

namespace consoleui {

void printScanReport(const std::filesystem::path &root,
                     const std::vector<FileInfo> &largest,
                     std::size_t entryCount, std::uintmax_t totalBytes);

/** @brief One row per request; dry-run rows are marked [DRY RUN] */
void printDeletionResults(const BatchSummary &summary, bool dryRun);

void printBackups(const std::vector<BackupEntry> &entries, int days);

void printRestoreResult(const RecoveryResult &result);

void printAuditSummary(const AuditSummary &summary);

} // namespace consoleui

#endif // CONSOLEUI_HPP
