/**
 * @file consoleui.cpp
 * @brief Implementation of the FTXUI reports and confirmation dialog
 */

#include "consoleui.hpp"
#include "utils.hpp"

#include <iostream>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

using namespace ftxui;

namespace {

/**
 * @brief Renders a document once to stdout, sized to its content
 */
void printDocument(Element document) {
  auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(document));
  Render(screen, document);
  screen.Print();
  std::cout << std::endl;
}

Element outcomeLabel(const DeletionResult &result) {
  switch (result.outcome) {
  case Outcome::DryRun:
    return text("[DRY RUN]") | bold | color(Color::Cyan);
  case Outcome::Deleted:
    return text("DELETED") | bold | color(Color::Green);
  case Outcome::AlreadyAbsent:
    return text("ABSENT") | color(Color::GrayLight);
  case Outcome::Blocked:
    return text("BLOCKED") | bold | color(Color::Red);
  case Outcome::Cancelled:
    return text("CANCELLED") | bold | color(Color::Yellow);
  case Outcome::Failed:
    return text("FAILED") | bold | color(Color::Red);
  }
  return text("?");
}

} // namespace

std::string FtxuiConfirmationPrompt::ask(const std::string &path,
                                         std::uintmax_t bytes) {
  std::string typed;
  bool submitted = false;
  auto screen = ScreenInteractive::TerminalOutput();

  auto input = Input(&typed, "type DELETE");

  auto renderer = Renderer(input, [&] {
    return vbox({
               text("PERMANENT DELETION") | bold | color(Color::Red) | hcenter,
               separator(),
               text("Path: " + path) | color(Color::Yellow),
               text("Size: " + formatBytes(bytes)),
               text("This cannot be undone.") | color(Color::Red),
               separator(),
               hbox({text("Type ") | color(Color::GrayLight),
                     text(kConfirmationPhrase) | bold | color(Color::Red),
                     text(" and press Enter, ESC to cancel: ") |
                         color(Color::GrayLight),
                     input->Render()}),
           }) |
           border;
  });

  auto handler = CatchEvent(renderer, [&](Event event) {
    if (event == Event::Return) {
      submitted = true;
      screen.Exit();
      return true;
    }
    if (event == Event::Escape) {
      submitted = false;
      screen.Exit();
      return true;
    }
    return false;
  });

  screen.Loop(handler);
  return submitted ? typed : std::string();
}

namespace consoleui {

void printScanReport(const std::filesystem::path &root,
                     const std::vector<FileInfo> &largest,
                     std::size_t entryCount, std::uintmax_t totalBytes) {
  Elements rows;
  for (const auto &file : largest) {
    rows.push_back(hbox({
        text(file.getSizeFormatted()) | size(WIDTH, EQUAL, 12) |
            color(Color::Yellow),
        text(file.getPath()),
    }));
  }
  if (rows.empty()) {
    rows.push_back(text("No files found") | color(Color::GrayLight));
  }

  printDocument(vbox({
                    text("lazyscan: " + root.string()) | bold,
                    text(std::to_string(entryCount) + " entries, " +
                         formatBytes(totalBytes) + " in files"),
                    separator(),
                    vbox(std::move(rows)),
                }) |
                border);
}

void printDeletionResults(const BatchSummary &summary, bool dryRun) {
  Elements rows;
  for (const auto &result : summary.results) {
    Elements row = {outcomeLabel(result) | size(WIDTH, EQUAL, 12),
                    text(formatBytes(result.bytesFreed)) |
                        size(WIDTH, EQUAL, 11)};
    row.push_back(paragraph(result.message.empty() ? result.path
                                                   : result.message) |
                  flex);
    rows.push_back(hbox(std::move(row)));

    if (result.backupPath) {
      rows.push_back(text("    backup: " + *result.backupPath) |
                     color(Color::GrayLight));
    }
    if (result.outcome == Outcome::Deleted) {
      rows.push_back(text("    operation id: " + result.operationId) |
                     color(Color::GrayLight));
    }
  }

  std::string footer =
      dryRun ? "[DRY RUN] Nothing was deleted. " +
                   formatBytes(summary.bytesFreed) +
                   " would be freed. Re-run with --execute to delete."
             : std::to_string(summary.succeeded) + " succeeded, " +
                   std::to_string(summary.failed) + " not deleted, " +
                   formatBytes(summary.bytesFreed) + " freed";

  printDocument(vbox({
                    text(dryRun ? "Cleanup preview" : "Cleanup results") |
                        bold,
                    separator(),
                    vbox(std::move(rows)),
                    separator(),
                    text(footer) |
                        color(dryRun ? Color::Cyan : Color::Default),
                }) |
                border);
}

void printBackups(const std::vector<BackupEntry> &entries, int days) {
  Elements rows;
  for (const auto &entry : entries) {
    rows.push_back(vbox({
        hbox({text(entry.createdAt) | size(WIDTH, EQUAL, 22),
              text(formatBytes(entry.size)) | size(WIDTH, EQUAL, 11),
              text(entry.originalPath)}),
        text("    " + entry.operationId + " (" + entry.category + ")") |
            color(Color::GrayLight),
    }));
  }
  if (rows.empty()) {
    rows.push_back(text("No recoverable operations") | color(Color::GrayLight));
  }

  printDocument(vbox({
                    text("Recoverable operations, last " +
                         std::to_string(days) + " day(s)") |
                        bold,
                    separator(),
                    vbox(std::move(rows)),
                }) |
                border);
}

void printRestoreResult(const RecoveryResult &result) {
  printDocument(vbox({
                    text(result.success ? "RESTORED" : "NOT RESTORED") | bold |
                        color(result.success ? Color::Green : Color::Red),
                    text(result.message),
                    text(formatBytes(result.bytesRestored) + " restored") |
                        color(Color::GrayLight),
                }) |
                border);
}

void printAuditSummary(const AuditSummary &summary) {
  Elements counts;
  for (const auto &[decision, count] : summary.byDecision) {
    counts.push_back(text(decision + ": " + std::to_string(count)) |
                     size(WIDTH, EQUAL, 16));
  }

  Elements blocked;
  for (const auto &record : summary.blocked) {
    blocked.push_back(hbox({text(record.timestamp) | size(WIDTH, EQUAL, 22),
                            text(record.reason) | color(Color::Red) |
                                size(WIDTH, EQUAL, 24),
                            text(record.path)}));
  }

  Elements content = {
      text("Audit summary, last " + std::to_string(summary.hours) +
           " hour(s)") |
          bold,
      separator(),
      text(std::to_string(summary.total) + " records, " +
           formatBytes(summary.bytesExecuted) + " deleted"),
      hbox(std::move(counts)),
  };
  if (!blocked.empty()) {
    content.push_back(separator());
    content.push_back(text("Blocked") | bold | color(Color::Red));
    content.push_back(vbox(std::move(blocked)));
  }

  printDocument(vbox(std::move(content)) | border);
}

} // namespace consoleui
