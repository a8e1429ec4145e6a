#include "rag_core/async/ingest_dataset_task.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

#include "rag_core/async/service_provider.hpp"
#include "rag_core/db/dataset_repo.hpp"
#include "rag_core/db/task_repo.hpp"
#include "rag_core/errors.hpp"
#include "rag_core/ingest/document_ingestor.hpp"
#include "rag_core/resolver/strategy_resolver.hpp"

namespace rag_core {

namespace {

FileOutcome make_file_outcome(const std::string& hash, const std::string& filename,
                              FileOutcomeKind kind, const std::string& detail) {
  FileOutcome outcome;
  outcome.content_hash = hash;
  outcome.filename = filename;
  outcome.outcome = kind;
  outcome.detail = detail;
  return outcome;
}

}  // namespace

void IngestionSummary::add(FileOutcomeKind kind) {
  switch (kind) {
    case FileOutcomeKind::PROCESSED: ++processed; break;
    case FileOutcomeKind::FAILED: ++failed; break;
    case FileOutcomeKind::SKIPPED_DUPLICATE: ++skipped_duplicate; break;
    case FileOutcomeKind::SKIPPED_UNSUPPORTED: ++skipped_unsupported; break;
    case FileOutcomeKind::CANCELLED: ++cancelled; break;
  }
}

size_t IngestionSummary::total() const {
  return processed + failed + skipped_duplicate + skipped_unsupported + cancelled;
}

TaskStatus IngestionSummary::final_status(bool cancel_requested) const {
  if (cancel_requested) {
    return TaskStatus::CANCELLED;
  }
  if (failed == 0 && skipped_unsupported == 0) {
    return TaskStatus::SUCCEEDED;
  }
  if (processed == 0 && skipped_duplicate == 0) {
    return TaskStatus::FAILED;
  }
  return TaskStatus::PARTIAL;
}

std::string IngestionSummary::describe() const {
  return std::to_string(processed) + " processed, " + std::to_string(skipped_duplicate) +
         " duplicate, " + std::to_string(skipped_unsupported) + " unsupported, " +
         std::to_string(failed) + " failed, " + std::to_string(cancelled) + " cancelled";
}

IngestDatasetTask::IngestDatasetTask(IngestionTask record,
                                     std::vector<std::string> content_hashes)
    : ITask(std::move(record)), content_hashes_(std::move(content_hashes)) {}

std::string IngestDatasetTask::display_name(DatasetRepo& dataset_repo,
                                            const std::string& hash) const {
  try {
    std::optional<DocumentRecord> document = dataset_repo.get_document(record_.dataset_name, hash);
    return document ? document->filename : hash;
  } catch (const std::exception& e) {
    std::cerr << "[IngestDatasetTask " << record_.id << "] Filename lookup for " << hash
              << " failed: " << e.what() << std::endl;
    return hash;
  }
}

void IngestDatasetTask::record_abandoned_files(IngestionTaskRepo& task_repo,
                                               DatasetRepo& dataset_repo,
                                               const std::vector<bool>& recorded,
                                               const std::string& reason) const {
  for (size_t index = 0; index < content_hashes_.size(); ++index) {
    if (recorded[index]) {
      continue;
    }
    const std::string& hash = content_hashes_[index];
    FileOutcome failed =
        make_file_outcome(hash, display_name(dataset_repo, hash), FileOutcomeKind::FAILED, reason);
    try {
      task_repo.record_file_outcome(record_.id, failed);
    } catch (const std::exception& e) {
      // The queue is unreachable; the task itself is still marked failed by the worker.
      std::cerr << "[IngestDatasetTask " << record_.id << "] Could not record outcome for " << hash
                << ": " << e.what() << std::endl;
      return;
    }
  }
}

std::string IngestDatasetTask::make_payload(const std::vector<std::string>& content_hashes) {
  return nlohmann::json{{"content_hashes", content_hashes}}.dump();
}

TaskResult IngestDatasetTask::execute(ServiceProvider& services,
                                      const ProgressUpdater& on_progress) {
  IngestionTaskRepo& task_repo = services.get_task_repo();
  DatasetRepo& dataset_repo = services.get_dataset_repo();
  StrategyResolver& resolver = services.get_resolver();

  std::optional<DatasetRecord> dataset = dataset_repo.get_dataset(record_.dataset_name);
  if (!dataset) {
    throw NotFoundError("Dataset not found: " + record_.dataset_name);
  }
  // Configuration problems fail the task before any file is touched.
  resolver.resolve(dataset->data_processing_strategy, dataset->database_name);

  const size_t total = content_hashes_.size();
  on_progress(0.0f, "Ingesting " + std::to_string(total) + " files");
  std::cout << "[IngestDatasetTask " << record_.id << "] Dataset " << record_.dataset_name
            << ": " << total << " files" << std::endl;

  DocumentIngestor ingestor(resolver);
  IngestionSummary summary;
  std::mutex summary_mutex;
  std::atomic<size_t> next_index{0};
  std::atomic<bool> cancelled{false};
  std::exception_ptr first_error;
  std::string abort_reason;
  std::vector<bool> recorded(total, false);

  auto record = [&](size_t index, const FileOutcome& outcome) {
    task_repo.record_file_outcome(record_.id, outcome);
    std::lock_guard<std::mutex> lock(summary_mutex);
    recorded[index] = true;
    summary.add(outcome.outcome);
    const size_t done = summary.total();
    on_progress(total == 0 ? 1.0f : static_cast<float>(done) / static_cast<float>(total),
                std::to_string(done) + " of " + std::to_string(total) + " files done");
  };

  // Never throws: whatever goes wrong with one file becomes that file's outcome.
  auto process_file = [&](const std::string& hash) -> FileOutcome {
    try {
      std::optional<DocumentRecord> document =
          dataset_repo.get_document(record_.dataset_name, hash);
      if (!document) {
        return make_file_outcome(hash, hash, FileOutcomeKind::FAILED,
                                  "document was removed from the dataset before processing");
      }
      return ingestor.ingest(*dataset, *document);
    } catch (const std::exception& e) {
      std::cerr << "[IngestDatasetTask " << record_.id << "] File " << hash
                << " failed: " << e.what() << std::endl;
      return make_file_outcome(hash, hash, FileOutcomeKind::FAILED, e.what());
    }
  };

  // Only a failure to reach the task queue itself (cancel flag, outcome rows)
  // aborts the run.
  auto run_files = [&]() {
    try {
      while (!cancelled.load()) {
        if (task_repo.is_cancel_requested(record_.id)) {
          cancelled.store(true);
          break;
        }
        const size_t index = next_index.fetch_add(1);
        if (index >= total) {
          break;
        }
        record(index, process_file(content_hashes_[index]));
      }
    } catch (const std::exception& e) {
      std::lock_guard<std::mutex> lock(summary_mutex);
      std::cerr << "[IngestDatasetTask " << record_.id << "] Aborting: " << e.what() << std::endl;
      if (!first_error) {
        first_error = std::current_exception();
        abort_reason = e.what();
      }
      cancelled.store(true);
    }
  };

  const size_t thread_count = std::min(services.max_concurrent_files(), std::max<size_t>(total, 1));
  std::vector<std::thread> threads;
  threads.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    threads.emplace_back(run_files);
  }
  for (auto& thread : threads) {
    thread.join();
  }
  if (first_error) {
    record_abandoned_files(task_repo, dataset_repo, recorded, "task aborted: " + abort_reason);
    std::rethrow_exception(first_error);
  }

  // Files no thread claimed.
  for (size_t index = 0; index < total; ++index) {
    if (recorded[index]) {
      continue;
    }
    const std::string& hash = content_hashes_[index];
    record(index, make_file_outcome(hash, display_name(dataset_repo, hash),
                                    FileOutcomeKind::CANCELLED, "not started, task was cancelled"));
  }

  TaskResult result;
  result.status = summary.final_status(cancelled.load());
  result.summary = summary.describe();
  std::cout << "[IngestDatasetTask " << record_.id << "] " << to_string(result.status) << ": "
            << result.summary << std::endl;
  return result;
}

}  // namespace rag_core
