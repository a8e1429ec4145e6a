#pragma once

#include <string>
#include <vector>

#include "rag_core/async/ITask.hpp"
#include "rag_core/types/document.hpp"

namespace rag_core {

class DatasetRepo;
class IngestionTaskRepo;

// Outcome counts of one ingestion run.
struct IngestionSummary {
  size_t processed = 0;
  size_t failed = 0;
  size_t skipped_duplicate = 0;
  size_t skipped_unsupported = 0;
  size_t cancelled = 0;

  void add(FileOutcomeKind kind);
  size_t total() const;

  // cancelled if cancellation was requested, succeeded when nothing failed
  // or was unsupported, failed when nothing was processed or already present,
  // partial otherwise.
  TaskStatus final_status(bool cancel_requested) const;
  std::string describe() const;
};

/**
 * Ingests a fixed list of a dataset's documents, snapshotted when the task
 * was submitted. Files run on up to max_concurrent_files threads; every file
 * ends with exactly one recorded outcome, also when the run aborts. Once
 * cancellation is requested no further file starts, files already running
 * finish, and the rest are recorded as cancelled.
 */
class IngestDatasetTask : public ITask {
 public:
  static constexpr const char* TYPE = "INGEST_DATASET";

  IngestDatasetTask(IngestionTask record, std::vector<std::string> content_hashes);

  TaskResult execute(ServiceProvider& services, const ProgressUpdater& on_progress) override;
  const char* type() const override {
    return TYPE;
  }

  const std::vector<std::string>& content_hashes() const {
    return content_hashes_;
  }

  static std::string make_payload(const std::vector<std::string>& content_hashes);

 private:
  // Filename for an outcome row, falling back to the hash when the lookup fails.
  std::string display_name(DatasetRepo& dataset_repo, const std::string& hash) const;
  // Best effort after an abort: every file without an outcome is recorded as failed.
  void record_abandoned_files(IngestionTaskRepo& task_repo, DatasetRepo& dataset_repo,
                              const std::vector<bool>& recorded, const std::string& reason) const;

  std::vector<std::string> content_hashes_;
};

}  // namespace rag_core
