#include "rag_core/db/task_repo.hpp"

#include <sqlite_modern_cpp.h>

#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/db/sqlite_support.hpp"
#include "rag_core/db/transaction.hpp"

namespace rag_core {

namespace {

const char* TASK_COLUMNS =
    "SELECT id, task_type, status, priority, dataset_name, payload, cancel_requested, "
    "error_message, created_at, updated_at FROM ingestion_tasks ";

IngestionTask make_task(long long id, std::string task_type, const std::string& status, int priority,
                        std::string dataset_name, std::optional<std::string> payload,
                        int cancel_requested, std::optional<std::string> error_message,
                        const std::string& created_at, const std::string& updated_at) {
  IngestionTask task;
  task.id = id;
  task.task_type = std::move(task_type);
  task.status = task_status_from_string(status);
  task.priority = priority;
  task.dataset_name = std::move(dataset_name);
  if (payload)
    task.payload = *payload;
  task.cancel_requested = cancel_requested != 0;
  if (error_message)
    task.error_message = *error_message;
  task.created_at = string_to_time_point(created_at);
  task.updated_at = string_to_time_point(updated_at);
  return task;
}

}  // namespace

IngestionTaskRepo::IngestionTaskRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

long long IngestionTaskRepo::create_task(const std::string& task_type,
                                         const std::string& dataset_name,
                                         const std::string& payload, int priority) {
  try {
    PooledConnection conn(db_manager_);
    std::string now = time_point_to_string(std::chrono::system_clock::now());
    *conn << "INSERT INTO ingestion_tasks (task_type, status, priority, dataset_name, payload, "
             "created_at, updated_at) VALUES (?,?,?,?,?,?,?)"
          << task_type << to_string(TaskStatus::PENDING) << priority << dataset_name << payload
          << now << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("create_task", e));
  }
}

std::optional<IngestionTask> IngestionTaskRepo::fetch_and_claim_next_task() {
  std::optional<IngestionTask> result;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TxMode::Immediate);
    *conn << std::string(TASK_COLUMNS) +
                 "WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC LIMIT 1"
          << to_string(TaskStatus::PENDING) >>
        [&](long long id, std::string task_type, std::string status, int priority,
            std::string dataset_name, std::optional<std::string> payload, int cancel_requested,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_task(id, std::move(task_type), status, priority, std::move(dataset_name),
                             std::move(payload), cancel_requested, std::move(error_message),
                             created_at, updated_at);
        };

    if (result) {
      auto now = std::chrono::system_clock::now();
      *conn << "UPDATE ingestion_tasks SET status = ?, updated_at = ? WHERE id = ?"
            << to_string(TaskStatus::RUNNING) << time_point_to_string(now) << result->id;
      result->status = TaskStatus::RUNNING;
      result->updated_at = now;
    }
    tx.commit();
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("fetch_and_claim_next_task", e));
  }
}

void IngestionTaskRepo::update_task_status(long long task_id, TaskStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_tasks SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(new_status) << time_point_to_string(std::chrono::system_clock::now())
          << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("update_task_status", e));
  }
}

void IngestionTaskRepo::mark_task_as_failed(long long task_id, const std::string& error_message) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_tasks SET status = ?, error_message = ?, updated_at = ? WHERE id = ?"
          << to_string(TaskStatus::FAILED) << error_message
          << time_point_to_string(std::chrono::system_clock::now()) << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("mark_task_as_failed", e));
  }
}

bool IngestionTaskRepo::request_cancel(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TxMode::Immediate);
    std::optional<std::string> status;
    *conn << "SELECT status FROM ingestion_tasks WHERE id = ?" << task_id >>
        [&](std::string s) { status = std::move(s); };
    if (!status) {
      return false;
    }
    std::string now = time_point_to_string(std::chrono::system_clock::now());
    const TaskStatus current = task_status_from_string(*status);
    if (current == TaskStatus::PENDING) {
      *conn << "UPDATE ingestion_tasks SET status = ?, cancel_requested = 1, updated_at = ? "
               "WHERE id = ?"
            << to_string(TaskStatus::CANCELLED) << now << task_id;
    } else if (current == TaskStatus::RUNNING) {
      *conn << "UPDATE ingestion_tasks SET cancel_requested = 1, updated_at = ? WHERE id = ?"
            << now << task_id;
    }
    tx.commit();
    return true;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("request_cancel", e));
  }
}

bool IngestionTaskRepo::is_cancel_requested(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    int flag = 0;
    *conn << "SELECT cancel_requested FROM ingestion_tasks WHERE id = ?" << task_id >>
        [&](int value) { flag = value; };
    return flag != 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("is_cancel_requested", e));
  }
}

int IngestionTaskRepo::requeue_interrupted_tasks() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TxMode::Immediate);
    // A re-run records every file again, so partial results of the
    // interrupted run are dropped with the requeue.
    *conn << "DELETE FROM task_file_outcomes WHERE task_id IN "
             "(SELECT id FROM ingestion_tasks WHERE status = ?)"
          << to_string(TaskStatus::RUNNING);
    *conn << "DELETE FROM task_progress WHERE task_id IN "
             "(SELECT id FROM ingestion_tasks WHERE status = ?)"
          << to_string(TaskStatus::RUNNING);
    *conn << "UPDATE ingestion_tasks SET status = ?, updated_at = ? WHERE status = ?"
          << to_string(TaskStatus::PENDING)
          << time_point_to_string(std::chrono::system_clock::now())
          << to_string(TaskStatus::RUNNING);
    const int requeued = conn->rows_modified();
    tx.commit();
    return requeued;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("requeue_interrupted_tasks", e));
  }
}

void IngestionTaskRepo::record_file_outcome(long long task_id, const FileOutcome& outcome) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO task_file_outcomes (task_id, filename, content_hash, outcome, detail, "
             "chunk_count, failed_chunks, extraction_failures) VALUES (?,?,?,?,?,?,?,?)"
          << task_id << outcome.filename << outcome.content_hash << to_string(outcome.outcome)
          << outcome.detail << outcome.chunk_count << outcome.failed_chunks
          << outcome.extraction_failures;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("record_file_outcome", e));
  }
}

std::vector<FileOutcome> IngestionTaskRepo::get_file_outcomes(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<FileOutcome> outcomes;
    *conn << "SELECT filename, content_hash, outcome, detail, chunk_count, failed_chunks, "
             "extraction_failures FROM task_file_outcomes WHERE task_id = ? ORDER BY id ASC"
          << task_id >>
        [&](std::string filename, std::optional<std::string> content_hash, std::string outcome,
            std::optional<std::string> detail, int chunk_count, int failed_chunks,
            int extraction_failures) {
          FileOutcome result;
          result.filename = std::move(filename);
          if (content_hash)
            result.content_hash = *content_hash;
          result.outcome = file_outcome_from_string(outcome);
          if (detail)
            result.detail = *detail;
          result.chunk_count = chunk_count;
          result.failed_chunks = failed_chunks;
          result.extraction_failures = extraction_failures;
          outcomes.push_back(std::move(result));
        };
    return outcomes;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_file_outcomes", e));
  }
}

void IngestionTaskRepo::upsert_task_progress(long long task_id, float percent,
                                             const std::string& message) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    *conn << "INSERT INTO task_progress (task_id, progress_percent, status_message, updated_at) "
             "VALUES (?,?,?,?) ON CONFLICT(task_id) DO UPDATE SET "
             "progress_percent = excluded.progress_percent, "
             "status_message = excluded.status_message, updated_at = excluded.updated_at"
          << task_id << static_cast<double>(percent) << message << now;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("upsert_task_progress", e));
  }
}

std::optional<TaskProgress> IngestionTaskRepo::get_task_progress(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<TaskProgress> result;
    *conn << "SELECT task_id, progress_percent, status_message, updated_at FROM task_progress "
             "WHERE task_id = ?"
          << task_id >>
        [&](long long id, double percent, std::string message, long long updated_at) {
          TaskProgress progress;
          progress.task_id = id;
          progress.progress_percent = static_cast<float>(percent);
          progress.status_message = std::move(message);
          progress.updated_at = updated_at;
          result = std::move(progress);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task_progress", e));
  }
}

std::optional<IngestionTask> IngestionTaskRepo::get_task(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<IngestionTask> result;
    *conn << std::string(TASK_COLUMNS) + "WHERE id = ?" << task_id >>
        [&](long long id, std::string task_type, std::string status, int priority,
            std::string dataset_name, std::optional<std::string> payload, int cancel_requested,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          result = make_task(id, std::move(task_type), status, priority, std::move(dataset_name),
                             std::move(payload), cancel_requested, std::move(error_message),
                             created_at, updated_at);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task", e));
  }
}

std::vector<IngestionTask> IngestionTaskRepo::get_tasks_by_status(TaskStatus status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<IngestionTask> tasks;
    *conn << std::string(TASK_COLUMNS) +
                 "WHERE status = ? ORDER BY priority ASC, created_at ASC, id ASC"
          << to_string(status) >>
        [&](long long id, std::string task_type, std::string status_db, int priority,
            std::string dataset_name, std::optional<std::string> payload, int cancel_requested,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), status_db, priority,
                                    std::move(dataset_name), std::move(payload), cancel_requested,
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_tasks_by_status", e));
  }
}

std::vector<IngestionTask> IngestionTaskRepo::get_all_tasks(int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<IngestionTask> tasks;
    *conn << std::string(TASK_COLUMNS) + "ORDER BY id DESC LIMIT ?" << limit >>
        [&](long long id, std::string task_type, std::string status_db, int priority,
            std::string dataset_name, std::optional<std::string> payload, int cancel_requested,
            std::optional<std::string> error_message, std::string created_at,
            std::string updated_at) {
          tasks.push_back(make_task(id, std::move(task_type), status_db, priority,
                                    std::move(dataset_name), std::move(payload), cancel_requested,
                                    std::move(error_message), created_at, updated_at));
        };
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_all_tasks", e));
  }
}

void IngestionTaskRepo::clear_completed_tasks(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM ingestion_tasks WHERE status IN (?, ?, ?, ?) AND updated_at <= ?"
          << to_string(TaskStatus::SUCCEEDED) << to_string(TaskStatus::FAILED)
          << to_string(TaskStatus::PARTIAL) << to_string(TaskStatus::CANCELLED)
          << time_point_to_string(cutoff);
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("clear_completed_tasks", e));
  }
}

}  // namespace rag_core
