/**
 * @file Task.hpp
 * @brief Executor-facing wrapper around a Batch with lifecycle state.
 */

#pragma once

#include "domain/Batch.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace batchplanner::domain {

enum class TaskStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
    Cancelled
};

enum class TaskType {
    FileBatch,
    SingleFile,
    LargeFileChunk
};

inline std::string TaskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

inline std::string TaskTypeToString(TaskType type) {
    switch (type) {
        case TaskType::FileBatch: return "file_batch";
        case TaskType::SingleFile: return "single_file";
        case TaskType::LargeFileChunk: return "large_file_chunk";
    }
    return "file_batch";
}

inline TaskType TaskTypeForBatch(BatchKind kind) {
    switch (kind) {
        case BatchKind::Combined: return TaskType::FileBatch;
        case BatchKind::Single: return TaskType::SingleFile;
        case BatchKind::Chunk: return TaskType::LargeFileChunk;
    }
    return TaskType::FileBatch;
}

struct TaskTiming {
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    long long estimatedDurationMs = 0;
};

/**
 * @class Task
 * @brief Owns one batch. Created Pending; the executor drives the transitions.
 */
class Task {
public:
    static Task FromBatch(std::string id, Batch batch);

    /// 30 s base, 2 s per thousand tokens, 5 s per extra member file.
    static long long EstimateDurationMs(const Batch& batch);

    const std::string& getId() const { return m_id; }
    TaskType getType() const { return m_type; }
    TaskStatus getStatus() const { return m_status; }
    const Batch& getBatch() const { return m_batch; }
    const ProcessingHints& getProcessingHints() const { return m_batch.metadata.processingHints; }
    const TaskTiming& getTiming() const { return m_timing; }
    const std::optional<std::string>& getErrorMessage() const { return m_errorMessage; }

    bool isTerminal() const;

    /// Pending -> InProgress.
    void start();
    /// InProgress -> Completed.
    void complete();
    /// InProgress -> Failed.
    void fail(const std::string& reason);
    /// Pending or InProgress -> Cancelled.
    void cancel();

    std::string progressDescription() const;
    /// "N/M" for chunk tasks.
    std::optional<std::string> chunkProgressDescription() const;

private:
    Task(std::string id, Batch batch);

    void transition(TaskStatus from, TaskStatus to);

    std::string m_id;
    TaskType m_type;
    TaskStatus m_status = TaskStatus::Pending;
    Batch m_batch;
    TaskTiming m_timing;
    std::optional<std::string> m_errorMessage;
};

} // namespace batchplanner::domain
