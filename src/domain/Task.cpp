/**
 * @file Task.cpp
 * @brief Implementation of the Task lifecycle.
 */

#include "domain/Task.hpp"

#include <stdexcept>

namespace batchplanner::domain {

Task::Task(std::string id, Batch batch)
    : m_id(std::move(id)),
      m_type(TaskTypeForBatch(batch.kind)),
      m_batch(std::move(batch)) {
    m_timing.createdAt = std::chrono::system_clock::now();
    m_timing.estimatedDurationMs = EstimateDurationMs(m_batch);
}

Task Task::FromBatch(std::string id, Batch batch) {
    if (id.empty()) {
        throw std::runtime_error("Task id must not be empty");
    }
    return Task(std::move(id), std::move(batch));
}

long long Task::EstimateDurationMs(const Batch& batch) {
    const long long base = 30000;
    const long long perThousandTokens = 2000;
    const long long perExtraFile = 5000;

    long long files = static_cast<long long>(batch.members.size());
    long long extraFiles = files > 1 ? files - 1 : 0;
    return base + (batch.estimatedTokens * perThousandTokens) / 1000 + extraFiles * perExtraFile;
}

bool Task::isTerminal() const {
    return m_status == TaskStatus::Completed ||
           m_status == TaskStatus::Failed ||
           m_status == TaskStatus::Cancelled;
}

void Task::transition(TaskStatus from, TaskStatus to) {
    if (m_status != from) {
        throw std::runtime_error("Task " + m_id + ": cannot move from " + TaskStatusToString(m_status) +
                                 " to " + TaskStatusToString(to));
    }
    m_status = to;
}

void Task::start() {
    transition(TaskStatus::Pending, TaskStatus::InProgress);
    m_timing.startedAt = std::chrono::system_clock::now();
}

void Task::complete() {
    transition(TaskStatus::InProgress, TaskStatus::Completed);
    m_timing.completedAt = std::chrono::system_clock::now();
}

void Task::fail(const std::string& reason) {
    transition(TaskStatus::InProgress, TaskStatus::Failed);
    m_timing.completedAt = std::chrono::system_clock::now();
    m_errorMessage = reason;
}

void Task::cancel() {
    if (isTerminal()) {
        throw std::runtime_error("Task " + m_id + ": cannot cancel a " + TaskStatusToString(m_status) + " task");
    }
    m_status = TaskStatus::Cancelled;
    m_timing.completedAt = std::chrono::system_clock::now();
}

std::string Task::progressDescription() const {
    std::string what;
    switch (m_type) {
        case TaskType::FileBatch:
            what = "batch of " + std::to_string(m_batch.members.size()) + " files";
            break;
        case TaskType::SingleFile:
            what = "file " + (m_batch.members.empty() ? std::string("?") : m_batch.members.front().path);
            break;
        case TaskType::LargeFileChunk: {
            std::string path = m_batch.parentFileRef ? m_batch.parentFileRef->path : std::string("?");
            what = "chunk " + chunkProgressDescription().value_or("?") + " of " + path;
            break;
        }
    }

    switch (m_status) {
        case TaskStatus::Pending: return "Waiting to process " + what;
        case TaskStatus::InProgress: return "Processing " + what;
        case TaskStatus::Completed: return "Completed " + what;
        case TaskStatus::Failed: return "Failed " + what + ": " + m_errorMessage.value_or("unknown error");
        case TaskStatus::Cancelled: return "Cancelled " + what;
    }
    return what;
}

std::optional<std::string> Task::chunkProgressDescription() const {
    if (!m_batch.chunkInfo.has_value()) {
        return std::nullopt;
    }
    return std::to_string(m_batch.chunkInfo->chunkIndex) + "/" + std::to_string(m_batch.chunkInfo->totalChunks);
}

} // namespace batchplanner::domain
