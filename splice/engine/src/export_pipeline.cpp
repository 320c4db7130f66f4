/**
 * @file export_pipeline.cpp
 * @brief Export job management
 */

#include <splice/engine/export_pipeline.hpp>

#include <splice/core/logger.hpp>

namespace spl::engine {

ExportPipeline::~ExportPipeline() {
    cancelAll();
    for (const auto& job : jobs()) {
        job->wait();
    }
}

std::shared_ptr<ExportJob> ExportPipeline::submit(std::shared_ptr<const model::TimelineSnapshot> snapshot,
                                                  ExportSettings settings,
                                                  std::shared_ptr<RenderBackend> backend) {
    auto job = std::make_shared<ExportJob>(std::move(snapshot), std::move(settings), std::move(backend));

    Entry entry;
    entry.job = job;
    entry.progressConnection = job->progress.connectScoped(
        [this](const ExportProgress& p) { progress.fire(p); });
    entry.stateConnection = job->stateChanged.connectScoped(
        [this](const ExportProgress& p) { stateChanged.fire(p); });

    {
        std::lock_guard lock(m_mutex);
        m_jobs.emplace(job->id(), std::move(entry));
    }

    LOG_DEBUG("Export {} submitted", job->id().shortString());
    return job;
}

Result<void> ExportPipeline::start(const UUID& jobId) {
    auto j = job(jobId);
    if (!j) {
        return Err(ErrorCode::NotFound, "Unknown export " + jobId.toString());
    }
    return j->start();
}

Result<void> ExportPipeline::run(const UUID& jobId) {
    auto j = job(jobId);
    if (!j) {
        return Err(ErrorCode::NotFound, "Unknown export " + jobId.toString());
    }
    return j->run();
}

Result<void> ExportPipeline::cancel(const UUID& jobId) {
    auto j = job(jobId);
    if (!j) {
        return Err(ErrorCode::NotFound, "Unknown export " + jobId.toString());
    }
    j->cancel();
    return Ok();
}

void ExportPipeline::cancelAll() {
    for (const auto& j : jobs()) {
        if (!isTerminal(j->state())) {
            j->cancel();
        }
    }
}

Result<ExportState> ExportPipeline::wait(const UUID& jobId) {
    auto j = job(jobId);
    if (!j) {
        return Err<ExportState>(ErrorCode::NotFound, "Unknown export " + jobId.toString());
    }
    return j->wait();
}

std::shared_ptr<ExportJob> ExportPipeline::job(const UUID& jobId) const {
    std::lock_guard lock(m_mutex);
    auto it = m_jobs.find(jobId);
    return it != m_jobs.end() ? it->second.job : nullptr;
}

std::vector<std::shared_ptr<ExportJob>> ExportPipeline::jobs() const {
    std::lock_guard lock(m_mutex);
    std::vector<std::shared_ptr<ExportJob>> result;
    result.reserve(m_jobs.size());
    for (const auto& [id, entry] : m_jobs) {
        result.push_back(entry.job);
    }
    return result;
}

size_t ExportPipeline::removeFinished() {
    std::vector<Entry> finished;
    {
        std::lock_guard lock(m_mutex);
        for (auto it = m_jobs.begin(); it != m_jobs.end();) {
            // A job reporting its own end is still on its worker's stack
            if (isTerminal(it->second.job->state()) && !it->second.job->onWorkerThread()) {
                finished.push_back(std::move(it->second));
                it = m_jobs.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Join outside the lock; a terminal job may still be unwinding its worker
    for (auto& entry : finished) {
        entry.job->wait();
    }
    return finished.size();
}

} // namespace spl::engine
