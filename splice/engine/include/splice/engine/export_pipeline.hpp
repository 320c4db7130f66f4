/**
 * @file export_pipeline.hpp
 * @brief Owner of export jobs
 */

#pragma once

#include <splice/engine/export_job.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace spl::engine {

/**
 * @brief Creates, runs and tracks export jobs
 *
 * Job signals are forwarded to the pipeline's own signals, so one
 * observer can follow every export. Destroying the pipeline cancels and
 * joins all running jobs.
 *
 * Usage:
 * @code
 *   ExportPipeline pipeline;
 *   auto job = pipeline.submit(timeline.snapshot(), settings, backend);
 *   pipeline.start(job->id());
 *   ...
 *   pipeline.cancel(job->id());
 *   pipeline.wait(job->id());
 * @endcode
 */
class ExportPipeline {
public:
    ExportPipeline() = default;
    ~ExportPipeline();

    ExportPipeline(const ExportPipeline&) = delete;
    ExportPipeline& operator=(const ExportPipeline&) = delete;

    /// Create a Pending job over an immutable snapshot
    std::shared_ptr<ExportJob> submit(std::shared_ptr<const model::TimelineSnapshot> snapshot,
                                      ExportSettings settings,
                                      std::shared_ptr<RenderBackend> backend);

    /// Render on a worker thread
    Result<void> start(const UUID& jobId);

    /// Render on the calling thread (see ExportJob::run)
    Result<void> run(const UUID& jobId);

    Result<void> cancel(const UUID& jobId);
    void cancelAll();

    /// Block until the job's worker finishes; NotFound for unknown ids
    Result<ExportState> wait(const UUID& jobId);

    [[nodiscard]] std::shared_ptr<ExportJob> job(const UUID& jobId) const;
    [[nodiscard]] std::vector<std::shared_ptr<ExportJob>> jobs() const;

    /// Forget terminal jobs; returns how many were dropped. A job whose
    /// worker is the calling thread is kept for a later call.
    size_t removeFinished();

    Signal<const ExportProgress&> progress;
    Signal<const ExportProgress&> stateChanged;

private:
    struct Entry {
        std::shared_ptr<ExportJob> job;
        ScopedConnection progressConnection;
        ScopedConnection stateConnection;
    };

    mutable std::mutex m_mutex;
    std::map<UUID, Entry> m_jobs;
};

} // namespace spl::engine
