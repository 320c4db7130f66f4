/**
 * @file export_job.hpp
 * @brief One export of a timeline snapshot to a media file
 *
 * State machine:
 *   Pending -> Rendering -> {Completed, Failed, Cancelled}
 *   Rendering -> Cancelling -> Cancelled
 *   Pending -> Cancelled
 *
 * Every rendered frame emits one progress event; the job then emits
 * exactly one terminal stateChanged event and nothing after it.
 */

#pragma once

#include <splice/core/result.hpp>
#include <splice/core/signals.hpp>
#include <splice/core/uuid.hpp>
#include <splice/engine/export_settings.hpp>
#include <splice/engine/render_backend.hpp>
#include <splice/model/timeline.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace spl::engine {

enum class ExportState : uint8_t {
    Pending,
    Rendering,
    Cancelling,
    Completed,
    Failed,
    Cancelled,
};

inline const char* exportStateToString(ExportState state) {
    switch (state) {
        case ExportState::Pending: return "pending";
        case ExportState::Rendering: return "rendering";
        case ExportState::Cancelling: return "cancelling";
        case ExportState::Completed: return "completed";
        case ExportState::Failed: return "failed";
        case ExportState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

inline bool isTerminal(ExportState state) {
    return state == ExportState::Completed || state == ExportState::Failed ||
           state == ExportState::Cancelled;
}

struct ExportProgress {
    UUID exportId;
    int64_t currentFrame = 0;
    int64_t totalFrames = 0;
    Microseconds estimatedTimeRemaining{0};
    ExportState state = ExportState::Pending;
};

class ExportJob {
public:
    ExportJob(std::shared_ptr<const model::TimelineSnapshot> snapshot,
              ExportSettings settings,
              std::shared_ptr<RenderBackend> backend);

    /**
     * @brief Requests cancellation of a running worker and joins it
     *
     * Must not run on the job's own worker (from one of its signals);
     * ExportPipeline::removeFinished() keeps such jobs alive.
     */
    ~ExportJob();

    ExportJob(const ExportJob&) = delete;
    ExportJob& operator=(const ExportJob&) = delete;

    /**
     * @brief Render on the calling thread until a terminal state
     *
     * @return Ok when Completed, Cancelled when cancelled, the job error
     *         when Failed, InvalidState if the job is not Pending
     */
    Result<void> run();

    /// Run on a worker thread; InvalidState if not Pending
    Result<void> start();

    /**
     * @brief Request cancellation
     *
     * A Pending job becomes Cancelled immediately. A Rendering job stops
     * before its next frame. No effect on terminal jobs.
     */
    void cancel();

    /// Join the worker started by start(); returns the final state.
    /// From the worker itself this returns the current state without joining.
    ExportState wait();

    /// True when called from the worker started by start()
    [[nodiscard]] bool onWorkerThread() const;

    // ========== Queries ==========

    [[nodiscard]] const UUID& id() const { return m_id; }
    [[nodiscard]] ExportState state() const { return m_state.load(); }
    [[nodiscard]] int64_t currentFrame() const { return m_currentFrame.load(); }
    [[nodiscard]] int64_t totalFrames() const { return m_totalFrames.load(); }
    [[nodiscard]] Microseconds estimatedTimeRemaining() const {
        return Microseconds(m_etaMicros.load());
    }
    /// Frames replaced by blank frames after failing twice
    [[nodiscard]] int64_t recoveredFrameErrors() const { return m_recoveredFrameErrors.load(); }
    [[nodiscard]] std::optional<Error> lastError() const;
    [[nodiscard]] const ExportSettings& settings() const { return m_settings; }
    [[nodiscard]] std::shared_ptr<const model::TimelineSnapshot> snapshot() const { return m_snapshot; }

    // ========== Signals ==========

    /// After every frame (from the rendering thread)
    Signal<const ExportProgress&> progress;

    /// On every state change, terminal one last
    Signal<const ExportProgress&> stateChanged;

private:
    enum class Outcome { Completed, Failed, Cancelled };

    Outcome renderFrames(Tick rangeStart);
    Result<FrameBuffer> renderWithRetry(const FrameRequest& request);
    Result<void> finish(Outcome outcome);

    void setState(ExportState state);
    void setError(const Error& error);
    ExportProgress makeProgress() const;

    UUID m_id;
    std::shared_ptr<const model::TimelineSnapshot> m_snapshot;
    ExportSettings m_settings;
    std::shared_ptr<RenderBackend> m_backend;

    std::atomic<ExportState> m_state{ExportState::Pending};
    std::atomic<bool> m_cancelRequested{false};
    std::atomic<int64_t> m_currentFrame{0};
    std::atomic<int64_t> m_totalFrames{0};
    std::atomic<int64_t> m_etaMicros{0};
    std::atomic<int64_t> m_recoveredFrameErrors{0};

    mutable std::mutex m_errorMutex;
    std::optional<Error> m_lastError;

    std::mutex m_workerMutex;
    std::thread m_worker;
    std::atomic<std::thread::id> m_workerThreadId{};
};

} // namespace spl::engine
