/**
 * @file transcription_service.hpp
 * @brief Transcription job lifecycle and caption track installation
 *
 * Jobs move Queued -> Running -> {Completed, Failed}; Queued may jump
 * straight to a terminal state. Transcriber events may arrive on any
 * thread and wait in an inbox until pump() applies them on the editing
 * thread. A completed job installs its cues as a caption track through
 * the history manager, so "Add Captions" is one undo step.
 */

#pragma once

#include <splice/captions/transcription_job.hpp>
#include <splice/core/result.hpp>
#include <splice/core/signals.hpp>
#include <splice/model/commands/history_manager.hpp>

#include <deque>
#include <map>
#include <memory>
#include <mutex>

namespace spl::model {
class MediaAssetRegistry;
}

namespace spl::captions {

class TranscriptionService {
public:
    /**
     * @param registry asset lookup for request(); must outlive the service
     * @param transcriber speech-to-text collaborator
     */
    TranscriptionService(model::HistoryManager& history,
                         const model::MediaAssetRegistry* registry,
                         std::shared_ptr<Transcriber> transcriber);

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    /**
     * @brief Start a job for an asset
     *
     * @return job id; NotFound if the registry does not know the asset,
     *         JobAlreadyActive if a Queued/Running job exists for it
     */
    Result<UUID> request(const UUID& assetId, std::string language = "auto");

    /**
     * @brief Apply queued transcriber events (editing thread only)
     *
     * While the history has an open transaction, completions stay queued
     * and are applied by the first pump() after it commits or aborts.
     * @return number of events applied
     */
    size_t pump();

    [[nodiscard]] std::optional<TranscriptionJob> job(const UUID& jobId) const;
    [[nodiscard]] std::vector<TranscriptionJob> jobs() const;
    [[nodiscard]] std::optional<TranscriptionJob> activeJobFor(const UUID& assetId) const;

    /// Fired after a job changes state
    Signal<const TranscriptionJob&> jobChanged;

private:
    struct Inbox {
        std::mutex mutex;
        std::deque<std::pair<UUID, TranscriptionEvent>> events;
    };

    void apply(const UUID& jobId, TranscriptionEvent event);
    void transition(TranscriptionJob& job, TranscriptionState next);
    Result<void> install(TranscriptionJob& job, std::vector<model::Caption> cues);

    model::HistoryManager& m_history;
    const model::MediaAssetRegistry* m_registry;
    std::shared_ptr<Transcriber> m_transcriber;

    // Shared with transcriber sinks so late events never dangle
    std::shared_ptr<Inbox> m_inbox;

    std::map<UUID, TranscriptionJob> m_jobs;
};

/**
 * @brief Prepare transcriber output for installation
 *
 * Sorts by start, drops empty cues, clips a cue that starts inside the
 * previous one to the previous end (dropping it if nothing remains) and
 * assigns ids where missing.
 */
std::vector<model::Caption> normalizeCues(std::vector<model::Caption> cues);

} // namespace spl::captions
