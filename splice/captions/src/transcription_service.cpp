/**
 * @file transcription_service.cpp
 * @brief Transcription job state machine
 */

#include <splice/captions/transcription_service.hpp>

#include <splice/core/logger.hpp>
#include <splice/model/media_asset_registry.hpp>

#include <algorithm>
#include <iterator>
#include <set>

namespace spl::captions {

namespace {

TranscriptionState stateFor(TranscriptionEvent::Type type) {
    switch (type) {
        case TranscriptionEvent::Type::Queued: return TranscriptionState::Queued;
        case TranscriptionEvent::Type::Running: return TranscriptionState::Running;
        case TranscriptionEvent::Type::Completed: return TranscriptionState::Completed;
        case TranscriptionEvent::Type::Failed: return TranscriptionState::Failed;
    }
    return TranscriptionState::Failed;
}

bool isAllowed(TranscriptionState from, TranscriptionState to) {
    switch (from) {
        case TranscriptionState::Queued:
            return to != TranscriptionState::Queued;
        case TranscriptionState::Running:
            return to == TranscriptionState::Completed || to == TranscriptionState::Failed;
        default:
            return false;
    }
}

} // anonymous namespace

std::vector<model::Caption> normalizeCues(std::vector<model::Caption> cues) {
    std::stable_sort(cues.begin(), cues.end(),
        [](const model::Caption& a, const model::Caption& b) { return a.startTick < b.startTick; });

    std::vector<model::Caption> result;
    result.reserve(cues.size());

    for (auto& cue : cues) {
        if (cue.startTick < 0) cue.startTick = 0;
        if (!result.empty() && cue.startTick < result.back().endTick) {
            cue.startTick = result.back().endTick;
        }
        if (cue.endTick <= cue.startTick) continue;

        if (cue.id.isNull()) {
            cue.id = UUID::generate();
        }
        result.push_back(std::move(cue));
    }
    return result;
}

TranscriptionService::TranscriptionService(model::HistoryManager& history,
                                           const model::MediaAssetRegistry* registry,
                                           std::shared_ptr<Transcriber> transcriber)
    : m_history(history)
    , m_registry(registry)
    , m_transcriber(std::move(transcriber))
    , m_inbox(std::make_shared<Inbox>()) {
}

Result<UUID> TranscriptionService::request(const UUID& assetId, std::string language) {
    std::string descriptor;
    if (m_registry) {
        auto asset = m_registry->find(assetId);
        if (!asset || m_registry->isRemoved(assetId)) {
            return Err<UUID>(ErrorCode::NotFound, "Unknown asset " + assetId.toString());
        }
        descriptor = asset->descriptor;
    }

    if (auto active = activeJobFor(assetId)) {
        return Err<UUID>(ErrorCode::JobAlreadyActive,
            "Transcription " + active->id.shortString() + " already " +
            transcriptionStateToString(active->state) + " for asset " + assetId.shortString());
    }

    if (!m_transcriber) {
        return Err<UUID>(ErrorCode::NotSupported, "No transcriber configured");
    }

    TranscriptionJob job;
    job.id = UUID::generate();
    job.sourceAssetId = assetId;
    job.language = language.empty() ? "auto" : std::move(language);
    const UUID jobId = job.id;

    auto [it, inserted] = m_jobs.emplace(jobId, std::move(job));
    LOG_INFO("Transcription {} queued for asset {} ({})",
             jobId.shortString(), assetId.shortString(), it->second.language);
    jobChanged.fire(it->second);

    TranscriptionRequest req{jobId, assetId, descriptor, it->second.language};
    std::shared_ptr<Inbox> inbox = m_inbox;
    TranscriptionSink sink = [inbox, jobId](TranscriptionEvent event) {
        std::lock_guard lock(inbox->mutex);
        inbox->events.emplace_back(jobId, std::move(event));
    };

    try {
        m_transcriber->transcribe(req, std::move(sink));
    } catch (const std::exception& e) {
        // Reported as a job failure, not a request failure
        std::lock_guard lock(m_inbox->mutex);
        m_inbox->events.emplace_back(jobId, TranscriptionEvent::failed(e.what()));
    }

    return jobId;
}

size_t TranscriptionService::pump() {
    std::deque<std::pair<UUID, TranscriptionEvent>> events;
    {
        std::lock_guard lock(m_inbox->mutex);
        events.swap(m_inbox->events);
    }

    // Installing captions is its own history entry, so completions wait
    // until no transaction is open. Later events of a held job wait too.
    std::deque<std::pair<UUID, TranscriptionEvent>> held;
    std::set<UUID> heldJobs;
    size_t applied = 0;

    for (auto& [jobId, event] : events) {
        const bool blocked = event.type == TranscriptionEvent::Type::Completed &&
                             m_history.inTransaction();
        if (blocked || heldJobs.count(jobId) > 0) {
            heldJobs.insert(jobId);
            held.emplace_back(jobId, std::move(event));
            continue;
        }
        apply(jobId, std::move(event));
        ++applied;
    }

    if (!held.empty()) {
        LOG_DEBUG("Holding {} transcription event(s) until the open transaction ends", held.size());
        std::lock_guard lock(m_inbox->mutex);
        m_inbox->events.insert(m_inbox->events.begin(),
                               std::make_move_iterator(held.begin()),
                               std::make_move_iterator(held.end()));
    }
    return applied;
}

void TranscriptionService::apply(const UUID& jobId, TranscriptionEvent event) {
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        LOG_WARN("Event for unknown transcription {}", jobId.shortString());
        return;
    }
    TranscriptionJob& job = it->second;

    const TranscriptionState next = stateFor(event.type);
    if (!isAllowed(job.state, next)) {
        LOG_WARN("Transcription {}: ignoring {} -> {}", jobId.shortString(),
                 transcriptionStateToString(job.state), transcriptionStateToString(next));
        return;
    }

    switch (next) {
        case TranscriptionState::Completed: {
            auto installed = install(job, std::move(event.cues));
            if (!installed) {
                job.errorReason = installed.error().message();
                LOG_ERROR("Transcription {} could not install captions: {}",
                          jobId.shortString(), installed.error().what());
                transition(job, TranscriptionState::Failed);
                return;
            }
            transition(job, TranscriptionState::Completed);
            return;
        }
        case TranscriptionState::Failed:
            job.errorReason = event.reason.empty() ? "Transcription failed" : event.reason;
            LOG_ERROR("Transcription {} failed: {}", jobId.shortString(), job.errorReason);
            transition(job, TranscriptionState::Failed);
            return;
        default:
            transition(job, next);
            return;
    }
}

void TranscriptionService::transition(TranscriptionJob& job, TranscriptionState next) {
    LOG_DEBUG("Transcription {}: {} -> {}", job.id.shortString(),
              transcriptionStateToString(job.state), transcriptionStateToString(next));
    job.state = next;
    jobChanged.fire(job);
}

Result<void> TranscriptionService::install(TranscriptionJob& job, std::vector<model::Caption> cues) {
    cues = normalizeCues(std::move(cues));
    if (cues.empty()) {
        return Err(ErrorCode::TranscriptionFailed, "Transcription produced no captions");
    }

    model::CaptionTrack captions;
    captions.id = UUID::generate();
    captions.language = job.language;
    captions.cues = std::move(cues);

    model::Track track = model::Track::make(model::TrackKind::Caption,
                                            "Captions (" + job.language + ")");
    track.captionTrackId = captions.id;
    for (const auto& cue : captions.cues) {
        model::Element element;
        element.id = UUID::generate();
        element.trackId = track.id;
        element.name = cue.text;
        element.startTick = cue.startTick;
        element.durationTicks = cue.duration();
        element.source = model::SourceRef::cue(cue.id);
        track.elements.push_back(std::move(element));
    }

    const UUID captionTrackId = captions.id;
    const UUID trackId = track.id;
    const size_t cueCount = captions.cues.size();

    auto result = m_history.execute(model::cmd::AddTrack{std::move(track), std::nullopt, std::move(captions)},
                                    "Add Captions");
    if (!result) {
        return result;
    }

    job.resultCaptionTrackId = captionTrackId;
    job.resultTrackId = trackId;
    LOG_INFO("Transcription {} installed {} captions", job.id.shortString(), cueCount);
    return Ok();
}

std::optional<TranscriptionJob> TranscriptionService::job(const UUID& jobId) const {
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return std::nullopt;
    return it->second;
}

std::vector<TranscriptionJob> TranscriptionService::jobs() const {
    std::vector<TranscriptionJob> result;
    result.reserve(m_jobs.size());
    for (const auto& [id, job] : m_jobs) {
        result.push_back(job);
    }
    return result;
}

std::optional<TranscriptionJob> TranscriptionService::activeJobFor(const UUID& assetId) const {
    for (const auto& [id, job] : m_jobs) {
        if (job.sourceAssetId == assetId && isActive(job.state)) {
            return job;
        }
    }
    return std::nullopt;
}

} // namespace spl::captions
