/**
 * @file transcription_job.hpp
 * @brief Transcription jobs and the transcriber collaborator interface
 */

#pragma once

#include <splice/core/uuid.hpp>
#include <splice/model/caption_track.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spl::captions {

enum class TranscriptionState : uint8_t {
    Queued,
    Running,
    Completed,
    Failed,
};

inline const char* transcriptionStateToString(TranscriptionState state) {
    switch (state) {
        case TranscriptionState::Queued: return "queued";
        case TranscriptionState::Running: return "running";
        case TranscriptionState::Completed: return "completed";
        case TranscriptionState::Failed: return "failed";
        default: return "unknown";
    }
}

/// Queued and Running jobs are active
inline bool isActive(TranscriptionState state) {
    return state == TranscriptionState::Queued || state == TranscriptionState::Running;
}

struct TranscriptionJob {
    UUID id;
    UUID sourceAssetId;
    std::string language;
    TranscriptionState state = TranscriptionState::Queued;
    std::optional<UUID> resultCaptionTrackId;   ///< Set once Completed
    std::optional<UUID> resultTrackId;          ///< Timeline track holding the cues
    std::string errorReason;                    ///< Set once Failed
};

/**
 * @brief Event reported by a transcriber
 *
 * Cues carry source-relative ticks; ids are assigned on install.
 */
struct TranscriptionEvent {
    enum class Type : uint8_t {
        Queued,
        Running,
        Completed,
        Failed,
    };

    Type type = Type::Queued;
    std::vector<model::Caption> cues;   ///< Completed only
    std::string reason;                 ///< Failed only

    static TranscriptionEvent running() { return {Type::Running, {}, {}}; }
    static TranscriptionEvent completed(std::vector<model::Caption> cues) {
        return {Type::Completed, std::move(cues), {}};
    }
    static TranscriptionEvent failed(std::string reason) {
        return {Type::Failed, {}, std::move(reason)};
    }
};

struct TranscriptionRequest {
    UUID jobId;
    UUID assetId;
    std::string descriptor;     ///< Source path or URI of the asset
    std::string language;       ///< "auto" lets the transcriber detect it
};

/// Receives events; callable from any thread, any number of times
using TranscriptionSink = std::function<void(TranscriptionEvent)>;

/**
 * @brief Speech-to-text collaborator (external process, remote API, ...)
 */
class Transcriber {
public:
    virtual ~Transcriber() = default;

    /// Start work and report progress through sink; must not block
    virtual void transcribe(const TranscriptionRequest& request, TranscriptionSink sink) = 0;
};

} // namespace spl::captions
