/**
 * @file export_job.cpp
 * @brief Export frame loop and state machine
 */

#include <splice/engine/export_job.hpp>

#include <splice/core/invariant.hpp>
#include <splice/core/logger.hpp>
#include <splice/engine/eta_estimator.hpp>

namespace spl::engine {

namespace {

/// Collect a backend future; exceptions and empty futures become errors
template<typename T>
Result<T> awaitResult(std::future<Result<T>> future, ErrorCode failure) {
    if (!future.valid()) {
        return Err<T>(failure, "Backend returned an empty future");
    }
    try {
        return future.get();
    } catch (const std::exception& e) {
        return Err<T>(failure, e.what());
    }
}

} // anonymous namespace

ExportJob::ExportJob(std::shared_ptr<const model::TimelineSnapshot> snapshot,
                     ExportSettings settings,
                     std::shared_ptr<RenderBackend> backend)
    : m_id(UUID::generate())
    , m_snapshot(std::move(snapshot))
    , m_settings(std::move(settings))
    , m_backend(std::move(backend)) {
}

ExportJob::~ExportJob() {
    m_cancelRequested.store(true);
    if (!SPLICE_INVARIANT(!onWorkerThread(), "export job destroyed by its own worker")) {
        // Joining ourselves would throw; let the thread unwind on its own
        std::lock_guard lock(m_workerMutex);
        m_worker.detach();
        return;
    }
    wait();
}

// ============================================================================
// Control
// ============================================================================

Result<void> ExportJob::run() {
    ExportState expected = ExportState::Pending;
    if (!m_state.compare_exchange_strong(expected, ExportState::Rendering)) {
        return Err(ErrorCode::InvalidState,
            std::string("Export job is ") + exportStateToString(expected));
    }
    stateChanged.fire(makeProgress());

    auto fail = [this](const Error& error) -> Result<void> {
        setError(error);
        LOG_ERROR("Export {} failed: {}", m_id.shortString(), error.what());
        setState(ExportState::Failed);
        return Err(error);
    };

    if (!m_snapshot || !m_backend) {
        return fail(Error(ErrorCode::InvalidArgument, "Export needs a snapshot and a backend"));
    }
    auto valid = m_settings.validate();
    if (!valid) {
        return fail(valid.error());
    }

    Tick rangeStart = 0;
    Tick rangeEnd = m_snapshot->endTick();
    if (m_settings.range) {
        rangeStart = m_settings.range->start;
        rangeEnd = m_settings.range->end;
    }

    const int64_t total = frameCountForTicks(rangeEnd - rangeStart, m_settings.frameRate);
    if (total <= 0) {
        return fail(Error(ErrorCode::InvalidRange, "Nothing to export: timeline is empty"));
    }
    m_totalFrames.store(total);

    LOG_INFO("Export {} started: {} frames at {}x{} {}/{} fps -> {}",
             m_id.shortString(), total, m_settings.width, m_settings.height,
             m_settings.frameRate.num, m_settings.frameRate.den, m_settings.outputPath);

    auto prepared = m_backend->prepare(m_settings, total);
    if (!prepared) {
        return fail(prepared.error());
    }

    return finish(renderFrames(rangeStart));
}

Result<void> ExportJob::start() {
    std::lock_guard lock(m_workerMutex);
    if (m_worker.joinable() || state() != ExportState::Pending) {
        return Err(ErrorCode::InvalidState, "Export job already started");
    }

    m_worker = std::thread([this] {
        m_workerThreadId.store(std::this_thread::get_id());
        auto result = run();
        if (!result) {
            LOG_DEBUG("Export {} worker finished: {}", m_id.shortString(), result.error().what());
        }
        m_workerThreadId.store(std::thread::id());
    });
    return Ok();
}

void ExportJob::cancel() {
    m_cancelRequested.store(true);

    ExportState expected = ExportState::Pending;
    if (m_state.compare_exchange_strong(expected, ExportState::Cancelled)) {
        LOG_INFO("Export {} cancelled before start", m_id.shortString());
        stateChanged.fire(makeProgress());
    }
}

ExportState ExportJob::wait() {
    // A joining caller may hold m_workerMutex while our slots run
    if (onWorkerThread()) {
        return state();
    }
    std::lock_guard lock(m_workerMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
    return state();
}

bool ExportJob::onWorkerThread() const {
    return m_workerThreadId.load() == std::this_thread::get_id();
}

std::optional<Error> ExportJob::lastError() const {
    std::lock_guard lock(m_errorMutex);
    return m_lastError;
}

// ============================================================================
// Frame Loop
// ============================================================================

ExportJob::Outcome ExportJob::renderFrames(Tick rangeStart) {
    const Rational rate = m_settings.frameRate;
    const int64_t total = m_totalFrames.load();

    EtaEstimator eta(m_settings.etaWindow);
    int consecutiveFailures = 0;

    for (int64_t i = 0; i < total; ++i) {
        if (m_cancelRequested.load()) {
            LOG_INFO("Export {} cancelled at frame {}/{}", m_id.shortString(), i, total);
            return Outcome::Cancelled;
        }

        const TimePoint frameStart = Clock::now();

        FrameRequest request;
        request.frameIndex = i;
        request.timestamp = rangeStart + frameIndexToTicks(i, rate);
        request.frameDuration = frameIndexToTicks(i + 1, rate) - frameIndexToTicks(i, rate);
        request.layers = m_snapshot->activeElementsAt(request.timestamp);
        request.snapshot = m_snapshot.get();
        request.width = m_settings.width;
        request.height = m_settings.height;

        FrameBuffer frame;
        auto rendered = renderWithRetry(request);
        if (rendered) {
            frame = std::move(rendered).value();
            consecutiveFailures = 0;
        } else {
            setError(rendered.error());
            if (++consecutiveFailures >= m_settings.maxConsecutiveFrameFailures) {
                LOG_ERROR("Export {}: {} consecutive frames failed, giving up at frame {}",
                          m_id.shortString(), consecutiveFailures, i);
                return Outcome::Failed;
            }

            LOG_WARN("Export {}: frame {} failed twice, using a blank frame: {}",
                     m_id.shortString(), i, rendered.error().what());
            m_recoveredFrameErrors.fetch_add(1);

            const auto samples = static_cast<size_t>(
                static_cast<int64_t>(m_settings.sampleRate) * request.frameDuration / kTicksPerSecond);
            frame = FrameBuffer::blank(m_settings.width, m_settings.height, request.timestamp, i,
                                       m_settings.sampleRate, m_settings.channels, samples);
            frame.substituted = true;
        }

        auto encoded = awaitResult(m_backend->encode(frame), ErrorCode::EncoderError);
        if (!encoded) {
            setError(encoded.error());
            LOG_ERROR("Export {}: encoding frame {} failed: {}",
                      m_id.shortString(), i, encoded.error().what());
            return Outcome::Failed;
        }

        eta.addSample(std::chrono::duration_cast<Microseconds>(Clock::now() - frameStart));
        m_currentFrame.store(i + 1);
        m_etaMicros.store(eta.estimate(total - (i + 1)).count());
        progress.fire(makeProgress());
    }
    return Outcome::Completed;
}

Result<FrameBuffer> ExportJob::renderWithRetry(const FrameRequest& request) {
    auto result = awaitResult(m_backend->renderFrame(request), ErrorCode::RenderError);
    if (result) {
        return result;
    }

    LOG_DEBUG("Export {}: retrying frame {} after: {}",
              m_id.shortString(), request.frameIndex, result.error().what());
    return awaitResult(m_backend->renderFrame(request), ErrorCode::RenderError);
}

Result<void> ExportJob::finish(Outcome outcome) {
    if (outcome == Outcome::Cancelled) {
        setState(ExportState::Cancelling);
    }

    // Always flush and close the output
    auto finalized = awaitResult(m_backend->finalize(), ErrorCode::EncoderError);

    switch (outcome) {
        case Outcome::Completed:
            if (!finalized) {
                setError(finalized.error());
                LOG_ERROR("Export {} failed to finalize: {}", m_id.shortString(), finalized.error().what());
                setState(ExportState::Failed);
                return finalized;
            }
            LOG_INFO("Export {} completed ({} frames, {} recovered frame errors)",
                     m_id.shortString(), m_currentFrame.load(), m_recoveredFrameErrors.load());
            setState(ExportState::Completed);
            return Ok();

        case Outcome::Cancelled:
            if (!finalized) {
                LOG_ERROR("Export {}: finalize after cancel failed: {}",
                          m_id.shortString(), finalized.error().what());
            }
            setState(ExportState::Cancelled);
            return Err(ErrorCode::Cancelled, "Export cancelled");

        case Outcome::Failed:
            break;
    }

    if (!finalized) {
        LOG_ERROR("Export {}: finalize after failure failed: {}",
                  m_id.shortString(), finalized.error().what());
    }
    setState(ExportState::Failed);
    auto error = lastError();
    return Err(error ? *error : Error(ErrorCode::Unknown, "Export failed"));
}

// ============================================================================
// Internals
// ============================================================================

void ExportJob::setState(ExportState state) {
    const ExportState previous = m_state.exchange(state);
    LOG_DEBUG("Export {}: {} -> {}", m_id.shortString(),
              exportStateToString(previous), exportStateToString(state));
    stateChanged.fire(makeProgress());
}

void ExportJob::setError(const Error& error) {
    std::lock_guard lock(m_errorMutex);
    m_lastError = error;
}

ExportProgress ExportJob::makeProgress() const {
    ExportProgress p;
    p.exportId = m_id;
    p.currentFrame = m_currentFrame.load();
    p.totalFrames = m_totalFrames.load();
    p.estimatedTimeRemaining = estimatedTimeRemaining();
    p.state = m_state.load();
    return p;
}

} // namespace spl::engine
