// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionDispatcher.hpp"

#include <core/BoundedQueue.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace talktype
{

namespace
{

    /// @brief A queued utterance and its position in submission order.
    struct Job
    {
        std::uint64_t sequence = 0;
        Utterance utterance;
    };

    /// @brief What a job produced. Neither a result nor an error means the job is skipped silently.
    struct Outcome
    {
        std::uint64_t utteranceId = 0;
        std::optional<TranscriptionResult> result;
        std::optional<Error> error;
    };

} // namespace

struct TranscriptionDispatcher::Impl
{
    std::shared_ptr<Recognizer> recognizer;
    DispatcherConfig config;
    ResultCallback onResult;
    FailureCallback onFailure;

    BoundedQueue<Job> queue;
    std::vector<std::jthread> workers;
    std::mutex lifecycleMutex;
    std::atomic<bool> running = false;

    std::mutex submitMutex;
    std::uint64_t nextSequence = 0;

    // Lock order: deliveryMutex, then reorderMutex. submit() only ever takes reorderMutex,
    // so callbacks may submit.
    std::mutex deliveryMutex;
    std::mutex reorderMutex;
    std::map<std::uint64_t, Outcome> finished;
    std::uint64_t nextToDeliver = 0;

    std::atomic<std::uint64_t> submitted = 0;
    std::atomic<std::uint64_t> completed = 0;
    std::atomic<std::uint64_t> failed = 0;
    std::atomic<std::uint64_t> dropped = 0;

    Impl(std::shared_ptr<Recognizer> recognizer,
         DispatcherConfig config,
         ResultCallback onResult,
         FailureCallback onFailure):
        recognizer(std::move(recognizer)),
        config(std::move(config)),
        onResult(std::move(onResult)),
        onFailure(std::move(onFailure)),
        queue(this->config.queueCapacity)
    {
        queue.close();
    }

    void run(const std::stop_token& stopToken)
    {
        while (auto job = queue.pop(stopToken))
        {
            auto outcome = process(job->utterance, stopToken);

            // Abandoned: stop() discards whatever is left.
            if (stopToken.stop_requested())
                return;

            {
                auto lock = std::lock_guard(reorderMutex);
                finished.emplace(job->sequence, std::move(outcome));
            }
            deliverReady();
        }
    }

    auto process(Utterance& utterance, const std::stop_token& stopToken) -> Outcome
    {
        if (config.onDequeue)
            config.onDequeue(utterance);

        auto samples = config.preprocess ? preprocess(utterance.samples, utterance.sampleRate, *config.preprocess)
                                         : std::move(utterance.samples);

        auto sampleRate = utterance.sampleRate;
        if (auto const wanted = recognizer->inputSampleRate(); wanted != 0 && wanted != sampleRate)
        {
            auto converted = resample(samples, sampleRate, wanted);
            if (!converted)
            {
                ++failed;
                return Outcome { .utteranceId = utterance.id, .result = std::nullopt, .error = converted.error() };
            }
            log::trace("Resampled utterance #{} from {}Hz to {}Hz", utterance.id, sampleRate, wanted);
            samples = std::move(*converted);
            sampleRate = wanted;
        }

        auto const started = std::chrono::steady_clock::now();
        auto const deadline = config.recognitionTimeout.count() > 0
                                  ? started + config.recognitionTimeout
                                  : std::chrono::steady_clock::time_point::max();

        log::debug("Recognizing utterance #{} ({} samples)", utterance.id, samples.size());

        auto recognition = recognizer->recognize(RecognitionRequest {
            .samples = samples,
            .sampleRate = sampleRate,
            .deadline = deadline,
            .stopToken = stopToken,
        });

        auto const finishedAt = std::chrono::steady_clock::now();
        auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - started);

        auto outcome = Outcome { .utteranceId = utterance.id, .result = std::nullopt, .error = std::nullopt };

        if (!recognition)
        {
            auto error = recognition.error();
            if (error.code == ErrorCode::Cancelled)
            {
                log::debug("Recognition of utterance #{} cancelled", utterance.id);
                return outcome;
            }

            if (error.code != ErrorCode::RecognitionFailed && error.code != ErrorCode::RecognitionTimeout)
                error = Error { ErrorCode::RecognitionFailed, std::format("{}", error) };

            ++failed;
            outcome.error = std::move(error);
            return outcome;
        }

        if (finishedAt > deadline)
        {
            ++failed;
            outcome.error = Error { ErrorCode::RecognitionTimeout,
                                    std::format("Recognition took {} ms, the limit is {} ms",
                                                elapsed.count(),
                                                config.recognitionTimeout.count()) };
            return outcome;
        }

        ++completed;
        log::debug("Utterance #{} recognized in {} ms", utterance.id, elapsed.count());

        outcome.result = TranscriptionResult {
            .utteranceId = utterance.id,
            .text = recognition->text,
            .rawText = recognition->text,
            .startTime = utterance.startTime,
            .endTime = utterance.endTime,
            .confidence = recognition->confidence,
            .language = std::move(recognition->language),
            .processingTime = elapsed,
        };
        return outcome;
    }

    /// @brief Delivers every outcome whose predecessors have all been delivered.
    void deliverReady()
    {
        auto deliveryLock = std::lock_guard(deliveryMutex);

        auto ready = std::vector<Outcome> {};
        {
            auto lock = std::lock_guard(reorderMutex);
            for (auto it = finished.find(nextToDeliver); it != finished.end(); it = finished.find(nextToDeliver))
            {
                ready.push_back(std::move(it->second));
                finished.erase(it);
                ++nextToDeliver;
            }
        }

        for (auto& outcome: ready)
        {
            if (outcome.result)
            {
                if (onResult)
                    onResult(std::move(*outcome.result));
            }
            else if (outcome.error)
            {
                log::debug("Utterance #{} skipped: {}", outcome.utteranceId, *outcome.error);
                if (onFailure)
                    onFailure(outcome.utteranceId, *outcome.error);
            }
        }
    }

    void resetOrdering()
    {
        {
            auto lock = std::lock_guard(submitMutex);
            nextSequence = 0;
        }
        auto lock = std::lock_guard(reorderMutex);
        finished.clear();
        nextToDeliver = 0;
    }
};

TranscriptionDispatcher::TranscriptionDispatcher(std::shared_ptr<Recognizer> recognizer,
                                                 DispatcherConfig config,
                                                 ResultCallback onResult,
                                                 FailureCallback onFailure):
    _impl(std::make_unique<Impl>(std::move(recognizer), std::move(config), std::move(onResult), std::move(onFailure)))
{
}

TranscriptionDispatcher::~TranscriptionDispatcher()
{
    stop(StopMode::Abandon);
}

auto TranscriptionDispatcher::start() -> VoidResult
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (_impl->running)
        return {};

    if (!_impl->recognizer)
        return makeError(ErrorCode::InvalidArgument, "Transcription dispatcher has no recognizer");

    _impl->queue.reopen();
    _impl->resetOrdering();

    auto const workerCount = std::max<std::size_t>(1, _impl->config.maxInFlight);
    for (auto i = std::size_t { 0 }; i < workerCount; ++i)
        _impl->workers.emplace_back([impl = _impl.get(), i](const std::stop_token& token) {
            log::setThreadName(std::format("stt-{}", i + 1));
            impl->run(token);
        });

    _impl->running = true;
    log::debug("Transcription dispatcher started ({} worker(s), queue capacity {})",
               workerCount,
               _impl->queue.capacity());
    return {};
}

auto TranscriptionDispatcher::submit(Utterance utterance) -> Result<SubmitReceipt>
{
    if (!_impl->running)
        return makeError(ErrorCode::InvalidArgument, "Transcription dispatcher is not running");

    auto receipt = SubmitReceipt { .utteranceId = utterance.id, .droppedUtteranceId = std::nullopt };

    auto lock = std::lock_guard(_impl->submitMutex);
    auto const sequence = _impl->nextSequence;
    auto outcome = _impl->queue.push(Job { .sequence = sequence, .utterance = std::move(utterance) });
    if (!outcome.accepted)
        return makeError(ErrorCode::InvalidArgument, "Transcription dispatcher is not running");

    ++_impl->nextSequence;
    ++_impl->submitted;

    if (outcome.dropped)
    {
        ++_impl->dropped;
        receipt.droppedUtteranceId = outcome.dropped->utterance.id;
        log::debug("Dispatch queue full, dropped utterance #{}", outcome.dropped->utterance.id);

        // A dropped job never reaches a worker; mark its slot so later outcomes are not held back.
        auto reorderLock = std::lock_guard(_impl->reorderMutex);
        _impl->finished.emplace(outcome.dropped->sequence, Outcome { .utteranceId = outcome.dropped->utterance.id });
    }

    return receipt;
}

void TranscriptionDispatcher::stop(StopMode mode)
{
    auto lock = std::lock_guard(_impl->lifecycleMutex);
    if (!_impl->running)
        return;
    _impl->running = false;

    if (mode == StopMode::Abandon)
    {
        if (auto const discarded = _impl->queue.clear(); discarded > 0)
            log::debug("Abandoning {} queued utterance(s)", discarded);
        for (auto& worker: _impl->workers)
            worker.request_stop();
    }

    _impl->queue.close();

    for (auto& worker: _impl->workers)
        if (worker.joinable())
            worker.join();
    _impl->workers.clear();

    _impl->queue.clear();
    _impl->resetOrdering();
    log::debug("Transcription dispatcher stopped ({})", mode == StopMode::Drain ? "drained" : "abandoned");
}

auto TranscriptionDispatcher::isRunning() const -> bool
{
    return _impl->running;
}

auto TranscriptionDispatcher::pending() const -> std::size_t
{
    return _impl->queue.size();
}

auto TranscriptionDispatcher::stats() const -> DispatcherStats
{
    return DispatcherStats {
        .submitted = _impl->submitted,
        .completed = _impl->completed,
        .failed = _impl->failed,
        .dropped = _impl->dropped,
    };
}

auto TranscriptionDispatcher::config() const -> const DispatcherConfig&
{
    return _impl->config;
}

} // namespace talktype
