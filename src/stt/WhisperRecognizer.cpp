// SPDX-License-Identifier: Apache-2.0
#include "WhisperRecognizer.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <array>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace talktype
{

namespace
{

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};
    auto whisperLogMutex = std::mutex {};

    /// @brief Maps ggml_log_level to talktype::log::Level.
    /// @param level The ggml log level.
    /// @return The corresponding log level, or std::nullopt for GGML_LOG_LEVEL_NONE.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            // whisper.cpp is chatty at info level; keep its model dump out of the normal output
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Log callback for whisper.cpp that forwards messages to talktype::log.
    ///
    /// Handles continuation lines by buffering partial lines and emitting complete lines
    /// on newline characters.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        auto lock = std::lock_guard(whisperLogMutex);
        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);

            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && line.find_first_not_of(" \t\r") != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    /// @brief State shared with whisper's abort callback for one call.
    struct AbortProbe
    {
        std::chrono::steady_clock::time_point deadline;
        std::stop_token stopToken;
        bool timedOut = false;
        bool cancelled = false;
    };

    auto abortCallback(void* userData) -> bool
    {
        auto* probe = static_cast<AbortProbe*>(userData);
        if (probe->stopToken.stop_requested())
        {
            probe->cancelled = true;
            return true;
        }
        if (std::chrono::steady_clock::now() >= probe->deadline)
        {
            probe->timedOut = true;
            return true;
        }
        return false;
    }

    struct StateDeleter
    {
        void operator()(whisper_state* state) const { whisper_free_state(state); }
    };

    auto trim(std::string text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return text.substr(start, end - start + 1);
    }

    /// @brief Returns true for whisper's non-speech markers ("[BLANK_AUDIO]", "(blank audio)", ...).
    auto isHallucinationMarker(std::string_view text) -> bool
    {
        if (!text.starts_with('[') && !text.starts_with('('))
            return false;

        static constexpr auto HallucinationPatterns = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[NOISE]" },       std::string_view { "(silence)" },
        };
        for (auto const& pattern: HallucinationPatterns)
            if (text == pattern)
                return true;
        return false;
    }

} // namespace

auto whisperLanguageCode(int languageId) -> std::string
{
    if (auto const* code = whisper_lang_str(languageId))
        return code;
    return {};
}

auto processingDeviceFromString(std::string_view name) -> std::optional<ProcessingDevice>
{
    if (name == "cpu")
        return ProcessingDevice::Cpu;
    if (name == "gpu" || name == "cuda")
        return ProcessingDevice::Gpu;
    return std::nullopt;
}

auto processingDeviceToString(ProcessingDevice device) -> std::string_view
{
    switch (device)
    {
        case ProcessingDevice::Cpu: return "cpu";
        case ProcessingDevice::Gpu: return "gpu";
    }
    return "cpu";
}

struct WhisperRecognizer::Impl
{
    whisper_context* ctx = nullptr;
    WhisperConfig config;
    std::string name;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperRecognizer::WhisperRecognizer(): _impl(std::make_unique<Impl>())
{
}

WhisperRecognizer::~WhisperRecognizer() = default;

auto WhisperRecognizer::initialize(const WhisperConfig& config) -> VoidResult
{
    _impl->config = config;
    _impl->name = std::format("whisper.cpp ({})", processingDeviceToString(config.device));

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    params.use_gpu = config.device == ProcessingDevice::Gpu;
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {} on {}", config.modelPath, processingDeviceToString(config.device));
    return {};
}

auto WhisperRecognizer::recognize(const RecognitionRequest& request) -> Result<Recognition>
{
    if (!_impl->ctx)
        return makeError(ErrorCode::RecognitionFailed, "Whisper model not loaded");

    if (request.sampleRate != WHISPER_SAMPLE_RATE)
        return makeError(ErrorCode::RecognitionFailed,
                         std::format("Whisper expects {}Hz audio, got {}Hz", WHISPER_SAMPLE_RATE, request.sampleRate));

    auto state = std::unique_ptr<whisper_state, StateDeleter>(whisper_init_state(_impl->ctx));
    if (!state)
        return makeError(ErrorCode::RecognitionFailed, "Failed to allocate whisper state");

    auto const& config = _impl->config;
    auto params = whisper_full_default_params(config.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH
                                                                   : WHISPER_SAMPLING_GREEDY);
    params.language = config.language.c_str();
    params.detect_language = false;
    params.translate = config.translate;
    params.n_threads = config.threads;
    params.beam_search.beam_size = config.beamSize;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.no_context = true;
    params.single_segment = false;

    auto probe = AbortProbe { .deadline = request.deadline, .stopToken = request.stopToken };
    params.abort_callback = abortCallback;
    params.abort_callback_user_data = &probe;

    auto const result = whisper_full_with_state(
        _impl->ctx, state.get(), params, request.samples.data(), static_cast<int>(request.samples.size()));

    if (probe.cancelled)
        return makeError(ErrorCode::Cancelled, "Recognition abandoned");
    if (probe.timedOut)
        return makeError(ErrorCode::RecognitionTimeout, "Whisper did not finish before the deadline");
    if (result != 0)
        return makeError(ErrorCode::RecognitionFailed,
                         std::format("Whisper transcription failed with code: {}", result));

    auto const nSegments = whisper_full_n_segments_from_state(state.get());
    auto const eot = whisper_token_eot(_impl->ctx);

    auto text = std::string {};
    auto probabilitySum = 0.0;
    auto tokenCount = 0;

    for (auto i = 0; i < nSegments; ++i)
    {
        if (auto const* segmentText = whisper_full_get_segment_text_from_state(state.get(), i))
            text += segmentText;

        auto const nTokens = whisper_full_n_tokens_from_state(state.get(), i);
        for (auto j = 0; j < nTokens; ++j)
        {
            if (whisper_full_get_token_id_from_state(state.get(), i, j) >= eot)
                continue;
            probabilitySum += whisper_full_get_token_p_from_state(state.get(), i, j);
            ++tokenCount;
        }
    }

    auto recognition = Recognition {
        .text = trim(std::move(text)),
        .confidence = std::nullopt,
        .language = whisperLanguageCode(whisper_full_lang_id_from_state(state.get())),
    };

    if (tokenCount > 0)
        recognition.confidence = static_cast<float>(probabilitySum / tokenCount);

    if (isHallucinationMarker(recognition.text))
    {
        log::debug("Whisper returned a non-speech marker: {}", recognition.text);
        recognition.text.clear();
    }

    return recognition;
}

auto WhisperRecognizer::inputSampleRate() const -> unsigned
{
    return WHISPER_SAMPLE_RATE;
}

auto WhisperRecognizer::name() const -> std::string_view
{
    return _impl->name;
}

auto WhisperRecognizer::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

auto makeRecognizer(const WhisperConfig& config) -> Result<std::shared_ptr<Recognizer>>
{
    auto recognizer = std::make_shared<WhisperRecognizer>();
    auto result = recognizer->initialize(config);
    if (!result)
        return std::unexpected(result.error());

    log::info("Recognition engine: {}", recognizer->name());
    return recognizer;
}

} // namespace talktype
