// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <talktype/Config.hpp>
#include <talktype/OutputSink.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace talktype
{

/// @brief Wires configuration, recognizer, pipeline and output sink together.
class App
{
  public:
    /// @brief Constructs the application.
    /// @param config The application configuration.
    /// @param configPath File the configuration was loaded from; calibrations and reloads use it.
    /// @param sink Receives the transcriptions.
    App(AppConfig config, std::string configPath, std::unique_ptr<OutputSink> sink);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration and loads the recognition model.
    ///
    /// Downloads the model of the configured size if no explicit model path is set and it is missing.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the interactive dictation loop on the microphone.
    ///
    /// Reads control commands from stdin: Enter toggles listening, "d" toggles debug mode,
    /// "r" reloads the settings, "q" quits.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Transcribes an audio file through the same pipeline and returns when it is done.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto transcribeFile(std::string_view path) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace talktype
