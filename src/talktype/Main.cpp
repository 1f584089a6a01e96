// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <talktype/App.hpp>
#include <talktype/Config.hpp>
#include <talktype/OutputSink.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <memory>
#include <print>
#include <string>

namespace
{

auto listDevices() -> int
{
    auto devices = talktype::listCaptureDevices();
    if (!devices)
    {
        talktype::log::error("Cannot enumerate capture devices: {}", devices.error().message);
        return 1;
    }

    if (devices->empty())
        std::println("No capture devices found.");
    for (auto const& device: *devices)
        std::println("  [{}] {}{}", device.index, device.name, device.isDefault ? " (default)" : "");
    return 0;
}

void listModels()
{
    for (auto const& model: talktype::availableModels())
        std::println("  {:<16} {:>9}  {}", model.size, model.sizeLabel, talktype::modelFilename(model.size));
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "talktype: local dictation with whisper.cpp" };

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto modelSize = std::string {};
    auto device = std::string {};
    auto processingDevice = std::string {};
    auto inputFile = std::string {};
    auto downloadSize = std::string {};
    auto listDevicesFlag = false;
    auto listModelsFlag = false;
    auto debug = false;
    auto timestamps = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Path to a whisper ggml model file");
    app.add_option("--model-size", modelSize, "Whisper model size (tiny, base, small, medium, ...)");
    app.add_option("--device", device, "Capture device (index or part of the name)");
    app.add_option("--processing-device", processingDevice, "Recognition device (cpu|gpu|cuda)");
    app.add_option("-i,--input", inputFile, "Transcribe an audio file instead of the microphone");
    app.add_option("--download-model", downloadSize, "Download the whisper model of the given size and exit");
    app.add_flag("--list-devices", listDevicesFlag, "List capture devices and exit");
    app.add_flag("--list-models", listModelsFlag, "List downloadable whisper model sizes and exit");
    app.add_flag("--debug", debug, "Start in debug mode (debug logging, utterance recordings)");
    app.add_flag("--timestamps", timestamps, "Prefix each transcription with its time span");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (listDevicesFlag)
        return listDevices();

    if (listModelsFlag)
    {
        listModels();
        return 0;
    }

    if (!downloadSize.empty())
    {
        auto downloaded = talktype::downloadModel(downloadSize);
        if (!downloaded)
        {
            talktype::log::error("{}", downloaded.error().message);
            return 1;
        }
        return 0;
    }

    if (configPath.empty())
        configPath = talktype::defaultConfigPath();

    auto configResult = talktype::loadConfig(configPath);
    if (!configResult)
    {
        talktype::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.processing.whisperModelPath = modelPath;
    if (!modelSize.empty())
    {
        config.processing.modelSize = modelSize;
        if (modelPath.empty())
            config.processing.whisperModelPath.clear();
    }
    if (!device.empty())
        config.audio.device = device;
    if (!processingDevice.empty())
        config.processing.device = processingDevice;
    if (debug)
        config.debug.enabled = true;

    talktype::log::setLevel(talktype::log::levelFromString(config.debug.logLevel));
    if ((verbose || config.debug.enabled) && !talktype::log::enabled(talktype::log::Level::Debug))
        talktype::log::setLevel(talktype::log::Level::Debug);

    auto application = talktype::App(
        std::move(config), configPath, std::make_unique<talktype::ConsoleSink>(stdout, timestamps));

    auto initResult = application.initialize();
    if (!initResult)
    {
        talktype::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    if (!inputFile.empty())
        return application.transcribeFile(inputFile);

    return application.run();
}
