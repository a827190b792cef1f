#include <JuceHeader.h>
#include <iostream>
#include <memory>
#include <vector>
#include "BandSpec.h"
#include "RenderLength.h"
#include "../dsp/EqualizerChain.h"
#include "../util/Logging.h"
#include "../util/Version.h"

namespace
{
struct RenderSettings
{
    juce::File input;
    juce::File output;
    std::vector<interleaf::BandSpec> bands;
    float inputGainDb = 0.0f;
    float outputGainDb = 0.0f;
    float dryWet = 1.0f;
    bool logToFile = false;
};

void printUsage()
{
    std::cerr << "Usage: interleaf_render --input=in.wav --output=out.wav\n"
                 "         [--band=INDEX,TYPE,FREQ,Q,GAIN_DB,INTERLEAVE[,os]]...\n"
                 "         [--in-gain=DB] [--out-gain=DB] [--mix=0..1] [--log]\n"
                 "TYPE: lowpass highpass bandpass notch peak lowshelf highshelf\n";
}

juce::Result parseSettings(const juce::ArgumentList& args, RenderSettings& settings)
{
    const auto inputPath = args.getValueForOption("--input");
    const auto outputPath = args.getValueForOption("--output");
    if (inputPath.isEmpty() || outputPath.isEmpty())
        return juce::Result::fail("--input and --output are required");

    settings.input = juce::File::getCurrentWorkingDirectory().getChildFile(inputPath);
    settings.output = juce::File::getCurrentWorkingDirectory().getChildFile(outputPath);

    if (args.containsOption("--in-gain"))
        settings.inputGainDb = args.getValueForOption("--in-gain").getFloatValue();
    if (args.containsOption("--out-gain"))
        settings.outputGainDb = args.getValueForOption("--out-gain").getFloatValue();
    if (args.containsOption("--mix"))
        settings.dryWet = args.getValueForOption("--mix").getFloatValue();
    settings.logToFile = args.containsOption("--log");

    for (const auto& arg : args.arguments)
    {
        if (! arg.isLongOption("band"))
            continue;

        interleaf::BandSpec spec;
        const auto result = interleaf::parseBandSpec(arg.getLongOptionValue(), spec);
        if (result.failed())
            return result;
        settings.bands.push_back(spec);
    }

    return juce::Result::ok();
}

void applySettings(interleaf::EqualizerChain& chain, const RenderSettings& settings, double sampleRate)
{
    chain.setChainGain(settings.inputGainDb, settings.outputGainDb, settings.dryWet);
    for (const auto& spec : settings.bands)
    {
        chain.setBandParams(spec.index, spec.params, spec.interleaveCount, true);
        chain.setBandOversampling(spec.index, spec.oversampled);
    }
    chain.configure(sampleRate);
}

juce::Result render(const RenderSettings& settings)
{
    juce::AudioFormatManager formatManager;
    formatManager.registerBasicFormats();

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(settings.input));
    if (reader == nullptr)
        return juce::Result::fail("cannot read " + settings.input.getFullPathName());

    const int numChannels = static_cast<int>(reader->numChannels);
    const double sampleRate = reader->sampleRate;
    if (numChannels <= 0)
        return juce::Result::fail("no audio channels in " + settings.input.getFullPathName());

    std::vector<std::unique_ptr<interleaf::EqualizerChain>> chains;
    for (int ch = 0; ch < numChannels; ++ch)
    {
        chains.push_back(std::make_unique<interleaf::EqualizerChain>());
        applySettings(*chains.back(), settings, sampleRate);
    }

    const int latency = chains.front()->getLatencySamples();
    int bufferLength = 0;
    const auto lengthResult = interleaf::computeRenderLength(reader->lengthInSamples, latency, bufferLength);
    if (lengthResult.failed())
        return juce::Result::fail(settings.input.getFullPathName() + ": " + lengthResult.getErrorMessage());

    const int numSamples = bufferLength - latency;
    juce::AudioBuffer<float> buffer(numChannels, bufferLength);
    buffer.clear();
    if (! reader->read(&buffer, 0, numSamples, 0, true, true))
        return juce::Result::fail("read failed for " + settings.input.getFullPathName());

    for (int ch = 0; ch < numChannels; ++ch)
    {
        chains[static_cast<size_t>(ch)]->processBlock(buffer.getWritePointer(ch), buffer.getNumSamples());
        chains[static_cast<size_t>(ch)]->flushDiagnostics();
    }

    settings.output.deleteFile();
    auto stream = settings.output.createOutputStream();
    if (stream == nullptr)
        return juce::Result::fail("cannot open " + settings.output.getFullPathName());

    juce::WavAudioFormat wavFormat;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        wavFormat.createWriterFor(stream.get(), sampleRate, static_cast<unsigned int>(numChannels), 24, {}, 0));
    if (writer == nullptr)
        return juce::Result::fail("cannot create WAV writer for " + settings.output.getFullPathName());
    stream.release();

    // Drop the oversampling latency so the output lines up with the input.
    if (! writer->writeFromAudioSampleBuffer(buffer, latency, numSamples))
        return juce::Result::fail("write failed for " + settings.output.getFullPathName());

    juce::Logger::writeToLog("Rendered " + juce::String(numSamples) + " samples x "
                             + juce::String(numChannels) + " channels, latency "
                             + juce::String(latency) + " samples compensated");
    return juce::Result::ok();
}
} // namespace

int main(int argc, char* argv[])
{
    juce::ArgumentList args(argc, argv);
    if (args.containsOption("--help|-h") || args.size() == 0)
    {
        printUsage();
        return args.size() == 0 ? 1 : 0;
    }

    RenderSettings settings;
    const auto parsed = parseSettings(args, settings);
    if (parsed.failed())
    {
        std::cerr << "interleaf_render: " << parsed.getErrorMessage() << "\n";
        printUsage();
        return 1;
    }

    std::unique_ptr<Logging::ScopedLogger> logger;
    if (settings.logToFile)
        logger = std::make_unique<Logging::ScopedLogger>();

    juce::Logger::writeToLog(Version::displayString() + " render: " + settings.input.getFullPathName()
                             + " -> " + settings.output.getFullPathName());

    const auto result = render(settings);
    if (result.failed())
    {
        std::cerr << "interleaf_render: " << result.getErrorMessage() << "\n";
        return 1;
    }

    return 0;
}
