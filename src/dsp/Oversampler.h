#pragma once

#include <memory>
#include <JuceHeader.h>

namespace interleaf
{
// 2x oversampling around a per-sample inner stage.
// The inner stage runs at twice the prepared host rate and must be configured for it.
class Oversampler
{
public:
    static constexpr int kFactor = 2;

    Oversampler();
    ~Oversampler();

    // Allocates filter state; call off the audio thread.
    void prepare(double hostSampleRate);
    // Clear up/down filter state.
    void reset();
    bool isPrepared() const { return oversampling != nullptr; }

    // Group delay at the host rate, constant once prepared.
    int getLatencySamples() const { return latencySamples; }
    double getInnerSampleRate() const { return hostRate * kFactor; }

    // One host sample in, one host sample out; innerStage sees kFactor samples.
    template <typename InnerStage>
    float processSample(float x, InnerStage&& innerStage)
    {
        if (oversampling == nullptr)
            return innerStage(x);

        inputSample = x;
        const float* inputChannels[] = { &inputSample };
        const juce::dsp::AudioBlock<const float> inputBlock(inputChannels, 1, 1);

        auto upBlock = oversampling->processSamplesUp(inputBlock);
        auto* upData = upBlock.getChannelPointer(0);
        for (size_t i = 0; i < upBlock.getNumSamples(); ++i)
            upData[i] = innerStage(upData[i]);

        outputSample = 0.0f;
        float* outputChannels[] = { &outputSample };
        juce::dsp::AudioBlock<float> outputBlock(outputChannels, 1, 1);
        oversampling->processSamplesDown(outputBlock);
        return outputSample;
    }

private:
    std::unique_ptr<juce::dsp::Oversampling<float>> oversampling;
    double hostRate = 44100.0;
    int latencySamples = 0;
    float inputSample = 0.0f;
    float outputSample = 0.0f;

    JUCE_DECLARE_NON_COPYABLE(Oversampler)
};
} // namespace interleaf
