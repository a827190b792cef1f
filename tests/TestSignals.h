#pragma once

#include <cmath>
#include <random>
#include <vector>

namespace testsignals
{
constexpr double kPi = 3.14159265358979323846;

inline std::vector<float> sine(double frequencyHz, double sampleRate, int numSamples, float amplitude = 0.5f)
{
    std::vector<float> out(static_cast<size_t>(numSamples));
    for (int i = 0; i < numSamples; ++i)
        out[static_cast<size_t>(i)] = amplitude * static_cast<float>(std::sin(2.0 * kPi * frequencyHz * i / sampleRate));
    return out;
}

inline std::vector<float> impulse(int numSamples)
{
    std::vector<float> out(static_cast<size_t>(numSamples), 0.0f);
    if (numSamples > 0)
        out[0] = 1.0f;
    return out;
}

inline std::vector<float> noise(int numSamples, unsigned int seed = 1234u)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-0.5f, 0.5f);
    std::vector<float> out(static_cast<size_t>(numSamples));
    for (auto& s : out)
        s = dist(rng);
    return out;
}

// RMS over [start, end).
inline double rms(const std::vector<float>& data, size_t start, size_t end)
{
    double sum = 0.0;
    for (size_t i = start; i < end; ++i)
        sum += static_cast<double>(data[i]) * data[i];
    return end > start ? std::sqrt(sum / static_cast<double>(end - start)) : 0.0;
}

inline double energy(const std::vector<float>& data, size_t start, size_t end)
{
    double sum = 0.0;
    for (size_t i = start; i < end; ++i)
        sum += static_cast<double>(data[i]) * data[i];
    return sum;
}

template <typename Processor>
std::vector<float> run(Processor&& processor, const std::vector<float>& input)
{
    std::vector<float> out;
    out.reserve(input.size());
    for (auto x : input)
        out.push_back(processor(x));
    return out;
}
} // namespace testsignals
