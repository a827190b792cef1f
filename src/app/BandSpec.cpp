#include "BandSpec.h"
#include "../util/ParamRanges.h"

namespace
{
bool isNumber(const juce::String& text)
{
    return text.isNotEmpty() && text.containsOnly("0123456789.-+eE");
}

bool isInteger(const juce::String& text)
{
    return text.isNotEmpty() && text.trimCharactersAtStart("-+").containsOnly("0123456789");
}
} // namespace

namespace interleaf
{
bool parseFilterType(const juce::String& text, FilterType& type)
{
    const auto name = text.trim().toLowerCase();
    for (auto candidate : { FilterType::lowPass, FilterType::highPass, FilterType::bandPass,
                            FilterType::notch, FilterType::peaking, FilterType::lowShelf,
                            FilterType::highShelf })
    {
        if (name == filterTypeName(candidate))
        {
            type = candidate;
            return true;
        }
    }
    return false;
}

juce::Result parseBandSpec(const juce::String& text, BandSpec& spec)
{
    auto tokens = juce::StringArray::fromTokens(text, ",", "");
    tokens.trim();

    if (tokens.size() != 6 && tokens.size() != 7)
        return juce::Result::fail("expected INDEX,TYPE,FREQ,Q,GAIN_DB,INTERLEAVE[,os] but got '" + text + "'");

    if (! isInteger(tokens[0]))
        return juce::Result::fail("band index is not an integer: '" + tokens[0] + "'");

    const int index = tokens[0].getIntValue();
    if (! ParamRanges::isValidBand(index))
        return juce::Result::fail("band index out of range: " + juce::String(index));

    FilterType type = FilterType::peaking;
    if (! parseFilterType(tokens[1], type))
        return juce::Result::fail("unknown filter type: '" + tokens[1] + "'");

    for (int i = 2; i <= 4; ++i)
        if (! isNumber(tokens[i]))
            return juce::Result::fail("not a number: '" + tokens[i] + "'");

    if (! isInteger(tokens[5]))
        return juce::Result::fail("interleave count is not an integer: '" + tokens[5] + "'");

    const int interleave = tokens[5].getIntValue();
    if (interleave < 0 || interleave > ParamRanges::kMaxInterleave)
        return juce::Result::fail("interleave count must be 0.."
                                  + juce::String(ParamRanges::kMaxInterleave));

    bool oversampled = false;
    if (tokens.size() == 7)
    {
        if (tokens[6] != "os")
            return juce::Result::fail("unknown band flag: '" + tokens[6] + "'");
        oversampled = true;
    }

    spec.index = index;
    spec.params.type = type;
    spec.params.cutoffHz = tokens[2].getFloatValue();
    spec.params.q = tokens[3].getFloatValue();
    spec.params.gainDb = tokens[4].getFloatValue();
    spec.interleaveCount = interleave;
    spec.oversampled = oversampled;
    return juce::Result::ok();
}
} // namespace interleaf
