#include "Biquad.h"

namespace interleaf
{
void Biquad::setCoefficients(const Coefficients& newCoefficients)
{
    coeffs = newCoefficients;
}

void Biquad::reset()
{
    history = {};
}

float Biquad::processSample(float x)
{
    const double in = x;
    const double y = coeffs.b0 * in
        + coeffs.b1 * history.x1
        + coeffs.b2 * history.x2
        - coeffs.a1 * history.y1
        - coeffs.a2 * history.y2;

    history.x2 = history.x1;
    history.x1 = in;
    history.y2 = history.y1;
    history.y1 = y;
    return static_cast<float>(y);
}

void Biquad::setState(const BiquadHistory& newHistory)
{
    history = newHistory;
}

bool Biquad::isCleared() const
{
    return history.x1 == 0.0 && history.x2 == 0.0 && history.y1 == 0.0 && history.y2 == 0.0;
}
} // namespace interleaf
