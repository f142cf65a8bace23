#include "PixelPositions.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace vantage {

int roundHalfUp(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

BitmapPositionLength positionsBox(double mediaPos1, double mediaPos2, double pixelRatio) {
    const int scaled1 = roundHalfUp(mediaPos1 * pixelRatio);
    const int scaled2 = roundHalfUp(mediaPos2 * pixelRatio);
    return {
        std::min(scaled1, scaled2),
        std::abs(scaled2 - scaled1) + 1,
    };
}

BitmapPositionLength positionsLine(double mediaPos, double pixelRatio, int desiredWidth, bool widthIsBitmap) {
    const int scaledPosition = roundHalfUp(mediaPos * pixelRatio);
    const int lineBitmapWidth = widthIsBitmap ? desiredWidth : roundHalfUp(desiredWidth * pixelRatio);
    const int offset = static_cast<int>(std::floor(lineBitmapWidth * 0.5));
    return {scaledPosition - offset, lineBitmapWidth};
}

} // namespace vantage
