#pragma once

// Pixel snapping for bitmap-space drawing. Media coordinates (CSS-like pixels)
// times the device pixel ratio give bitmap coordinates; these helpers round
// so that adjacent shapes share edges and 1px strokes land on whole pixels.

namespace vantage {

struct BitmapPositionLength {
    int position = 0;   // first covered bitmap pixel
    int length = 0;     // covered pixel count, always >= 1
};

// Math.round: halves go toward +infinity (-2.5 -> -2, 2.5 -> 3)
int roundHalfUp(double value);

BitmapPositionLength positionsBox(double mediaPos1, double mediaPos2, double pixelRatio);

BitmapPositionLength positionsLine(double mediaPos, double pixelRatio,
                                   int desiredWidth = 1, bool widthIsBitmap = false);

} // namespace vantage
