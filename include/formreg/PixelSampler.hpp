#pragma once
#include <opencv2/core.hpp>

namespace formreg {

// Read-only view over a decoded 8-bit image (gray, BGR or BGRA).
// Holds a shallow cv::Mat header, the pixels are never written.
class PixelSampler {
public:
    explicit PixelSampler(const cv::Mat& image);

    int width() const { return img_.cols; }
    int height() const { return img_.rows; }
    int area() const { return img_.cols * img_.rows; }
    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < img_.cols && y < img_.rows;
    }

    // 0.299 R + 0.587 G + 0.114 B, caller guarantees contains(x, y).
    double luminance(int x, int y) const;

    // Pixel as BGRA. Gray is replicated, 3-channel images get alpha 255.
    cv::Vec4b bgra(int x, int y) const;

private:
    cv::Mat img_;
};

}
