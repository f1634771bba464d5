#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "formreg/PixelSampler.hpp"
#include "formreg/Types.hpp"

namespace formreg {

struct Blob {
    int pixelCount = 0;
    int minX = 0, maxX = -1;
    int minY = 0, maxY = -1;
    cv::Point2f centroid{-1, -1};

    int width() const { return maxX - minX + 1; }
    int height() const { return maxY - minY + 1; }
    cv::Rect bounds() const { return cv::Rect(minX, minY, width(), height()); }
};

struct FillResult {
    Status status = Status::NotFound;
    Blob blob;
    bool ok() const { return status == Status::Ok; }
};

class BlobAnalyzer {
public:
    // Hard limit on a single dark flood fill.
    static constexpr int kMaxDarkBlobPixels = 5000;
    // Dark blobs must stay below this share of the whole image.
    static constexpr double kMaxDarkBlobAreaRatio = 0.05;
    static constexpr double kMaxAspectRatio = 2.5;
    // Bright fills larger than this share of the window are rejected.
    static constexpr double kMaxBrightFillRatio = 0.5;

    BlobAnalyzer(const PixelSampler& sampler, int threshold)
        : sampler_(sampler), threshold_(threshold) {}

    /*
      Magic wand fill. Starting from a light seed, spreads over light
      4-neighbours inside `window` and stops at the first dark ring.
      Dark neighbours are marked visited but never expanded.
    */
    FillResult fillBrightRegion(cv::Point seed, const cv::Rect& window) const;

    /*
      Every dark connected region inside `window` that passes the
      size / aspect filters, in raster order of their first pixel.
    */
    std::vector<Blob> findDarkBlobs(const cv::Rect& window, int minSize) const;

    bool acceptDarkBlob(const Blob& b, int minSize) const;

    // Accepted blob whose centroid is closest to `target`, first wins ties.
    static FillResult closestBlob(const std::vector<Blob>& blobs, cv::Point2f target);

private:
    bool isLight(int x, int y) const { return sampler_.luminance(x, y) > threshold_; }
    bool isDark(int x, int y) const { return sampler_.luminance(x, y) < threshold_; }

    Blob floodDark(int sx, int sy, const cv::Rect& window,
                   std::vector<unsigned char>& visited) const;

    const PixelSampler& sampler_;
    int threshold_;
};

}
