#include "formreg/CornerFinder.hpp"
#include "formreg/BlobAnalyzer.hpp"
#include "formreg/PixelSampler.hpp"
#include <algorithm>

namespace formreg {

std::array<cv::Rect, 4> CornerFinder::quadrants(cv::Size s) const {
    const int qw = static_cast<int>(s.width * kQuadrantRatio);
    const int qh = static_cast<int>(s.height * kQuadrantRatio);
    return {{
        cv::Rect(0, 0, qw, qh),
        cv::Rect(s.width - qw, 0, qw, qh),
        cv::Rect(s.width - qw, s.height - qh, qw, qh),
        cv::Rect(0, s.height - qh, qw, qh)
    }};
}

CornerResult CornerFinder::locate(const cv::Mat& image) const {
    CornerResult R;
    if (image.empty()) return R;

    PixelSampler sampler(image);
    BlobAnalyzer analyzer(sampler, settings_.threshold);

    const float right = static_cast<float>(image.cols - 1);
    const float bottom = static_cast<float>(image.rows - 1);
    const std::array<cv::Point2f, 4> targets = {{
        {0, 0}, {right, 0}, {right, bottom}, {0, bottom}
    }};
    const auto windows = quadrants(image.size());

    CornerSet found;
    for (int i = 0; i < 4; ++i) {
        std::vector<Blob> blobs = analyzer.findDarkBlobs(windows[i], settings_.minSize);
        FillResult best = BlobAnalyzer::closestBlob(blobs, targets[i]);
        // a partial set is useless for the homography
        if (!best.ok()) return R;
        found[i] = best.blob.centroid;
    }

    R.corners = found;
    R.status = Status::Ok;
    return R;
}

std::array<cv::Rect2d, 4> CornerFinder::markRects(const CornerSet& corners, cv::Size imageSize) const {
    const double side = std::max(static_cast<double>(settings_.minSize),
                                 std::min(imageSize.width, imageSize.height) * kMarkSizeRatio);
    std::array<cv::Rect2d, 4> out;
    for (int i = 0; i < 4; ++i) {
        out[i] = cv::Rect2d(corners[i].x - side / 2, corners[i].y - side / 2, side, side);
    }
    return out;
}

}
