#pragma once
#include <opencv2/core.hpp>
#include <array>
#include "formreg/DetectionSettings.hpp"
#include "formreg/Types.hpp"

namespace formreg {

struct CornerResult {
    Status status = Status::NotFound;
    CornerSet corners{{{-1,-1},{-1,-1},{-1,-1},{-1,-1}}};
    bool ok() const { return status == Status::Ok; }
};

class CornerFinder {
public:
    // Each search window covers this share of the width and height.
    static constexpr double kQuadrantRatio = 0.2;
    // Template mark rectangles are at least this share of the short side.
    static constexpr double kMarkSizeRatio = 0.03;

    explicit CornerFinder(const DetectionSettings& settings = DetectionSettings())
        : settings_(settings) {}

    // All four fiducial centroids, or NotFound when any quadrant is empty.
    CornerResult locate(const cv::Mat& image) const;

    // Square mark areas centred on detected corners, TL, TR, BR, BL.
    std::array<cv::Rect2d, 4> markRects(const CornerSet& corners, cv::Size imageSize) const;

    const DetectionSettings& settings() const { return settings_; }

private:
    std::array<cv::Rect, 4> quadrants(cv::Size imageSize) const;

    DetectionSettings settings_;
};

}
