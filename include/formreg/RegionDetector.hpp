#pragma once
#include <opencv2/core.hpp>
#include "formreg/DetectionSettings.hpp"
#include "formreg/Types.hpp"

namespace formreg {

struct RegionResult {
    Status status = Status::NotFound;
    cv::Rect rect;
    bool ok() const { return status == Status::Ok; }
};

// Seed-based ("magic wand") detection of a bordered answer region.
class RegionDetector {
public:
    explicit RegionDetector(const DetectionSettings& settings = DetectionSettings())
        : settings_(settings) {}

    RegionResult detect(const cv::Mat& image, cv::Point seed) const;

    void setSettings(const DetectionSettings& s) { settings_ = s; }
    const DetectionSettings& settings() const { return settings_; }

private:
    DetectionSettings settings_;
};

// Grows (or shrinks, for negative margins) a rectangle on every side.
cv::Rect inflateRect(const cv::Rect& r, int margin);
cv::Rect2d inflateRect(const cv::Rect2d& r, double margin);

}
