#include "formreg/RegionDetector.hpp"
#include "formreg/BlobAnalyzer.hpp"
#include "formreg/PixelSampler.hpp"
#include <cstdint>

namespace formreg {

cv::Rect inflateRect(const cv::Rect& r, int margin) {
    return cv::Rect(cv::saturate_cast<int>(static_cast<int64_t>(r.x) - margin),
                    cv::saturate_cast<int>(static_cast<int64_t>(r.y) - margin),
                    cv::saturate_cast<int>(r.width + 2 * static_cast<int64_t>(margin)),
                    cv::saturate_cast<int>(r.height + 2 * static_cast<int64_t>(margin)));
}

cv::Rect2d inflateRect(const cv::Rect2d& r, double margin) {
    return cv::Rect2d(r.x - margin, r.y - margin, r.width + 2 * margin, r.height + 2 * margin);
}

RegionResult RegionDetector::detect(const cv::Mat& image, cv::Point seed) const {
    RegionResult R;
    if (image.empty()) return R;

    PixelSampler sampler(image);
    BlobAnalyzer analyzer(sampler, settings_.threshold);

    FillResult fill = analyzer.fillBrightRegion(seed, cv::Rect(0, 0, sampler.width(), sampler.height()));
    if (!fill.ok()) return R;

    cv::Rect rect = inflateRect(fill.blob.bounds(), settings_.padding);
    if (rect.width < settings_.minSize || rect.height < settings_.minSize) return R;

    R.rect = rect;
    R.status = Status::Ok;
    return R;
}

}
