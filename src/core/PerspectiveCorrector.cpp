#include "formreg/PerspectiveCorrector.hpp"
#include "formreg/Homography.hpp"
#include "formreg/PerspectiveWarp.hpp"

namespace formreg {

PerspectiveCorrector::PerspectiveCorrector(const DetectionSettings& settings)
    : finder_(settings) {}

CornerResult PerspectiveCorrector::sourceCorners(const cv::Mat& image, const std::string& imageId) {
    if (imageId.empty()) return finder_.locate(image);
    return cache_.getOrCompute(imageId, [this, &image]() { return finder_.locate(image); });
}

RegistrationResult PerspectiveCorrector::findAndWarp(const cv::Mat& image,
                                                     const std::string& imageId,
                                                     const CornerSet& idealCorners,
                                                     const std::vector<cv::Rect2d>& targets,
                                                     const CornerSet* supplied) {
    RegistrationResult R;
    if (image.empty()) return R;

    CornerResult C;
    if (supplied) {
        C.corners = *supplied;
        C.status = Status::Ok;
    } else {
        C = sourceCorners(image, imageId);
    }
    if (!C.ok()) {
        R.status = C.status;
        return R;
    }
    R.corners = C.corners;

    HomographyResult hr = solveHomography(idealCorners, C.corners);
    if (!hr.ok()) {
        R.status = hr.status;
        return R;
    }

    R.crops.reserve(targets.size());
    for (const auto& t : targets) {
        R.crops.push_back(warpWithHomography(image, hr.H, t));
    }
    R.status = Status::Ok;
    return R;
}

RegistrationResult PerspectiveCorrector::findAndWarp(const cv::Mat& image,
                                                     const std::string& imageId,
                                                     const CornerSet& idealCorners,
                                                     const cv::Rect2d& target,
                                                     const CornerSet* supplied) {
    return findAndWarp(image, imageId, idealCorners, std::vector<cv::Rect2d>{target}, supplied);
}

}
