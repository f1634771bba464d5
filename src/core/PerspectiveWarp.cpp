#include "formreg/PerspectiveWarp.hpp"
#include "formreg/Homography.hpp"
#include "formreg/PixelSampler.hpp"
#include <cmath>

namespace formreg {

cv::Mat warpWithHomography(const cv::Mat& image, const cv::Matx33d& H, const cv::Rect2d& target) {
    const int w = static_cast<int>(std::floor(target.width));
    const int h = static_cast<int>(std::floor(target.height));
    if (w <= 0 || h <= 0 || image.empty()) return cv::Mat();

    PixelSampler sampler(image);
    const double srcW = sampler.width();
    const double srcH = sampler.height();

    // zero-initialised, so unmapped pixels stay fully transparent
    cv::Mat out(h, w, CV_8UC4, cv::Scalar::all(0));

    for (int dy = 0; dy < h; ++dy) {
        cv::Vec4b* row = out.ptr<cv::Vec4b>(dy);
        const double ty = target.y + dy;
        for (int dx = 0; dx < w; ++dx) {
            const double tx = target.x + dx;
            cv::Point2d s;
            if (!applyHomography(H, cv::Point2d(tx, ty), s)) continue;

            // half-up rounding
            const double fx = std::floor(s.x + 0.5);
            const double fy = std::floor(s.y + 0.5);
            if (fx < 0 || fy < 0 || fx >= srcW || fy >= srcH) continue;

            row[dx] = sampler.bgra(static_cast<int>(fx), static_cast<int>(fy));
        }
    }
    return out;
}

WarpResult rectifyRegion(const cv::Mat& image,
                         const CornerSet& sourceCorners,
                         const CornerSet& idealCorners,
                         const cv::Rect2d& target) {
    WarpResult R;
    // ideal -> source, so the output grid is pulled without inverting H
    HomographyResult hr = solveHomography(idealCorners, sourceCorners);
    if (!hr.ok()) {
        R.status = hr.status;
        return R;
    }
    R.image = warpWithHomography(image, hr.H, target);
    R.status = Status::Ok;
    return R;
}

}
