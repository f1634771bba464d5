#pragma once
#include <opencv2/core.hpp>
#include "formreg/Types.hpp"

namespace formreg {

struct WarpResult {
    Status status = Status::Degenerate;
    cv::Mat image;   // CV_8UC4, floor(target.width) x floor(target.height)
    bool ok() const { return status == Status::Ok; }
};

/*
  Cuts `target` (template coordinates) out of a scanned page.
  The homography is solved from idealCorners to sourceCorners, so every
  output pixel is pulled from the source with a forward mapping.
  Nearest neighbour, pixels that land outside the page are transparent.
*/
WarpResult rectifyRegion(const cv::Mat& image,
                         const CornerSet& sourceCorners,
                         const CornerSet& idealCorners,
                         const cv::Rect2d& target);

// Same, with an already solved ideal->source transform.
cv::Mat warpWithHomography(const cv::Mat& image, const cv::Matx33d& idealToSource,
                           const cv::Rect2d& target);

}
