#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "formreg/CornerCache.hpp"
#include "formreg/CornerFinder.hpp"
#include "formreg/Types.hpp"

namespace formreg {

struct RegistrationResult {
    Status status = Status::NotFound;
    std::vector<cv::Mat> crops;   // one per target, same order
    CornerSet corners{{{-1,-1},{-1,-1},{-1,-1},{-1,-1}}};  // scanned page corners
    bool ok() const { return status == Status::Ok; }
};

// Detect-then-dewarp for scanned pages of one template.
class PerspectiveCorrector {
public:
    explicit PerspectiveCorrector(const DetectionSettings& settings = DetectionSettings());

    /*
      Corners come from `supplied` if given, else from the cache entry for
      `imageId`, else from a fresh search that is then cached. An empty id
      bypasses the cache.
    */
    RegistrationResult findAndWarp(const cv::Mat& image,
                                   const std::string& imageId,
                                   const CornerSet& idealCorners,
                                   const std::vector<cv::Rect2d>& targets,
                                   const CornerSet* supplied = nullptr);

    RegistrationResult findAndWarp(const cv::Mat& image,
                                   const std::string& imageId,
                                   const CornerSet& idealCorners,
                                   const cv::Rect2d& target,
                                   const CornerSet* supplied = nullptr);

    CornerResult sourceCorners(const cv::Mat& image, const std::string& imageId);

    CornerCache& cache() { return cache_; }
    const CornerFinder& finder() const { return finder_; }

private:
    CornerFinder finder_;
    CornerCache cache_;
};

}
