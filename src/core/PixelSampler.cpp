#include "formreg/PixelSampler.hpp"
#include <stdexcept>
#include <string>

namespace formreg {

PixelSampler::PixelSampler(const cv::Mat& image) : img_(image) {
    if (img_.empty()) return;
    const int ch = img_.channels();
    if (img_.depth() != CV_8U || (ch != 1 && ch != 3 && ch != 4)) {
        throw std::invalid_argument("PixelSampler: expected 8-bit gray, BGR or BGRA image, got type "
                                    + std::to_string(img_.type()));
    }
}

double PixelSampler::luminance(int x, int y) const {
    switch (img_.channels()) {
    case 1:
        return img_.at<uchar>(y, x);
    case 3: {
        const cv::Vec3b& p = img_.at<cv::Vec3b>(y, x);
        return 0.299 * p[2] + 0.587 * p[1] + 0.114 * p[0];
    }
    default: {
        const cv::Vec4b& p = img_.at<cv::Vec4b>(y, x);
        return 0.299 * p[2] + 0.587 * p[1] + 0.114 * p[0];
    }
    }
}

cv::Vec4b PixelSampler::bgra(int x, int y) const {
    switch (img_.channels()) {
    case 1: {
        uchar g = img_.at<uchar>(y, x);
        return cv::Vec4b(g, g, g, 255);
    }
    case 3: {
        const cv::Vec3b& p = img_.at<cv::Vec3b>(y, x);
        return cv::Vec4b(p[0], p[1], p[2], 255);
    }
    default:
        return img_.at<cv::Vec4b>(y, x);
    }
}

}
