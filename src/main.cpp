#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "formreg/CornerFinder.hpp"
#include "formreg/DetectionSettings.hpp"
#include "formreg/PerspectiveCorrector.hpp"
#include "formreg/RegionDetector.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace std;

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitNotFound = 2,
    kExitDegenerate = 3
};

static const char* kCornerLabels[4] = { "TL", "TR", "BR", "BL" };
static const double kMaxCoordinate = 1e9;

/* =========================================================
   HELPERS
   ========================================================= */
static void printUsage() {
    cerr << "Usage:\n"
         << "  formreg corners <image> [config]\n"
         << "  formreg wand <image> <x> <y> [config]\n"
         << "  formreg rectify <scan> <template> <x> <y> <w> <h> <out.png> [config] [--margin=<px>]\n";
}

static int exitFor(formreg::Status s) {
    switch (s) {
    case formreg::Status::Ok:         return kExitOk;
    case formreg::Status::NotFound:   return kExitNotFound;
    case formreg::Status::Degenerate: return kExitDegenerate;
    }
    return kExitUsage;
}

// Finite and small enough to become a pixel coordinate.
static bool parseNumber(const string& s, double& out) {
    char* end = nullptr;
    out = strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return false;
    return std::isfinite(out) && std::abs(out) <= kMaxCoordinate;
}

// Pulls "--margin=<px>" out of the positional arguments.
static bool takeMargin(vector<string>& args, double& margin) {
    const string flag = "--margin=";
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i].compare(0, flag.size(), flag) != 0) continue;
        if (!parseNumber(args[i].substr(flag.size()), margin)) return false;
        args.erase(args.begin() + static_cast<long>(i));
        return true;
    }
    return true;
}

static bool loadImage(const string& path, cv::Mat& out) {
    out = cv::imread(path, cv::IMREAD_COLOR);
    if (out.empty()) {
        cerr << "Image could not be read: " << path << "\n";
        return false;
    }
    cout << "Loaded " << path << " (" << out.cols << "x" << out.rows << ")\n";
    return true;
}

static formreg::DetectionSettings settingsFrom(const vector<string>& args, size_t configIndex) {
    if (args.size() > configIndex) return formreg::loadDetectionSettings(args[configIndex]);
    return formreg::DetectionSettings();
}

static void printCorners(const formreg::CornerSet& c) {
    cout << fixed << setprecision(2);
    for (int i = 0; i < 4; ++i) {
        cout << "  " << kCornerLabels[i] << ": (" << c[i].x << ", " << c[i].y << ")\n";
    }
}

/* =========================================================
   COMMANDS
   ========================================================= */
static int runCorners(const vector<string>& args) {
    if (args.size() < 1) { printUsage(); return kExitUsage; }

    cv::Mat img;
    if (!loadImage(args[0], img)) return kExitUsage;

    formreg::CornerFinder finder(settingsFrom(args, 1));
    formreg::CornerResult R = finder.locate(img);
    if (!R.ok()) {
        cerr << "Fiducial marks not found, adjust threshold or min_size\n";
        return exitFor(R.status);
    }

    cout << "Corners:\n";
    printCorners(R.corners);

    auto marks = finder.markRects(R.corners, img.size());
    cout << "Mark areas:\n";
    for (int i = 0; i < 4; ++i) {
        cout << "  " << kCornerLabels[i] << ": x=" << marks[i].x << " y=" << marks[i].y
             << " w=" << marks[i].width << " h=" << marks[i].height << "\n";
    }
    return kExitOk;
}

static int runWand(const vector<string>& args) {
    double x = 0, y = 0;
    if (args.size() < 3 || !parseNumber(args[1], x) || !parseNumber(args[2], y)) {
        printUsage();
        return kExitUsage;
    }

    cv::Mat img;
    if (!loadImage(args[0], img)) return kExitUsage;

    formreg::RegionDetector detector(settingsFrom(args, 3));
    formreg::RegionResult R = detector.detect(img, cv::Point(cvFloor(x), cvFloor(y)));
    if (!R.ok()) {
        cerr << "No region around (" << x << ", " << y << ")\n";
        return exitFor(R.status);
    }
    cout << "Region: x=" << R.rect.x << " y=" << R.rect.y
         << " w=" << R.rect.width << " h=" << R.rect.height << "\n";
    return kExitOk;
}

static int runRectify(vector<string> args) {
    double tx = 0, ty = 0, tw = 0, th = 0, margin = 0;
    if (!takeMargin(args, margin) || args.size() < 7 ||
        !parseNumber(args[2], tx) || !parseNumber(args[3], ty) ||
        !parseNumber(args[4], tw) || !parseNumber(args[5], th)) {
        printUsage();
        return kExitUsage;
    }
    const string outPath = args[6];
    const string configPath = args.size() > 7 ? args[7] : string();

    cv::Mat scan, tmpl;
    if (!loadImage(args[0], scan) || !loadImage(args[1], tmpl)) return kExitUsage;

    formreg::DetectionSettings settings = settingsFrom(args, 7);
    formreg::PerspectiveCorrector corrector(settings);

    // Template corners: stored calibration first, detection otherwise.
    formreg::CornerSet ideal;
    if (configPath.empty() || !formreg::loadTemplateCorners(configPath, ideal)) {
        formreg::CornerResult T = corrector.finder().locate(tmpl);
        if (!T.ok()) {
            cerr << "Template fiducial marks not found\n";
            return exitFor(T.status);
        }
        ideal = T.corners;
    }
    cout << "Template corners:\n";
    printCorners(ideal);

    // Answer snippets keep some surrounding context.
    const cv::Rect2d target = formreg::inflateRect(cv::Rect2d(tx, ty, tw, th), margin);
    formreg::RegistrationResult R = corrector.findAndWarp(scan, args[0], ideal, target);
    if (!R.ok()) {
        cerr << "Rectification failed: " << formreg::statusName(R.status) << "\n";
        return exitFor(R.status);
    }
    cout << "Scan corners:\n";
    printCorners(R.corners);

    const cv::Mat& crop = R.crops.front();
    if (crop.empty()) {
        cerr << "Target area is empty\n";
        return kExitUsage;
    }
    try {
        if (!cv::imwrite(outPath, crop)) {
            cerr << "Could not write " << outPath << "\n";
            return kExitUsage;
        }
    } catch (const cv::Exception& e) {
        cerr << "Could not write " << outPath << ": " << e.what() << "\n";
        return kExitUsage;
    }
    cout << "Wrote " << outPath << " (" << crop.cols << "x" << crop.rows << ")\n";
    return kExitOk;
}

/* =========================================================
   MAIN
   ========================================================= */
int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return kExitUsage;
    }

    const string cmd = argv[1];
    vector<string> args(argv + 2, argv + argc);

    if (cmd == "corners") return runCorners(args);
    if (cmd == "wand") return runWand(args);
    if (cmd == "rectify") return runRectify(args);

    cerr << "Unknown command: " << cmd << "\n";
    printUsage();
    return kExitUsage;
}
