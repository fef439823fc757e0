#include "template_matcher.h"
#include "../common/structured_logger.h"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace deskpilot {

namespace {
    cv::Mat decodeGray(const ImageBytes& bytes) {
        if (bytes.empty()) {
            return cv::Mat();
        }
        return cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
    }

    /**
     * @brief Decode both images and compute the correlation surface
     * @return false (after logging) if matching is impossible for these inputs
     */
    bool correlate(const ImageBytes& screen, const ImageBytes& templ, cv::Mat& scores, cv::Size& templateSize) {
        try {
            cv::Mat screenImage = decodeGray(screen);
            cv::Mat templateImage = decodeGray(templ);
            if (screenImage.empty() || templateImage.empty()) {
                SLOG_WARNING().message("Could not decode image for matching")
                    .context("screen_bytes", screen.size())
                    .context("template_bytes", templ.size());
                return false;
            }
            if (templateImage.cols > screenImage.cols || templateImage.rows > screenImage.rows) {
                SLOG_WARNING().message("Template is larger than the screen image")
                    .context("template", std::to_string(templateImage.cols) + "x" + std::to_string(templateImage.rows))
                    .context("screen", std::to_string(screenImage.cols) + "x" + std::to_string(screenImage.rows));
                return false;
            }

            cv::matchTemplate(screenImage, templateImage, scores, cv::TM_CCOEFF_NORMED);
            // Flat regions divide by zero
            cv::patchNaNs(scores, 0.0);
            templateSize = templateImage.size();
            return true;
        } catch (const cv::Exception& e) {
            SLOG_WARNING().message("Template matching failed").context("error", e.what());
            return false;
        }
    }

    MatchResult toResult(const cv::Point& location, double confidence, const cv::Size& size) {
        MatchResult result;
        result.found = true;
        result.location = ScreenPoint{location.x, location.y};
        result.confidence = confidence;
        result.boundingBox = ScreenRegion{location.x, location.y, size.width, size.height};
        return result;
    }
}

MatchResult TemplateMatcher::findImage(const ImageBytes& screen, const ImageBytes& templ, double threshold) {
    SCOPED_TIMER("template_match");
    auto started = std::chrono::steady_clock::now();

    MatchResult result;
    cv::Mat scores;
    cv::Size templateSize;
    if (correlate(screen, templ, scores, templateSize)) {
        double minVal = 0.0;
        double maxVal = 0.0;
        cv::Point minLoc;
        cv::Point maxLoc;
        cv::minMaxLoc(scores, &minVal, &maxVal, &minLoc, &maxLoc);

        result = toResult(maxLoc, maxVal, templateSize);
        result.found = maxVal >= threshold;
    }

    result.searchTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

std::vector<MatchResult> TemplateMatcher::findAllImages(const ImageBytes& screen, const ImageBytes& templ,
                                                        double threshold) {
    SCOPED_TIMER("template_match_all");
    auto started = std::chrono::steady_clock::now();

    std::vector<MatchResult> matches;
    cv::Mat scores;
    cv::Size templateSize;
    if (!correlate(screen, templ, scores, templateSize)) {
        return matches;
    }

    while (static_cast<int>(matches.size()) < kMaxMatches) {
        double maxVal = 0.0;
        cv::Point maxLoc;
        cv::minMaxLoc(scores, nullptr, &maxVal, nullptr, &maxLoc);
        if (maxVal < threshold) {
            break;
        }

        matches.push_back(toResult(maxLoc, maxVal, templateSize));

        // Blank every position whose window would overlap this match
        cv::Rect neighbourhood(maxLoc.x - templateSize.width + 1, maxLoc.y - templateSize.height + 1,
                               templateSize.width * 2 - 1, templateSize.height * 2 - 1);
        neighbourhood &= cv::Rect(0, 0, scores.cols, scores.rows);
        scores(neighbourhood).setTo(cv::Scalar(-1.0));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    for (auto& match : matches) {
        match.searchTime = elapsed;
    }
    return matches;
}

} // namespace deskpilot
