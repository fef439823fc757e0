#include <iostream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "environmental_perception/template_matcher.h"
#include "common/structured_logger.h"
#include "test_support.h"

using namespace deskpilot;
using namespace std::chrono_literals;

namespace {

ImageBytes encodePng(const cv::Mat& image) {
    std::vector<uchar> buffer;
    cv::imencode(".png", image, buffer);
    return ImageBytes(buffer.begin(), buffer.end());
}

// Noise gives every position a distinct neighbourhood
cv::Mat noiseImage(int width, int height) {
    cv::theRNG().state = 12345;
    cv::Mat image(height, width, CV_8UC1);
    cv::randu(image, cv::Scalar(0), cv::Scalar(256));
    return image;
}

} // namespace

void testFindsCroppedTemplate() {
    std::cout << "[TEST] Finds Cropped Template\n";

    cv::Mat screen = noiseImage(160, 120);
    cv::Mat patch = screen(cv::Rect(50, 40, 24, 16)).clone();

    TemplateMatcher matcher;
    MatchResult result = matcher.findImage(encodePng(screen), encodePng(patch), 0.9);
    CHECK(result.found);
    CHECK_EQ(result.location.x, 50);
    CHECK_EQ(result.location.y, 40);
    CHECK_EQ(result.boundingBox.width, 24);
    CHECK_EQ(result.boundingBox.height, 16);
    CHECK(result.confidence > 0.99);

    TemplateImage image;
    image.imageData = encodePng(patch);
    image.matchThreshold = 0.95;
    CHECK(matcher.findImage(encodePng(screen), image).found);
    CHECK(matcher.isImagePresent(encodePng(screen), encodePng(patch), 0.95));

    std::cout << "[OK] Finds cropped template test passed\n\n";
}

void testRejectsUnusableInput() {
    std::cout << "[TEST] Rejects Unusable Input\n";

    TemplateMatcher matcher;
    cv::Mat screen = noiseImage(64, 48);
    cv::Mat large = noiseImage(128, 96);

    CHECK(!matcher.findImage(encodePng(screen), encodePng(large), 0.5).found);
    CHECK(!matcher.findImage(ImageBytes{1, 2, 3, 4}, encodePng(screen), 0.5).found);
    CHECK(!matcher.findImage(encodePng(screen), ImageBytes{}, 0.5).found);
    CHECK(matcher.findAllImages(ImageBytes{}, encodePng(screen), 0.5).empty());

    // A flat screen has no correlation anywhere
    cv::Mat blank = cv::Mat::zeros(48, 64, CV_8UC1);
    cv::Mat patch = screen(cv::Rect(5, 5, 10, 10)).clone();
    MatchResult result = matcher.findImage(encodePng(blank), encodePng(patch), 0.5);
    CHECK(!result.found);

    std::cout << "[OK] Rejects unusable input test passed\n\n";
}

void testFindsAllOccurrences() {
    std::cout << "[TEST] Finds All Occurrences\n";

    cv::Mat screen = noiseImage(160, 120);
    cv::Mat patch = screen(cv::Rect(50, 40, 24, 16)).clone();
    patch.copyTo(screen(cv::Rect(10, 10, 24, 16)));
    patch.copyTo(screen(cv::Rect(120, 90, 24, 16)));

    TemplateMatcher matcher;
    auto matches = matcher.findAllImages(encodePng(screen), encodePng(patch), 0.99);
    CHECK_EQ(matches.size(), 3u);

    bool sawOriginal = false;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (matches[i].location.x == 50 && matches[i].location.y == 40) {
            sawOriginal = true;
        }
        if (i > 0) {
            CHECK(matches[i - 1].confidence >= matches[i].confidence);
        }
    }
    CHECK(sawOriginal);

    std::cout << "[OK] Finds all occurrences test passed\n\n";
}

void testWaitingHelpers() {
    std::cout << "[TEST] Waiting Helpers\n";

    cv::Mat screen = noiseImage(96, 64);
    ImageBytes screenBytes = encodePng(screen);
    ImageBytes patchBytes = encodePng(screen(cv::Rect(30, 20, 16, 16)).clone());
    ImageBytes blankBytes = encodePng(cv::Mat::zeros(64, 96, CV_8UC1));

    TemplateMatcher matcher;
    CancellationToken token;

    int captures = 0;
    MatchResult appeared = matcher.waitForImage([&] { return ++captures < 3 ? blankBytes : screenBytes; },
                                                patchBytes, 5s, 0.9, token);
    CHECK(appeared.found);
    CHECK_EQ(captures, 3);

    auto start = std::chrono::steady_clock::now();
    MatchResult missing = matcher.waitForImage([&] { return blankBytes; }, patchBytes, 60ms, 0.9, token);
    CHECK(!missing.found);
    CHECK(std::chrono::steady_clock::now() - start >= 60ms);

    CHECK(matcher.waitForImageDisappear([&] { return blankBytes; }, patchBytes, 1s, 0.9, token));
    CHECK(!matcher.waitForImageDisappear([&] { return screenBytes; }, patchBytes, 60ms, 0.9, token));

    token.cancel();
    CHECK(!matcher.waitForImage([&] { return screenBytes; }, patchBytes, 5s, 0.9, token).found);

    std::cout << "[OK] Waiting helpers test passed\n\n";
}

int main() {
    std::cout << "=== DeskPilot Template Matcher Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testFindsCroppedTemplate();
        testRejectsUnusableInput();
        testFindsAllOccurrences();
        testWaitingHelpers();
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
    return test::finish("Template matcher");
}
