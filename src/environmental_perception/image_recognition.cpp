#include "image_recognition.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace deskpilot {

MatchResult IImageRecognitionService::findImage(const ImageBytes& screen, const TemplateImage& templ) {
    return findImage(screen, templ.imageData, templ.matchThreshold);
}

bool IImageRecognitionService::isImagePresent(const ImageBytes& screen, const ImageBytes& templ, double threshold) {
    return findImage(screen, templ, threshold).found;
}

MatchResult IImageRecognitionService::waitForImage(const ScreenCapture& capture, const ImageBytes& templ,
                                                   std::chrono::milliseconds timeout, double threshold,
                                                   CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!token.isCancelled()) {
        MatchResult result = findImage(capture(), templ, threshold);
        if (result.found) {
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        if (!token.sleepFor(std::min(remaining, kPollInterval))) {
            break;
        }
    }

    SLOG_DEBUG().message("Image did not appear").context("timeout_ms", timeout.count());
    return MatchResult{};
}

bool IImageRecognitionService::waitForImageDisappear(const ScreenCapture& capture, const ImageBytes& templ,
                                                     std::chrono::milliseconds timeout, double threshold,
                                                     CancellationToken& token) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!token.isCancelled()) {
        if (!findImage(capture(), templ, threshold).found) {
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        if (!token.sleepFor(std::min(remaining, kPollInterval))) {
            break;
        }
    }
    return false;
}

} // namespace deskpilot
