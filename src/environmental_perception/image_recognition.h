#ifndef DESKPILOT_IMAGE_RECOGNITION_H
#define DESKPILOT_IMAGE_RECOGNITION_H

#include <chrono>
#include <functional>
#include <vector>
#include "../models/script_models.h"
#include "../common/cancellation_token.h"

namespace deskpilot {

using ScreenCapture = std::function<ImageBytes()>;

/**
 * @brief Template matching against encoded screen captures
 *
 * Only the two raw matching primitives are abstract. The convenience
 * operations are built on findImage and may be overridden.
 */
class IImageRecognitionService {
public:
    static constexpr std::chrono::milliseconds kPollInterval{500};

    virtual ~IImageRecognitionService() = default;

    virtual MatchResult findImage(const ImageBytes& screen, const ImageBytes& templ, double threshold) = 0;

    // All matches at or above threshold, best first, with overlapping hits suppressed
    virtual std::vector<MatchResult> findAllImages(const ImageBytes& screen, const ImageBytes& templ,
                                                   double threshold) = 0;

    // Uses the template's own threshold
    virtual MatchResult findImage(const ImageBytes& screen, const TemplateImage& templ);

    virtual bool isImagePresent(const ImageBytes& screen, const ImageBytes& templ, double threshold);

    /**
     * @brief Poll capture() until the template appears
     * @return The successful match, or found=false on timeout or cancellation
     */
    virtual MatchResult waitForImage(const ScreenCapture& capture, const ImageBytes& templ,
                                     std::chrono::milliseconds timeout, double threshold,
                                     CancellationToken& token);

    // true once the template is no longer found; false on timeout or cancellation
    virtual bool waitForImageDisappear(const ScreenCapture& capture, const ImageBytes& templ,
                                       std::chrono::milliseconds timeout, double threshold,
                                       CancellationToken& token);
};

} // namespace deskpilot

#endif // DESKPILOT_IMAGE_RECOGNITION_H
