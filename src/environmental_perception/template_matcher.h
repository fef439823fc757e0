#ifndef DESKPILOT_TEMPLATE_MATCHER_H
#define DESKPILOT_TEMPLATE_MATCHER_H

#include "image_recognition.h"

namespace deskpilot {

/**
 * @brief Normalized correlation matching (cv::TM_CCOEFF_NORMED) on grayscale images
 *
 * Stateless and safe to share between threads. Undecodable input and
 * templates larger than the screen log a warning and yield found=false.
 */
class TemplateMatcher : public IImageRecognitionService {
public:
    static constexpr int kMaxMatches = 100;

    using IImageRecognitionService::findImage;

    MatchResult findImage(const ImageBytes& screen, const ImageBytes& templ, double threshold) override;
    std::vector<MatchResult> findAllImages(const ImageBytes& screen, const ImageBytes& templ,
                                           double threshold) override;
};

} // namespace deskpilot

#endif // DESKPILOT_TEMPLATE_MATCHER_H
