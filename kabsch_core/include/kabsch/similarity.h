#pragma once

#include <opencv2/core.hpp>

namespace kabsch
{
    /**
     * @brief Parts of a similarity transform x -> scale * rotation * x + translation
     *
     * rotation is C x C and translation C x 1, both CV_64F.
     */
    struct similarity
    {
        double  scale       = 1.0;
        cv::Mat rotation    = { };
        cv::Mat translation = { };
    };
} // namespace kabsch
