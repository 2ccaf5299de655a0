#pragma once

#include <opencv2/core.hpp>

#include <yaml-cpp/emitter.h>

#include "kabsch/similarity.h"

namespace kabsch
{
    /// Emit a matrix as a block sequence of rows, each row a flow sequence
    YAML::Emitter& operator<<(YAML::Emitter& emitter, const cv::Mat& matrix);

    /// Emit scale, rotation and translation as a map
    YAML::Emitter& operator<<(YAML::Emitter& emitter, const similarity& similarity);
}
