#pragma once

#include <opencv2/core.hpp>

#include "kabsch/similarity.h"

namespace kabsch::utils
{
    /**
     * Build the (C+1) x (C+1) homogeneous matrix of a similarity
     * @return identity with scale * rotation in the top-left block and translation in column C
     */
    auto compose(const similarity& similarity) -> cv::Mat;

    /**
     * Split a homogeneous similarity matrix into its parts. The scale is the RMS column norm of
     * the top-left block, sqrt(trace(B^T B) / C), which is exact for scale * rotation.
     * @throws dimension_mismatch if the matrix is not square or smaller than 2 x 2
     */
    auto decompose(const cv::Mat& transform) -> similarity;

    /**
     * Transform every row p of an R x C matrix to B * p + t
     * @throws dimension_mismatch if points does not have C columns
     */
    auto apply(const cv::Mat& transform, const cv::Mat& points) -> cv::Mat;

    /**
     * Root-mean-square distance between the transformed source points and their destinations
     * @throws dimension_mismatch if src and dst differ in shape
     */
    auto rmsd(const cv::Mat& transform, const cv::Mat& src, const cv::Mat& dst) -> double;
}
