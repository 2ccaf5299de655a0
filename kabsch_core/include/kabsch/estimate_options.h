#pragma once

#include <yaml-cpp/node/node.h>

namespace kabsch
{
    /// Similarity estimation configuration
    struct estimate_options
    {
        /// Estimate a uniform scale in addition to rotation and translation
        bool estimate_scale = true;

        /// Singular values of the cross-covariance strictly above this count towards its rank
        double rank_tolerance = 1e-5;

        /**
         * Read the keys estimate_scale and rank_tolerance of a YAML map
         * @param node The map, may be undefined; missing keys keep their defaults
         * @throws std::runtime_error if a key holds a value of the wrong type
         */
        static auto parse_yaml(const YAML::Node& node) -> estimate_options;

        void print() const;

        /// @throws std::invalid_argument if rank_tolerance is negative
        void validate() const;
    };
} // namespace kabsch
