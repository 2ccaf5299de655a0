#pragma once

#include <stdexcept>

namespace kabsch
{
    /// Thrown when the number of values handed to a container does not match its declared shape
    class length_mismatch : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// Thrown when two matrices that must agree in shape do not
    class dimension_mismatch : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };
} // namespace kabsch
