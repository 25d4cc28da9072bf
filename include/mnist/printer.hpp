#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>

#include "mnist/idx.hpp"

namespace mnist {

/// Row width of the canonical 28x28 digits.
constexpr std::size_t kPrintWidth = 28;

/**
 * @brief Render an image as ASCII art.
 *
 * Pixels brighter than 0.5 print as `*`, everything else as `_`. Each row of
 * @p width pixels ends with a newline, including a final partial row.
 */
inline void print_image(const Image& image, std::ostream& out = std::cout,
                        std::size_t width = kPrintWidth) {
    if (width == 0)
        return;
    for (std::size_t i = 0; i < image.size(); ++i) {
        out << (image[i] > 0.5f ? '*' : '_');
        if ((i + 1) % width == 0 || i + 1 == image.size())
            out << '\n';
    }
}

} // namespace mnist
