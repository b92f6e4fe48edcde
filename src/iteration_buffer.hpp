#pragma once

#include "decimal.hpp"
#include "fractal.hpp"

#include <cstddef>
#include <vector>

// Continuous iteration values, row-major. Row 0 is the bottom row (ymin),
// column 0 the left column (xmin). Non-escaping pixels hold kInterior.
struct IterationBuffer {
    std::vector<double> values;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        values.assign(static_cast<size_t>(w) * static_cast<size_t>(h), kInterior);
    }

    double at(int px, int py) const
    {
        return values[static_cast<size_t>(py) * width + px];
    }
};

// One kernel call: plane rectangle, pixel grid and iteration cap.
// Pixel (px, py) samples c = (xmin + px * (xmax - xmin) / width,
//                             ymin + py * (ymax - ymin) / height).
struct ComputeRequest {
    Decimal xmin, xmax;
    Decimal ymin, ymax;
    int     width    = 0;
    int     height   = 0;
    int     max_iter = 0;
};
