#pragma once

// AVX escape-time kernel, implemented in kernel_avx.cpp (compiled with -mavx).
// Computes 4 horizontally adjacent pixels at once.
// re4:  real coordinates of the 4 pixels
// im:   imaginary coordinate (same for all 4 pixels in a row)
// out4: receives 4 smooth iteration values, kInterior for non-escaping lanes

void avx_mandelbrot_4(const double* re4, double im, int max_iter, double* out4);
