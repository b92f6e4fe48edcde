// Compiled with -mavx only; do NOT include from other translation units.

#include "fractal_avx.hpp"
#include "fractal.hpp"

#include <immintrin.h>
#include <sleef.h>
#include <cmath>

// Scalar cardioid/bulb test. Kept local: an inline template from fractal.hpp
// instantiated here would carry VEX encoding into the non-AVX objects.
static bool lane_is_interior(double x, double y)
{
    const double y2 = y * y;
    const double xq = x - 0.25;
    const double q  = xq * xq + y2;
    if (q * (q + xq) < y2 * 0.25) return true;
    const double xb = x + 1.0;
    return xb * xb + y2 < 0.0625;
}

// -----------------------------------------------------------------------
// 4 pixels per call. Per lane the update sequence is the one of
// escape_time<double>: z <- z^2 + c, then the |z|^2 > 4 test, so scalar
// remainder pixels and vector lanes agree on the escape iteration.
// z update uses mul+add/sub (no FMA).
// -----------------------------------------------------------------------
void avx_mandelbrot_4(const double* re4, double im, int max_iter, double* out4)
{
    // Interior lanes never enter the loop
    alignas(32) double interior[4];
    for (int k = 0; k < 4; ++k)
        interior[k] = lane_is_interior(re4[k], im) ? 1.0 : 0.0;
    const __m256d interior_mask = _mm256_cmp_pd(_mm256_load_pd(interior),
                                                 _mm256_setzero_pd(), _CMP_NEQ_OQ);

    const __m256d cr = _mm256_loadu_pd(re4);
    const __m256d ci = _mm256_set1_pd(im);
    __m256d zr = _mm256_setzero_pd();
    __m256d zi = _mm256_setzero_pd();

    const __m256d four = _mm256_set1_pd(kBailoutSq);
    const __m256d one  = _mm256_set1_pd(1.0);

    // active: all bits set for lanes that have not yet escaped
    __m256d active   = _mm256_andnot_pd(interior_mask,
                           _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL)));
    __m256d escaped  = _mm256_setzero_pd();
    // updates_d counts z updates per lane; frozen once the lane escapes
    __m256d updates_d = _mm256_setzero_pd();
    __m256d final_r2  = _mm256_set1_pd(kBailoutSq);

    for (int n = 0; n < max_iter && _mm256_movemask_pd(active) != 0; ++n) {
        const __m256d new_zr = _mm256_add_pd(_mm256_mul_pd(zr, zr),
                                   _mm256_sub_pd(cr, _mm256_mul_pd(zi, zi)));  // zr^2 + (cr - zi^2)
        const __m256d new_zi = _mm256_add_pd(_mm256_mul_pd(_mm256_add_pd(zr, zr), zi), ci);

        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);
        updates_d = _mm256_add_pd(updates_d, _mm256_and_pd(active, one));

        const __m256d mag2 = _mm256_add_pd(_mm256_mul_pd(zr, zr), _mm256_mul_pd(zi, zi));
        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, four, _CMP_GT_OQ), active);

        final_r2 = _mm256_blendv_pd(final_r2, mag2, just_esc);
        escaped  = _mm256_or_pd(escaped, just_esc);
        active   = _mm256_andnot_pd(just_esc, active);
    }

    // Vectorized smooth coloring using SLEEF
    const __m256d inv_log2 = _mm256_set1_pd(1.0 / std::log(2.0));
    const __m256d half     = _mm256_set1_pd(0.5);
    const __m256d zero_v   = _mm256_setzero_pd();
    const __m256d top_v    = _mm256_set1_pd(
        std::nextafter(static_cast<double>(max_iter), 0.0));

    // smooth = updates - log2(log2(|z|))
    __m256d log_zn = _mm256_mul_pd(Sleef_logd4_u35(final_r2), half);
    __m256d nu     = _mm256_mul_pd(Sleef_logd4_u35(_mm256_mul_pd(log_zn, inv_log2)), inv_log2);
    __m256d smooth = _mm256_min_pd(top_v,
                         _mm256_max_pd(zero_v, _mm256_sub_pd(updates_d, nu)));

    __m256d result = _mm256_blendv_pd(_mm256_set1_pd(kInterior), smooth, escaped);
    _mm256_storeu_pd(out4, result);
}
