/*=====================================================================
NoiseFieldSampler.h
-------------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../utils/Array2D.h"
#include <stddef.h>


class GradientNoise;


/*=====================================================================
NoiseFieldSampler
-----------------
Samples a noise field over a pixel grid.
=====================================================================*/
namespace NoiseFieldSampler
{


// Resizes samples_out to width x height, and sets samples_out.elem(x, y) = (engine.getNoise(x, y) + 1) * 0.5
// for every integer pixel coordinate.  One sample per pixel, taken at the pixel's integer coordinate.
// Resulting values are in [0, 1].
void render(size_t width, size_t height, const GradientNoise& engine, Array2D<float>& samples_out);


// Maps a noise value in [-1, 1] to [0, 1].
inline float toUnitInterval(float noise_val) { return (noise_val + 1.f) * 0.5f; }


} // end namespace NoiseFieldSampler
