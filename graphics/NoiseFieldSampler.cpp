/*=====================================================================
NoiseFieldSampler.cpp
---------------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "NoiseFieldSampler.h"


#include "GradientNoise.h"


void NoiseFieldSampler::render(size_t width, size_t height, const GradientNoise& engine, Array2D<float>& samples_out)
{
	samples_out.resizeNoCopy(width, height);
	if(width == 0 || height == 0)
		return;

	for(size_t y=0; y<height; ++y)
	{
		float* row = samples_out.rowBegin(y);
		for(size_t x=0; x<width; ++x)
			row[x] = toUnitInterval(engine.getNoise((float)x, (float)y));
	}
}
