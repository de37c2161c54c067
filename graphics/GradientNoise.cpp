/*=====================================================================
GradientNoise.cpp
-----------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "GradientNoise.h"


#include "../maths/mathstypes.h"
#include "../utils/MTwister.h"
#include "../utils/Exception.h"
#include "../utils/StringUtils.h"
#include <cmath>


/*

See http://mrl.nyu.edu/~perlin/noise/

The 2D gradients are the 4 axis directions and the 4 unnormalised diagonals.

*/
static const float gradients[8][2] = {
	{ 1, 0 }, { -1, 0 }, { 0, 1 }, { 0, -1 },
	{ 1, 1 }, { -1, 1 }, { 1, -1 }, { -1, -1 }
};


static const char* noise_type_names[GradientNoise::NUM_NOISE_TYPES] = {
	"OPEN_SIMPLEX_2",
	"OPEN_SIMPLEX_2S",
	"CELLULAR",
	"PERLIN",
	"VALUE_CUBIC",
	"VALUE"
};


GradientNoise::GradientNoise(uint32 seed_)
:	noise_type(NoiseType_Perlin),
	frequency(0.01f),
	octaves(3),
	lacunarity(2.f),
	gain(0.5f)
{
	setSeed(seed_);
}


GradientNoise::~GradientNoise()
{
}


void GradientNoise::setSeed(uint32 seed_)
{
	seed = seed_;

	for(int i=0; i<256; ++i)
		perm[i] = (uint8)i;

	// Fisher-Yates shuffle, drawing each swap index uniformly from [0, i].
	MTwister rng(seed);
	for(int i=255; i>=1; --i)
	{
		const uint32 j = rng.randBelow((uint32)i + 1);
		mySwap(perm[i], perm[j]);
	}

	// Duplicate the table so that perm[perm[X] + Y] doesn't need wrapping.
	for(int i=0; i<256; ++i)
		perm[256 + i] = perm[i];
}


static GRADNOISE_STRONG_INLINE float fade(float t)
{
	return t * t * t * (t * (t * 6 - 15) + 10);
}


static GRADNOISE_STRONG_INLINE float grad(int hash, float x, float y)
{
	const float* g = gradients[hash & 7];
	return g[0] * x + g[1] * y;
}


// Returns floored mod 256 of the lattice coordinate fx, without converting fx itself to int, which could overflow.
static GRADNOISE_STRONG_INLINE int latticeIndex(float fx)
{
	return (int)(fx - 256.f * std::floor(fx * (1.f / 256.f))) & 0xFF;
}


float GradientNoise::noise(float x, float y) const
{
	if(!isFinite(x) || !isFinite(y))
		return 0.f;

	const float floor_x = std::floor(x);
	const float floor_y = std::floor(y);

	const int X = latticeIndex(floor_x);
	const int Y = latticeIndex(floor_y);

	const float xf = x - floor_x; // Fractional coords in noise space
	const float yf = y - floor_y;

	const float u = fade(xf); // Interpolation weights
	const float v = fade(yf);

	// X + 1 may be 256, which is fine since perm has 512 entries.
	const float n00 = grad(hash(X,     Y    ), xf,        yf);
	const float n10 = grad(hash(X + 1, Y    ), xf - 1.f,  yf);
	const float n01 = grad(hash(X,     Y + 1), xf,        yf - 1.f);
	const float n11 = grad(hash(X + 1, Y + 1), xf - 1.f,  yf - 1.f);

	const float nx0 = Maths::lerp(n00, n10, u);
	const float nx1 = Maths::lerp(n01, n11, u);
	return Maths::lerp(nx0, nx1, v);
}


float GradientNoise::fractalNoise(float x, float y) const
{
	// Accumulate in double, so that large gains or many octaves don't overflow the amplitude sums.
	double total = 0;
	double amplitude = 1;
	double freq = 1;
	double amplitude_sum = 0;

	for(int i=0; i<octaves; ++i)
	{
		total += noise((float)(x * freq), (float)(y * freq)) * amplitude;
		amplitude_sum += amplitude;
		amplitude *= gain;
		freq *= lacunarity;
	}

	if(amplitude_sum == 0)
		return 0.f;

	return (float)(total / amplitude_sum);
}


float GradientNoise::getNoise(float x, float y) const
{
	x *= frequency;
	y *= frequency;

	float v;
	switch(noise_type)
	{
	case NoiseType_Perlin:
		v = fractalNoise(x, y);
		break;
	default:
		// Other noise types are not implemented, evaluate them as Perlin.
		v = fractalNoise(x, y);
		break;
	}

	// A degenerate configuration (e.g. infinite gain) can give inf / inf.
	if(!isFinite(v))
		return 0.f;

	return myClamp(v, -1.f, 1.f);
}


const std::string GradientNoise::noiseTypeString(NoiseType t)
{
	if((int)t >= 0 && (int)t < NUM_NOISE_TYPES)
		return noise_type_names[t];
	return "UNKNOWN (" + toString((int32)t) + ")";
}


GradientNoise::NoiseType GradientNoise::noiseTypeForString(const std::string& s)
{
	const std::string upper_s = toUpperCase(s);
	for(int i=0; i<NUM_NOISE_TYPES; ++i)
		if(upper_s == noise_type_names[i])
			return (NoiseType)i;

	throw gradnoise::Exception("Unknown noise type '" + s + "'");
}
