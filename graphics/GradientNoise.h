/*=====================================================================
GradientNoise.h
---------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../utils/Platform.h"
#include <string>


/*=====================================================================
GradientNoise
-------------
Seeded 2D Perlin gradient noise, with fBm octave summation.

The permutation table is built by shuffling [0, 255] with an MT19937
generator seeded from the 32-bit seed, so a given seed always gives the
same table (and the same noise) on every platform.

getNoise() is the public entry point: it scales the input by the base
frequency, sums the octaves and clamps the result to [-1, 1].

Some tests in NoiseTests::test()
=====================================================================*/
class GradientNoise
{
public:
	enum NoiseType
	{
		NoiseType_OpenSimplex2 = 0,
		NoiseType_OpenSimplex2S = 1,
		NoiseType_Cellular = 2,
		NoiseType_Perlin = 3,
		NoiseType_ValueCubic = 4,
		NoiseType_Value = 5
	};

	static const int NUM_NOISE_TYPES = 6;

	GradientNoise(uint32 seed = 1337);
	~GradientNoise();

	// Rebuilds the permutation table.  Fractal parameters are left unchanged.
	void setSeed(uint32 seed);
	uint32 getSeed() const { return seed; }

	//==================== Configuration ======================
	// Changes take effect on the next evaluation.

	void setNoiseType(NoiseType t) { noise_type = t; }
	NoiseType getNoiseType() const { return noise_type; }

	void setFrequency(float f) { frequency = f; }
	float getFrequency() const { return frequency; }

	void setFractalOctaves(int n) { octaves = (n >= 1) ? n : 1; } // Values < 1 are treated as 1.
	int getFractalOctaves() const { return octaves; }

	void setFractalLacunarity(float l) { lacunarity = l; }
	float getFractalLacunarity() const { return lacunarity; }

	void setFractalGain(float g) { gain = g; }
	float getFractalGain() const { return gain; }

	//==================== Evaluation ======================

	// Frequency-scaled fractal noise, clamped to [-1, 1].  Non-finite fractal results give 0.
	// Noise types other than Perlin are not implemented and evaluate as Perlin.
	float getNoise(float x, float y) const;

	// Sum of octaves, normalised by the sum of the octave amplitudes.  No frequency scaling.
	// Returns 0 if the amplitude sum is zero.  Octave sums are accumulated in double precision.
	float fractalNoise(float x, float y) const;

	// Single octave of gradient noise.  Not normalised or clamped.  Zero at integer lattice points.
	// Returns 0 for non-finite input.
	float noise(float x, float y) const;

	//==================== Introspection ======================

	// The 512 entry permutation table.  Entries [256, 512) are a copy of entries [0, 256).
	const uint8* getPermutationTable() const { return perm; }

	static const std::string noiseTypeString(NoiseType t); // e.g. "PERLIN"
	static NoiseType noiseTypeForString(const std::string& s); // Throws gradnoise::Exception if s is not a valid noise type name.
	static bool isNoiseTypeImplemented(NoiseType t) { return t == NoiseType_Perlin; }

private:
	GRADNOISE_STRONG_INLINE int hash(int X, int Y) const { return perm[perm[X] + Y]; }

	uint8 perm[512];
	uint32 seed;

	NoiseType noise_type;
	float frequency;
	int octaves;
	float lacunarity;
	float gain;
};
