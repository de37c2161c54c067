/*=====================================================================
NoiseTests.cpp
--------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "NoiseTests.h"


#if BUILD_TESTS


#include "GradientNoise.h"
#include "NoiseFieldSampler.h"
#include "../utils/TestUtils.h"
#include "../utils/ConPrint.h"
#include "../utils/StringUtils.h"
#include "../utils/Timer.h"
#include "../utils/Exception.h"
#include <limits>
#include <vector>


static bool tablesEqual(const GradientNoise& a, const GradientNoise& b)
{
	for(int i=0; i<512; ++i)
		if(a.getPermutationTable()[i] != b.getPermutationTable()[i])
			return false;
	return true;
}


static void checkPermutationTable(const GradientNoise& noise)
{
	const uint8* p = noise.getPermutationTable();

	// First half is a permutation of [0, 255]
	std::vector<int> counts(256, 0);
	for(int i=0; i<256; ++i)
		counts[p[i]]++;
	for(int i=0; i<256; ++i)
		testEqual(counts[i], 1);

	// Second half is a copy of the first half
	for(int i=0; i<256; ++i)
		testEqual(p[256 + i], p[i]);
}


static void checkPermutationPrefixAndSuffix(uint32 seed, const int* expected_first_16, const int* expected_last_4)
{
	GradientNoise noise(seed);
	const uint8* p = noise.getPermutationTable();
	for(int i=0; i<16; ++i)
		testEqual((int)p[i], expected_first_16[i]);
	for(int i=0; i<4; ++i)
		testEqual((int)p[252 + i], expected_last_4[i]);
}


static void testArray2D()
{
	conPrint("testArray2D()");

	{
		Array2D<float> a;
		testAssert(a.getWidth() == 0 && a.getHeight() == 0);
		testAssert(a.numElements() == 0);
	}

	{
		Array2D<int> a(3, 2, 7);
		testAssert(a.getWidth() == 3);
		testAssert(a.getHeight() == 2);
		testAssert(a.numElements() == 6);
		for(size_t y=0; y<2; ++y)
		for(size_t x=0; x<3; ++x)
			testEqual(a.elem(x, y), 7);

		// Check row-major layout
		a.elem(2, 1) = 100;
		testEqual(a.getData()[1 * 3 + 2], 100);
		testEqual(a.rowBegin(1)[2], 100);

		a.setAllElems(-1);
		testEqual(a.elem(2, 1), -1);
	}

	// Test resize preserves overlapping data
	{
		Array2D<int> a(2, 2);
		a.elem(0, 0) = 1;
		a.elem(1, 0) = 2;
		a.elem(0, 1) = 3;
		a.elem(1, 1) = 4;

		a.resize(3, 1);
		testAssert(a.getWidth() == 3 && a.getHeight() == 1);
		testEqual(a.elem(0, 0), 1);
		testEqual(a.elem(1, 0), 2);

		a.resizeNoCopy(4, 5);
		testAssert(a.numElements() == 20);
	}

	// Test ==
	{
		Array2D<int> a(2, 3, 1);
		Array2D<int> b(2, 3, 1);
		Array2D<int> c(3, 2, 1);
		testAssert(a == b);
		testAssert(a != c); // Same number of elements but different dimensions
		b.elem(1, 2) = 0;
		testAssert(a != b);
	}
}


void NoiseTests::test()
{
	conPrint("NoiseTests::test()");

	testArray2D();

	//==================== Test defaults ====================
	{
		GradientNoise noise;
		testEqual(noise.getSeed(), (uint32)1337);
		testAssert(noise.getNoiseType() == GradientNoise::NoiseType_Perlin);
		testEqual(noise.getFrequency(), 0.01f);
		testEqual(noise.getFractalOctaves(), 3);
		testEqual(noise.getFractalLacunarity(), 2.f);
		testEqual(noise.getFractalGain(), 0.5f);
	}

	//==================== Test permutation table validity ====================
	{
		const uint32 seeds[] = { 0, 1, 42, 1337, 999999, 123456789, 0xFFFFFFFFu };
		for(size_t i=0; i<staticArrayNumElems(seeds); ++i)
			checkPermutationTable(GradientNoise(seeds[i]));
	}

	//==================== Test permutation tables against reference values ====================
	// These must not change, otherwise images generated from a saved seed can't be reproduced.
	{
		const int first[] = { 234, 9, 103, 60, 5, 79, 232, 229, 45, 51, 131, 3, 168, 29, 170, 216 };
		const int last[] = { 70, 189, 6, 57 };
		checkPermutationPrefixAndSuffix(42, first, last);
	}
	{
		const int first[] = { 181, 1, 179, 217, 161, 25, 228, 36, 81, 234, 229, 120, 231, 131, 68, 197 };
		const int last[] = { 255, 149, 146, 187 };
		checkPermutationPrefixAndSuffix(1337, first, last);
	}
	{
		const int first[] = { 1, 88, 132, 233, 162, 39, 185, 237, 238, 159, 164, 76, 59, 144, 97, 94 };
		const int last[] = { 107, 227, 194, 197 };
		checkPermutationPrefixAndSuffix(0, first, last);
	}
	{
		const int first[] = { 230, 93, 253, 231, 27, 246, 42, 224, 241, 87, 2, 236, 229, 156, 143, 28 };
		const int last[] = { 171, 183, 62, 107 };
		checkPermutationPrefixAndSuffix(999999, first, last);
	}

	// Different seeds should give different tables.
	testAssert(!tablesEqual(GradientNoise(1), GradientNoise(2)));

	//==================== Test reseeding ====================
	{
		GradientNoise a(42);
		GradientNoise b(7);
		b.setFrequency(0.02f);
		b.setFractalOctaves(4);
		b.setSeed(42);
		testAssert(tablesEqual(a, b));
		testEqual(b.getSeed(), (uint32)42);

		// setSeed leaves the fractal parameters unchanged.
		testEqual(b.getFrequency(), 0.02f);
		testEqual(b.getFractalOctaves(), 4);

		// Reseeding with the same seed is idempotent.
		const float v = b.getNoise(13.7f, -2.2f);
		b.setSeed(42);
		b.setSeed(42);
		testEqual(b.getNoise(13.7f, -2.2f), v);

		// Reseeding with a different seed and then back restores the output.
		b.setSeed(43);
		b.setSeed(42);
		testEqual(b.getNoise(13.7f, -2.2f), v);
	}

	//==================== Test single octave noise against reference values ====================
	{
		GradientNoise noise(1337);
		testEpsEqualWithEps(noise.noise(0.5f, 0.5f), 0.25f, 1.0e-6f);
		testEpsEqualWithEps(noise.noise(1.25f, 2.75f), -0.2553577423095703f, 1.0e-5f);
		testEpsEqualWithEps(noise.noise(-3.3f, 4.4f), 0.36541924608f, 1.0e-4f);
		testEpsEqualWithEps(noise.noise(100.7f, -200.2f), -0.492194237439992f, 1.0e-4f);
		testEpsEqualWithEps(noise.noise(0.3f, 0.9f), -0.0636808070399999f, 1.0e-4f);
	}

	//==================== Test noise is zero at integer lattice points ====================
	{
		GradientNoise noise(42);
		for(int y=-5; y<=5; ++y)
		for(int x=-5; x<=5; ++x)
			testEqual(noise.noise((float)x, (float)y), 0.f);

		// Large coordinates shouldn't overflow the lattice index computation.
		testEqual(noise.noise(3.0e9f, -3.0e9f), 0.f);
		testEqual(noise.noise(std::numeric_limits<float>::max(), 1.f), 0.f);
	}

	//==================== Test non-finite input ====================
	{
		GradientNoise noise(42);
		testEqual(noise.noise(std::numeric_limits<float>::quiet_NaN(), 0.5f), 0.f);
		testEqual(noise.noise(0.5f, std::numeric_limits<float>::infinity()), 0.f);
		const float v = noise.getNoise(std::numeric_limits<float>::quiet_NaN(), 1.f);
		testAssert(v >= -1.f && v <= 1.f);
	}

	//==================== Test the lattice wraps with period 256, including for negative coordinates ====================
	{
		GradientNoise noise(99);
		testEqual(noise.noise(300.25f, 0.75f), noise.noise(44.25f, 0.75f));
		testEqual(noise.noise(-0.25f, 0.5f), noise.noise(255.75f, 0.5f));
		testEqual(noise.noise(0.5f, -0.25f), noise.noise(0.5f, 255.75f));
		testEqual(noise.noise(-256.5f, -1.5f), noise.noise(-0.5f, 254.5f));
	}

	//==================== Test continuity across cell boundaries ====================
	{
		GradientNoise noise(1234);
		const float eps = 1.0e-4f;
		for(int i=-10; i<=10; ++i)
		{
			const float b = (float)i;
			for(int z=0; z<8; ++z)
			{
				const float t = z * 0.13f + 0.05f;

				// Crossing a vertical cell boundary
				testAssert(std::fabs(noise.noise(b - eps, t) - noise.noise(b + eps, t)) < 1.0e-3f);
				// Crossing a horizontal cell boundary
				testAssert(std::fabs(noise.noise(t, b - eps) - noise.noise(t, b + eps)) < 1.0e-3f);
			}
		}
	}

	//==================== Test determinism ====================
	{
		GradientNoise a(2024);
		GradientNoise b(2024);
		for(int i=0; i<100; ++i)
		{
			const float x = i * 3.71f - 150.f;
			const float y = i * -1.37f + 20.f;
			testEqual(a.getNoise(x, y), b.getNoise(x, y));
			testEqual(a.getNoise(x, y), a.getNoise(x, y)); // Repeated evaluation gives the same result.
		}
	}

	//==================== Test fractal noise against reference values ====================
	// seed 42, frequency 0.02, 4 octaves, lacunarity 2, gain 0.5.
	{
		GradientNoise noise(42);
		noise.setFrequency(0.02f);
		noise.setFractalOctaves(4);
		noise.setFractalLacunarity(2.f);
		noise.setFractalGain(0.5f);

		testEqual(noise.getNoise(0, 0), 0.f);
		testEqual(noise.getNoise(0, 0), noise.fractalNoise(0, 0));

		testEpsEqualWithEps(noise.getNoise(3, 7), -0.008383005741248324f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(10.5f, -4.25f), -0.0821053801944471f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(123, 456), -0.1673012505068067f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(-50, -77), -0.012482246792533448f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(1, 2), -0.026956408282419297f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(7, 7), -0.10109457055795892f, 1.0e-4f);

		// Single octave at the frequency-scaled point
		testEpsEqualWithEps(noise.noise(3 * 0.02f, 7 * 0.02f), -0.039913882686140295f, 1.0e-4f);
		testEpsEqualWithEps(noise.noise(123 * 0.02f, 456 * 0.02f), -0.37332284034551544f, 1.0e-4f);
		testEpsEqualWithEps(noise.noise(-50 * 0.02f, -77 * 0.02f), 0.03468061440000003f, 1.0e-4f);

		// getNoise is fractalNoise at the frequency-scaled point, when in range.
		testEqual(noise.getNoise(10.5f, -4.25f), noise.fractalNoise(10.5f * 0.02f, -4.25f * 0.02f));
	}

	// Default parameters with seed 1337
	{
		GradientNoise noise;
		testEpsEqualWithEps(noise.getNoise(10, 20), 0.023168667062857123f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(-123.4f, 567.8f), 0.05564530547712695f, 1.0e-4f);
	}

	//==================== Test fractal noise with a single octave is just the noise ====================
	{
		GradientNoise noise(5);
		noise.setFractalOctaves(1);
		for(int i=0; i<20; ++i)
		{
			const float x = i * 0.77f - 3.f;
			const float y = i * 0.31f + 1.f;
			testEqual(noise.fractalNoise(x, y), noise.noise(x, y));
		}
	}

	//==================== Test octave count floor ====================
	{
		GradientNoise a(11);
		GradientNoise b(11);
		a.setFractalOctaves(0);
		testEqual(a.getFractalOctaves(), 1);
		a.setFractalOctaves(-5);
		testEqual(a.getFractalOctaves(), 1);
		b.setFractalOctaves(1);
		for(int i=0; i<20; ++i)
			testEqual(a.getNoise(i * 13.1f, i * 7.3f), b.getNoise(i * 13.1f, i * 7.3f));
	}

	//==================== Test zero amplitude sum ====================
	{
		GradientNoise noise(42);
		noise.setFractalOctaves(2);
		noise.setFractalGain(-1.f); // Amplitudes are 1 and -1.
		testEqual(noise.fractalNoise(0.3f, 0.7f), 0.f);
		testEqual(noise.getNoise(30.f, 70.f), 0.f);
	}

	//==================== Test noise type fallback ====================
	{
		GradientNoise perlin(77);
		perlin.setFrequency(0.05f);
		perlin.setFractalOctaves(5);

		for(int t=0; t<GradientNoise::NUM_NOISE_TYPES; ++t)
		{
			GradientNoise other(77);
			other.setFrequency(0.05f);
			other.setFractalOctaves(5);
			other.setNoiseType((GradientNoise::NoiseType)t);

			testAssert(GradientNoise::isNoiseTypeImplemented((GradientNoise::NoiseType)t) == (t == GradientNoise::NoiseType_Perlin));

			for(int i=0; i<20; ++i)
				testEqual(other.getNoise(i * 5.5f, i * -3.25f), perlin.getNoise(i * 5.5f, i * -3.25f));
		}
	}

	//==================== Test noise type names ====================
	{
		testStringsEqual(GradientNoise::noiseTypeString(GradientNoise::NoiseType_OpenSimplex2), "OPEN_SIMPLEX_2");
		testStringsEqual(GradientNoise::noiseTypeString(GradientNoise::NoiseType_Perlin), "PERLIN");
		testStringsEqual(GradientNoise::noiseTypeString(GradientNoise::NoiseType_Value), "VALUE");

		for(int t=0; t<GradientNoise::NUM_NOISE_TYPES; ++t)
			testAssert(GradientNoise::noiseTypeForString(GradientNoise::noiseTypeString((GradientNoise::NoiseType)t)) == (GradientNoise::NoiseType)t);

		testAssert(GradientNoise::noiseTypeForString("perlin") == GradientNoise::NoiseType_Perlin);
		testAssert(GradientNoise::noiseTypeForString("Value_Cubic") == GradientNoise::NoiseType_ValueCubic);

		try
		{
			GradientNoise::noiseTypeForString("SIMPLEX");
			failTest("Expected exception");
		}
		catch(gradnoise::Exception&)
		{}
	}

	//==================== Test range bound ====================
	// Use parameters where the unclamped fractal sum can exceed [-1, 1].
	{
		GradientNoise noise(31337);
		noise.setFrequency(0.173f);
		noise.setFractalOctaves(6);
		noise.setFractalLacunarity(1.1f);
		noise.setFractalGain(-0.9f);

		for(int y=-40; y<40; ++y)
		for(int x=-40; x<40; ++x)
		{
			const float v = noise.getNoise(x * 1.3f, y * 0.7f);
			testAssert(v >= -1.f && v <= 1.f);
		}
	}
	{
		GradientNoise noise(8);
		noise.setFrequency(0.0371f);
		noise.setFractalOctaves(5);
		for(int y=0; y<64; ++y)
		for(int x=0; x<64; ++x)
		{
			const float v = noise.getNoise((float)x, (float)y);
			testAssert(v >= -1.f && v <= 1.f);
		}
	}

	//==================== Test range bound with extreme gains and octave counts ====================
	// The amplitude sums here exceed the float range, so must not be accumulated in float.
	{
		GradientNoise noise(42);
		noise.setFrequency(1.f);
		noise.setFractalOctaves(5);
		noise.setFractalGain(1.0e10f);
		const float v = noise.getNoise(0.5f, 0.3f);
		testAssert(v >= -1.f && v <= 1.f);
		testEpsEqualWithEps(v, 0.23475199998478075f, 1.0e-4f); // Dominated by the last octave.

		noise.setFractalOctaves(200);
		noise.setFractalGain(2.f);
		const float v2 = noise.getNoise(0.5f, 0.3f);
		testAssert(v2 >= -1.f && v2 <= 1.f);
		testAssert(std::fabs(v2) < 1.0e-6f);

		for(int i=0; i<50; ++i)
		{
			const float x = i * 7.7f - 100.f;
			const float y = i * -2.9f + 33.f;
			const float w = noise.getNoise(x, y);
			testAssert(w >= -1.f && w <= 1.f);
		}
	}

	// Degenerate configurations that make the fractal sum non-finite evaluate to 0.
	{
		GradientNoise noise(42);
		noise.setFrequency(1.f);
		noise.setFractalOctaves(3);
		noise.setFractalGain(std::numeric_limits<float>::infinity());
		testEqual(noise.getNoise(0.5f, 0.3f), 0.f);

		noise.setFractalGain(std::numeric_limits<float>::quiet_NaN());
		testEqual(noise.getNoise(0.5f, 0.3f), 0.f);

		noise.setFractalGain(0.5f);
		noise.setFrequency(std::numeric_limits<float>::quiet_NaN());
		testEqual(noise.getNoise(0.5f, 0.3f), 0.f);
	}

	//==================== Test configuration takes effect on the next evaluation ====================
	{
		GradientNoise noise(42);
		noise.setFrequency(0.37f);
		noise.setFractalOctaves(1);
		testEpsEqualWithEps(noise.getNoise(1, 0), -0.271205477046f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(0, 1), 0.168217701246f, 1.0e-4f);
		testEpsEqualWithEps(noise.getNoise(1, 1), -0.10298777580000001f, 1.0e-4f);

		noise.setFrequency(1.f);
		testEqual(noise.getNoise(1, 1), 0.f);
	}

	//==================== Test NoiseFieldSampler ====================
	// 2x2 grid, frequency 1, 1 octave: every sample point is a lattice point so all samples are 0.5.
	{
		GradientNoise noise(42);
		noise.setFrequency(1.f);
		noise.setFractalOctaves(1);

		Array2D<float> samples;
		NoiseFieldSampler::render(2, 2, noise, samples);
		testAssert(samples.getWidth() == 2 && samples.getHeight() == 2);
		for(size_t y=0; y<2; ++y)
		for(size_t x=0; x<2; ++x)
		{
			testEqual(samples.elem(x, y), (noise.noise((float)x, (float)y) + 1.f) * 0.5f);
			testEqual(samples.elem(x, y), 0.5f);
		}
	}

	// Non-square grid checked against direct evaluation, and reference values.
	{
		GradientNoise noise(42);
		noise.setFrequency(0.02f);
		noise.setFractalOctaves(4);

		Array2D<float> samples;
		NoiseFieldSampler::render(5, 3, noise, samples);
		testAssert(samples.getWidth() == 5 && samples.getHeight() == 3);
		testAssert(samples.numElements() == 15);

		for(size_t y=0; y<3; ++y)
		for(size_t x=0; x<5; ++x)
		{
			const float v = samples.elem(x, y);
			testEqual(v, NoiseFieldSampler::toUnitInterval(noise.getNoise((float)x, (float)y)));
			testEqual(samples.getData()[y * 5 + x], v); // Row-major layout
			testAssert(v >= 0.f && v <= 1.f);
		}

		testEqual(samples.elem(0, 0), 0.5f);
		testEpsEqualWithEps(samples.elem(1, 0), 0.478864f, 1.0e-4f);
		testEpsEqualWithEps(samples.elem(2, 0), 0.459759f, 1.0e-4f);
		testEpsEqualWithEps(samples.elem(0, 1), 0.501264f, 1.0e-4f);
		testEpsEqualWithEps(samples.elem(1, 1), 0.480128f, 1.0e-4f);
		testEpsEqualWithEps(samples.elem(2, 1), 0.460172f, 1.0e-4f);

		// Rendering again into the same array, and into a differently-sized array, gives the same result.
		Array2D<float> samples2(17, 9);
		NoiseFieldSampler::render(5, 3, noise, samples2);
		testAssert(samples2 == samples);
		NoiseFieldSampler::render(5, 3, noise, samples);
		testAssert(samples2 == samples);
	}

	// Empty grids
	{
		GradientNoise noise(42);
		Array2D<float> samples(3, 3);
		NoiseFieldSampler::render(0, 4, noise, samples);
		testAssert(samples.numElements() == 0);
		NoiseFieldSampler::render(4, 0, noise, samples);
		testAssert(samples.numElements() == 0);
	}

	//==================== Performance test ====================
	{
		GradientNoise noise(42);
		noise.setFrequency(0.008f);
		noise.setFractalOctaves(5);

		Timer timer;
		Array2D<float> samples;
		NoiseFieldSampler::render(550, 500, noise, samples);
		conPrint("Rendered 550 x 500 samples in " + timer.elapsedStringNSigFigs(4));
	}

	conPrint("NoiseTests::test() done.");
}


#endif // BUILD_TESTS
