/*=====================================================================
MTwister.cpp
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "MTwister.h"


static const uint32 MATRIX_A   = 0x9908b0dfu; // constant vector a
static const uint32 UPPER_MASK = 0x80000000u; // most significant w-r bits
static const uint32 LOWER_MASK = 0x7fffffffu; // least significant r bits


MTwister::MTwister(uint32 seed)
:	mti(N + 1)
{
	init_by_array(&seed, 1);
}


MTwister::~MTwister()
{
}


void MTwister::init_genrand(uint32 s)
{
	mt[0] = s;
	for(mti=1; mti<N; mti++)
		mt[mti] = 1812433253u * (mt[mti-1] ^ (mt[mti-1] >> 30)) + (uint32)mti;
}


void MTwister::init_by_array(const uint32* init_key, int key_length)
{
	assert(key_length >= 1);

	init_genrand(19650218u);

	int i = 1;
	int j = 0;
	for(int k = myMax(N, key_length); k > 0; k--)
	{
		mt[i] = (mt[i] ^ ((mt[i-1] ^ (mt[i-1] >> 30)) * 1664525u)) + init_key[j] + (uint32)j; // non linear
		i++;
		j++;
		if(i >= N) { mt[0] = mt[N-1]; i = 1; }
		if(j >= key_length) j = 0;
	}
	for(int k = N - 1; k > 0; k--)
	{
		mt[i] = (mt[i] ^ ((mt[i-1] ^ (mt[i-1] >> 30)) * 1566083941u)) - (uint32)i; // non linear
		i++;
		if(i >= N) { mt[0] = mt[N-1]; i = 1; }
	}

	mt[0] = 0x80000000u; // MSB is 1, assuring non-zero initial array
}


uint32 MTwister::genrand_int32()
{
	if(mti >= N) // Generate N words at one time
	{
		if(mti == N + 1) // If init_genrand() has not been called, a default initial seed is used.
			init_genrand(5489u);

		int kk;
		for(kk=0; kk<N-M; kk++)
		{
			const uint32 y = (mt[kk] & UPPER_MASK) | (mt[kk+1] & LOWER_MASK);
			mt[kk] = mt[kk+M] ^ (y >> 1) ^ ((y & 1u) ? MATRIX_A : 0u);
		}
		for(; kk<N-1; kk++)
		{
			const uint32 y = (mt[kk] & UPPER_MASK) | (mt[kk+1] & LOWER_MASK);
			mt[kk] = mt[kk+(M-N)] ^ (y >> 1) ^ ((y & 1u) ? MATRIX_A : 0u);
		}
		const uint32 y = (mt[N-1] & UPPER_MASK) | (mt[0] & LOWER_MASK);
		mt[N-1] = mt[M-1] ^ (y >> 1) ^ ((y & 1u) ? MATRIX_A : 0u);

		mti = 0;
	}

	uint32 y = mt[mti++];

	// Tempering
	y ^= (y >> 11);
	y ^= (y << 7) & 0x9d2c5680u;
	y ^= (y << 15) & 0xefc60000u;
	y ^= (y >> 18);

	return y;
}


uint32 MTwister::randBelow(uint32 n)
{
	assert(n > 0);

	// Use the bit length of n, not n - 1, so that n = 1 still draws a single bit.
	const int k = Maths::bitLength(n);

	uint32 r = getRandBits(k);
	while(r >= n)
		r = getRandBits(k);
	return r;
}


#if BUILD_TESTS


#include "TestUtils.h"
#include "ConPrint.h"


void MTwister::test()
{
	conPrint("MTwister::test()");

	// Reference output from mt19937ar.out: init_by_array({0x123, 0x234, 0x345, 0x456}, 4)
	{
		MTwister rng(0);
		const uint32 key[4] = { 0x123, 0x234, 0x345, 0x456 };
		rng.init_by_array(key, 4);
		testEqual(rng.genrand_int32(), (uint32)1067595299u);
		testEqual(rng.genrand_int32(), (uint32)955945823u);
		testEqual(rng.genrand_int32(), (uint32)477289528u);
	}

	// init_genrand(5489) is the C++ std::mt19937 default seed; its first output is 3499211612.
	{
		MTwister rng(0);
		rng.init_genrand(5489u);
		testEqual(rng.genrand_int32(), (uint32)3499211612u);
	}

	// Single word key seeding, as used by the constructor.
	{
		MTwister rng(42);
		testEqual(rng.genrand_int32(), (uint32)2746317213u);
		testEqual(rng.genrand_int32(), (uint32)478163327u);
		testEqual(rng.genrand_int32(), (uint32)107420369u);
	}

	// Same seed gives the same sequence.
	{
		MTwister a(1337);
		MTwister b(1337);
		for(int i=0; i<2000; ++i) // Cross the state regeneration boundary (N = 624) a few times.
			testAssert(a.genrand_int32() == b.genrand_int32());
	}

	// getRandBits takes the high bits.
	{
		MTwister a(7);
		MTwister b(7);
		const uint32 full = a.genrand_int32();
		testEqual(b.getRandBits(8), full >> 24);
	}

	// randBelow stays in range, and randBelow(1) is always 0.
	{
		MTwister rng(99);
		for(int i=0; i<1000; ++i)
		{
			testAssert(rng.randBelow(1) == 0);
			testAssert(rng.randBelow(256) < 256);
			testAssert(rng.randBelow(3) < 3);
		}
	}

	// unitRandom is in [0, 1)
	{
		MTwister rng(3);
		for(int i=0; i<1000; ++i)
		{
			const float x = rng.unitRandom();
			testAssert(x >= 0.f && x < 1.f);
		}
	}

	conPrint("MTwister::test() done.");
}


#endif // BUILD_TESTS
