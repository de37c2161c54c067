/*=====================================================================
MTwister.h
----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../maths/mathstypes.h"


/*=====================================================================
MTwister
--------
Mersenne Twister MT19937, see
http://www.math.sci.hiroshima-u.ac.jp/m-mat/MT/MT2002/emt19937ar.html

The output sequence for a given seed must never change, since it
determines the permutation table of GradientNoise.
=====================================================================*/
class MTwister
{
public:
	// Seeds with init_by_array() using the single key word 'seed'.
	MTwister(uint32 seed);

	~MTwister();

	void init_genrand(uint32 s);
	void init_by_array(const uint32* init_key, int key_length);

	// Returns a random float in [0, 1)
	inline float unitRandom() { return genrand_int32() * Maths::uInt32ToUnitFloatScale(); }

	uint32 genrand_int32();

	// Returns the k most significant bits of the next output.  1 <= k <= 32.
	inline uint32 getRandBits(int k);

	// Returns an integer uniformly distributed in [0, n), by rejection sampling getRandBits().  n must be > 0.
	uint32 randBelow(uint32 n);

	static void test();

private:
	static const int N = 624;
	static const int M = 397;

	uint32 mt[N]; // the array for the state vector
	int mti; // mti==N+1 means mt[N] is not initialized
};


uint32 MTwister::getRandBits(int k)
{
	assert(k >= 1 && k <= 32);
	return genrand_int32() >> (32 - k);
}
