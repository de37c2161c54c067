/*=====================================================================
mathstypes.h
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../utils/Platform.h"
#include <cmath>
#include <cassert>


const double GRADNOISE_EPSILON = 0.00001;


template <class T>
GRADNOISE_STRONG_INLINE T myClamp(T x, T lowerbound, T upperbound)
{
	assert(lowerbound <= upperbound);

	return x < lowerbound ? lowerbound : (x > upperbound ? upperbound : x);
}


template <class T>
GRADNOISE_STRONG_INLINE const T myMax(const T x, const T y)
{
	return x >= y ? x : y;
}


template <class T>
void mySwap(T& x, T& y)
{
	const T temp = x;
	x = y;
	y = temp;
}


template <class Real>
inline bool isNAN(Real x)
{
	return std::isnan(x);
}


template <class Real>
inline bool isFinite(Real x)
{
	return std::isfinite(x);
}


template <class Real>
inline bool epsEqual(Real a, Real b, Real epsilon = (Real)GRADNOISE_EPSILON)
{
	// With fast-math enabled, comparisons are not checked for NAN compares (the 'unordered predicate').
	// So we need to do this explicitly ourselves.
	const Real fabs_diff = std::fabs(a - b);
	if(isNAN(fabs_diff))
		return false;
	return fabs_diff <= epsilon;
}


namespace Maths
{


// Multiply by this constant to convert a unsigned 32 bit integer to a float in [0, 1).
// 2.3283063E-10f is the next float value below 2^-32, so 0xFFFFFFFF maps to the largest float below 1.
inline float uInt32ToUnitFloatScale() { return 2.3283063E-10f; }


template <class T>
inline T lerp(const T& a, const T& b, float t)
{
	return a + (b - a) * t;
}


// Number of bits needed to represent x, e.g. bitLength(0) = 0, bitLength(1) = 1, bitLength(256) = 9.
inline int bitLength(uint32 x)
{
	int n = 0;
	while(x != 0)
	{
		x >>= 1;
		n++;
	}
	return n;
}


} // end namespace Maths
