/*=====================================================================
Clock.cpp
---------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "Clock.h"


#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#include <windows.h>
#else
#include <sys/time.h>
#include <cstddef>
#endif


namespace Clock
{


#if defined(_WIN32)
static double clock_period = 0;
#endif


void init()
{
#if defined(_WIN32)
	LARGE_INTEGER freq;
	QueryPerformanceFrequency(&freq);
	clock_period = 1.0 / (double)freq.QuadPart;
#endif
}


double getCurTimeRealSec()
{
#if defined(_WIN32)
	LARGE_INTEGER count;
	QueryPerformanceCounter(&count);
	return (double)count.QuadPart * clock_period;
#else
	struct timeval t;
	gettimeofday(&t, NULL);
	return (double)t.tv_sec + (double)t.tv_usec * 0.000001;
#endif
}


} // end namespace Clock
