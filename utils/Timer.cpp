/*=====================================================================
Timer.cpp
---------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "Timer.h"


#include "StringUtils.h"


const std::string Timer::elapsedStringNSigFigs(int n) const
{
	const double t = elapsed();
	if(t < 1.0)
		return doubleToStringNSigFigs(t * 1.0e3, n) + " ms";
	else
		return doubleToStringNSigFigs(t, n) + " s";
}
