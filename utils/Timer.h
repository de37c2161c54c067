/*=====================================================================
Timer.h
-------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Clock.h"
#include <string>


class Timer
{
public:
	inline Timer();

	inline double elapsed() const { return Clock::getCurTimeRealSec() - time_started; }
	const std::string elapsedStringNSigFigs(int n) const; // Print with n significant figures.

private:
	double time_started;
};


Timer::Timer()
{
	time_started = Clock::getCurTimeRealSec();
}
