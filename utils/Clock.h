/*=====================================================================
Clock.h
-------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


namespace Clock
{


// This needs to be called before getCurTimeRealSec() is used.
void init();


// IMPORTANT NOTE: must call Clock::init() first.
double getCurTimeRealSec();


}
