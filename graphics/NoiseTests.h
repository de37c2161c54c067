/*=====================================================================
NoiseTests.h
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


/*=====================================================================
NoiseTests
----------
Tests for GradientNoise and NoiseFieldSampler.
=====================================================================*/
namespace NoiseTests
{

void test();

}
