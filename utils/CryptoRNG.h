/*=====================================================================
CryptoRNG.h
-----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Platform.h"
#include <stddef.h> // For size_t


/*=====================================================================
CryptoRNG
---------
Random bytes from the OS entropy source.  Used for picking a seed when
the user doesn't supply one.
=====================================================================*/
namespace CryptoRNG
{


// Fill buffer with random bytes.
// May block on Linux if the entropy pool has not been initialised yet.
void getRandomBytes(uint8* buf, size_t buflen); // Throws gradnoise::Exception on failure.

// Returns a uniformly distributed integer in [0, n).  n must be > 0.
uint32 getRandomUInt32Below(uint32 n); // Throws gradnoise::Exception on failure.


void test();


} // End namespace CryptoRNG
