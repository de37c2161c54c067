/*=====================================================================
CryptoRNG.cpp
-------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "CryptoRNG.h"


#include "Exception.h"
#include "PlatformUtils.h"
#include <limits>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#include <windows.h>
#include <wincrypt.h>
#elif defined(__APPLE__)
#include <Security/Security.h>
#else // Linux:
#include <sys/random.h>
#include <errno.h>
#endif


namespace CryptoRNG
{


void getRandomBytes(uint8* buf, size_t buflen)
{
	if(buflen == 0)
		return;

#ifdef _WIN32

	HCRYPTPROV provider;
	if(!CryptAcquireContext(
		&provider,
		NULL, // szContainer
		NULL, // szProvider - use default
		PROV_RSA_FULL, // dwProvType
		CRYPT_VERIFYCONTEXT // dwFlags - we do not require access to persisted private keys.
	))
		throw gradnoise::Exception("CryptAcquireContext failed: " + PlatformUtils::getLastErrorString());

	if(!CryptGenRandom(provider, (DWORD)buflen, buf))
	{
		const std::string err = PlatformUtils::getLastErrorString();
		CryptReleaseContext(provider, /*flags=*/0);
		throw gradnoise::Exception("CryptGenRandom failed: " + err);
	}

	if(!CryptReleaseContext(provider, /*flags=*/0))
		throw gradnoise::Exception("CryptReleaseContext failed: " + PlatformUtils::getLastErrorString());

#elif defined(__APPLE__)

	const int res = SecRandomCopyBytes(kSecRandomDefault, buflen, buf);
	if(res != 0)
		throw gradnoise::Exception("SecRandomCopyBytes failed: " + PlatformUtils::getLastErrorString());

#else // Linux:

	// getrandom() may return fewer bytes than requested for large requests, or be interrupted by a signal.
	size_t num_read = 0;
	while(num_read < buflen)
	{
		const ssize_t res = getrandom(buf + num_read, buflen - num_read, /*flags=*/0);
		if(res < 0)
		{
			if(errno == EINTR)
				continue;
			throw gradnoise::Exception("getrandom failed: " + PlatformUtils::getLastErrorString());
		}
		num_read += (size_t)res;
	}

#endif
}


uint32 getRandomUInt32Below(uint32 n)
{
	if(n == 0)
		throw gradnoise::Exception("getRandomUInt32Below: n must be > 0");

	// Reject values in the final partial block of size 2^32 mod n, to avoid modulo bias.
	const uint32 limit = std::numeric_limits<uint32>::max() - (std::numeric_limits<uint32>::max() % n + 1) % n;
	while(1)
	{
		uint32 x;
		getRandomBytes((uint8*)&x, sizeof(x));
		if(x <= limit)
			return x % n;
	}
}


} // end namespace CryptoRNG


#if BUILD_TESTS


#include "TestUtils.h"
#include "ConPrint.h"
#include "StringUtils.h"
#include "Timer.h"


void CryptoRNG::test()
{
	conPrint("CryptoRNG::test()");
	try
	{
		for(int i=0; i<16; ++i)
		{
			const int BUFSIZE = 16;
			uint8 data[BUFSIZE];
			Timer timer;
			CryptoRNG::getRandomBytes(data, i);
			const double elapsed = timer.elapsed();

			std::string s;
			for(int z=0; z<i; ++z)
				s += toString((uint32)data[z]) + " ";
			conPrint(s + "(generation took " + doubleToStringNSigFigs(elapsed * 1.0e3, 4) + " ms)");
		}

		// Two 16 byte draws should essentially never be equal.
		{
			uint8 a[16];
			uint8 b[16];
			CryptoRNG::getRandomBytes(a, sizeof(a));
			CryptoRNG::getRandomBytes(b, sizeof(b));
			bool all_equal = true;
			for(int z=0; z<16; ++z)
				if(a[z] != b[z])
					all_equal = false;
			testAssert(!all_equal);
		}

		//==================== getRandomUInt32Below ====================
		testAssert(CryptoRNG::getRandomUInt32Below(1) == 0);
		for(int i=0; i<1000; ++i)
		{
			const uint32 x = CryptoRNG::getRandomUInt32Below(1000000);
			testAssert(x < 1000000);
		}

		try
		{
			CryptoRNG::getRandomUInt32Below(0);
			failTest("Expected exception");
		}
		catch(gradnoise::Exception&)
		{}
	}
	catch(gradnoise::Exception& e)
	{
		failTest(e.what());
	}
	conPrint("CryptoRNG::test() done.");
}


#endif // BUILD_TESTS
