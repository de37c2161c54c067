/*=====================================================================
gradnoise_tests.cpp
-------------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "../graphics/NoiseTests.h"
#include "../graphics/PNGWriter.h"
#include "../utils/MTwister.h"
#include "../utils/StringUtils.h"
#include "../utils/ArgumentParser.h"
#include "../utils/CryptoRNG.h"
#include "../utils/ConPrint.h"
#include "../utils/Clock.h"
#include "../utils/Timer.h"


// Runs all unit tests.  Test failures print a message and exit the process with a non-zero status.
int main(int /*argc*/, char** /*argv*/)
{
	Clock::init();

#if BUILD_TESTS
	Timer timer;

	StringUtils::test();
	MTwister::test();
	ArgumentParser::test();
	CryptoRNG::test();
	NoiseTests::test();
	PNGWriter::test();

	conPrint("All tests passed.  Elapsed: " + timer.elapsedStringNSigFigs(4));
	return 0;
#else
	stdErrPrint("Tests were not compiled, build with BUILD_TESTS=1.");
	return 1;
#endif
}
