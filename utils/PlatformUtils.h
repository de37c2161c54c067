/*=====================================================================
PlatformUtils.h
---------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Exception.h"
#include <string>


namespace PlatformUtils
{


class PlatformUtilsExcep : public gradnoise::Exception
{
public:
	PlatformUtilsExcep(const std::string& s_) : gradnoise::Exception(s_) {}
	~PlatformUtilsExcep(){}
};


// Returns a directory for temporary files, without a trailing path separator.
const std::string getTempDirPath(); // throws PlatformUtilsExcep

// Returns a description of the last OS error on this thread (GetLastError() on Windows, errno elsewhere).
const std::string getLastErrorString();

#if defined(_WIN32)
const std::string getErrorStringForCode(unsigned long error_code);
#else
const std::string getErrorStringForCode(int error_code);
#endif


} // end namespace PlatformUtils
