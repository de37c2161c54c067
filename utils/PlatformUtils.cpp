/*=====================================================================
PlatformUtils.cpp
-----------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "PlatformUtils.h"


#include "StringUtils.h"
#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX 1
#endif
#include <windows.h>
#else
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#endif


const std::string PlatformUtils::getTempDirPath() // throws PlatformUtilsExcep
{
#if defined(_WIN32)
	char path[MAX_PATH + 1];
	const DWORD num_chars = GetTempPathA(MAX_PATH + 1, path);
	if(num_chars == 0 || num_chars > MAX_PATH)
		throw PlatformUtilsExcep("GetTempPath() failed: " + getLastErrorString());

	std::string p(path, num_chars);
	if(!p.empty() && p[p.size() - 1] == '\\')
		p.erase(p.size() - 1); // Remove trailing backslash.
	return p;
#else
	const char* tmpdir = getenv("TMPDIR");
	if(tmpdir && tmpdir[0] != '\0')
	{
		std::string p(tmpdir);
		if(p.size() > 1 && p[p.size() - 1] == '/')
			p.erase(p.size() - 1);
		return p;
	}
	return "/tmp";
#endif
}


#if defined(_WIN32)

const std::string PlatformUtils::getErrorStringForCode(unsigned long error_code)
{
	char buf[2048];
	const DWORD result = FormatMessageA(
		FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
		NULL, // source
		error_code,
		MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
		buf,
		(DWORD)sizeof(buf),
		NULL // arguments
	);
	if(result == 0)
		return "[Unknown (error code=" + toString((uint32)error_code) + ")]";

	// The formatted message contains a trailing newline (\r\n), remove it.
	std::string s(buf, result);
	while(!s.empty() && (s[s.size() - 1] == '\n' || s[s.size() - 1] == '\r'))
		s.erase(s.size() - 1);
	return s + " (code " + toString((uint32)error_code) + ")";
}

#else

const std::string PlatformUtils::getErrorStringForCode(int error_code)
{
	char buf[4096];
#if defined(__APPLE__) || ((_POSIX_C_SOURCE >= 200112L || _XOPEN_SOURCE >= 600) && !_GNU_SOURCE)
	// XSI-compliant version of strerror_r(), returns zero on success.
	if(strerror_r(error_code, buf, sizeof(buf)) == 0)
		return std::string(buf);
	else
		return "[Unknown (error code=" + toString(error_code) + ")]";
#else
	// GNU version, returns a pointer to the message, which may or may not be in buf.
	const char* msg = strerror_r(error_code, buf, sizeof(buf));
	return std::string(msg);
#endif
}

#endif


const std::string PlatformUtils::getLastErrorString()
{
#if defined(_WIN32)
	return getErrorStringForCode(GetLastError());
#else
	return getErrorStringForCode(errno);
#endif
}
