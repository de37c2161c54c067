/*=====================================================================
FileHandle.cpp
--------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "FileHandle.h"


#include "PlatformUtils.h"
#include "Exception.h"
#include <assert.h>


FileHandle::FileHandle()
:	f(NULL)
{
}


FileHandle::FileHandle(const std::string& pathname, const std::string& openmode)
:	f(NULL)
{
	open(pathname, openmode);
}


FileHandle::~FileHandle()
{
	if(f)
		fclose(f);
}


void FileHandle::open(const std::string& pathname, const std::string& openmode) // throws gradnoise::Exception
{
	assert(!f);

	// On Linux and OS X, fopen accepts UTF-8 encoded filenames natively.
	f = fopen(pathname.c_str(), openmode.c_str());
	if(!f)
		throw gradnoise::Exception("Failed to open file '" + pathname + "': " + PlatformUtils::getLastErrorString());

	path = pathname;
}


void FileHandle::close() // throws gradnoise::Exception
{
	if(f)
	{
		const int res = fclose(f);
		f = NULL;
		if(res != 0)
			throw gradnoise::Exception("Failed to close file '" + path + "': " + PlatformUtils::getLastErrorString());
	}
}
