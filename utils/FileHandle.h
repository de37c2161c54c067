/*=====================================================================
FileHandle.h
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Platform.h"
#include <string>
#include <cstdio>


/*=====================================================================
FileHandle
----------
A wrapper around FILE* which takes care of fclose()ing the file pointer,
by calling it in the destructor.
=====================================================================*/
class FileHandle
{
public:
	FileHandle();
	FileHandle(const std::string& pathname, const std::string& openmode); // throws gradnoise::Exception
	~FileHandle();

	void open(const std::string& pathname, const std::string& openmode); // throws gradnoise::Exception

	// Closes the file, checking for errors from flushing buffered writes.
	void close(); // throws gradnoise::Exception

	FILE* getFile() { return f; }

private:
	GRADNOISE_DISABLE_COPY(FileHandle)

	FILE* f;
	std::string path;
};
