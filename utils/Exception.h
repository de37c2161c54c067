/*=====================================================================
Exception.h
-----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
// Not using pragma once since we copy this file and pragma once is path based
#ifndef GRADNOISE_EXCEPTION_H
#define GRADNOISE_EXCEPTION_H


#include <string>


namespace gradnoise
{


// Base exception class
class Exception
{
public:
	Exception(const std::string& s_) : s(s_) {}
	~Exception(){}

	const std::string& what() const { return s; }
private:
	std::string s;
};


}


#endif // GRADNOISE_EXCEPTION_H
