/*=====================================================================
TestUtils.h
-----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../maths/mathstypes.h"
#include "StringUtils.h"
#include <string>

// Wrap test assert functions in macros, so we can print out a nice error messsage with the variable names and line number.

#define testAssert(expr) (TestUtils::doTestAssert((expr), (#expr), (__LINE__), (__FILE__)))


#define testEqual(a, b) (TestUtils::doTestEqual((a), (b), (#a), (#b), (__LINE__), (__FILE__)))
#define testStringsEqual(a, b) (TestUtils::doTestStringsEqual((a), (b), (#a), (#b), (__LINE__), (__FILE__)))

#define testEpsEqual(a, b) (TestUtils::doTestEpsEqual((a), (b), (#a), (#b), (__LINE__), (__FILE__)))
#define testEpsEqualWithEps(a, b, eps) (TestUtils::doTestEpsEqualWithEps((a), (b), (eps), (#a), (#b), (#eps), (__LINE__), (__FILE__)))


#define failTest(message) (TestUtils::doFailTest((message), (__LINE__), (__FILE__)))


namespace TestUtils
{


void doTestAssert(bool expr, const char* test, long line, const char* file);


template <class T>
inline void doTestEqual(const T& a, const T& b, const char* a_str, const char* b_str, long line, const char* file);

void doTestStringsEqual(const std::string& a, const std::string& b, const char* a_str, const char* b_str, long line, const char* file);

template <class T>
inline void doTestEpsEqual(const T& a, const T& b, const char* a_str, const char* b_str, long line, const char* file);
template <class T>
inline void doTestEpsEqualWithEps(const T& a, const T& b, float eps, const char* a_str, const char* b_str, const char* eps_str, long line, const char* file);


void doFailTest(const std::string& msg, long line, const char* file);

void printMessageAndFail(const std::string& msg);




//======================= Inline definitions ======================

template <class T>
void doTestEqual(const T& a, const T& b, const char* a_str, const char* b_str, long line, const char* file)
{
	if(a != b)
	{
		printMessageAndFail("Test equal failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + 
			a_str + "=" + toString(a) + " was not equal to " + b_str + "=" + toString(b));
	}
}


template <class T>
void doTestEpsEqual(const T& a, const T& b, const char* a_str, const char* b_str, long line, const char* file)
{
	if(!epsEqual(a, b))
	{
		printMessageAndFail("Test epsEqual failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + 
			a_str + "=" + toString(a) + " was not equal to " + b_str + "=" + toString(b));
	}
}


template <class T>
void doTestEpsEqualWithEps(const T& a, const T& b, float eps, const char* a_str, const char* b_str, const char* eps_str, long line, const char* file)
{
	if(!epsEqual(a, b, (T)eps))
	{
		printMessageAndFail("Test epsEqual failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + 
			a_str + "=" + toString(a) + " was not equal to " + b_str + "=" + toString(b) + " with " + eps_str + "=" + toString(eps));
	}
}


}
