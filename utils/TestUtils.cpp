/*=====================================================================
TestUtils.cpp
-------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "TestUtils.h"


#include "ConPrint.h"
#include <stdlib.h>


namespace TestUtils
{


void doTestAssert(bool expr, const char* test, long line, const char* file)
{
	if(!expr)
		printMessageAndFail("Test Assertion Failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + std::string(test));
}


void doTestStringsEqual(const std::string& a, const std::string& b, const char* a_str, const char* b_str, long line, const char* file)
{
	if(a != b)
	{
		printMessageAndFail("Test strings equal failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + 
			a_str + "='" + a + "' was not equal to " + b_str + "='" + b + "'");
	}
}


void doFailTest(const std::string& msg, long line, const char* file)
{
	printMessageAndFail("Test Failed: " + std::string(file) + ", line " + toString((int)line) + ":\n" + msg);
}


void printMessageAndFail(const std::string& msg)
{
	stdErrPrint(msg);
	exit(1);
}


}
