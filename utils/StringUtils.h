/*=====================================================================
StringUtils.h
-------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Platform.h"
#include "Exception.h"
#include <string>
#include <vector>


class StringUtilsExcep : public gradnoise::Exception
{
public:
	StringUtilsExcep(const std::string& msg) : gradnoise::Exception(msg) {}
	~StringUtilsExcep(){}
};


//====================== String to Number conversion ======================
// These functions ignore the current locale.  Decimal separator is always considered to be '.'.
// The whole string must be consumed, e.g. "12abc" is not a valid int.

float stringToFloat(const std::string& s); // throws StringUtilsExcep
double stringToDouble(const std::string& s); // throws StringUtilsExcep

int stringToInt(const std::string& s); // throws StringUtilsExcep
uint64 stringToUInt64(const std::string& s); // throws StringUtilsExcep
uint32 stringToUInt32(const std::string& s); // throws StringUtilsExcep, including if the value is >= 2^32.


//====================== Number to String conversion ======================

const std::string int32ToString(int32 i);
const std::string int64ToString(int64 i);
const std::string uInt32ToString(uint32 x);
const std::string uInt64ToString(uint64 x);

// These functions write the shortest string such that they can be re-read to get the original number.
const std::string floatToString(float f);
const std::string doubleToString(double d);

const std::string doubleToStringNDecimalPlaces(double d, int num_decimal_places); // e.g. (-0.0821, 3) -> "-0.082"

const std::string doubleToStringNSigFigs(double d, int num_sig_figs = 4);


// Overloaded toString functions:
inline const std::string toString(double f)
{
	return doubleToString(f);
}

inline const std::string toString(float f)
{
	return floatToString(f);
}

inline const std::string toString(int32 i)
{
	return int32ToString(i);
}

inline const std::string toString(int64 i)
{
	return int64ToString(i);
}

inline const std::string toString(uint32 x)
{
	return uInt32ToString(x);
}

inline const std::string toString(uint64 x)
{
	return uInt64ToString(x);
}

#if defined(__APPLE__)
// On Mac, size_t is not the same type as uint64.  So need to define this to avoid an error about ambigious function calls.
inline const std::string toString(size_t x)
{
	return uInt64ToString(x);
}
#endif


//====================== Misc ======================

const std::string toUpperCase(const std::string& text);

bool startsWith(const std::string& s, const std::string& prefix);

// Joins the strings with the separator between each one, e.g. join(["a", "b"], ", ") = "a, b"
const std::string join(const std::vector<std::string>& strings, const std::string& separator);


namespace StringUtils
{

void test();

}
