/*=====================================================================
StringUtils.cpp
---------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "StringUtils.h"


#include "../maths/mathstypes.h"
#include <double-conversion/double-conversion.h>
#include <limits>


float stringToFloat(const std::string& s) // throws StringUtilsExcep
{
	double_conversion::StringToDoubleConverter s2d_converter(
		double_conversion::StringToDoubleConverter::NO_FLAGS,
		std::numeric_limits<double>::quiet_NaN(), // empty string value
		std::numeric_limits<double>::quiet_NaN(), // junk string value.  We'll use this to detect failed parses.
		NULL, // infinity symbol
		NULL // NaN symbol
	);

	int num_processed_chars = 0;
	const float x = s2d_converter.StringToFloat(s.c_str(), (int)s.length(), &num_processed_chars);
	if(::isNAN(x) || num_processed_chars != (int)s.length())
		throw StringUtilsExcep("Failed to convert '" + s + "' to a float.");
	return x;
}


double stringToDouble(const std::string& s) // throws StringUtilsExcep
{
	double_conversion::StringToDoubleConverter s2d_converter(
		double_conversion::StringToDoubleConverter::NO_FLAGS,
		std::numeric_limits<double>::quiet_NaN(), // empty string value
		std::numeric_limits<double>::quiet_NaN(), // junk string value.  We'll use this to detect failed parses.
		NULL, // infinity symbol
		NULL // NaN symbol
	);

	int num_processed_chars = 0;
	const double x = s2d_converter.StringToDouble(s.c_str(), (int)s.length(), &num_processed_chars);
	if(::isNAN(x) || num_processed_chars != (int)s.length())
		throw StringUtilsExcep("Failed to convert '" + s + "' to a double.");
	return x;
}


int stringToInt(const std::string& s) // throws StringUtilsExcep
{
	if(s.empty())
		throw StringUtilsExcep("Failed to convert '' to an int.");

	const bool negative = s[0] == '-';
	const size_t digits_begin = (s[0] == '-' || s[0] == '+') ? 1 : 0;
	if(digits_begin == s.size())
		throw StringUtilsExcep("Failed to convert '" + s + "' to an int.");

	// Accumulate as a positive int64, checking against the int32 range as we go.
	const int64 limit = negative ? -(int64)std::numeric_limits<int32>::min() : (int64)std::numeric_limits<int32>::max();
	int64 x = 0;
	for(size_t i=digits_begin; i<s.size(); ++i)
	{
		if(s[i] < '0' || s[i] > '9')
			throw StringUtilsExcep("Failed to convert '" + s + "' to an int: Invalid character '" + s[i] + "'");
		x = x * 10 + (s[i] - '0');
		if(x > limit)
			throw StringUtilsExcep("Failed to convert '" + s + "' to an int: Value is out of range.");
	}

	return (int)(negative ? -x : x);
}


uint64 stringToUInt64(const std::string& s) // throws StringUtilsExcep
{
	if(s.empty())
		throw StringUtilsExcep("Failed to convert '' to an uint64.");

	uint64 x = 0;
	for(size_t i=0; i<s.size(); ++i)
	{
		if(s[i] < '0' || s[i] > '9')
			throw StringUtilsExcep("Failed to convert '" + s + "' to an uint64: Invalid character '" + s[i] + "'");

		const uint64 digit = (uint64)(s[i] - '0');
		if(x > (std::numeric_limits<uint64>::max() - digit) / 10) // If x * 10 + digit will overflow...
			throw StringUtilsExcep("Failed to convert '" + s + "' to an uint64: Value is too large.");
		x = x * 10 + digit;
	}
	return x;
}


uint32 stringToUInt32(const std::string& s) // throws StringUtilsExcep
{
	const uint64 x = stringToUInt64(s);
	if(x > (uint64)std::numeric_limits<uint32>::max())
		throw StringUtilsExcep("Failed to convert '" + s + "' to an uint32: Value is too large.");
	return (uint32)x;
}


const std::string uInt64ToString(uint64 x)
{
	// Write digits backwards from the end of the buffer.
	char buffer[32];
	int i = (int)sizeof(buffer);
	do
	{
		const uint64 x_div_10 = x / 10u;
		buffer[--i] = '0' + (char)(x - x_div_10 * 10);
		x = x_div_10;
	}
	while(x != 0);

	return std::string(buffer + i, buffer + sizeof(buffer));
}


const std::string uInt32ToString(uint32 x)
{
	return uInt64ToString((uint64)x);
}


const std::string int64ToString(int64 i)
{
	if(i >= 0)
		return uInt64ToString((uint64)i);
	else
		return "-" + uInt64ToString(0 - (uint64)i); // Unsigned negation so that int64 min doesn't overflow.
}


const std::string int32ToString(int32 i)
{
	return int64ToString((int64)i);
}


const std::string floatToString(float f)
{
	// A float value of -0.0 may be passed in here.  We want to print "0" for this.
	if(f == 0 && !isNAN(f))
		return "0";

	double_conversion::DoubleToStringConverter converter(
		double_conversion::DoubleToStringConverter::NO_FLAGS,
		"Inf", // Infinity symbol
		"NaN", // NaN symbol
		'e',
		-6, // decimal_in_shortest_low
		21, // decimal_in_shortest_high
		0, // max_leading_padding_zeroes_in_precision_mode
		0 // max_trailing_padding_zeroes_in_precision_mode
	);

	char buffer[64];
	double_conversion::StringBuilder builder(buffer, sizeof(buffer));
	converter.ToShortestSingle(f, &builder);
	return std::string(builder.Finalize());
}


const std::string doubleToString(double d)
{
	if(d == 0 && !isNAN(d))
		return "0";

	double_conversion::DoubleToStringConverter converter(
		double_conversion::DoubleToStringConverter::NO_FLAGS,
		"Inf", // Infinity symbol
		"NaN", // NaN symbol
		'e',
		-6, // decimal_in_shortest_low
		21, // decimal_in_shortest_high
		0, // max_leading_padding_zeroes_in_precision_mode
		0 // max_trailing_padding_zeroes_in_precision_mode
	);

	char buffer[64];
	double_conversion::StringBuilder builder(buffer, sizeof(buffer));
	converter.ToShortest(d, &builder);
	return std::string(builder.Finalize());
}


const std::string doubleToStringNSigFigs(double d, int num_sig_figs)
{
	if(d == 0 && !isNAN(d))
		return "0";

	double_conversion::DoubleToStringConverter converter(
		double_conversion::DoubleToStringConverter::NO_FLAGS,
		"Inf", // Infinity symbol
		"NaN", // NaN symbol
		'e',
		-6, // decimal_in_shortest_low - not used for precision mode
		21, // decimal_in_shortest_high - not used for precision mode
		10, // max_leading_padding_zeroes_in_precision_mode - set this high to avoid formatting in exponential mode (e.g. 1.0e-8)
		10 // max_trailing_padding_zeroes_in_precision_mode - set this high to avoid formatting in exponential mode (e.g. 1.0e8)
	);

	// The result will never contain more than kMaxPrecisionDigits (=120) + 7 characters
	char buffer[128];
	double_conversion::StringBuilder builder(buffer, sizeof(buffer));

	// Sig figs has to be in this range for ToPrecision() to succeed.
	const int use_sig_figs = myClamp(num_sig_figs, (int)double_conversion::DoubleToStringConverter::kMinPrecisionDigits, (int)double_conversion::DoubleToStringConverter::kMaxPrecisionDigits);

	const bool res = converter.ToPrecision(d, use_sig_figs, &builder);
	if(!res)
		return doubleToString(d);

	return std::string(builder.Finalize());
}


const std::string doubleToStringNDecimalPlaces(double d, int num_decimal_places)
{
	double_conversion::DoubleToStringConverter converter(
		double_conversion::DoubleToStringConverter::NO_FLAGS,
		"Inf", // Infinity symbol
		"NaN", // NaN symbol
		'e',
		-6, // decimal_in_shortest_low - not used for fixed mode
		21, // decimal_in_shortest_high - not used for fixed mode
		0, // max_leading_padding_zeroes_in_precision_mode
		0 // max_trailing_padding_zeroes_in_precision_mode
	);

	char buffer[256];
	double_conversion::StringBuilder builder(buffer, sizeof(buffer));

	const int use_places = myClamp(num_decimal_places, 0, (int)double_conversion::DoubleToStringConverter::kMaxFixedDigitsAfterPoint);

	// ToFixed() fails for values >= 10^21 and for NaN/Inf.
	const bool res = converter.ToFixed(d, use_places, &builder);
	if(!res)
		return doubleToString(d);

	return std::string(builder.Finalize());
}


const std::string toUpperCase(const std::string& text)
{
	std::string upperstr = text;
	for(size_t i=0; i<upperstr.size(); ++i)
		if(upperstr[i] >= 'a' && upperstr[i] <= 'z')
			upperstr[i] = upperstr[i] - 'a' + 'A';

	return upperstr;
}


bool startsWith(const std::string& s, const std::string& prefix)
{
	return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}


const std::string join(const std::vector<std::string>& strings, const std::string& separator)
{
	std::string res;
	for(size_t i=0; i<strings.size(); ++i)
	{
		if(i > 0)
			res += separator;
		res += strings[i];
	}
	return res;
}


#if BUILD_TESTS


#include "TestUtils.h"
#include "ConPrint.h"


void StringUtils::test()
{
	conPrint("StringUtils::test()");

	//==================== stringToInt ====================
	testAssert(stringToInt("0") == 0);
	testAssert(stringToInt("550") == 550);
	testAssert(stringToInt("-3") == -3);
	testAssert(stringToInt("+7") == 7);
	testAssert(stringToInt("2147483647") == 2147483647);
	testAssert(stringToInt("-2147483648") == std::numeric_limits<int32>::min());

	const char* bad_ints[] = { "", "-", "12abc", "abc", "1.5", "2147483648", "-2147483649", " 1" };
	for(size_t i=0; i<staticArrayNumElems(bad_ints); ++i)
	{
		try
		{
			stringToInt(bad_ints[i]);
			failTest("Expected StringUtilsExcep for '" + std::string(bad_ints[i]) + "'");
		}
		catch(StringUtilsExcep&)
		{}
	}

	//==================== stringToUInt32 ====================
	testAssert(stringToUInt32("0") == 0);
	testAssert(stringToUInt32("999999") == 999999u);
	testAssert(stringToUInt32("4294967295") == 4294967295u);
	try
	{
		stringToUInt32("4294967296");
		failTest("Expected StringUtilsExcep");
	}
	catch(StringUtilsExcep&)
	{}
	try
	{
		stringToUInt32("-1");
		failTest("Expected StringUtilsExcep");
	}
	catch(StringUtilsExcep&)
	{}

	//==================== stringToFloat / stringToDouble ====================
	testAssert(stringToFloat("0.008") == 0.008f);
	testAssert(stringToFloat("-2") == -2.f);
	testAssert(stringToDouble("0.5") == 0.5);
	testAssert(stringToDouble("1e3") == 1000.0);
	try
	{
		stringToFloat("0.5x");
		failTest("Expected StringUtilsExcep");
	}
	catch(StringUtilsExcep&)
	{}
	try
	{
		stringToDouble("");
		failTest("Expected StringUtilsExcep");
	}
	catch(StringUtilsExcep&)
	{}

	//==================== Number to string ====================
	testStringsEqual(toString((int32)0), "0");
	testStringsEqual(toString((int32)-42), "-42");
	testStringsEqual(toString(std::numeric_limits<int32>::min()), "-2147483648");
	testStringsEqual(toString(std::numeric_limits<int64>::min()), "-9223372036854775808");
	testStringsEqual(toString((uint32)4294967295u), "4294967295");
	testStringsEqual(toString(0.008f), "0.008");
	testStringsEqual(toString(-0.0f), "0");
	testStringsEqual(toString(2.0), "2");
	testStringsEqual(doubleToStringNSigFigs(1.23456, 3), "1.23");
	testStringsEqual(doubleToStringNDecimalPlaces(-0.0821053, 3), "-0.082");
	testStringsEqual(doubleToStringNDecimalPlaces(0.5, 3), "0.500");
	testStringsEqual(doubleToStringNDecimalPlaces(12.0, 0), "12");

	//==================== Misc ====================
	testStringsEqual(toUpperCase("perlin_2"), "PERLIN_2");
	testAssert(startsWith("--width", "--"));
	testAssert(!startsWith("-", "--"));
	{
		std::vector<std::string> v;
		testStringsEqual(join(v, ", "), "");
		v.push_back("a");
		v.push_back("b");
		testStringsEqual(join(v, ", "), "a, b");
	}

	conPrint("StringUtils::test() done.");
}


#endif // BUILD_TESTS
