/*=====================================================================
ArgumentParser.cpp
------------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "ArgumentParser.h"


#include "StringUtils.h"
#include <assert.h>


ArgumentParser::ArgumentParser(const std::vector<std::string>& args, const std::map<std::string, std::vector<ArgumentType> >& syntax_, bool allow_unnamed_arg)
:	syntax(syntax_)
{
	// Parse
	bool parsed_free_arg = false;
	for(int i=1; i<(int)args.size(); ++i)
	{
		const std::string name = args[i];
		if(syntax.find(name) == syntax.end())
		{
			if(!allow_unnamed_arg || parsed_free_arg)
				throw ArgumentParserExcep("Unknown option '" + name + "'");

			parsed_free_arg = true;
			unnamed_arg = args[i];
		}
		else
		{
			const std::vector<ArgumentType>& arg_types = syntax[name];

			parsed_args[name] = std::vector<ParsedArg>();

			for(unsigned int z=0; z<arg_types.size(); ++z)
			{
				i++;
				if(i >= (int)args.size())
					throw ArgumentParserExcep("Failed to find expected token following '" + name + "'");

				try
				{
					parsed_args[name].push_back(ParsedArg());
					if(arg_types[z] == ArgumentType_string)
					{
						parsed_args[name].back().string_val = args[i];
					}
					else if(arg_types[z] == ArgumentType_int)
					{
						parsed_args[name].back().int_val = ::stringToInt(args[i]);
					}
					else if(arg_types[z] == ArgumentType_double)
					{
						parsed_args[name].back().double_val = ::stringToDouble(args[i]);
					}
					else
					{
						assert(0);
					}

					parsed_args[name].back().type = arg_types[z];
				}
				catch(StringUtilsExcep& e)
				{
					throw ArgumentParserExcep("Invalid value for '" + name + "': " + e.what());
				}
			}
		}
	}
}


ArgumentParser::ArgumentParser()
{}


ArgumentParser::~ArgumentParser()
{}


const std::vector<std::string> ArgumentParser::getArgs() const
{
	std::vector<std::string> res;

	if(unnamed_arg != "")
		res.push_back(unnamed_arg);

	for(std::map<std::string, std::vector<ParsedArg> >::const_iterator i = parsed_args.begin(); i != parsed_args.end(); ++i)
	{
		res.push_back((*i).first);
		for(unsigned int z=0; z<(*i).second.size(); ++z)
			res.push_back((*i).second[z].toString());
	}
	return res;
}


const std::vector<ArgumentParser::ParsedArg>& ArgumentParser::getValues(const std::string& name, unsigned int value_index, ArgumentType type) const
{
	std::map<std::string, std::vector<ParsedArg> >::const_iterator res = parsed_args.find(name);
	if(res == parsed_args.end())
		throw ArgumentParserExcep("arg with name '" + name + "' not present.");

	const std::vector<ParsedArg>& values = (*res).second;

	if(value_index >= values.size())
		throw ArgumentParserExcep("value_index out of bounds");

	if(values[value_index].type != type)
		throw ArgumentParserExcep("incorrect type");

	return values;
}


const std::string ArgumentParser::getArgStringValue(const std::string& name, unsigned int value_index) const
{
	return getValues(name, value_index, ArgumentType_string)[value_index].string_val;
}


int ArgumentParser::getArgIntValue(const std::string& name, unsigned int value_index) const
{
	return getValues(name, value_index, ArgumentType_int)[value_index].int_val;
}


double ArgumentParser::getArgDoubleValue(const std::string& name, unsigned int value_index) const
{
	return getValues(name, value_index, ArgumentType_double)[value_index].double_val;
}


const std::string ArgumentParser::getArgsAsString() const
{
	return join(getArgs(), " ");
}


const std::string ArgumentParser::ParsedArg::toString() const
{
	switch(type)
	{
	case ArgumentType_string:
		return string_val;
	case ArgumentType_int:
		return ::toString((int32)int_val);
	case ArgumentType_double:
		return ::toString(double_val);
	default:
		assert(0);
		return "ERROR";
	};
}


#if BUILD_TESTS


#include "TestUtils.h"
#include "ConPrint.h"


static std::map<std::string, std::vector<ArgumentParser::ArgumentType> > makeTestSyntax()
{
	std::map<std::string, std::vector<ArgumentParser::ArgumentType> > syntax;
	syntax["--width"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_int);
	syntax["--gain"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_double);
	syntax["--output"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_string);
	syntax["--size"] = std::vector<ArgumentParser::ArgumentType>(2, ArgumentParser::ArgumentType_int);
	syntax["--help"] = std::vector<ArgumentParser::ArgumentType>();
	return syntax;
}


static std::vector<std::string> makeArgs(const char* const* argv, size_t num)
{
	return std::vector<std::string>(argv, argv + num);
}


void ArgumentParser::test()
{
	conPrint("ArgumentParser::test()");

	const std::map<std::string, std::vector<ArgumentType> > syntax = makeTestSyntax();

	try
	{
		// Just the program name
		{
			const char* argv[] = { "noisegen" };
			ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
			testAssert(!parser.isArgPresent("--width"));
			testAssert(!parser.isArgPresent("--help"));
			testAssert(parser.getArgs().empty());
		}

		{
			const char* argv[] = { "noisegen", "--width", "550", "--gain", "0.5", "--output", "out.png", "--help", "--size", "3", "-4" };
			ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
			testAssert(parser.isArgPresent("--help"));
			testEqual(parser.getArgIntValue("--width"), 550);
			testAssert(parser.getArgDoubleValue("--gain") == 0.5);
			testStringsEqual(parser.getArgStringValue("--output"), "out.png");
			testEqual(parser.getArgIntValue("--size", 0), 3);
			testEqual(parser.getArgIntValue("--size", 1), -4);
			testStringsEqual(parser.getArgsAsString(), "--gain 0.5 --help --output out.png --size 3 -4 --width 550");

			// Wrong type
			try
			{
				parser.getArgStringValue("--width");
				failTest("Expected ArgumentParserExcep");
			}
			catch(ArgumentParserExcep&)
			{}

			// Index out of bounds
			try
			{
				parser.getArgIntValue("--size", 2);
				failTest("Expected ArgumentParserExcep");
			}
			catch(ArgumentParserExcep&)
			{}
		}

		// Unnamed arg
		{
			const char* argv[] = { "noisegen", "somefile.png", "--width", "10" };
			ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, true);
			testStringsEqual(parser.getUnnamedArg(), "somefile.png");
			testEqual(parser.getArgIntValue("--width"), 10);
		}
	}
	catch(ArgumentParserExcep& e)
	{
		failTest(e.what());
	}

	// Unknown option
	try
	{
		const char* argv[] = { "noisegen", "--colour", "red" };
		ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
		failTest("Expected ArgumentParserExcep");
	}
	catch(ArgumentParserExcep&)
	{}

	// Second unnamed arg is not allowed.
	try
	{
		const char* argv[] = { "noisegen", "a.png", "b.png" };
		ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, true);
		failTest("Expected ArgumentParserExcep");
	}
	catch(ArgumentParserExcep&)
	{}

	// Missing value
	try
	{
		const char* argv[] = { "noisegen", "--width" };
		ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
		failTest("Expected ArgumentParserExcep");
	}
	catch(ArgumentParserExcep&)
	{}

	// Value that doesn't parse
	try
	{
		const char* argv[] = { "noisegen", "--width", "wide" };
		ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
		failTest("Expected ArgumentParserExcep");
	}
	catch(ArgumentParserExcep&)
	{}

	try
	{
		const char* argv[] = { "noisegen", "--gain", "0.5.5" };
		ArgumentParser parser(makeArgs(argv, staticArrayNumElems(argv)), syntax, false);
		failTest("Expected ArgumentParserExcep");
	}
	catch(ArgumentParserExcep&)
	{}

	conPrint("ArgumentParser::test() done.");
}


#endif // BUILD_TESTS
