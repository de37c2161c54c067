/*=====================================================================
ArgumentParser.h
----------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "Exception.h"
#include <vector>
#include <string>
#include <map>


class ArgumentParserExcep : public gradnoise::Exception
{
public:
	ArgumentParserExcep(const std::string& s_) : gradnoise::Exception(s_) {}
};


/*=====================================================================
ArgumentParser
--------------
For parsing command line arguments.

Use like this:

std::map<std::string, std::vector<ArgumentParser::ArgumentType> > syntax;
syntax["--output"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_string); // One string arg
syntax["--help"] = std::vector<ArgumentParser::ArgumentType>(); // Zero args
syntax["--size"] = std::vector<ArgumentParser::ArgumentType>(2, ArgumentParser::ArgumentType_int); // 2 int args

ArgumentParser parser(args, syntax, false);

args[0] is the program name and is skipped.
=====================================================================*/
class ArgumentParser
{
public:
	enum ArgumentType
	{
		ArgumentType_string,
		ArgumentType_int,
		ArgumentType_double
	};

	class ParsedArg
	{
	public:
		ParsedArg() : double_val(-666.0), int_val(-666), type(ArgumentType_string) {}
		~ParsedArg(){}

		std::string string_val;
		double double_val;
		int int_val;
		ArgumentType type;

		const std::string toString() const;
	};


	ArgumentParser(const std::vector<std::string>& args, const std::map<std::string, std::vector<ArgumentType> >& syntax, bool allow_unnamed_arg); // Throws ArgumentParserExcep
	ArgumentParser();

	~ArgumentParser();

	bool isArgPresent(const std::string& name) const { return parsed_args.find(name) != parsed_args.end(); }

	const std::string getArgStringValue(const std::string& name, unsigned int value_index = 0) const; // Throws ArgumentParserExcep
	int getArgIntValue(const std::string& name, unsigned int value_index = 0) const; // Throws ArgumentParserExcep
	double getArgDoubleValue(const std::string& name, unsigned int value_index = 0) const; // Throws ArgumentParserExcep

	const std::string getUnnamedArg() const { return unnamed_arg; }

	const std::vector<std::string> getArgs() const;
	const std::string getArgsAsString() const;

	static void test();

private:
	const std::vector<ParsedArg>& getValues(const std::string& name, unsigned int value_index, ArgumentType type) const;

	std::map<std::string, std::vector<ArgumentType> > syntax;
	std::map<std::string, std::vector<ParsedArg> > parsed_args;
	std::string unnamed_arg;
};
