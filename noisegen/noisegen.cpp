/*=====================================================================
noisegen.cpp
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "../graphics/GradientNoise.h"
#include "../graphics/NoiseFieldSampler.h"
#include "../graphics/PNGWriter.h"
#include "../utils/ArgumentParser.h"
#include "../utils/CryptoRNG.h"
#include "../utils/StringUtils.h"
#include "../utils/ConPrint.h"
#include "../utils/Clock.h"
#include "../utils/Timer.h"
#include "../utils/Exception.h"
#include <map>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>


static const int DEFAULT_WIDTH = 550;
static const int DEFAULT_HEIGHT = 500;
static const double DEFAULT_FREQUENCY = 0.008;
static const int DEFAULT_OCTAVES = 5;
static const double DEFAULT_LACUNARITY = 2.0;
static const double DEFAULT_GAIN = 0.5;
static const char* DEFAULT_OUTPUT_PATH = "perlin_from_fastnoiselite_port.png";
static const uint32 MAX_RANDOM_SEED = 999999;


static void printUsage()
{
	conPrint("Usage: noisegen [options]");
	conPrint("Renders 2D fractal gradient noise to an 8 bit greyscale PNG.");
	conPrint("");
	conPrint("  --width N             Image width in pixels (default " + toString((int32)DEFAULT_WIDTH) + ")");
	conPrint("  --height N            Image height in pixels (default " + toString((int32)DEFAULT_HEIGHT) + ")");
	conPrint("  --seed N              32 bit seed (default: random in [0, " + toString(MAX_RANDOM_SEED) + "])");
	conPrint("  --frequency F         Base frequency (default " + toString(DEFAULT_FREQUENCY) + ")");
	conPrint("  --octaves N           Number of fractal octaves (default " + toString((int32)DEFAULT_OCTAVES) + ")");
	conPrint("  --lacunarity F        Frequency multiplier per octave (default " + toString(DEFAULT_LACUNARITY) + ")");
	conPrint("  --gain F              Amplitude multiplier per octave (default " + toString(DEFAULT_GAIN) + ")");
	conPrint("  --noise-type NAME     One of OPEN_SIMPLEX_2, OPEN_SIMPLEX_2S, CELLULAR, PERLIN, VALUE_CUBIC, VALUE (default PERLIN)");
	conPrint("  --output PATH         Output PNG path (default " + std::string(DEFAULT_OUTPUT_PATH) + ")");
	conPrint("  --demo                Print an 8 x 8 grid of noise values for seed 42 and exit");
	conPrint("  --help                Print this message and exit");
}


// Prints noise values for seed 42, frequency 0.02, 4 octaves, as an 8 x 8 text grid.
static void printDemoGrid()
{
	GradientNoise noise(42);
	noise.setNoiseType(GradientNoise::NoiseType_Perlin);
	noise.setFrequency(0.02f);
	noise.setFractalOctaves(4);
	noise.setFractalLacunarity(2.f);
	noise.setFractalGain(0.5f);

	for(int y=0; y<8; ++y)
	{
		std::vector<std::string> row;
		for(int x=0; x<8; ++x)
		{
			const std::string s = doubleToStringNDecimalPlaces(noise.getNoise((float)x, (float)y), 3);
			row.push_back(startsWith(s, "-") ? s : ("+" + s));
		}
		conPrint(join(row, " "));
	}
}


static int getPositiveIntArg(const ArgumentParser& parser, const std::string& name, int default_val)
{
	if(!parser.isArgPresent(name))
		return default_val;
	const int x = parser.getArgIntValue(name);
	if(x <= 0)
		throw ArgumentParserExcep("Invalid value for '" + name + "': must be > 0.");
	return x;
}


static float getFloatArg(const ArgumentParser& parser, const std::string& name, double default_val)
{
	return (float)(parser.isArgPresent(name) ? parser.getArgDoubleValue(name) : default_val);
}


int main(int argc, char** argv)
{
	Clock::init();

	try
	{
		std::map<std::string, std::vector<ArgumentParser::ArgumentType> > syntax;
		syntax["--width"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_int);
		syntax["--height"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_int);
		syntax["--seed"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_string); // Parsed as uint32 below.
		syntax["--frequency"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_double);
		syntax["--octaves"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_int);
		syntax["--lacunarity"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_double);
		syntax["--gain"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_double);
		syntax["--noise-type"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_string);
		syntax["--output"] = std::vector<ArgumentParser::ArgumentType>(1, ArgumentParser::ArgumentType_string);
		syntax["--demo"] = std::vector<ArgumentParser::ArgumentType>();
		syntax["--help"] = std::vector<ArgumentParser::ArgumentType>();

		std::vector<std::string> args;
		for(int i=0; i<argc; ++i)
			args.push_back(argv[i]);

		ArgumentParser parser;
		try
		{
			parser = ArgumentParser(args, syntax, /*allow_unnamed_arg=*/false);
		}
		catch(ArgumentParserExcep& e)
		{
			stdErrPrint("Error: " + e.what());
			printUsage();
			return 1;
		}

		if(parser.isArgPresent("--help"))
		{
			printUsage();
			return 0;
		}

		if(parser.isArgPresent("--demo"))
		{
			printDemoGrid();
			return 0;
		}

		const int width  = getPositiveIntArg(parser, "--width", DEFAULT_WIDTH);
		const int height = getPositiveIntArg(parser, "--height", DEFAULT_HEIGHT);
		const float frequency  = getFloatArg(parser, "--frequency", DEFAULT_FREQUENCY);
		const float lacunarity = getFloatArg(parser, "--lacunarity", DEFAULT_LACUNARITY);
		const float gain       = getFloatArg(parser, "--gain", DEFAULT_GAIN);
		const int octaves = parser.isArgPresent("--octaves") ? parser.getArgIntValue("--octaves") : DEFAULT_OCTAVES;
		const std::string output_path = parser.isArgPresent("--output") ? parser.getArgStringValue("--output") : std::string(DEFAULT_OUTPUT_PATH);

		GradientNoise::NoiseType noise_type = GradientNoise::NoiseType_Perlin;
		if(parser.isArgPresent("--noise-type"))
			noise_type = GradientNoise::noiseTypeForString(parser.getArgStringValue("--noise-type"));

		uint32 seed;
		if(parser.isArgPresent("--seed"))
		{
			try
			{
				seed = stringToUInt32(parser.getArgStringValue("--seed"));
			}
			catch(StringUtilsExcep& e)
			{
				throw ArgumentParserExcep("Invalid value for '--seed': " + e.what());
			}
			conPrint("Using seed: " + toString(seed));
		}
		else
		{
			seed = CryptoRNG::getRandomUInt32Below(MAX_RANDOM_SEED + 1);
			conPrint("Using random seed: " + toString(seed));
		}

		GradientNoise noise(seed);
		noise.setNoiseType(noise_type);
		noise.setFrequency(frequency);
		noise.setFractalOctaves(octaves);
		noise.setFractalLacunarity(lacunarity);
		noise.setFractalGain(gain);

		if(!GradientNoise::isNoiseTypeImplemented(noise_type))
			conPrint("Note: noise type " + GradientNoise::noiseTypeString(noise_type) + " is not implemented, using " +
				GradientNoise::noiseTypeString(GradientNoise::NoiseType_Perlin) + " instead.");

		conPrint("Rendering " + toString((int32)width) + " x " + toString((int32)height) + ", frequency " + toString(noise.getFrequency()) +
			", " + toString((int32)noise.getFractalOctaves()) + " octaves, lacunarity " + toString(noise.getFractalLacunarity()) +
			", gain " + toString(noise.getFractalGain()));

		Timer timer;
		Array2D<float> samples;
		NoiseFieldSampler::render((size_t)width, (size_t)height, noise, samples);
		conPrint("Rendered in " + timer.elapsedStringNSigFigs(4));

		// Store the parameters so that the image can be reproduced.
		std::map<std::string, std::string> metadata;
		metadata["seed"] = toString(seed);
		metadata["frequency"] = toString(noise.getFrequency());
		metadata["octaves"] = toString((int32)noise.getFractalOctaves());
		metadata["lacunarity"] = toString(noise.getFractalLacunarity());
		metadata["gain"] = toString(noise.getFractalGain());
		metadata["noise_type"] = GradientNoise::noiseTypeString(noise_type);

		PNGWriter::writeGreyscale(samples, metadata, output_path);

		conPrint("Saved " + output_path);
		return 0;
	}
	catch(ArgumentParserExcep& e)
	{
		stdErrPrint("Error: " + e.what());
		return 1;
	}
	catch(ImFormatExcep& e)
	{
		stdErrPrint("Failed to write image: " + e.what());
		return 1;
	}
	catch(gradnoise::Exception& e)
	{
		stdErrPrint("Error: " + e.what());
		return 1;
	}
	catch(std::bad_alloc&)
	{
		stdErrPrint("Error: Out of memory, the image dimensions are too large.");
		return 1;
	}
	catch(std::length_error&)
	{
		stdErrPrint("Error: Out of memory, the image dimensions are too large.");
		return 1;
	}
}
