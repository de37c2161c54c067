/*=====================================================================
PNGWriter.h
-----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include "../utils/Array2D.h"
#include "../utils/Exception.h"
#include "../utils/Platform.h"
#include <map>
#include <string>


class ImFormatExcep : public gradnoise::Exception
{
public:
	ImFormatExcep(const std::string& s_) : gradnoise::Exception(s_) {}
	~ImFormatExcep(){}
};


/*=====================================================================
PNGWriter
---------
Saving of PNG files using libpng.
=====================================================================*/
class PNGWriter
{
public:
	// All methods throw ImFormatExcep on failure.

	// Write tightly-packed data laid out in row-major order.
	// N is the number of channels (1 = grey, 2 = grey + alpha, 3 = RGB, 4 = RGBA), bits_per_channel must be 8 or 16.
	// 16 bit data is in native byte order.
	static void write(const void* data, unsigned int W, unsigned int H, unsigned int N, unsigned int bits_per_channel, const std::map<std::string, std::string>& metadata, const std::string& path); // Write with metadata
	static void write(const void* data, unsigned int W, unsigned int H, unsigned int N, unsigned int bits_per_channel, const std::string& path); // Write with no metadata

	// Writes an 8 bit greyscale image with pixel (x, y) = round(255 * clamp(samples.elem(x, y), 0, 1)).
	static void writeGreyscale(const Array2D<float>& samples, const std::map<std::string, std::string>& metadata, const std::string& path);

	static uint8 quantiseSample(float s) { return (uint8)(clampSample(s) * 255.f + 0.5f); }

	// Returns the tEXt key/value pairs of a PNG file.
	static const std::map<std::string, std::string> getMetaData(const std::string& image_path);

	static void test();

private:
	// NaN maps to 0.
	static float clampSample(float s) { return (s > 0.f) ? ((s < 1.f) ? s : 1.f) : 0.f; }
};
