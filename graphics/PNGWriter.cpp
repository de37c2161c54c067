/*=====================================================================
PNGWriter.cpp
-------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "PNGWriter.h"


#include "../utils/FileHandle.h"
#include "../utils/StringUtils.h"
#include <png.h>
#include <vector>
#include <string.h>


static void pngwriter_error_func(png_structp /*png*/, const char* msg)
{
	throw ImFormatExcep("Error while processing PNG file: " + std::string(msg));
}


static void pngwriter_warning_func(png_structp /*png*/, const char* /*msg*/)
{
}


void PNGWriter::write(const void* data, unsigned int W, unsigned int H, unsigned int N, unsigned int bits_per_channel, const std::string& pathname) // Write with no metadata
{
	std::map<std::string, std::string> metadata;
	write(data, W, H, N, bits_per_channel, metadata, pathname);
}


// Write with metadata
void PNGWriter::write(const void* data, unsigned int W, unsigned int H, unsigned int N, unsigned int bits_per_channel, const std::map<std::string, std::string>& metadata, const std::string& pathname)
{
	png_struct* png = NULL;
	png_info* info = NULL;

	try
	{
		int colour_type;
		if(N == 1)
			colour_type = PNG_COLOR_TYPE_GRAY;
		else if(N == 2)
			colour_type = PNG_COLOR_TYPE_GRAY_ALPHA;
		else if(N == 3)
			colour_type = PNG_COLOR_TYPE_RGB;
		else if(N == 4)
			colour_type = PNG_COLOR_TYPE_RGB_ALPHA;
		else
			throw ImFormatExcep("Invalid bytes pp");

		if(!(bits_per_channel == 8 || bits_per_channel == 16))
			throw ImFormatExcep("Invalid bits_per_channel");

		if(W == 0 || H == 0)
			throw ImFormatExcep("Invalid image dimensions " + toString((uint32)W) + " x " + toString((uint32)H) + ", width and height must be > 0.");

		// Open the file
		FileHandle fp(pathname, "wb");

		// Create and initialize the png_struct with the desired error handler functions.
		png = png_create_write_struct(
			PNG_LIBPNG_VER_STRING,
			NULL, // error user pointer
			pngwriter_error_func, // error func
			pngwriter_warning_func // warning func
		);
		if(!png)
			throw ImFormatExcep("Failed to create PNG object.");

		info = png_create_info_struct(png);
		if(!info)
			throw ImFormatExcep("Failed to create PNG info object.");

		// set up the output control if you are using standard C stream
		png_init_io(png, fp.getFile());

		//------------------------------------------------------------------------
		// Set some image info
		//------------------------------------------------------------------------
		png_set_IHDR(png, info, (png_uint_32)W, (png_uint_32)H,
			bits_per_channel, // bit depth of each channel
			colour_type, // colour type
			PNG_INTERLACE_NONE, // interlace type
			PNG_COMPRESSION_TYPE_DEFAULT, // compression type
			PNG_FILTER_TYPE_DEFAULT // filter method
		);

		//------------------------------------------------------------------------
		// Write metadata pairs if present
		//------------------------------------------------------------------------
		if(metadata.size() > 0)
		{
			std::vector<png_text> txt(metadata.size());
			memset(&txt[0], 0, sizeof(png_text)*metadata.size());
			int c = 0;
			for(std::map<std::string, std::string>::const_iterator i = metadata.begin(); i != metadata.end(); ++i)
			{
				txt[c].compression = PNG_TEXT_COMPRESSION_NONE;
				txt[c].key = (png_charp)(*i).first.c_str();
				txt[c].text = (png_charp)(*i).second.c_str();
				txt[c].text_length = (*i).second.length();
				c++;
			}
			png_set_text(png, info, &txt[0], (int)metadata.size()); // libpng copies the text.
		}


		// Write info
		png_write_info(png, info);


		// PNG files store 16-bit pixels in network byte order (big-endian).  Use png_set_swap to convert little-endian data to big-endian.
#if defined(__x86_64__) || defined(_M_X64) || defined(__aarch64__) || defined(_M_ARM64) // If we are targetting a little endian platform:
		if(bits_per_channel > 8)
			png_set_swap(png);
#endif

		const size_t bytes_per_channel = (bits_per_channel == 8) ? 1 : 2;

		for(unsigned int y=0; y<H; ++y)
			png_write_row(
				png,
				(png_const_bytep)((const uint8*)data + (size_t)y * W * N * bytes_per_channel) // Pointer to row data
			);

		//------------------------------------------------------------------------
		//finish writing file
		//------------------------------------------------------------------------
		png_write_end(png, info);

		//------------------------------------------------------------------------
		//free structs
		//------------------------------------------------------------------------
		png_destroy_write_struct(&png, &info);

		fp.close(); // Check that buffered data was flushed successfully.
	}
	catch(ImFormatExcep& e)
	{
		// Free any allocated libPNG structures, then re-throw the exception.
		if(png)
			png_destroy_write_struct(&png, &info);
		throw e;
	}
	catch(gradnoise::Exception& e)
	{
		if(png)
			png_destroy_write_struct(&png, &info);
		throw ImFormatExcep("Failed to write '" + pathname + "': " + e.what());
	}
}


void PNGWriter::writeGreyscale(const Array2D<float>& samples, const std::map<std::string, std::string>& metadata, const std::string& path)
{
	const size_t W = samples.getWidth();
	const size_t H = samples.getHeight();

	std::vector<uint8> bytes(W * H);
	for(size_t y=0; y<H; ++y)
	for(size_t x=0; x<W; ++x)
		bytes[y * W + x] = quantiseSample(samples.elem(x, y));

	write(bytes.empty() ? NULL : &bytes[0], (unsigned int)W, (unsigned int)H, /*N=*/1, /*bits per channel=*/8, metadata, path);
}


const std::map<std::string, std::string> PNGWriter::getMetaData(const std::string& image_path)
{
	png_struct* png = NULL;
	png_info* info = NULL;

	try
	{
		FileHandle fp(image_path, "rb");

		png = png_create_read_struct(
			PNG_LIBPNG_VER_STRING,
			NULL,
			pngwriter_error_func,
			pngwriter_warning_func
		);
		if(!png)
			throw ImFormatExcep("Failed to create PNG struct.");

		info = png_create_info_struct(png);
		if(!info)
			throw ImFormatExcep("Failed to create PNG info struct.");

		png_init_io(png, fp.getFile());

		png_read_info(png, info);

		png_textp text_ptr;
		const int num_comments = png_get_text(png, info, &text_ptr, NULL);

		std::map<std::string, std::string> metadata;
		for(int i=0; i<num_comments; ++i)
			metadata[std::string(text_ptr[i].key)] = std::string(text_ptr[i].text, text_ptr[i].text_length);

		// Free structures
		png_destroy_read_struct(&png, &info, NULL);

		return metadata;
	}
	catch(ImFormatExcep& e)
	{
		if(png)
			png_destroy_read_struct(&png, &info, NULL);
		throw e;
	}
	catch(gradnoise::Exception& )
	{
		if(png)
			png_destroy_read_struct(&png, &info, NULL);
		throw ImFormatExcep("Failed to open file '" + image_path + "' for reading.");
	}
}


#if BUILD_TESTS


#include "../utils/TestUtils.h"
#include "../utils/ConPrint.h"
#include "../utils/PlatformUtils.h"
#include <limits>


// Reads back a PNG file as 8 bit greyscale, using the libpng simplified API.
static void readGreyscale8(const std::string& path, unsigned int& W_out, unsigned int& H_out, std::vector<uint8>& data_out)
{
	png_image image;
	memset(&image, 0, sizeof(image));
	image.version = PNG_IMAGE_VERSION;

	if(!png_image_begin_read_from_file(&image, path.c_str()))
		failTest("png_image_begin_read_from_file failed: " + std::string(image.message));

	image.format = PNG_FORMAT_GRAY;
	data_out.resize(PNG_IMAGE_SIZE(image));

	if(!png_image_finish_read(&image, /*background=*/NULL, &data_out[0], /*row_stride=*/0, /*colormap=*/NULL))
	{
		const std::string msg(image.message);
		png_image_free(&image);
		failTest("png_image_finish_read failed: " + msg);
	}

	W_out = image.width;
	H_out = image.height;
}


void PNGWriter::test()
{
	conPrint("PNGWriter::test()");

	//==================== Test sample quantisation ====================
	testEqual(quantiseSample(0.f), (uint8)0);
	testEqual(quantiseSample(1.f), (uint8)255);
	testEqual(quantiseSample(0.5f), (uint8)128); // 127.5 rounds up
	testEqual(quantiseSample(0.499f), (uint8)127);
	testEqual(quantiseSample(-0.3f), (uint8)0);
	testEqual(quantiseSample(1.7f), (uint8)255);
	testEqual(quantiseSample(std::numeric_limits<float>::quiet_NaN()), (uint8)0);

	try
	{
		const std::string dir = PlatformUtils::getTempDirPath();

		//==================== Write a greyscale image with metadata and read it back ====================
		{
			const std::string path = dir + "/gradnoise_png_write_test.png";

			const size_t W = 7;
			const size_t H = 3;
			Array2D<float> samples(W, H);
			for(size_t y=0; y<H; ++y)
			for(size_t x=0; x<W; ++x)
				samples.elem(x, y) = (float)(x + y * W) / (float)(W * H - 1);

			std::map<std::string, std::string> metadata;
			metadata["seed"] = "42";
			metadata["noise_type"] = "PERLIN";

			PNGWriter::writeGreyscale(samples, metadata, path);

			unsigned int read_W, read_H;
			std::vector<uint8> read_data;
			readGreyscale8(path, read_W, read_H, read_data);
			testEqual(read_W, (unsigned int)W);
			testEqual(read_H, (unsigned int)H);
			testAssert(read_data.size() == W * H);

			for(size_t y=0; y<H; ++y)
			for(size_t x=0; x<W; ++x)
				testEqual(read_data[y * W + x], quantiseSample(samples.elem(x, y)));

			// First and last pixels should be exactly black and white.
			testEqual(read_data[0], (uint8)0);
			testEqual(read_data[W * H - 1], (uint8)255);

			const std::map<std::string, std::string> read_metadata = PNGWriter::getMetaData(path);
			testAssert(read_metadata.size() == 2);
			testAssert(read_metadata.find("seed") != read_metadata.end());
			testStringsEqual(read_metadata.find("seed")->second, "42");
			testStringsEqual(read_metadata.find("noise_type")->second, "PERLIN");
		}

		//==================== Write 16 bit RGB data ====================
		{
			const std::string path = dir + "/gradnoise_png_write_test_16.png";

			const unsigned int W = 4;
			const unsigned int H = 5;
			const unsigned int N = 3;
			std::vector<uint16> data(W * H * N);
			for(size_t i=0; i<data.size(); ++i)
				data[i] = (uint16)(i * 1000);

			PNGWriter::write(&data[0], W, H, N, /*bits per channel=*/16, path);

			testAssert(PNGWriter::getMetaData(path).empty());

			unsigned int read_W, read_H;
			std::vector<uint8> read_data;
			readGreyscale8(path, read_W, read_H, read_data);
			testEqual(read_W, W);
			testEqual(read_H, H);
		}
	}
	catch(ImFormatExcep& e)
	{
		failTest(e.what());
	}

	//==================== Test invalid arguments ====================
	{
		const uint8 data[4] = { 0, 1, 2, 3 };
		try
		{
			PNGWriter::write(data, 2, 2, /*N=*/5, 8, PlatformUtils::getTempDirPath() + "/gradnoise_invalid.png");
			failTest("Expected ImFormatExcep");
		}
		catch(ImFormatExcep&)
		{}

		try
		{
			PNGWriter::write(data, 2, 2, 1, /*bits_per_channel=*/4, PlatformUtils::getTempDirPath() + "/gradnoise_invalid.png");
			failTest("Expected ImFormatExcep");
		}
		catch(ImFormatExcep&)
		{}

		try
		{
			Array2D<float> empty;
			PNGWriter::writeGreyscale(empty, std::map<std::string, std::string>(), PlatformUtils::getTempDirPath() + "/gradnoise_invalid.png");
			failTest("Expected ImFormatExcep");
		}
		catch(ImFormatExcep&)
		{}
	}

	//==================== Test writing to a path that can't be opened ====================
	try
	{
		const uint8 data[4] = { 0, 1, 2, 3 };
		PNGWriter::write(data, 2, 2, 1, 8, PlatformUtils::getTempDirPath() + "/non_existent_dir_7c1f/test.png");
		failTest("Expected ImFormatExcep");
	}
	catch(ImFormatExcep& e)
	{
		conPrint("Got expected exception: " + e.what());
	}

	//==================== Test reading metadata from a missing file ====================
	try
	{
		PNGWriter::getMetaData(PlatformUtils::getTempDirPath() + "/non_existent_dir_7c1f/test.png");
		failTest("Expected ImFormatExcep");
	}
	catch(ImFormatExcep&)
	{}

	conPrint("PNGWriter::test() done.");
}


#endif // BUILD_TESTS
