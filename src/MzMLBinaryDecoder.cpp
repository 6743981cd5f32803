#include "MzMLBinaryDecoder.hpp"
#include "MzMLErrors.hpp"
#include <cstring>
#include <limits>
#include <zlib.h>

#include <MSNumpress.hpp>

// mzML binary arrays are little-endian IEEE 754.
// memcpy-based reinterpretation only produces correct results on LE platforms.
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__, "mzML binary decoding requires a little-endian platform");

namespace mzparse {

static constexpr uint8_t BASE64_INVALID = 255;
static constexpr uint8_t BASE64_PAD = 254;

// ASCII -> 6-bit value, BASE64_INVALID or BASE64_PAD
// NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays)
static const uint8_t BASE64_DECODE_TABLE[256] = {
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 0-15
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 16-31
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 62,  255, 255, 255, 63,  // 32-47 ('+' = 62, '/' = 63)
    52,  53,  54,  55,  56,  57,  58,  59,  60,  61,  255, 255, 255, 254, 255, 255, // 48-63 ('0'-'9', '=' = 254)
    255, 0,   1,   2,   3,   4,   5,   6,   7,   8,   9,   10,  11,  12,  13,  14,  // 64-79 ('A'-'O')
    15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25,  255, 255, 255, 255, 255, // 80-95 ('P'-'Z')
    255, 26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,  // 96-111 ('a'-'o')
    41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51,  255, 255, 255, 255, 255, // 112-127 ('p'-'z')
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 128-143
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 144-159
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 160-175
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 176-191
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 192-207
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 208-223
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 224-239
    255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, 255, // 240-255
};

static const char BASE64_ENCODE_TABLE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
// NOLINTEND(cppcoreguidelines-avoid-c-arrays)

static const char *compression_name(Compression codec) {
	switch (codec) {
	case Compression::ZLIB:
		return "zlib";
	case Compression::NUMPRESS_LINEAR:
		return "MS-Numpress linear";
	case Compression::NUMPRESS_SLOF:
		return "MS-Numpress slof";
	case Compression::NUMPRESS_PIC:
		return "MS-Numpress pic";
	default:
		return "none";
	}
}

Compression MzMLBinaryDecoder::compression_from_tag(const std::optional<std::string> &tag) {
	if (!tag) {
		return Compression::NONE;
	}
	const auto &t = *tag;
	if (t == "zlib" || t == "zlib compression") {
		return Compression::ZLIB;
	}
	if (t == "MS-Numpress linear" || t == "MS-Numpress linear prediction compression") {
		return Compression::NUMPRESS_LINEAR;
	}
	if (t == "MS-Numpress slof" || t == "MS-Numpress short logged float compression") {
		return Compression::NUMPRESS_SLOF;
	}
	if (t == "MS-Numpress pic" || t == "MS-Numpress positive integer compression") {
		return Compression::NUMPRESS_PIC;
	}
	return Compression::NONE;
}

std::vector<uint8_t> MzMLBinaryDecoder::base64_decode(const std::string &input) {
	// Writers may wrap long payloads; whitespace is dropped before validation
	std::string symbols;
	symbols.reserve(input.size());
	for (char c : input) {
		if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
			symbols.push_back(c);
		}
	}
	if (symbols.empty()) {
		return {};
	}
	if (symbols.size() % 4 != 0) {
		throw DecodeError("input length " + std::to_string(symbols.size()) + " is not a multiple of 4");
	}

	// Up to two '=' may close the last group; any other '=' is rejected below
	size_t padding = 0;
	if (symbols[symbols.size() - 1] == '=') {
		padding = symbols[symbols.size() - 2] == '=' ? 2 : 1;
	}
	size_t data_symbols = symbols.size() - padding;

	std::vector<uint8_t> result;
	result.reserve((symbols.size() / 4) * 3 - padding);

	uint32_t bits = 0;
	int pending_bits = 0;
	for (size_t i = 0; i < data_symbols; i++) {
		uint8_t v = BASE64_DECODE_TABLE[static_cast<uint8_t>(symbols[i])];
		if (v == BASE64_PAD) {
			throw DecodeError("padding '=' at invalid position " + std::to_string(i));
		}
		if (v == BASE64_INVALID) {
			throw DecodeError("invalid character at position " + std::to_string(i));
		}
		bits = (bits << 6) | v;
		pending_bits += 6;
		if (pending_bits >= 8) {
			pending_bits -= 8;
			result.push_back(static_cast<uint8_t>(bits >> pending_bits));
		}
	}
	return result;
}

std::vector<uint8_t> MzMLBinaryDecoder::zlib_inflate(const std::vector<uint8_t> &compressed) {
	if (compressed.empty()) {
		return {};
	}
	if (compressed.size() > static_cast<size_t>(std::numeric_limits<uInt>::max())) {
		throw DecompressionError("zlib", "input too large for zlib (> 4GB)");
	}

	z_stream strm = {};
	strm.next_in = const_cast<Bytef *>(compressed.data());
	strm.avail_in = static_cast<uInt>(compressed.size());

	int ret = inflateInit(&strm);
	if (ret != Z_OK) {
		throw DecompressionError("zlib", "inflateInit failed");
	}

	std::vector<uint8_t> result;
	uint8_t buffer[16384];

	do {
		strm.next_out = buffer;
		strm.avail_out = sizeof(buffer);
		ret = inflate(&strm, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END) {
			inflateEnd(&strm);
			throw DecompressionError("zlib", "corrupt or invalid compressed data");
		}

		size_t have = sizeof(buffer) - strm.avail_out;
		result.insert(result.end(), buffer, buffer + have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&strm);
	return result;
}

std::vector<uint8_t> MzMLBinaryDecoder::numpress_decode(Compression codec, const std::vector<uint8_t> &encoded) {
	const std::string algorithm = compression_name(codec);
	if (encoded.empty()) {
		return {};
	}
	namespace np = ms::numpress::MSNumpress;
	// linear and slof start with an 8-byte fixed point; the vector overloads size their output from it
	if ((codec == Compression::NUMPRESS_LINEAR || codec == Compression::NUMPRESS_SLOF) && encoded.size() < 8) {
		throw DecompressionError(algorithm, "input shorter than the 8-byte fixed point header");
	}

	std::vector<double> values;
	try {
		switch (codec) {
		case Compression::NUMPRESS_LINEAR:
			np::decodeLinear(encoded, values);
			break;
		case Compression::NUMPRESS_SLOF:
			np::decodeSlof(encoded, values);
			break;
		case Compression::NUMPRESS_PIC:
			np::decodePic(encoded, values);
			break;
		default:
			throw DecompressionError(algorithm, "not an MS-Numpress codec");
		}
	} catch (const char *msg) {
		// MSNumpress reports corrupt input by throwing string literals
		throw DecompressionError(algorithm, msg);
	} catch (const std::length_error &e) {
		throw DecompressionError(algorithm, e.what());
	}

	std::vector<uint8_t> bytes(values.size() * sizeof(double));
	if (!values.empty()) {
		std::memcpy(bytes.data(), values.data(), bytes.size());
	}
	return bytes;
}

std::vector<uint8_t> MzMLBinaryDecoder::decompress(const std::vector<uint8_t> &raw, Compression codec) {
	switch (codec) {
	case Compression::ZLIB:
		return zlib_inflate(raw);
	case Compression::NUMPRESS_LINEAR:
	case Compression::NUMPRESS_SLOF:
	case Compression::NUMPRESS_PIC:
		return numpress_decode(codec, raw);
	default:
		return raw;
	}
}

std::vector<float> MzMLBinaryDecoder::to_floats_32(const std::vector<uint8_t> &bytes) {
	if (bytes.size() % 4 != 0) {
		throw TruncatedArrayError("32-bit float", bytes.size());
	}

	size_t count = bytes.size() / 4;
	std::vector<float> result(count);
	if (count > 0) {
		std::memcpy(result.data(), bytes.data(), bytes.size());
	}
	return result;
}

std::vector<float> MzMLBinaryDecoder::to_floats_64(const std::vector<uint8_t> &bytes) {
	if (bytes.size() % 8 != 0) {
		throw TruncatedArrayError("64-bit float", bytes.size());
	}

	size_t count = bytes.size() / 8;
	std::vector<float> result(count);

	for (size_t i = 0; i < count; i++) {
		// memcpy avoids strict aliasing violations
		double d;
		std::memcpy(&d, bytes.data() + i * 8, 8);
		result[i] = static_cast<float>(d);
	}

	return result;
}

std::vector<float> MzMLBinaryDecoder::decode(const std::string &base64_text,
                                             const std::optional<std::string> &compression,
                                             const std::string &precision) {
	auto raw_bytes = base64_decode(base64_text);
	auto bytes = decompress(raw_bytes, compression_from_tag(compression));

	if (precision == "32-bit float") {
		return to_floats_32(bytes);
	}
	if (precision == "64-bit float") {
		return to_floats_64(bytes);
	}
	throw UnknownPrecisionError(precision);
}

std::string MzMLBinaryDecoder::base64_encode(const std::vector<uint8_t> &data) {
	std::string out;
	out.reserve(((data.size() + 2) / 3) * 4);

	size_t i = 0;
	for (; i + 2 < data.size(); i += 3) {
		uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8) |
		                  static_cast<uint32_t>(data[i + 2]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 18) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 12) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 6) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[triple & 0x3F]);
	}

	size_t rest = data.size() - i;
	if (rest == 1) {
		uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 18) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 12) & 0x3F]);
		out += "==";
	} else if (rest == 2) {
		uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 18) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 12) & 0x3F]);
		out.push_back(BASE64_ENCODE_TABLE[(triple >> 6) & 0x3F]);
		out.push_back('=');
	}
	return out;
}

std::vector<uint8_t> MzMLBinaryDecoder::zlib_compress_for_test(const std::vector<uint8_t> &data) {
	if (data.empty()) {
		return {};
	}
	if (data.size() > static_cast<size_t>(std::numeric_limits<uInt>::max())) {
		throw std::runtime_error("zlib_compress_for_test: input too large for zlib (> 4GB)");
	}

	z_stream strm = {};
	int ret = deflateInit(&strm, Z_DEFAULT_COMPRESSION);
	if (ret != Z_OK) {
		throw std::runtime_error("zlib_compress_for_test: deflateInit failed");
	}

	strm.next_in = const_cast<Bytef *>(data.data());
	strm.avail_in = static_cast<uInt>(data.size());

	std::vector<uint8_t> result;
	uint8_t buffer[16384];

	do {
		strm.next_out = buffer;
		strm.avail_out = sizeof(buffer);
		ret = deflate(&strm, Z_FINISH);

		if (ret < 0) {
			deflateEnd(&strm);
			throw std::runtime_error("zlib_compress_for_test: deflate failed");
		}

		size_t have = sizeof(buffer) - strm.avail_out;
		result.insert(result.end(), buffer, buffer + have);
	} while (ret != Z_STREAM_END);

	deflateEnd(&strm);
	return result;
}

} // namespace mzparse
