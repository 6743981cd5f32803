#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mzparse {

// Decompression selected by a compression hint
enum class Compression { NONE, ZLIB, NUMPRESS_LINEAR, NUMPRESS_SLOF, NUMPRESS_PIC };

class MzMLBinaryDecoder {
public:
	// Maps a compression hint to a codec. Accepts the short tags ("zlib", "MS-Numpress linear", ...)
	// and the full controlled-vocabulary names ("zlib compression", ...). Anything else is NONE.
	[[nodiscard]] static Compression compression_from_tag(const std::optional<std::string> &tag);

	[[nodiscard]] static std::vector<uint8_t> base64_decode(const std::string &input);
	[[nodiscard]] static std::vector<uint8_t> zlib_inflate(const std::vector<uint8_t> &compressed);
	[[nodiscard]] static std::vector<uint8_t> numpress_decode(Compression codec, const std::vector<uint8_t> &encoded);
	[[nodiscard]] static std::vector<uint8_t> decompress(const std::vector<uint8_t> &raw, Compression codec);

	[[nodiscard]] static std::vector<float> to_floats_32(const std::vector<uint8_t> &bytes);
	[[nodiscard]] static std::vector<float> to_floats_64(const std::vector<uint8_t> &bytes);

	// base64 -> decompress -> reinterpret by precision ("32-bit float" / "64-bit float")
	[[nodiscard]] static std::vector<float> decode(const std::string &base64_text,
	                                               const std::optional<std::string> &compression,
	                                               const std::string &precision);

	// Test helpers: build payloads for round-trip testing
	[[nodiscard]] static std::string base64_encode(const std::vector<uint8_t> &data);
	[[nodiscard]] static std::vector<uint8_t> zlib_compress_for_test(const std::vector<uint8_t> &data);
};

} // namespace mzparse
