#pragma once

#include "MzMLModel.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mzparse {

// How binary encoding hints are read from a binaryDataArray's cvParams
enum class HintMatching {
	NAME_SUBSTRING, // first name containing "compression" / "32-bit" / "64-bit"
	ACCESSION       // exact accession codes, names ignored
};

// Compression hint, or nullopt when no param describes compression.
// NAME_SUBSTRING returns the param name as written; ACCESSION returns the short tag
// ("zlib", "no compression", "MS-Numpress linear", "MS-Numpress slof", "MS-Numpress pic").
std::optional<std::string> infer_compression(const std::vector<CvParam> &params,
                                             HintMatching matching = HintMatching::NAME_SUBSTRING);

// Precision hint ("32-bit float" / "64-bit float" under ACCESSION), or nullopt when absent.
std::optional<std::string> infer_precision(const std::vector<CvParam> &params,
                                           HintMatching matching = HintMatching::NAME_SUBSTRING);

} // namespace mzparse
