#include "MzMLParamInference.hpp"

namespace mzparse {

static const char *compression_for_accession(const std::string &accession) {
	if (accession == "MS:1000574") {
		return "zlib";
	}
	if (accession == "MS:1000576") {
		return "no compression";
	}
	if (accession == "MS:1002312") {
		return "MS-Numpress linear";
	}
	if (accession == "MS:1002314") {
		return "MS-Numpress slof";
	}
	if (accession == "MS:1002313") {
		return "MS-Numpress pic";
	}
	return nullptr;
}

static const char *precision_for_accession(const std::string &accession) {
	if (accession == "MS:1000521") {
		return "32-bit float";
	}
	if (accession == "MS:1000523") {
		return "64-bit float";
	}
	return nullptr;
}

std::optional<std::string> infer_compression(const std::vector<CvParam> &params, HintMatching matching) {
	for (const auto &cv : params) {
		if (matching == HintMatching::ACCESSION) {
			if (auto *tag = compression_for_accession(cv.accession)) {
				return std::string(tag);
			}
		} else if (cv.name.find("compression") != std::string::npos) {
			return cv.name;
		}
	}
	return std::nullopt;
}

std::optional<std::string> infer_precision(const std::vector<CvParam> &params, HintMatching matching) {
	for (const auto &cv : params) {
		if (matching == HintMatching::ACCESSION) {
			if (auto *tag = precision_for_accession(cv.accession)) {
				return std::string(tag);
			}
		} else if (cv.name.find("32-bit") != std::string::npos || cv.name.find("64-bit") != std::string::npos) {
			return cv.name;
		}
	}
	return std::nullopt;
}

} // namespace mzparse
