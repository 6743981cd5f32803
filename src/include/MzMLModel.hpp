#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mzparse {

// A controlled-vocabulary annotation, e.g.
// <cvParam cvRef="MS" accession="MS:1000523" name="64-bit float"/>
struct CvParam {
	std::string cv_ref;
	std::string accession;
	std::string name;
	std::optional<std::string> value;
	std::optional<std::string> unit_name;
	std::optional<std::string> unit_accession;
	std::optional<std::string> unit_cv_ref;
};

// First param with the given accession, or nullptr
const CvParam *find_cv_param(const std::vector<CvParam> &params, const std::string &accession);

struct ScanWindow {
	std::vector<CvParam> cv_params;
};

struct Scan {
	std::vector<CvParam> cv_params;
	std::vector<ScanWindow> scan_windows;
};

struct ScanList {
	size_t count = 0; // as declared; 0 when the attribute is absent
	std::vector<CvParam> cv_params;
	std::vector<Scan> scans;
};

struct BinaryDataArray {
	size_t encoded_length = 0; // as declared on the element
	std::vector<CvParam> cv_params;
	std::optional<std::vector<float>> decoded_data;

	// Hints the array was decoded with
	std::optional<std::string> compression;
	std::string precision;

	// Raw payload, only held between the walk and a deferred decode
	std::optional<std::string> encoded_text;
};

struct Spectrum {
	std::string id;
	size_t index = 0;
	size_t default_array_length = 0;
	std::vector<CvParam> cv_params;
	std::optional<ScanList> scan_list;
	std::vector<BinaryDataArray> binary_data_arrays;

	// First array annotated with the given accession (MS:1000514 m/z, MS:1000515 intensity), or nullptr
	const BinaryDataArray *find_array(const std::string &accession) const;
};

struct Run {
	std::string id;
	std::string start_time_stamp;
	std::vector<Spectrum> spectra;
};

} // namespace mzparse
