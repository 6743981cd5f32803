#include "MzMLModel.hpp"

namespace mzparse {

const CvParam *find_cv_param(const std::vector<CvParam> &params, const std::string &accession) {
	for (const auto &cv : params) {
		if (cv.accession == accession) {
			return &cv;
		}
	}
	return nullptr;
}

const BinaryDataArray *Spectrum::find_array(const std::string &accession) const {
	for (const auto &array : binary_data_arrays) {
		if (find_cv_param(array.cv_params, accession)) {
			return &array;
		}
	}
	return nullptr;
}

} // namespace mzparse
