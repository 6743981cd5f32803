#include "MzMLAttributes.hpp"
#include "MzMLErrors.hpp"
#include <charconv>

namespace mzparse {

static const std::string *find_attribute(const XmlToken &element, const std::string &name) {
	for (const auto &attr : element.attributes) {
		if (attr.first == name) {
			return &attr.second;
		}
	}
	return nullptr;
}

const std::string &required_attribute(const XmlToken &element, const std::string &name) {
	auto *value = find_attribute(element, name);
	if (!value) {
		throw MissingAttributeError(element.name, name);
	}
	return *value;
}

std::optional<std::string> optional_attribute(const XmlToken &element, const std::string &name) {
	auto *value = find_attribute(element, name);
	if (!value) {
		return std::nullopt;
	}
	return *value;
}

size_t parse_non_negative(const std::string &element, const std::string &attribute, const std::string &text) {
	// from_chars accepts no sign, whitespace or prefix; the whole string must be consumed
	size_t out = 0;
	const char *first = text.data();
	const char *last = text.data() + text.size();
	auto result = std::from_chars(first, last, out);
	if (text.empty() || result.ec != std::errc() || result.ptr != last) {
		throw MalformedNumberError(element, attribute, text);
	}
	return out;
}

size_t required_non_negative(const XmlToken &element, const std::string &name) {
	return parse_non_negative(element.name, name, required_attribute(element, name));
}

CvParam parse_cv_param(const XmlToken &element) {
	CvParam cv;
	cv.cv_ref = required_attribute(element, "cvRef");
	cv.accession = required_attribute(element, "accession");
	cv.name = required_attribute(element, "name");
	cv.value = optional_attribute(element, "value");
	cv.unit_name = optional_attribute(element, "unitName");
	cv.unit_accession = optional_attribute(element, "unitAccession");
	cv.unit_cv_ref = optional_attribute(element, "unitCvRef");
	return cv;
}

} // namespace mzparse
