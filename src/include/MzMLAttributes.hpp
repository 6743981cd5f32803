#pragma once

#include "MzMLModel.hpp"
#include "XmlTokenSource.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace mzparse {

// Value of a required attribute; throws MissingAttributeError(element, name) when absent
const std::string &required_attribute(const XmlToken &element, const std::string &name);

std::optional<std::string> optional_attribute(const XmlToken &element, const std::string &name);

// Parses a non-negative decimal integer; throws MalformedNumberError naming the element and attribute
size_t parse_non_negative(const std::string &element, const std::string &attribute, const std::string &text);

// Required attribute parsed as a non-negative integer
size_t required_non_negative(const XmlToken &element, const std::string &name);

// <cvParam cvRef accession name [value unitName unitAccession unitCvRef]/>
CvParam parse_cv_param(const XmlToken &element);

} // namespace mzparse
