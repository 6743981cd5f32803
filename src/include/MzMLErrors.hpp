#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mzparse {

// Base for every error raised while parsing an mzML document.
// Context (spectrum, array) is prepended by the walker as the error propagates,
// so catch sites see e.g. "spectrum 'scan=3' binaryDataArray #1: invalid base64 ...".
class MzMLError : public std::runtime_error {
public:
	explicit MzMLError(const std::string &msg) : std::runtime_error(msg), message_(msg) {
	}

	const char *what() const noexcept override {
		return message_.c_str();
	}

	void add_context(const std::string &context) {
		message_ = context + ": " + message_;
	}

private:
	std::string message_;
};

class MissingAttributeError : public MzMLError {
public:
	MissingAttributeError(const std::string &element, const std::string &attribute)
	    : MzMLError("missing attribute '" + attribute + "' on <" + element + ">"), element_(element),
	      attribute_(attribute) {
	}

	const std::string &element() const noexcept {
		return element_;
	}
	const std::string &attribute() const noexcept {
		return attribute_;
	}

private:
	std::string element_;
	std::string attribute_;
};

class MalformedNumberError : public MzMLError {
public:
	MalformedNumberError(const std::string &element, const std::string &attribute, const std::string &value)
	    : MzMLError("malformed number '" + value + "' in attribute '" + attribute + "' on <" + element + ">"),
	      value_(value) {
	}

	const std::string &value() const noexcept {
		return value_;
	}

private:
	std::string value_;
};

class DecodeError : public MzMLError {
public:
	explicit DecodeError(const std::string &detail) : MzMLError("invalid base64: " + detail) {
	}
};

class DecompressionError : public MzMLError {
public:
	DecompressionError(const std::string &algorithm, const std::string &detail)
	    : MzMLError(algorithm + " decompression failed: " + detail), algorithm_(algorithm) {
	}

	const std::string &algorithm() const noexcept {
		return algorithm_;
	}

private:
	std::string algorithm_;
};

class UnknownPrecisionError : public MzMLError {
public:
	explicit UnknownPrecisionError(const std::string &tag) : MzMLError("unknown precision: " + tag), tag_(tag) {
	}

	const std::string &tag() const noexcept {
		return tag_;
	}

private:
	std::string tag_;
};

class TruncatedArrayError : public MzMLError {
public:
	TruncatedArrayError(const std::string &precision, size_t byte_count)
	    : MzMLError("decoded byte count " + std::to_string(byte_count) + " is not a multiple of the " + precision +
	                " element size") {
	}
};

class DocumentStructureError : public MzMLError {
public:
	explicit DocumentStructureError(const std::string &detail) : MzMLError(detail) {
	}
};

class XmlSyntaxError : public MzMLError {
public:
	XmlSyntaxError(unsigned long line, const std::string &detail)
	    : MzMLError("XML parse error at line " + std::to_string(line) + ": " + detail), line_(line) {
	}

	unsigned long line() const noexcept {
		return line_;
	}

private:
	unsigned long line_;
};

class ArrayLengthMismatchError : public MzMLError {
public:
	ArrayLengthMismatchError(size_t expected, size_t actual)
	    : MzMLError("defaultArrayLength " + std::to_string(expected) + " but the array decoded to " +
	                std::to_string(actual) + " values"),
	      expected_(expected), actual_(actual) {
	}

	size_t expected() const noexcept {
		return expected_;
	}
	size_t actual() const noexcept {
		return actual_;
	}

private:
	size_t expected_;
	size_t actual_;
};

} // namespace mzparse
