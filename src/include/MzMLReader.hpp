#pragma once

#include "MzMLModel.hpp"
#include "MzMLParamInference.hpp"
#include "XmlTokenSource.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mzparse {

// Warning callback type for parser warnings
using WarningCallback = std::function<void(const std::string &)>;

// Default warning callback that writes to stderr
void DefaultWarningCallback(const std::string &msg);

// What to do when a binaryDataArray carries no 32-bit/64-bit cvParam
enum class MissingPrecision {
	DEFAULT_32BIT, // decode as "32-bit float"
	REJECT         // UnknownPrecisionError
};

// Decoded array length vs. the spectrum's defaultArrayLength
enum class ArrayLengthCheck { IGNORE, WARN, REJECT };

struct ParseOptions {
	HintMatching hint_matching = HintMatching::NAME_SUBSTRING;
	MissingPrecision missing_precision = MissingPrecision::DEFAULT_32BIT;
	ArrayLengthCheck array_length_check = ArrayLengthCheck::WARN;
	// 0 or 1: decode while walking. N > 1: decode after the walk on N threads.
	size_t decode_threads = 1;
	size_t read_chunk_size = ExpatTokenSource::DEFAULT_CHUNK_SIZE;
	WarningCallback warning_callback = DefaultWarningCallback;
};

// Element kinds the walker tracks on its stack
enum class ElementContext {
	RUN,
	SPECTRUM,
	SCAN_LIST,
	SCAN,
	SCAN_WINDOW,
	BINARY_DATA_ARRAY,
	BINARY,
	REFERENCEABLE_PARAM_GROUP,
	CHROMATOGRAM_LIST,
	OTHER,
};

struct OpenElement {
	ElementContext context;
	std::string name;
};

// Everything in progress during one walk. Owned by the caller of handle_token and
// passed by reference; nothing here outlives the walk.
struct WalkerContext {
	std::optional<Run> run;
	std::vector<Spectrum> spectra;

	std::optional<Spectrum> spectrum;
	std::vector<CvParam> spectrum_params; // flushed into the spectrum on close

	std::optional<ScanList> scan_list;
	std::optional<Scan> scan;
	std::optional<ScanWindow> scan_window;

	std::optional<BinaryDataArray> binary_array;
	std::string binary_text;

	// referenceableParamGroup id -> cvParams
	std::unordered_map<std::string, std::vector<CvParam>> param_groups;
	std::string current_param_group;

	std::vector<OpenElement> stack;
	size_t chromatogram_depth = 0; // > 0 while inside chromatogramList

	bool has_deferred_arrays = false;
};

// Single-pass walker turning an mzML token stream into a Run.
class MzMLReader {
public:
	explicit MzMLReader(ParseOptions options = {});

	// Consume the whole token stream
	[[nodiscard]] Run walk(XmlTokenSource &source) const;

	// One step of the walk; exposed for driving the state machine token by token
	void handle_token(const XmlToken &token, WalkerContext &ctx) const;

	// End of stream: yields the Run or throws DocumentStructureError
	[[nodiscard]] Run finish(WalkerContext &ctx) const;

	// Decode arrays left encoded by a deferred walk, on `threads` workers
	void decode_deferred(Run &run, size_t threads) const;

	[[nodiscard]] static Run parse(std::string_view document, const ParseOptions &options = {});
	[[nodiscard]] static Run parse_file(const std::string &path, const ParseOptions &options = {});

	static constexpr size_t MAX_CONTEXT_DEPTH = 64;

private:
	void on_open(const XmlToken &token, WalkerContext &ctx) const;
	void on_close(const XmlToken &token, WalkerContext &ctx) const;

	void add_cv_param(CvParam cv, WalkerContext &ctx) const;
	void finish_binary(WalkerContext &ctx) const;
	void decode_array(BinaryDataArray &array, const std::string &text, size_t position) const;
	void check_array_length(const Spectrum &spectrum, const BinaryDataArray &array) const;
	void warn(const std::string &msg) const;

	ParseOptions options_;
};

} // namespace mzparse
