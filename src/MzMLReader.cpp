#include "MzMLReader.hpp"
#include "MzMLAttributes.hpp"
#include "MzMLBinaryDecoder.hpp"
#include "MzMLErrors.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

namespace mzparse {

// Default warning callback writes to stderr
void DefaultWarningCallback(const std::string &msg) {
	std::cerr << "[mzML Warning] " << msg << std::endl;
}

static std::string array_label(size_t position) {
	return "binaryDataArray #" + std::to_string(position);
}

static std::string spectrum_label(const std::string &id) {
	return "spectrum '" + id + "'";
}

MzMLReader::MzMLReader(ParseOptions options) : options_(std::move(options)) {
}

void MzMLReader::warn(const std::string &msg) const {
	if (options_.warning_callback) {
		options_.warning_callback(msg);
	}
}

Run MzMLReader::walk(XmlTokenSource &source) const {
	WalkerContext ctx;
	XmlToken token;
	while (source.next(token)) {
		if (token.type == XmlTokenType::END) {
			break;
		}
		handle_token(token, ctx);
	}
	return finish(ctx);
}

void MzMLReader::handle_token(const XmlToken &token, WalkerContext &ctx) const {
	try {
		switch (token.type) {
		case XmlTokenType::OPEN:
			on_open(token, ctx);
			break;
		case XmlTokenType::CLOSE:
			on_close(token, ctx);
			break;
		case XmlTokenType::TEXT:
			if (!ctx.stack.empty() && ctx.stack.back().context == ElementContext::BINARY) {
				ctx.binary_text += token.text;
			}
			break;
		case XmlTokenType::END:
			break;
		}
	} catch (MzMLError &e) {
		if (ctx.spectrum) {
			e.add_context(spectrum_label(ctx.spectrum->id));
		}
		throw;
	}
}

Run MzMLReader::finish(WalkerContext &ctx) const {
	if (!ctx.run) {
		throw DocumentStructureError("no run element found");
	}
	if (!ctx.stack.empty()) {
		throw DocumentStructureError("token stream ended inside <" + ctx.stack.back().name + ">");
	}

	Run run = std::move(*ctx.run);
	ctx.run.reset();
	if (ctx.has_deferred_arrays) {
		decode_deferred(run, options_.decode_threads);
	}
	return run;
}

void MzMLReader::on_open(const XmlToken &token, WalkerContext &ctx) const {
	if (ctx.stack.size() >= MAX_CONTEXT_DEPTH) {
		throw DocumentStructureError("XML nesting too deep (>" + std::to_string(MAX_CONTEXT_DEPTH) + " levels)");
	}
	const auto &name = token.name;

	// Chromatograms are not modeled; everything below chromatogramList is skipped
	if (ctx.chromatogram_depth > 0) {
		ctx.chromatogram_depth++;
		ctx.stack.push_back({ElementContext::OTHER, name});
		return;
	}

	if (name == "run") {
		if (ctx.run) {
			throw DocumentStructureError("multiple <run> elements");
		}
		Run run;
		run.id = required_attribute(token, "id");
		run.start_time_stamp = required_attribute(token, "startTimeStamp");
		ctx.run = std::move(run);
		ctx.stack.push_back({ElementContext::RUN, name});
		return;
	}

	if (name == "spectrum") {
		if (ctx.spectrum) {
			throw DocumentStructureError("<spectrum> nested inside another spectrum");
		}
		Spectrum spectrum;
		spectrum.id = required_attribute(token, "id");
		spectrum.index = required_non_negative(token, "index");
		spectrum.default_array_length = required_non_negative(token, "defaultArrayLength");
		ctx.spectrum = std::move(spectrum);
		ctx.spectrum_params.clear();
		ctx.stack.push_back({ElementContext::SPECTRUM, name});
		return;
	}

	if (name == "scanList") {
		if (!ctx.spectrum) {
			throw DocumentStructureError("<scanList> outside <spectrum>");
		}
		if (ctx.scan_list) {
			throw DocumentStructureError("<scanList> nested inside another scanList");
		}
		ScanList scan_list;
		if (auto count = optional_attribute(token, "count")) {
			scan_list.count = parse_non_negative(name, "count", *count);
		}
		ctx.scan_list = std::move(scan_list);
		ctx.stack.push_back({ElementContext::SCAN_LIST, name});
		return;
	}

	if (name == "scan") {
		if (!ctx.scan_list) {
			throw DocumentStructureError("<scan> outside <scanList>");
		}
		if (ctx.scan) {
			throw DocumentStructureError("<scan> nested inside another scan");
		}
		ctx.scan = Scan {};
		ctx.stack.push_back({ElementContext::SCAN, name});
		return;
	}

	// scanWindow sits under scanWindowList, so only an open scan is required
	if (name == "scanWindow") {
		if (!ctx.scan) {
			throw DocumentStructureError("<scanWindow> outside <scan>");
		}
		if (ctx.scan_window) {
			throw DocumentStructureError("<scanWindow> nested inside another scanWindow");
		}
		ctx.scan_window = ScanWindow {};
		ctx.stack.push_back({ElementContext::SCAN_WINDOW, name});
		return;
	}

	if (name == "binaryDataArray") {
		if (!ctx.spectrum) {
			throw DocumentStructureError("<binaryDataArray> outside <spectrum>");
		}
		if (ctx.binary_array) {
			throw DocumentStructureError("<binaryDataArray> nested inside another binaryDataArray");
		}
		BinaryDataArray array;
		array.encoded_length = required_non_negative(token, "encodedLength");
		ctx.binary_array = std::move(array);
		ctx.binary_text.clear();
		ctx.stack.push_back({ElementContext::BINARY_DATA_ARRAY, name});
		return;
	}

	if (name == "binary") {
		if (!ctx.binary_array) {
			throw DocumentStructureError("<binary> outside <binaryDataArray>");
		}
		bool inside_binary = std::any_of(ctx.stack.begin(), ctx.stack.end(),
		                                 [](const OpenElement &e) { return e.context == ElementContext::BINARY; });
		if (inside_binary) {
			throw DocumentStructureError("<binary> nested inside another binary");
		}
		ctx.binary_text.clear();
		ctx.stack.push_back({ElementContext::BINARY, name});
		return;
	}

	if (name == "cvParam") {
		add_cv_param(parse_cv_param(token), ctx);
		ctx.stack.push_back({ElementContext::OTHER, name});
		return;
	}

	if (name == "referenceableParamGroup") {
		ctx.current_param_group = required_attribute(token, "id");
		ctx.param_groups[ctx.current_param_group] = {};
		ctx.stack.push_back({ElementContext::REFERENCEABLE_PARAM_GROUP, name});
		return;
	}

	if (name == "referenceableParamGroupRef") {
		const auto &ref = required_attribute(token, "ref");
		auto it = ctx.param_groups.find(ref);
		if (it == ctx.param_groups.end()) {
			throw DocumentStructureError("unknown referenceableParamGroup '" + ref + "'");
		}
		// Copy first: the target may be another group in the same map
		auto params = it->second;
		for (auto &cv : params) {
			add_cv_param(std::move(cv), ctx);
		}
		ctx.stack.push_back({ElementContext::OTHER, name});
		return;
	}

	if (name == "chromatogramList") {
		ctx.chromatogram_depth = 1;
		ctx.stack.push_back({ElementContext::CHROMATOGRAM_LIST, name});
		return;
	}

	ctx.stack.push_back({ElementContext::OTHER, name});
}

// Route a cvParam to the innermost modeled owner. Params under unmodeled spectrum
// children (precursor, selectedIon, activation, ...) land on the spectrum.
void MzMLReader::add_cv_param(CvParam cv, WalkerContext &ctx) const {
	for (auto it = ctx.stack.rbegin(); it != ctx.stack.rend(); ++it) {
		switch (it->context) {
		case ElementContext::REFERENCEABLE_PARAM_GROUP:
			ctx.param_groups[ctx.current_param_group].push_back(std::move(cv));
			return;
		case ElementContext::BINARY_DATA_ARRAY:
			ctx.binary_array->cv_params.push_back(std::move(cv));
			return;
		case ElementContext::SCAN_WINDOW:
			ctx.scan_window->cv_params.push_back(std::move(cv));
			return;
		case ElementContext::SCAN:
			ctx.scan->cv_params.push_back(std::move(cv));
			return;
		case ElementContext::SCAN_LIST:
			ctx.scan_list->cv_params.push_back(std::move(cv));
			return;
		case ElementContext::SPECTRUM:
			ctx.spectrum_params.push_back(std::move(cv));
			return;
		case ElementContext::RUN:
			// run-level metadata is not modeled
			return;
		default:
			break;
		}
	}
}

void MzMLReader::on_close(const XmlToken &token, WalkerContext &ctx) const {
	if (ctx.stack.empty()) {
		throw DocumentStructureError("unexpected </" + token.name + ">");
	}
	OpenElement open = std::move(ctx.stack.back());
	ctx.stack.pop_back();
	if (open.name != token.name) {
		throw DocumentStructureError("</" + token.name + "> closes <" + open.name + ">");
	}

	if (ctx.chromatogram_depth > 0) {
		ctx.chromatogram_depth--;
		return;
	}

	switch (open.context) {
	case ElementContext::BINARY:
		finish_binary(ctx);
		break;
	case ElementContext::BINARY_DATA_ARRAY:
		ctx.spectrum->binary_data_arrays.push_back(std::move(*ctx.binary_array));
		ctx.binary_array.reset();
		break;
	case ElementContext::SCAN_WINDOW:
		ctx.scan->scan_windows.push_back(std::move(*ctx.scan_window));
		ctx.scan_window.reset();
		break;
	case ElementContext::SCAN:
		ctx.scan_list->scans.push_back(std::move(*ctx.scan));
		ctx.scan.reset();
		break;
	case ElementContext::SCAN_LIST:
		ctx.spectrum->scan_list = std::move(*ctx.scan_list);
		ctx.scan_list.reset();
		break;
	case ElementContext::SPECTRUM:
		ctx.spectrum->cv_params = std::move(ctx.spectrum_params);
		ctx.spectrum_params.clear();
		ctx.spectra.push_back(std::move(*ctx.spectrum));
		ctx.spectrum.reset();
		break;
	case ElementContext::RUN:
		ctx.run->spectra = std::move(ctx.spectra);
		ctx.spectra.clear();
		break;
	case ElementContext::REFERENCEABLE_PARAM_GROUP:
		ctx.current_param_group.clear();
		break;
	default:
		break;
	}
}

// </binary>: derive hints from the array's cvParams, then decode now or leave for decode_deferred
void MzMLReader::finish_binary(WalkerContext &ctx) const {
	auto &array = *ctx.binary_array;
	size_t position = ctx.spectrum->binary_data_arrays.size();

	array.compression = infer_compression(array.cv_params, options_.hint_matching);
	auto precision = infer_precision(array.cv_params, options_.hint_matching);
	if (!precision) {
		if (options_.missing_precision == MissingPrecision::REJECT) {
			UnknownPrecisionError err("<none>");
			err.add_context(array_label(position));
			throw err;
		}
		precision = "32-bit float";
	}
	array.precision = *precision;

	if (options_.array_length_check != ArrayLengthCheck::IGNORE && ctx.binary_text.size() != array.encoded_length) {
		warn(spectrum_label(ctx.spectrum->id) + " " + array_label(position) + ": encodedLength " +
		     std::to_string(array.encoded_length) + " but payload has " + std::to_string(ctx.binary_text.size()) +
		     " characters");
	}

	if (options_.decode_threads > 1) {
		array.encoded_text = std::move(ctx.binary_text);
		ctx.binary_text.clear();
		ctx.has_deferred_arrays = true;
		return;
	}

	decode_array(array, ctx.binary_text, position);
	ctx.binary_text.clear();
	try {
		check_array_length(*ctx.spectrum, array);
	} catch (MzMLError &e) {
		e.add_context(array_label(position));
		throw;
	}
}

void MzMLReader::decode_array(BinaryDataArray &array, const std::string &text, size_t position) const {
	try {
		array.decoded_data = MzMLBinaryDecoder::decode(text, array.compression, array.precision);
	} catch (MzMLError &e) {
		e.add_context(array_label(position));
		throw;
	}
}

void MzMLReader::check_array_length(const Spectrum &spectrum, const BinaryDataArray &array) const {
	if (options_.array_length_check == ArrayLengthCheck::IGNORE || !array.decoded_data) {
		return;
	}
	size_t actual = array.decoded_data->size();
	if (actual == spectrum.default_array_length) {
		return;
	}
	if (options_.array_length_check == ArrayLengthCheck::REJECT) {
		throw ArrayLengthMismatchError(spectrum.default_array_length, actual);
	}
	warn(spectrum_label(spectrum.id) + ": defaultArrayLength " + std::to_string(spectrum.default_array_length) +
	     " but an array decoded to " + std::to_string(actual) + " values");
}

void MzMLReader::decode_deferred(Run &run, size_t threads) const {
	struct Task {
		Spectrum *spectrum;
		size_t position;
	};

	std::vector<Task> tasks;
	for (auto &spectrum : run.spectra) {
		for (size_t i = 0; i < spectrum.binary_data_arrays.size(); i++) {
			if (spectrum.binary_data_arrays[i].encoded_text) {
				tasks.push_back({&spectrum, i});
			}
		}
	}
	if (tasks.empty()) {
		return;
	}

	// Each task touches only its own array; errors are collected per task and the
	// first one in document order is rethrown after all workers have joined.
	std::vector<std::exception_ptr> errors(tasks.size());
	std::atomic<size_t> next_task {0};
	auto work = [&]() {
		while (true) {
			size_t i = next_task.fetch_add(1);
			if (i >= tasks.size()) {
				return;
			}
			auto &array = tasks[i].spectrum->binary_data_arrays[tasks[i].position];
			try {
				decode_array(array, *array.encoded_text, tasks[i].position);
				array.encoded_text.reset();
			} catch (...) {
				errors[i] = std::current_exception();
			}
		}
	};

	size_t workers = std::max<size_t>(1, std::min(threads, tasks.size()));
	std::vector<std::thread> pool;
	pool.reserve(workers - 1);
	for (size_t w = 1; w < workers; w++) {
		try {
			pool.emplace_back(work);
		} catch (const std::system_error &e) {
			// Continue with the threads already running; this thread drains the rest
			warn("started " + std::to_string(pool.size()) + " of " + std::to_string(workers - 1) +
			     " decode threads: " + e.what());
			break;
		}
	}
	work();
	for (auto &t : pool) {
		t.join();
	}

	for (size_t i = 0; i < tasks.size(); i++) {
		const auto &spectrum = *tasks[i].spectrum;
		try {
			if (errors[i]) {
				std::rethrow_exception(errors[i]);
			}
			check_array_length(spectrum, spectrum.binary_data_arrays[tasks[i].position]);
		} catch (MzMLError &e) {
			if (!errors[i]) {
				e.add_context(array_label(tasks[i].position));
			}
			e.add_context(spectrum_label(spectrum.id));
			throw;
		}
	}
}

Run MzMLReader::parse(std::string_view document, const ParseOptions &options) {
	auto source = ExpatTokenSource::from_memory(document, options.read_chunk_size);
	return MzMLReader(options).walk(*source);
}

Run MzMLReader::parse_file(const std::string &path, const ParseOptions &options) {
	auto source = ExpatTokenSource::from_file(path, options.read_chunk_size);
	return MzMLReader(options).walk(*source);
}

} // namespace mzparse
