#include <MzMLErrors.hpp>
#include <MzMLReader.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace mzparse;

static const std::string DATA_DIR = "data/mzml/";

// 100.0, 200.0, 300.0 as 64-bit floats
static const std::string MZ3_64 = "AAAAAAAAWUAAAAAAAABpQAAAAAAAwHJA";
// 1000, 5000, 2000 as 32-bit floats
static const std::string INT3_32 = "AAB6RABAnEUAAPpE";

static std::string cv_xml(const std::string &accession, const std::string &name) {
	return "<cvParam cvRef=\"MS\" accession=\"" + accession + "\" name=\"" + name + "\" value=\"\"/>";
}

static std::string array_xml(const std::string &payload, const std::string &params) {
	return "<binaryDataArray encodedLength=\"" + std::to_string(payload.size()) + "\">" + params + "<binary>" +
	       payload + "</binary></binaryDataArray>";
}

static std::string spectrum_xml(size_t index, size_t length, const std::string &arrays) {
	return "<spectrum index=\"" + std::to_string(index) + "\" id=\"scan=" + std::to_string(index + 1) +
	       "\" defaultArrayLength=\"" + std::to_string(length) + "\"><binaryDataArrayList>" + arrays +
	       "</binaryDataArrayList></spectrum>";
}

static std::string document(const std::string &spectra) {
	return "<?xml version=\"1.0\"?>\n<mzML xmlns=\"http://psi.hupo.org/ms/mzml\">"
	       "<run id=\"r\" startTimeStamp=\"2024-01-15T10:30:00Z\"><spectrumList>" +
	       spectra + "</spectrumList></run></mzML>";
}

// Collects warnings instead of printing them
struct WarningLog {
	std::vector<std::string> messages;

	WarningCallback callback() {
		return [this](const std::string &msg) { messages.push_back(msg); };
	}
};

static void check_same_decoded(const Run &a, const Run &b) {
	REQUIRE(a.spectra.size() == b.spectra.size());
	for (size_t i = 0; i < a.spectra.size(); i++) {
		const auto &sa = a.spectra[i];
		const auto &sb = b.spectra[i];
		CHECK(sa.id == sb.id);
		REQUIRE(sa.binary_data_arrays.size() == sb.binary_data_arrays.size());
		for (size_t j = 0; j < sa.binary_data_arrays.size(); j++) {
			CHECK(sa.binary_data_arrays[j].decoded_data == sb.binary_data_arrays[j].decoded_data);
			CHECK(sa.binary_data_arrays[j].precision == sb.binary_data_arrays[j].precision);
		}
	}
}

// ===== fixture files =====

TEST_CASE("parse_file: basic run with three spectra", "[mzml][reader]") {
	WarningLog log;
	ParseOptions options;
	options.warning_callback = log.callback();
	auto run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML", options);

	CHECK(run.id == "run_1");
	CHECK(run.start_time_stamp == "2024-01-15T10:30:00Z");
	REQUIRE(run.spectra.size() == 3);
	CHECK(log.messages.empty());

	const auto &s0 = run.spectra[0];
	CHECK(s0.id == "scan=1");
	CHECK(s0.index == 0);
	CHECK(s0.default_array_length == 3);
	REQUIRE(s0.cv_params.size() == 4);
	auto *level = find_cv_param(s0.cv_params, "MS:1000511");
	REQUIRE(level != nullptr);
	CHECK(level->value == "1");

	auto *mz = s0.find_array("MS:1000514");
	auto *intensity = s0.find_array("MS:1000515");
	REQUIRE(mz != nullptr);
	REQUIRE(intensity != nullptr);
	CHECK(mz->precision == "64-bit float");
	CHECK(mz->compression == "no compression");
	CHECK(*mz->decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
	CHECK(intensity->precision == "32-bit float");
	CHECK(*intensity->decoded_data == std::vector<float> {1000.0f, 5000.0f, 2000.0f});

	const auto &s2 = run.spectra[2];
	CHECK(s2.id == "scan=3");
	CHECK(*s2.find_array("MS:1000514")->decoded_data == std::vector<float> {400.0f, 500.0f, 600.0f, 700.0f});
	CHECK(*s2.find_array("MS:1000515")->decoded_data == std::vector<float> {1.0f, 2.0f, 3.0f, 4.0f});
	CHECK_FALSE(s2.scan_list.has_value());
}

TEST_CASE("parse_file: scan list, scans and scan windows", "[mzml][reader]") {
	auto run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML");
	const auto &s0 = run.spectra[0];
	REQUIRE(s0.scan_list.has_value());
	CHECK(s0.scan_list->count == 1);
	REQUIRE(s0.scan_list->cv_params.size() == 1);
	CHECK(s0.scan_list->cv_params[0].accession == "MS:1000795");
	REQUIRE(s0.scan_list->scans.size() == 1);

	const auto &scan = s0.scan_list->scans[0];
	auto *start_time = find_cv_param(scan.cv_params, "MS:1000016");
	REQUIRE(start_time != nullptr);
	CHECK(start_time->value == "90");
	CHECK(start_time->unit_name == "second");
	CHECK(start_time->unit_accession == "UO:0000010");
	CHECK(start_time->unit_cv_ref == "UO");

	REQUIRE(scan.scan_windows.size() == 1);
	auto *lower = find_cv_param(scan.scan_windows[0].cv_params, "MS:1000501");
	auto *upper = find_cv_param(scan.scan_windows[0].cv_params, "MS:1000500");
	REQUIRE(lower != nullptr);
	REQUIRE(upper != nullptr);
	CHECK(lower->value == "100");
	CHECK(upper->value == "500");
}

TEST_CASE("parse_file: precursor params belong to the spectrum", "[mzml][reader]") {
	auto run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML");
	const auto &s1 = run.spectra[1];
	CHECK(s1.cv_params.size() == 6);
	auto *selected = find_cv_param(s1.cv_params, "MS:1000744");
	REQUIRE(selected != nullptr);
	CHECK(selected->value == "200");
	CHECK(find_cv_param(s1.cv_params, "MS:1000133") != nullptr);
	CHECK(find_cv_param(s1.cv_params, "MS:1000831") == nullptr);
}

TEST_CASE("parse_file: zlib-compressed arrays", "[mzml][reader]") {
	auto run = MzMLReader::parse_file(DATA_DIR + "compressed.mzML");
	CHECK(run.id == "run_zlib");
	REQUIRE(run.spectra.size() == 1);
	const auto &s = run.spectra[0];
	REQUIRE(s.binary_data_arrays.size() == 2);
	CHECK(s.binary_data_arrays[0].compression == "zlib compression");
	CHECK(*s.binary_data_arrays[0].decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
	CHECK(*s.binary_data_arrays[1].decoded_data == std::vector<float> {1000.0f, 5000.0f, 2000.0f});
}

TEST_CASE("parse_file: referenceable param groups", "[mzml][reader]") {
	auto run = MzMLReader::parse_file(DATA_DIR + "param_groups.mzML");
	REQUIRE(run.spectra.size() == 1);
	const auto &s = run.spectra[0];
	auto *mz = s.find_array("MS:1000514");
	auto *intensity = s.find_array("MS:1000515");
	REQUIRE(mz != nullptr);
	REQUIRE(intensity != nullptr);
	CHECK(mz->cv_params.size() == 3);
	CHECK(mz->compression == "zlib compression");
	CHECK(mz->precision == "64-bit float");
	CHECK(*mz->decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
	CHECK(intensity->precision == "32-bit float");
	CHECK(*intensity->decoded_data == std::vector<float> {1000.0f, 5000.0f, 2000.0f});
}

TEST_CASE("parse_file: accession matching", "[mzml][reader]") {
	ParseOptions options;
	options.hint_matching = HintMatching::ACCESSION;
	auto run = MzMLReader::parse_file(DATA_DIR + "param_groups.mzML", options);
	const auto &mz = *run.spectra[0].find_array("MS:1000514");
	CHECK(mz.compression == "zlib");
	CHECK(mz.precision == "64-bit float");
	CHECK(*mz.decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
}

TEST_CASE("parse_file: chromatograms are skipped", "[mzml][reader]") {
	auto run = MzMLReader::parse_file(DATA_DIR + "with_chromatograms.mzML");
	CHECK(run.id == "run_chrom");
	REQUIRE(run.spectra.size() == 1);
	CHECK(*run.spectra[0].binary_data_arrays[0].decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
}

TEST_CASE("parse_file: document without a run", "[mzml][reader]") {
	CHECK_THROWS_AS(MzMLReader::parse_file(DATA_DIR + "no_run.mzML"), DocumentStructureError);
}

TEST_CASE("parse_file: malformed XML", "[mzml][reader]") {
	CHECK_THROWS_AS(MzMLReader::parse_file(DATA_DIR + "truncated.mzML"), XmlSyntaxError);
}

TEST_CASE("parse_file: nonexistent file", "[mzml][reader]") {
	CHECK_THROWS_WITH(MzMLReader::parse_file(DATA_DIR + "nonexistent.mzML"),
	                  Catch::Matchers::ContainsSubstring("cannot open"));
}

TEST_CASE("parse: read chunk size does not change the result", "[mzml][reader]") {
	auto reference = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML");
	for (size_t chunk : {1, 17, 4096}) {
		INFO("chunk size " << chunk);
		ParseOptions options;
		options.read_chunk_size = chunk;
		auto run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML", options);
		check_same_decoded(reference, run);
	}
}

// ===== in-memory documents =====

TEST_CASE("parse: document from memory", "[mzml][reader]") {
	auto doc = document(spectrum_xml(0, 3, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))));
	auto run = MzMLReader::parse(doc);
	REQUIRE(run.spectra.size() == 1);
	CHECK(*run.spectra[0].binary_data_arrays[0].decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
}

TEST_CASE("parse: missing precision defaults to 32-bit", "[mzml][reader]") {
	auto doc = document(spectrum_xml(0, 3, array_xml(INT3_32, cv_xml("MS:1000515", "intensity array"))));
	auto run = MzMLReader::parse(doc);
	const auto &array = run.spectra[0].binary_data_arrays[0];
	CHECK(array.precision == "32-bit float");
	CHECK(*array.decoded_data == std::vector<float> {1000.0f, 5000.0f, 2000.0f});
}

TEST_CASE("parse: missing precision rejected when configured", "[mzml][reader]") {
	ParseOptions options;
	options.missing_precision = MissingPrecision::REJECT;
	auto doc = document(spectrum_xml(0, 3, array_xml(INT3_32, cv_xml("MS:1000515", "intensity array"))));
	try {
		(void)MzMLReader::parse(doc, options);
		FAIL("expected UnknownPrecisionError");
	} catch (const UnknownPrecisionError &e) {
		CHECK_THAT(e.what(), Catch::Matchers::StartsWith("spectrum 'scan=1': binaryDataArray #0"));
	}
}

TEST_CASE("parse: integer precision is rejected by the decoder", "[mzml][reader]") {
	auto doc = document(spectrum_xml(0, 3, array_xml(INT3_32, cv_xml("MS:1000519", "32-bit integer"))));
	try {
		(void)MzMLReader::parse(doc);
		FAIL("expected UnknownPrecisionError");
	} catch (const UnknownPrecisionError &e) {
		CHECK_THAT(e.tag(), Catch::Matchers::Equals("32-bit integer"));
	}
}

TEST_CASE("parse: unrecognized compression passes bytes through", "[mzml][reader]") {
	auto params = cv_xml("MS:1000523", "64-bit float") + cv_xml("MS:9999999", "exotic compression");
	auto run = MzMLReader::parse(document(spectrum_xml(0, 3, array_xml(MZ3_64, params))));
	const auto &array = run.spectra[0].binary_data_arrays[0];
	CHECK(array.compression == "exotic compression");
	CHECK(*array.decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
}

TEST_CASE("parse: array length mismatch warns by default", "[mzml][reader]") {
	WarningLog log;
	ParseOptions options;
	options.warning_callback = log.callback();
	auto doc = document(spectrum_xml(0, 5, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))));
	auto run = MzMLReader::parse(doc, options);
	CHECK(run.spectra[0].binary_data_arrays[0].decoded_data->size() == 3);
	REQUIRE(log.messages.size() == 1);
	CHECK_THAT(log.messages[0], Catch::Matchers::ContainsSubstring("spectrum 'scan=1'"));
	CHECK_THAT(log.messages[0], Catch::Matchers::ContainsSubstring("defaultArrayLength 5"));
}

TEST_CASE("parse: array length mismatch rejected when configured", "[mzml][reader]") {
	ParseOptions options;
	options.array_length_check = ArrayLengthCheck::REJECT;
	auto doc = document(spectrum_xml(0, 5, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))));
	try {
		(void)MzMLReader::parse(doc, options);
		FAIL("expected ArrayLengthMismatchError");
	} catch (const ArrayLengthMismatchError &e) {
		CHECK(e.expected() == 5);
		CHECK(e.actual() == 3);
		CHECK_THAT(e.what(), Catch::Matchers::StartsWith("spectrum 'scan=1': binaryDataArray #0"));
	}
}

TEST_CASE("parse: array length check disabled", "[mzml][reader]") {
	WarningLog log;
	ParseOptions options;
	options.array_length_check = ArrayLengthCheck::IGNORE;
	options.warning_callback = log.callback();
	auto doc = document("<spectrum index=\"0\" id=\"scan=1\" defaultArrayLength=\"5\"><binaryDataArray "
	                    "encodedLength=\"999\">" +
	                    cv_xml("MS:1000523", "64-bit float") + "<binary>" + MZ3_64 + "</binary></binaryDataArray></spectrum>");
	auto run = MzMLReader::parse(doc, options);
	CHECK(run.spectra[0].binary_data_arrays[0].decoded_data->size() == 3);
	CHECK(log.messages.empty());
}

TEST_CASE("parse: encodedLength differing from the payload warns", "[mzml][reader]") {
	WarningLog log;
	ParseOptions options;
	options.warning_callback = log.callback();
	auto doc = document("<spectrum index=\"0\" id=\"scan=1\" defaultArrayLength=\"3\"><binaryDataArray "
	                    "encodedLength=\"40\">" +
	                    cv_xml("MS:1000523", "64-bit float") + "<binary>" + MZ3_64 + "</binary></binaryDataArray></spectrum>");
	auto run = MzMLReader::parse(doc, options);
	CHECK(run.spectra[0].binary_data_arrays[0].encoded_length == 40);
	CHECK(*run.spectra[0].binary_data_arrays[0].decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
	REQUIRE(log.messages.size() == 1);
	CHECK_THAT(log.messages[0], Catch::Matchers::ContainsSubstring("encodedLength 40"));
}

TEST_CASE("parse: warnings without a callback are dropped", "[mzml][reader]") {
	ParseOptions options;
	options.warning_callback = nullptr;
	auto doc = document(spectrum_xml(0, 5, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))));
	CHECK_NOTHROW(MzMLReader::parse(doc, options));
}

// ===== deferred decoding =====

TEST_CASE("parse: deferred decoding matches inline decoding", "[mzml][reader][threads]") {
	auto inline_run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML");
	for (size_t threads : {2, 4, 16}) {
		INFO("threads " << threads);
		ParseOptions options;
		options.decode_threads = threads;
		auto run = MzMLReader::parse_file(DATA_DIR + "basic_3spectra.mzML", options);
		check_same_decoded(inline_run, run);
		for (const auto &s : run.spectra) {
			for (const auto &array : s.binary_data_arrays) {
				CHECK_FALSE(array.encoded_text.has_value());
				CHECK(array.decoded_data.has_value());
			}
		}
	}
}

TEST_CASE("parse: deferred decoding of many spectra", "[mzml][reader][threads]") {
	std::string spectra;
	for (size_t i = 0; i < 200; i++) {
		auto arrays = array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float") + cv_xml("MS:1000514", "m/z array")) +
		              array_xml(INT3_32, cv_xml("MS:1000521", "32-bit float") + cv_xml("MS:1000515", "intensity array"));
		spectra += spectrum_xml(i, 3, arrays);
	}
	ParseOptions options;
	options.decode_threads = 8;
	auto run = MzMLReader::parse(document(spectra), options);
	REQUIRE(run.spectra.size() == 200);
	for (size_t i = 0; i < run.spectra.size(); i++) {
		CHECK(run.spectra[i].index == i);
	}
	CHECK(*run.spectra[199].find_array("MS:1000515")->decoded_data == std::vector<float> {1000.0f, 5000.0f, 2000.0f});
}

TEST_CASE("parse: deferred decoding reports the first failing array", "[mzml][reader][threads]") {
	auto good = array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"));
	auto bad = array_xml("AAAA!AAA", cv_xml("MS:1000523", "64-bit float"));
	auto doc = document(spectrum_xml(0, 3, good) + spectrum_xml(1, 3, good + bad) + spectrum_xml(2, 3, bad));
	ParseOptions options;
	options.decode_threads = 4;
	try {
		(void)MzMLReader::parse(doc, options);
		FAIL("expected DecodeError");
	} catch (const DecodeError &e) {
		CHECK_THAT(e.what(), Catch::Matchers::StartsWith("spectrum 'scan=2': binaryDataArray #1: invalid base64"));
	}
}

TEST_CASE("parse: deferred decoding applies the length check", "[mzml][reader][threads]") {
	ParseOptions options;
	options.decode_threads = 2;
	options.array_length_check = ArrayLengthCheck::REJECT;
	auto doc = document(spectrum_xml(0, 3, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))) +
	                    spectrum_xml(1, 4, array_xml(MZ3_64, cv_xml("MS:1000523", "64-bit float"))));
	try {
		(void)MzMLReader::parse(doc, options);
		FAIL("expected ArrayLengthMismatchError");
	} catch (const ArrayLengthMismatchError &e) {
		CHECK(e.expected() == 4);
		CHECK_THAT(e.what(), Catch::Matchers::StartsWith("spectrum 'scan=2': binaryDataArray #0"));
	}
}

TEST_CASE("parse: zero decode threads decodes inline", "[mzml][reader][threads]") {
	ParseOptions options;
	options.decode_threads = 0;
	auto run = MzMLReader::parse_file(DATA_DIR + "compressed.mzML", options);
	CHECK(*run.spectra[0].binary_data_arrays[0].decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
}

TEST_CASE("decode_deferred: more threads than arrays", "[mzml][reader][threads]") {
	WarningLog log;
	ParseOptions options;
	options.warning_callback = log.callback();

	Run run;
	run.id = "r";
	for (size_t i = 0; i < 3; i++) {
		Spectrum spectrum;
		spectrum.id = "scan=" + std::to_string(i + 1);
		spectrum.index = i;
		spectrum.default_array_length = 3;
		BinaryDataArray array;
		array.encoded_length = MZ3_64.size();
		array.precision = "64-bit float";
		array.encoded_text = MZ3_64;
		spectrum.binary_data_arrays.push_back(std::move(array));
		run.spectra.push_back(std::move(spectrum));
	}

	MzMLReader(options).decode_deferred(run, 64);
	for (const auto &s : run.spectra) {
		const auto &array = s.binary_data_arrays[0];
		CHECK_FALSE(array.encoded_text.has_value());
		REQUIRE(array.decoded_data.has_value());
		CHECK(*array.decoded_data == std::vector<float> {100.0f, 200.0f, 300.0f});
	}
	CHECK(log.messages.empty());
}
