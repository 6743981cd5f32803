#include "XmlTokenSource.hpp"
#include "MzMLErrors.hpp"
#include <algorithm>
#include <climits>
#include <cstdio>
#include <cstring>
#include <exception>
#include <expat.h>

namespace mzparse {

static bool is_xml_space(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

struct ExpatTokenSource::Impl {
	XML_Parser parser = nullptr;

	// Exactly one input is set
	FILE *file = nullptr;
	std::string path;
	std::string_view memory;
	size_t offset = 0;

	size_t chunk_size;
	std::vector<char> buffer;

	std::deque<XmlToken> pending;
	std::string text;
	bool input_done = false;
	bool end_delivered = false;

	// Exception captured from SAX callback (expat is C; cannot throw through it)
	std::exception_ptr pending_exception;

	explicit Impl(size_t chunk) : chunk_size(chunk == 0 ? DEFAULT_CHUNK_SIZE : std::min<size_t>(chunk, INT_MAX)) {
		parser = XML_ParserCreateNS(nullptr, '|');
		if (!parser) {
			throw MzMLError("failed to create XML parser");
		}
		XML_SetUserData(parser, this);
		XML_SetElementHandler(parser, start_element_handler, end_element_handler);
		XML_SetCharacterDataHandler(parser, char_data_handler);
	}

	~Impl() {
		if (parser) {
			XML_ParserFree(parser);
		}
		if (file) {
			std::fclose(file);
		}
	}

	// Strip namespace prefix from element name (expat with NS uses "ns|local")
	static const char *local_name(const char *full_name) {
		const char *pipe = std::strrchr(full_name, '|');
		return pipe ? pipe + 1 : full_name;
	}

	void flush_text() {
		size_t begin = 0;
		size_t end = text.size();
		while (begin < end && is_xml_space(text[begin])) {
			begin++;
		}
		while (end > begin && is_xml_space(text[end - 1])) {
			end--;
		}
		if (begin < end) {
			XmlToken token;
			token.type = XmlTokenType::TEXT;
			token.text = text.substr(begin, end - begin);
			pending.push_back(std::move(token));
		}
		text.clear();
	}

	void on_start_element(const char *name, const char **attrs) {
		flush_text();
		XmlToken token;
		token.type = XmlTokenType::OPEN;
		token.name = local_name(name);
		for (int i = 0; attrs[i]; i += 2) {
			token.attributes.emplace_back(local_name(attrs[i]), attrs[i + 1]);
		}
		pending.push_back(std::move(token));
	}

	void on_end_element(const char *name) {
		flush_text();
		XmlToken token;
		token.type = XmlTokenType::CLOSE;
		token.name = local_name(name);
		pending.push_back(std::move(token));
	}

	// Static SAX callbacks: catch all C++ exceptions to avoid UB propagating through expat's C frames
	static void XMLCALL start_element_handler(void *user_data, const char *name, const char **attrs) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception) {
			return;
		}
		try {
			self->on_start_element(name, attrs);
		} catch (...) {
			self->pending_exception = std::current_exception();
			XML_StopParser(self->parser, XML_FALSE);
		}
	}

	static void XMLCALL end_element_handler(void *user_data, const char *name) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception) {
			return;
		}
		try {
			self->on_end_element(name);
		} catch (...) {
			self->pending_exception = std::current_exception();
			XML_StopParser(self->parser, XML_FALSE);
		}
	}

	static void XMLCALL char_data_handler(void *user_data, const char *s, int len) {
		auto *self = static_cast<Impl *>(user_data);
		if (self->pending_exception) {
			return;
		}
		try {
			self->text.append(s, static_cast<size_t>(len));
		} catch (...) {
			self->pending_exception = std::current_exception();
			XML_StopParser(self->parser, XML_FALSE);
		}
	}

	// Hand the next chunk of input to expat
	void feed() {
		const char *data = nullptr;
		size_t len = 0;
		if (file) {
			len = std::fread(buffer.data(), 1, buffer.size(), file);
			if (len == 0 && std::ferror(file)) {
				throw MzMLError("read error in " + path);
			}
			data = buffer.data();
		} else {
			len = std::min(chunk_size, memory.size() - offset);
			data = memory.data() + offset;
			offset += len;
		}
		bool is_final = (len == 0);

		auto status = XML_Parse(parser, data, static_cast<int>(len), is_final ? XML_TRUE : XML_FALSE);

		if (pending_exception) {
			std::rethrow_exception(pending_exception);
		}
		if (status == XML_STATUS_ERROR) {
			XmlSyntaxError err(XML_GetCurrentLineNumber(parser), XML_ErrorString(XML_GetErrorCode(parser)));
			if (!path.empty()) {
				err.add_context(path);
			}
			throw err;
		}
		if (is_final) {
			input_done = true;
		}
	}
};

ExpatTokenSource::ExpatTokenSource(ConstructTag, size_t chunk_size) : impl_(std::make_unique<Impl>(chunk_size)) {
}

ExpatTokenSource::~ExpatTokenSource() = default;

std::unique_ptr<ExpatTokenSource> ExpatTokenSource::from_memory(std::string_view document, size_t chunk_size) {
	auto source = std::make_unique<ExpatTokenSource>(ConstructTag {}, chunk_size);
	source->impl_->memory = document;
	return source;
}

std::unique_ptr<ExpatTokenSource> ExpatTokenSource::from_file(const std::string &path, size_t chunk_size) {
	auto source = std::make_unique<ExpatTokenSource>(ConstructTag {}, chunk_size);
	auto &impl = *source->impl_;
	impl.path = path;
	impl.file = std::fopen(path.c_str(), "rb");
	if (!impl.file) {
		throw MzMLError("cannot open file: " + path);
	}
	impl.buffer.resize(impl.chunk_size);
	return source;
}

bool ExpatTokenSource::next(XmlToken &token) {
	while (impl_->pending.empty()) {
		if (impl_->input_done) {
			if (impl_->end_delivered) {
				return false;
			}
			impl_->end_delivered = true;
			token = XmlToken {};
			return true;
		}
		impl_->feed();
	}
	token = std::move(impl_->pending.front());
	impl_->pending.pop_front();
	return true;
}

VectorTokenSource::VectorTokenSource(std::vector<XmlToken> tokens) : tokens_(tokens.begin(), tokens.end()) {
	if (tokens_.empty() || tokens_.back().type != XmlTokenType::END) {
		tokens_.emplace_back();
	}
}

bool VectorTokenSource::next(XmlToken &token) {
	if (finished_ || tokens_.empty()) {
		return false;
	}
	token = std::move(tokens_.front());
	tokens_.pop_front();
	if (token.type == XmlTokenType::END) {
		finished_ = true;
	}
	return true;
}

XmlToken VectorTokenSource::open(const std::string &name, std::vector<std::pair<std::string, std::string>> attributes) {
	XmlToken token;
	token.type = XmlTokenType::OPEN;
	token.name = name;
	token.attributes = std::move(attributes);
	return token;
}

XmlToken VectorTokenSource::close(const std::string &name) {
	XmlToken token;
	token.type = XmlTokenType::CLOSE;
	token.name = name;
	return token;
}

XmlToken VectorTokenSource::text(const std::string &text) {
	XmlToken token;
	token.type = XmlTokenType::TEXT;
	token.text = text;
	return token;
}

} // namespace mzparse
