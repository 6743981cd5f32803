#pragma once

#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mzparse {

enum class XmlTokenType { OPEN, CLOSE, TEXT, END };

// One event from the tokenizer. OPEN carries name + attributes, CLOSE carries name,
// TEXT carries character data with entities already decoded.
struct XmlToken {
	XmlTokenType type = XmlTokenType::END;
	std::string name;
	std::vector<std::pair<std::string, std::string>> attributes;
	std::string text;
};

// Pull interface the document walker reads from
class XmlTokenSource {
public:
	virtual ~XmlTokenSource() = default;

	// Fills `token` with the next event. Returns false once END has been delivered.
	virtual bool next(XmlToken &token) = 0;
};

// Tokens from expat. The document is fed to the parser in chunks as tokens are pulled,
// so only one chunk's worth of events is buffered at a time.
// Adjacent character data is coalesced into one TEXT token, trimmed; whitespace-only text is dropped.
class ExpatTokenSource : public XmlTokenSource {
	struct ConstructTag {
		explicit ConstructTag() = default;
	};

public:
	static constexpr size_t DEFAULT_CHUNK_SIZE = 65536;

	// The document must outlive the source
	static std::unique_ptr<ExpatTokenSource> from_memory(std::string_view document,
	                                                     size_t chunk_size = DEFAULT_CHUNK_SIZE);
	static std::unique_ptr<ExpatTokenSource> from_file(const std::string &path,
	                                                   size_t chunk_size = DEFAULT_CHUNK_SIZE);

	// Use from_memory / from_file; ConstructTag is private
	ExpatTokenSource(ConstructTag, size_t chunk_size);
	~ExpatTokenSource() override;

	ExpatTokenSource(const ExpatTokenSource &) = delete;
	ExpatTokenSource &operator=(const ExpatTokenSource &) = delete;

	bool next(XmlToken &token) override;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

// Replays a fixed token list; END is appended if the list does not end with one
class VectorTokenSource : public XmlTokenSource {
public:
	explicit VectorTokenSource(std::vector<XmlToken> tokens);

	bool next(XmlToken &token) override;

	// Builders for synthetic streams
	static XmlToken open(const std::string &name, std::vector<std::pair<std::string, std::string>> attributes = {});
	static XmlToken close(const std::string &name);
	static XmlToken text(const std::string &text);

private:
	std::deque<XmlToken> tokens_;
	bool finished_ = false;
};

} // namespace mzparse
