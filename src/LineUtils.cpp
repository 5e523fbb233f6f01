#include "LineUtils.hpp"

namespace {

using traits = std::char_traits<char>;

// Feed every byte of the next line, terminator included, to keep().
// Returns false when the stream had nothing left.
template <typename Keep>
bool consume_line(std::istream& in, Keep keep) {
	std::istream::sentry guard(in, true);
	if (!guard) return false;
	std::streambuf* buf = in.rdbuf();
	bool consumed = false;
	for (;;) {
		traits::int_type c = buf->sbumpc();
		if (traits::eq_int_type(c, traits::eof())) {
			in.setstate(std::ios::eofbit);
			break;
		}
		consumed = true;
		char ch = traits::to_char_type(c);
		keep(ch);
		if (ch == '\n') break;
		if (ch == '\r') {
			if (traits::eq_int_type(buf->sgetc(), traits::to_int_type('\n'))) {
				keep(traits::to_char_type(buf->sbumpc()));
			}
			break;
		}
	}
	return consumed;
}

} // namespace

LineRead read_raw_line(std::istream& in, std::string& line, size_t max_bytes) {
	line.clear();
	bool oversize = false;
	bool found = consume_line(in, [&](char ch) {
		if (line.size() < max_bytes) {
			line.push_back(ch);
		} else {
			oversize = true;
		}
	});
	if (!found) return LineRead::End;
	return oversize ? LineRead::Oversize : LineRead::Line;
}

bool skip_raw_line(std::istream& in) {
	return consume_line(in, [](char) {});
}

void strip_line_terminator(std::string& line) {
	if (!line.empty() && line.back() == '\n') line.pop_back();
	if (!line.empty() && line.back() == '\r') line.pop_back();
}

void normalize_newlines(std::string& text) {
	size_t out = 0;
	for (size_t i = 0; i < text.size(); ++i) {
		char ch = text[i];
		if (ch == '\r') {
			if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
			ch = '\n';
		}
		text[out++] = ch;
	}
	text.resize(out);
}
