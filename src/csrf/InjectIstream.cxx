// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "InjectIstream.hxx"
#include "csrf-guard/Protocol.hxx"
#include "istream/FacadeIstream.hxx"
#include "istream/MemoryIstream.hxx"
#include "istream/StringSink.hxx"
#include "istream/UnusedPtr.hxx"
#include "istream/New.hxx"

#include <array>
#include <cassert>

#include <string.h>

using std::string_view_literals::operator""sv;

static constexpr std::string_view form_tag = "<form"sv;

static constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? ch + ('a' - 'A')
		: ch;
}

static constexpr bool
IsWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' ||
		ch == '\f';
}

/**
 * May this character follow the tag name "form"?
 */
static constexpr bool
IsTagNameDelimiter(char ch) noexcept
{
	return IsWhitespace(ch) || ch == '>' || ch == '/';
}

/**
 * Parser state inside a "<form" tag.  A quote character opens an
 * attribute value only if it is the first non-whitespace character
 * after '='; elsewhere (e.g. in "title=it's"), it is an ordinary
 * character.
 */
struct TagState {
	/** the quote character of the open attribute value or 0 */
	char quote = 0;

	/** has '=' been seen without a value character after it? */
	bool after_equals = false;

	/**
	 * Feed one character.
	 *
	 * @return true if this is the closing '>' of the tag
	 */
	constexpr bool Feed(char ch) noexcept {
		if (quote != 0) {
			if (ch == quote)
				quote = 0;
			return false;
		}

		if (ch == '>')
			return true;

		if (ch == '=')
			after_equals = true;
		else if (!IsWhitespace(ch)) {
			if (after_equals && (ch == '"' || ch == '\''))
				quote = ch;
			after_equals = false;
		}

		return false;
	}
};

class CsrfInjectIstream final : public FacadeIstream {
	enum class State {
		/** searching for '<' */
		NONE,

		/** a prefix of "<form" has been seen and is buffered in
		    #prefix */
		PREFIX,

		/** inside a "<form" tag, looking for its closing '>' */
		TAG,
	};

	State state = State::NONE;

	/**
	 * Only used in #TAG state.
	 */
	TagState tag;

	std::size_t prefix_length;

	/**
	 * The part of the input that might be a "<form" tag; it has
	 * been consumed from the input, but not yet been forwarded.
	 */
	std::array<char, form_tag.size()> prefix;

	/**
	 * Data which must be submitted to our handler before anything
	 * else; it points into #prefix or #markup.
	 */
	std::span<const char> pending{};

	/**
	 * The hidden input element containing the token.
	 */
	const std::string markup;

public:
	CsrfInjectIstream(UnusedIstreamPtr &&_input,
			  std::string_view token) noexcept
		:FacadeIstream(std::move(_input)),
		 markup(std::string{CsrfGuard::HIDDEN_INPUT_PREFIX} +
			std::string{token} +
			std::string{CsrfGuard::HIDDEN_INPUT_SUFFIX}) {}

private:
	/**
	 * Submit #pending to our handler.
	 *
	 * @return true if #pending is now empty, false if the handler
	 * has blocked or this object has been destroyed
	 */
	bool FlushPending() noexcept;

	/**
	 * Feed input data to the parser.
	 *
	 * @return the number of bytes consumed (0 if this object has
	 * been destroyed)
	 */
	std::size_t Feed(std::span<const std::byte> src) noexcept;

public:
	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override {
		/* this is a lower bound: the output contains at least
		   all input bytes */
		IstreamLength result{
			.length = pending.size(),
			.exhaustive = !HasInput(),
		};

		if (state == State::PREFIX)
			result.length += prefix_length;

		if (HasInput()) {
			result.length += GetInputLength().length;
			result.exhaustive = false;
		}

		return result;
	}

	void _Read() noexcept override;

	void _Close() noexcept override {
		if (HasInput())
			CloseInput();

		Destroy();
	}

	/* virtual methods from class IstreamHandler */

	std::size_t OnData(std::span<const std::byte> src) noexcept override {
		return Feed(src);
	}

	void OnEof() noexcept override;
	void OnError(std::exception_ptr ep) noexcept override;
};

bool
CsrfInjectIstream::FlushPending() noexcept
{
	assert(!pending.empty());

	const DestructObserver destructed(*this);

	const std::size_t nbytes = InvokeData(std::as_bytes(pending));
	if (destructed)
		return false;

	pending = pending.subspan(nbytes);
	return pending.empty();
}

std::size_t
CsrfInjectIstream::Feed(std::span<const std::byte> src) noexcept
{
	const DestructObserver destructed(*this);

	const char *const begin = (const char *)src.data();
	const char *const end = begin + src.size();
	const char *p = begin;

	while (p < end) {
		if (!pending.empty() && !FlushPending())
			return destructed ? 0 : std::size_t(p - begin);

		switch (state) {
		case State::NONE: {
			const char *lt = (const char *)memchr(p, '<', end - p);
			const char *stop = lt != nullptr ? lt : end;

			if (stop > p) {
				const std::size_t nbytes =
					InvokeData(std::as_bytes(std::span{p, stop}));
				if (destructed)
					return 0;

				p += nbytes;
				if (p < stop)
					/* blocking */
					return p - begin;
			}

			if (lt != nullptr) {
				prefix[0] = *p++;
				prefix_length = 1;
				state = State::PREFIX;
			}

			break;
		}

		case State::PREFIX:
			if (prefix_length < prefix.size()) {
				if (ToLowerASCII(*p) == form_tag[prefix_length]) {
					prefix[prefix_length++] = *p++;
					break;
				}

				/* mismatch: submit the buffered bytes
				   unmodified and parse this byte again in
				   state NONE */
				pending = std::span{prefix}.first(prefix_length);
				state = State::NONE;
			} else {
				/* the delimiter is not consumed here; in
				   state TAG, it may be the closing '>' */
				pending = prefix;
				if (IsTagNameDelimiter(*p)) {
					state = State::TAG;
					tag = {};
				} else
					state = State::NONE;
			}

			break;

		case State::TAG: {
			/* find the closing '>' outside of quoted
			   attribute values */
			TagState t = tag;
			const char *gt = nullptr;
			for (const char *i = p; i < end; ++i) {
				if (t.Feed(*i)) {
					gt = i;
					break;
				}
			}

			const char *stop = gt != nullptr ? gt + 1 : end;
			const std::size_t nbytes =
				InvokeData(std::as_bytes(std::span{p, stop}));
			if (destructed)
				return 0;

			for (std::size_t i = 0; i < nbytes; ++i)
				tag.Feed(p[i]);
			p += nbytes;

			if (p < stop)
				/* blocking */
				return p - begin;

			if (gt != nullptr) {
				state = State::NONE;
				tag = {};
				pending = markup;
			}

			break;
		}
		}
	}

	return src.size();
}

void
CsrfInjectIstream::_Read() noexcept
{
	if (!pending.empty() && !FlushPending())
		return;

	if (HasInput())
		ReadInput();
	else
		DestroyEof();
}

void
CsrfInjectIstream::OnEof() noexcept
{
	ClearInput();

	if (state == State::PREFIX) {
		/* an unfinished "<form" at the end: submit it
		   unmodified */
		assert(pending.empty());

		pending = std::span{prefix}.first(prefix_length);
		state = State::NONE;
	}

	if (!pending.empty() && !FlushPending())
		/* blocking (or destroyed); _Read() will finish this */
		return;

	DestroyEof();
}

void
CsrfInjectIstream::OnError(std::exception_ptr ep) noexcept
{
	ClearInput();
	DestroyError(std::move(ep));
}

/*
 * constructor
 *
 */

UnusedIstreamPtr
NewCsrfInjectIstream(UnusedIstreamPtr input, std::string_view token) noexcept
{
	return NewIstreamPtr<CsrfInjectIstream>(std::move(input), token);
}

namespace {

class InjectBufferHandler final : public StringSinkHandler {
public:
	std::string value;
	std::exception_ptr error;

	/* virtual methods from class StringSinkHandler */

	void OnStringSinkSuccess(std::string &&_value) noexcept override {
		value = std::move(_value);
	}

	void OnStringSinkError(std::exception_ptr _error) noexcept override {
		error = std::move(_error);
	}
};

} // anonymous namespace

std::string
CsrfInjectBuffer(std::string_view body, std::string_view token)
{
	InjectBufferHandler handler;

	auto &sink = NewStringSink(NewCsrfInjectIstream(NewIstreamPtr<MemoryIstream>(std::as_bytes(std::span{body})),
							token),
				   handler);
	ReadStringSink(sink);

	if (handler.error)
		std::rethrow_exception(handler.error);

	return std::move(handler.value);
}
