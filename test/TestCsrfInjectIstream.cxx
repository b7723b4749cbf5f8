// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IstreamFilterTest.hxx"
#include "csrf/InjectIstream.hxx"
#include "istream/StringIstream.hxx"
#include "istream/StringSink.hxx"
#include "istream/Reader.hxx"

#include <gtest/gtest.h>

#include <string>

using std::string_view_literals::operator""sv;

static constexpr auto token = "AbCd-_0123"sv;

#define HIDDEN_INPUT "<input type=\"hidden\" name=\"csrf-token\" value=\"AbCd-_0123\"/>"

class IstreamCsrfInjectTestTraits {
public:
	static constexpr const char *expected_result =
		"<html><body><div><form method='POST'>" HIDDEN_INPUT
		"<input name=\"a\"></form></div>"
		"<FORM\taction=\"/x?a>b\" method=\"post\">" HIDDEN_INPUT
		"</FORM><formation>"
		"<form/>" HIDDEN_INPUT
		"<for</body></html>";

	static constexpr bool enable_blocking = true;

	UnusedIstreamPtr CreateInput() const noexcept {
		return istream_string_new("<html><body><div><form method='POST'>"
					  "<input name=\"a\"></form></div>"
					  "<FORM\taction=\"/x?a>b\" method=\"post\">"
					  "</FORM><formation>"
					  "<form/>"
					  "<for</body></html>");
	}

	UnusedIstreamPtr CreateTest(UnusedIstreamPtr input) const noexcept {
		return NewCsrfInjectIstream(std::move(input), token);
	}
};

INSTANTIATE_TYPED_TEST_CASE_P(CsrfInject, IstreamFilterTest,
			      IstreamCsrfInjectTestTraits);

namespace {

class RecordingStringSinkHandler final : public StringSinkHandler {
public:
	std::string value;
	std::exception_ptr error;
	bool finished = false;

	/* virtual methods from class StringSinkHandler */

	void OnStringSinkSuccess(std::string &&_value) noexcept override {
		value = std::move(_value);
		finished = true;
	}

	void OnStringSinkError(std::exception_ptr _error) noexcept override {
		error = std::move(_error);
		finished = true;
	}
};

} // anonymous namespace

static std::string
Collect(UnusedIstreamPtr input)
{
	RecordingStringSinkHandler handler;
	auto &sink = NewStringSink(std::move(input), handler);
	ReadStringSink(sink);

	EXPECT_TRUE(handler.finished);
	if (handler.error)
		std::rethrow_exception(handler.error);

	return std::move(handler.value);
}

TEST(CsrfInjectIstream, Basic)
{
	EXPECT_EQ(CsrfInjectBuffer("<div><form method='POST'></form></div>"sv,
				   token),
		  "<div><form method='POST'>" HIDDEN_INPUT "</form></div>");
}

TEST(CsrfInjectIstream, NoForm)
{
	for (const auto s : {
			""sv,
			"hello world"sv,
			"<"sv,
			"<f"sv,
			"<form"sv,
			"<form method=\"post\""sv,
			"<formation>"sv,
			"<forms>"sv,
			"< form>"sv,
			"<div>form</div>"sv,
			"<<<<"sv,
		}) {
		EXPECT_EQ(CsrfInjectBuffer(s, token), s);
	}
}

TEST(CsrfInjectIstream, Delimiters)
{
	EXPECT_EQ(CsrfInjectBuffer("<form>"sv, token), "<form>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<FoRm>"sv, token), "<FoRm>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<form/>"sv, token), "<form/>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<form\n>"sv, token), "<form\n>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<form\r\nid=x>"sv, token),
		  "<form\r\nid=x>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<<form>"sv, token), "<<form>" HIDDEN_INPUT);
	EXPECT_EQ(CsrfInjectBuffer("<fo<form>"sv, token), "<fo<form>" HIDDEN_INPUT);
}

TEST(CsrfInjectIstream, Quotes)
{
	EXPECT_EQ(CsrfInjectBuffer("<form a='>' b=\">\">x"sv, token),
		  "<form a='>' b=\">\">" HIDDEN_INPUT "x");
	EXPECT_EQ(CsrfInjectBuffer("<form a=\"it's\">x"sv, token),
		  "<form a=\"it's\">" HIDDEN_INPUT "x");

	/* unterminated quote: no injection */
	EXPECT_EQ(CsrfInjectBuffer("<form a='>"sv, token), "<form a='>");

	/* whitespace between '=' and the quote */
	EXPECT_EQ(CsrfInjectBuffer("<form a = '>'>x"sv, token),
		  "<form a = '>'>" HIDDEN_INPUT "x");
}

/**
 * A quote which is not the first character of an attribute value is
 * an ordinary character.
 */
TEST(CsrfInjectIstream, UnquotedApostrophe)
{
	EXPECT_EQ(CsrfInjectBuffer("<form title=it's><p>x</p></form>"sv, token),
		  "<form title=it's>" HIDDEN_INPUT "<p>x</p></form>");
	EXPECT_EQ(CsrfInjectBuffer("<form title=it's><a href='y'>link</a></form>"sv, token),
		  "<form title=it's>" HIDDEN_INPUT "<a href='y'>link</a></form>");
	EXPECT_EQ(CsrfInjectBuffer("<form data-x=5\"><p>x</p></form>"sv, token),
		  "<form data-x=5\">" HIDDEN_INPUT "<p>x</p></form>");
	EXPECT_EQ(CsrfInjectBuffer("<form it's>x"sv, token),
		  "<form it's>" HIDDEN_INPUT "x");

	/* the same, split at every position */
	static constexpr auto input =
		"<form title=it's a= \"'>\"><form data-x=5\">y"sv;
	const auto expected = CsrfInjectBuffer(input, token);
	ASSERT_EQ(expected,
		  "<form title=it's a= \"'>\">" HIDDEN_INPUT
		  "<form data-x=5\">" HIDDEN_INPUT "y");

	for (std::size_t i = 0; i <= input.size(); ++i) {
		auto istream =
			NewConcatIstream(istream_string_new(std::string{input.substr(0, i)}),
					 istream_string_new(std::string{input.substr(i)}));

		EXPECT_EQ(Collect(NewCsrfInjectIstream(std::move(istream), token)),
			  expected) << "split at " << i;
	}

	EXPECT_EQ(Collect(NewCsrfInjectIstream(NewChunkIstream(istream_string_new(std::string{input}), 1),
					       token)),
		  expected);
}

TEST(CsrfInjectIstream, Multiple)
{
	EXPECT_EQ(CsrfInjectBuffer("<form><form>"sv, token),
		  "<form>" HIDDEN_INPUT "<form>" HIDDEN_INPUT);
}

/**
 * Split the input at every possible position; the output must not
 * depend on it.
 */
TEST(CsrfInjectIstream, EverySplit)
{
	static constexpr auto input =
		"a<form method='POST' x=\">\"><for<FORM>b<form"sv;
	const auto expected = CsrfInjectBuffer(input, token);
	ASSERT_EQ(expected,
		  "a<form method='POST' x=\">\">" HIDDEN_INPUT
		  "<for<FORM>" HIDDEN_INPUT "b<form");

	for (std::size_t i = 0; i <= input.size(); ++i) {
		for (std::size_t j = i; j <= input.size(); ++j) {
			auto istream =
				NewConcatIstream(istream_string_new(std::string{input.substr(0, i)}),
						 istream_string_new(std::string{input.substr(i, j - i)}),
						 istream_string_new(std::string{input.substr(j)}));

			EXPECT_EQ(Collect(NewCsrfInjectIstream(std::move(istream), token)),
				  expected) << "split at " << i << ", " << j;
		}
	}
}

TEST(CsrfInjectIstream, ByteByByte)
{
	static constexpr auto input = "<div><form method='POST'></form></div>"sv;

	EXPECT_EQ(Collect(NewCsrfInjectIstream(NewChunkIstream(istream_string_new(std::string{input}), 1),
					       token)),
		  CsrfInjectBuffer(input, token));
}

/**
 * Pull the output into small buffers; back pressure may occur
 * anywhere, including inside the inserted markup.
 */
TEST(CsrfInjectIstream, Reader)
{
	static constexpr auto input =
		"<div><form method='POST'></form><form></form></div>"sv;
	const auto expected = CsrfInjectBuffer(input, token);

	for (std::size_t buffer_size = 1; buffer_size <= 16; ++buffer_size) {
		IstreamReader reader(NewCsrfInjectIstream(istream_string_new(std::string{input}),
							  token));

		std::string output;
		std::byte buffer[16];

		while (true) {
			const std::size_t nbytes =
				reader.Read(std::span{buffer}.first(buffer_size));
			if (nbytes == 0)
				break;

			output.append((const char *)buffer, nbytes);
		}

		EXPECT_TRUE(reader.IsEof());
		EXPECT_EQ(output, expected) << "buffer size " << buffer_size;
	}
}

TEST(CsrfInjectIstream, Error)
{
	auto istream =
		NewConcatIstream(istream_string_new("<form>x"),
				 istream_fail_new(std::make_exception_ptr(std::runtime_error("test_fail"))));

	IstreamReader reader(NewCsrfInjectIstream(std::move(istream), token));

	std::string output;
	std::byte buffer[64];

	try {
		while (true) {
			const std::size_t nbytes = reader.Read(buffer);
			if (nbytes == 0)
				break;

			output.append((const char *)buffer, nbytes);
		}

		FAIL() << "error not propagated";
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(), "test_fail");
	}

	/* everything before the error has been delivered */
	EXPECT_EQ(output, "<form>" HIDDEN_INPUT "x");
	EXPECT_FALSE(reader.IsEof());
}

TEST(CsrfInjectIstream, Length)
{
	auto istream = NewCsrfInjectIstream(istream_string_new("<form>"), token);

	/* the output is at least as long as the input */
	const auto length = istream.GetLength();
	EXPECT_EQ(length.length, 6U);
	EXPECT_FALSE(length.exhaustive);
}
