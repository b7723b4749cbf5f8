// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "csrf/PathPattern.hxx"
#include "csrf/Error.hxx"

#include <gtest/gtest.h>

TEST(PathPattern, Match)
{
	const auto p = PathPattern::Compile("/a/<x>/c");

	const auto m = p.Match("/a/b/c");
	ASSERT_TRUE(m);
	ASSERT_EQ(m->size(), 1U);
	EXPECT_EQ(m->at("x"), "b");

	EXPECT_FALSE(p.Match("/a/b/c/d"));
	EXPECT_FALSE(p.Match("/a/c"));
	EXPECT_FALSE(p.Match("/x/b/c"));
	EXPECT_FALSE(p.Match("a/b/c"));
	EXPECT_FALSE(p.Match(""));
}

TEST(PathPattern, Literal)
{
	const auto p = PathPattern::Compile("/ex1");
	EXPECT_TRUE(p.Match("/ex1"));
	EXPECT_TRUE(p.Match("/ex1")->empty());
	EXPECT_FALSE(p.Match("/ex1/"));
	EXPECT_FALSE(p.Match("/ex"));
	EXPECT_FALSE(p.Match("/"));

	const auto root = PathPattern::Compile("/");
	EXPECT_TRUE(root.Match("/"));
	EXPECT_FALSE(root.Match("/a"));
}

TEST(PathPattern, PercentDecoding)
{
	const auto p = PathPattern::Compile("/a%20b/<x>");

	auto m = p.Match("/a%20b/c%2Fd");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->at("x"), "c/d");

	/* the literal is compared after decoding */
	EXPECT_TRUE(p.Match("/a%20b/x"));
	EXPECT_FALSE(p.Match("/a+b/x"));

	/* undecodable input */
	EXPECT_FALSE(p.Match("/a%20b/%zz"));
	EXPECT_FALSE(p.Match("/a%2/x"));
}

TEST(PathPattern, MultipleCaptures)
{
	const auto p = PathPattern::Compile("/<a>/x/<b>");

	const auto m = p.Match("/1/x/2");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->at("a"), "1");
	EXPECT_EQ(m->at("b"), "2");

	/* a capture binds exactly one segment, which may be empty */
	const auto e = p.Match("//x/2");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->at("a"), "");
}

TEST(PathPattern, Query)
{
	const auto p = PathPattern::Compile("/csrf-error?where=<other>&fixed=1");

	const auto m = p.Match("/csrf-error?fixed=1&where=abc&unrelated=x");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->at("other"), "abc");

	EXPECT_FALSE(p.Match("/csrf-error?where=abc"));
	EXPECT_FALSE(p.Match("/csrf-error?where=abc&fixed=2"));
	EXPECT_FALSE(p.Match("/csrf-error"));

	/* a pattern without a query ignores the query string */
	const auto q = PathPattern::Compile("/ex2/<dyn>");
	const auto n = q.Match("/ex2/abcd?foo=bar");
	ASSERT_TRUE(n);
	EXPECT_EQ(n->at("dyn"), "abcd");
}

TEST(PathPattern, DuplicateQueryParameter)
{
	EXPECT_THROW(PathPattern::Compile("/a?k=<x>&k=<y>"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/a?k=1&k=2"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/a?k=1&%6B=<x>"), CsrfConfigError);

	/* the concrete URI may repeat a parameter; the first one wins */
	const auto p = PathPattern::Compile("/a?k=<x>&l=<y>");
	const auto m = p.Match("/a?k=1&l=2&k=3");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->at("x"), "1");
	EXPECT_EQ(m->at("y"), "2");
}

TEST(PathPattern, Render)
{
	const auto p = PathPattern::Compile("/dst/<x>");

	PathCaptures captures;
	EXPECT_FALSE(p.Render(captures));

	captures.emplace("x", "b");
	EXPECT_EQ(p.Render(captures), "/dst/b");

	/* captured values are escaped */
	captures["x"] = "a b/c";
	EXPECT_EQ(p.Render(captures), "/dst/a%20b%2Fc");

	/* literals are emitted verbatim */
	const auto q = PathPattern::Compile("/a%20b/<x>?k=<y>&l=v%2F");
	captures.emplace("y", "?&");
	EXPECT_EQ(q.Render(captures), "/a%20b/a%20b%2Fc?k=%3F%26&l=v%2F");
}

TEST(PathPattern, MatchAndRender)
{
	const auto source = PathPattern::Compile("/some/<other>/path");
	const auto target = CompileExceptionTarget(source, "/csrf-error?where=<other>");

	const auto m = source.Match("/some/thing/path");
	ASSERT_TRUE(m);
	EXPECT_EQ(target.Render(*m), "/csrf-error?where=thing");
}

TEST(PathPattern, Captures)
{
	const auto p = PathPattern::Compile("/<a>/b?c=<d>");
	EXPECT_TRUE(p.HasCapture("a"));
	EXPECT_TRUE(p.HasCapture("d"));
	EXPECT_FALSE(p.HasCapture("b"));
	EXPECT_FALSE(p.HasCapture("c"));

	const auto names = p.GetCaptureNames();
	ASSERT_EQ(names.size(), 2U);
	EXPECT_EQ(names[0], "a");
	EXPECT_EQ(names[1], "d");
}

TEST(PathPattern, Malformed)
{
	EXPECT_THROW(PathPattern::Compile(""), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("a/b"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/<>"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/<a b>"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/<a>/<a>"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/x<a>"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/<a"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/%zz"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/a?b"), CsrfConfigError);
	EXPECT_THROW(PathPattern::Compile("/a?<b>=c"), CsrfConfigError);
}

TEST(PathPattern, DefaultTarget)
{
	EXPECT_NO_THROW(CompileDefaultTarget("/"));
	EXPECT_NO_THROW(CompileDefaultTarget("/csrf"));
	EXPECT_NO_THROW(CompileDefaultTarget("/<uri>"));
	EXPECT_NO_THROW(CompileDefaultTarget("/csrf?from=<uri>"));
	EXPECT_THROW(CompileDefaultTarget("/<invalid>"), CsrfConfigError);
	EXPECT_THROW(CompileDefaultTarget("/<uri>/<x>"), CsrfConfigError);

	const auto p = CompileDefaultTarget("/csrf?from=<uri>");
	PathCaptures captures;
	captures.emplace("uri", "/a/b?c=d");
	EXPECT_EQ(p.Render(captures), "/csrf?from=%2Fa%2Fb%3Fc%3Dd");
}

TEST(PathPattern, ExceptionTarget)
{
	const auto source = PathPattern::Compile("/ex2/<dyn>");
	EXPECT_NO_THROW(CompileExceptionTarget(source, "/ex2-target/<dyn>"));
	EXPECT_NO_THROW(CompileExceptionTarget(source, "/ex2-target"));
	EXPECT_THROW(CompileExceptionTarget(source, "/ex2-target/<other>"),
		     CsrfConfigError);
}
