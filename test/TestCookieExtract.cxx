// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/CookieExtract.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(CookieExtract, Basic)
{
	constexpr auto input = "a=b"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "c").data(), nullptr);
	ASSERT_EQ(ExtractCookieRaw(input, "a"), "b"sv);
}

TEST(CookieExtract, Basic2)
{
	constexpr auto input = "c=d;e=f"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "c"), "d"sv);
	ASSERT_EQ(ExtractCookieRaw(input, "e"), "f"sv);
}

TEST(CookieExtract, Quoted)
{
	constexpr auto input = "quoted=\"quoted!\\\\"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "quoted"), "quoted!\\\\");
}

TEST(CookieExtract, Invalid1)
{
	constexpr auto input = "invalid1=foo\t"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "invalid1"), "foo");
}

TEST(CookieExtract, Invalid2)
{
	/* this is actually invalid, but unfortunately RFC ignorance is
	   viral, and forces us to accept square brackets :-( */
	constexpr auto input = "invalid2=foo |[bar] ,"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "invalid2"), "foo |[bar] ,");
}

TEST(CookieExtract, Base64Url)
{
	constexpr auto input = "something=before; csrf=Ab-_09; and=after"sv;
	ASSERT_EQ(ExtractCookieRaw(input, "csrf"), "Ab-_09"sv);
}

TEST(CookieExtract, Empty)
{
	constexpr auto input = "csrf="sv;
	const auto value = ExtractCookieRaw(input, "csrf");
	ASSERT_NE(value.data(), nullptr);
	ASSERT_TRUE(value.empty());
}

TEST(CookieExtract, HasCookies)
{
	EXPECT_FALSE(HasCookies(""sv));
	EXPECT_FALSE(HasCookies(" ; "sv));
	EXPECT_TRUE(HasCookies("a=b"sv));
	EXPECT_TRUE(HasCookies("csrf="sv));

	EXPECT_FALSE(HasCookiesExcept(""sv, "csrf"sv));
	EXPECT_FALSE(HasCookiesExcept("csrf=abc"sv, "csrf"sv));
	EXPECT_TRUE(HasCookiesExcept("csrf=abc; some=cookie"sv, "csrf"sv));
	EXPECT_TRUE(HasCookiesExcept("some=cookie"sv, "csrf"sv));
}
