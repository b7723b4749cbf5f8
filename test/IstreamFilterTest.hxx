// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "istream/istream.hxx"
#include "istream/Sink.hxx"
#include "istream/ChunkIstream.hxx"
#include "istream/ConcatIstream.hxx"
#include "istream/FailIstream.hxx"
#include "istream/HeadIstream.hxx"
#include "istream/UnusedPtr.hxx"

#include <gtest/gtest.h>
#include <gtest/gtest-typed-test.h>

#include <stdexcept>
#include <string>

#include <string.h>

template<typename T>
class IstreamFilterTest : public ::testing::Test {
};

TYPED_TEST_CASE_P(IstreamFilterTest);

struct Context final : IstreamSink {

	bool half = false;
	bool got_data = false;
	bool eof = false;

	int close_after = -1;

	const char *const expected_result;
	bool record = false;
	std::string buffer;

	std::exception_ptr error;

	int block_after = -1;

	bool block_byte = false, block_byte_state = false;

	/**
	 * The current offset in the #Istream.
	 */
	std::size_t offset = 0;

	template<typename I>
	explicit Context(const char *_expected_result,
			 I &&_input) noexcept
		:IstreamSink(std::forward<I>(_input)),
		 expected_result(_expected_result) {}

	using IstreamSink::HasInput;
	using IstreamSink::CloseInput;

	/**
	 * Read until the stream ends.  All our sources are
	 * synchronous, therefore each Read() call must make progress;
	 * a stream which stalls fails the test.
	 */
	void WaitForEndOfStream() noexcept;

	/* virtual methods from class IstreamHandler */
	std::size_t OnData(std::span<const std::byte> src) noexcept override;
	void OnEof() noexcept override;
	void OnError(std::exception_ptr ep) noexcept override;
};

/*
 * utils
 *
 */

static void
run_istream_ctx(Context &ctx) noexcept
{
	ctx.eof = false;

	ctx.WaitForEndOfStream();

	if (ctx.expected_result && ctx.record) {
		ASSERT_EQ(ctx.buffer.size(), strlen(ctx.expected_result));
		ASSERT_EQ(ctx.buffer, ctx.expected_result);
	}
}

template<typename Traits, typename I>
static void
run_istream_block(const Traits &traits, I &&istream,
		  bool record, int block_after)
{
	Context ctx(traits.expected_result, std::forward<I>(istream));
	ctx.block_after = block_after;
	ctx.record = ctx.expected_result && record;

	run_istream_ctx(ctx);
}

template<typename Traits, typename I>
static void
run_istream(const Traits &traits, I &&istream, bool record)
{
	run_istream_block(traits, std::forward<I>(istream), record, -1);
}

/*
 * tests
 *
 */

/** normal run */
TYPED_TEST_P(IstreamFilterTest, Normal)
{
	TypeParam traits;

	auto istream = traits.CreateTest(traits.CreateInput());
	ASSERT_TRUE(!!istream);

	run_istream(traits, std::move(istream), true);
}

/** block once after n data() invocations */
TYPED_TEST_P(IstreamFilterTest, Block)
{
	TypeParam traits;
	if (!traits.enable_blocking)
		return;

	for (int n = 0; n < 8; ++n) {
		auto istream = traits.CreateTest(traits.CreateInput());
		ASSERT_TRUE(!!istream);

		run_istream_block(traits, std::move(istream), true, n);
	}
}

/** test with istream_byte */
TYPED_TEST_P(IstreamFilterTest, Byte)
{
	TypeParam traits;
	if (!traits.enable_blocking)
		return;

	auto istream =
		traits.CreateTest(NewChunkIstream(traits.CreateInput(), 1));

	run_istream(traits, std::move(istream), true);
}

/** test with istream_four */
TYPED_TEST_P(IstreamFilterTest, Four)
{
	TypeParam traits;
	if (!traits.enable_blocking)
		return;

	auto istream =
		traits.CreateTest(NewChunkIstream(traits.CreateInput(), 4));

	run_istream(traits, std::move(istream), true);
}

/** block and consume one byte at a time */
TYPED_TEST_P(IstreamFilterTest, BlockByte)
{
	TypeParam traits;
	if (!traits.enable_blocking)
		return;

	auto istream = traits.CreateTest(NewChunkIstream(traits.CreateInput(), 1));

	Context ctx(traits.expected_result, std::move(istream));
	ctx.block_byte = true;
	ctx.record = ctx.expected_result != nullptr;

	run_istream_ctx(ctx);
}

/** accept only half of the data */
TYPED_TEST_P(IstreamFilterTest, Half)
{
	TypeParam traits;

	auto istream = traits.CreateTest(traits.CreateInput());

	Context ctx(traits.expected_result, std::move(istream));
	ctx.half = true;
	ctx.record = ctx.expected_result != nullptr;

	run_istream_ctx(ctx);
}

/** input fails */
TYPED_TEST_P(IstreamFilterTest, Fail)
{
	TypeParam traits;

	const std::runtime_error error("test_fail");
	auto istream = traits.CreateTest(istream_fail_new(std::make_exception_ptr(error)));

	Context ctx(traits.expected_result, std::move(istream));
	run_istream_ctx(ctx);

	ASSERT_TRUE(ctx.error);
}

/** input fails after the first byte */
TYPED_TEST_P(IstreamFilterTest, FailAfterFirstByte)
{
	TypeParam traits;

	const std::runtime_error error("test_fail");
	auto istream =
		traits.CreateTest(NewConcatIstream(istream_head_new(traits.CreateInput(), 1),
						   istream_fail_new(std::make_exception_ptr(error))));

	Context ctx(traits.expected_result, std::move(istream));
	run_istream_ctx(ctx);

	ASSERT_TRUE(ctx.error);
}

TYPED_TEST_P(IstreamFilterTest, CloseInHandler)
{
	TypeParam traits;

	auto istream = traits.CreateTest(traits.CreateInput());

	Context ctx(traits.expected_result, std::move(istream));
	ctx.close_after = 0;

	run_istream_ctx(ctx);

	ASSERT_FALSE(ctx.HasInput());
}

/** abort without handler */
TYPED_TEST_P(IstreamFilterTest, AbortWithoutHandler)
{
	TypeParam traits;

	auto istream = traits.CreateTest(traits.CreateInput());

	istream.Clear();
}

/** abort after 1 byte of output */
TYPED_TEST_P(IstreamFilterTest, AbortAfter1Byte)
{
	TypeParam traits;

	auto istream = istream_head_new(traits.CreateTest(traits.CreateInput()),
					1);

	run_istream(traits, std::move(istream), false);
}

/** test with large input and a handler which consumes only half */
TYPED_TEST_P(IstreamFilterTest, Big)
{
	TypeParam traits;
	if (!traits.expected_result)
		return;

	static constexpr unsigned n = 64;

	auto istream = traits.CreateInput();
	std::string expected = traits.expected_result;
	for (unsigned i = 1; i < n; ++i) {
		istream = NewConcatIstream(std::move(istream),
					   traits.CreateInput());
		expected += traits.expected_result;
	}

	Context ctx(expected.c_str(),
		    traits.CreateTest(std::move(istream)));
	ctx.half = true;
	ctx.record = true;

	run_istream_ctx(ctx);
}

REGISTER_TYPED_TEST_CASE_P(IstreamFilterTest,
			   Normal,
			   Block,
			   Byte,
			   Four,
			   BlockByte,
			   Half,
			   Fail,
			   FailAfterFirstByte,
			   CloseInHandler,
			   AbortWithoutHandler,
			   AbortAfter1Byte,
			   Big);
