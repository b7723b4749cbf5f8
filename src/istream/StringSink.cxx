// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringSink.hxx"
#include "Sink.hxx"
#include "UnusedPtr.hxx"

class StringSink final : IstreamSink {
	std::string value;

	StringSinkHandler &handler;

public:
	StringSink(UnusedIstreamPtr &&_input,
		   StringSinkHandler &_handler) noexcept
		:IstreamSink(std::move(_input)),
		 handler(_handler) {}

	void Read() noexcept {
		const DestructObserver destructed(anchor);

		while (!destructed && HasInput())
			ReadInput();
	}

private:
	/* tells Read() whether this object was freed by a callback */
	DestructAnchor anchor;

	void Destroy() noexcept {
		delete this;
	}

	/* virtual methods from class IstreamHandler */

	std::size_t OnData(std::span<const std::byte> src) noexcept override {
		value.append((const char *)src.data(), src.size());
		return src.size();
	}

	void OnEof() noexcept override {
		ClearInput();

		auto &_handler = handler;
		auto _value = std::move(value);
		Destroy();
		_handler.OnStringSinkSuccess(std::move(_value));
	}

	void OnError(std::exception_ptr ep) noexcept override {
		ClearInput();

		auto &_handler = handler;
		Destroy();
		_handler.OnStringSinkError(std::move(ep));
	}
};

/*
 * constructor
 *
 */

StringSink &
NewStringSink(UnusedIstreamPtr input, StringSinkHandler &handler)
{
	return *new StringSink(std::move(input), handler);
}

void
ReadStringSink(StringSink &sink) noexcept
{
	sink.Read();
}
