// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConcatIstream.hxx"
#include "Sink.hxx"
#include "New.hxx"

#include <list>

class CatIstream final : public Istream {
	struct Input final : IstreamSink {
		CatIstream &cat;

		Input(CatIstream &_cat, UnusedIstreamPtr &&_istream) noexcept
			:IstreamSink(std::move(_istream)), cat(_cat) {}

		IstreamLength GetLength() const noexcept {
			return GetInputLength();
		}

		void Read() noexcept {
			ReadInput();
		}

		/* virtual methods from class IstreamHandler */

		std::size_t OnData(std::span<const std::byte> src) noexcept override {
			assert(HasInput());

			return cat.OnInputData(*this, src);
		}

		void OnEof() noexcept override {
			assert(HasInput());
			ClearInput();

			cat.OnInputEof(*this);
		}

		void OnError(std::exception_ptr ep) noexcept override {
			assert(HasInput());
			ClearInput();

			cat.OnInputError(*this, std::move(ep));
		}
	};

	bool reading = false;

	std::list<Input> inputs;

public:
	explicit CatIstream(std::span<UnusedIstreamPtr> _inputs) noexcept {
		for (UnusedIstreamPtr &_input : _inputs) {
			if (!_input)
				continue;

			inputs.emplace_back(*this, std::move(_input));
		}
	}

private:
	Input &GetCurrent() noexcept {
		return inputs.front();
	}

	bool IsCurrent(const Input &input) const noexcept {
		return !inputs.empty() && &inputs.front() == &input;
	}

	bool IsEOF() const noexcept {
		return inputs.empty();
	}

	void Remove(Input &i) noexcept {
		inputs.remove_if([&i](const Input &j){ return &i == &j; });
	}

	std::size_t OnInputData(Input &i, std::span<const std::byte> src) noexcept {
		return IsCurrent(i)
			? InvokeData(src)
			: 0;
	}

	void OnInputEof(Input &i) noexcept {
		const bool current = IsCurrent(i);
		Remove(i);

		if (IsEOF()) {
			assert(current);
			DestroyEof();
		} else if (current && !reading) {
			/* only call Input::Read() if this function was
			   not called from CatIstream::_Read(); in that
			   case, _Read() provides the loop */
			GetCurrent().Read();
		}
	}

	void OnInputError(Input &i, std::exception_ptr ep) noexcept {
		Remove(i);
		DestroyError(std::move(ep));
	}

public:
	/* virtual methods from class Istream */

	IstreamLength _GetLength() noexcept override;
	void _Read() noexcept override;
};

IstreamLength
CatIstream::_GetLength() noexcept
{
	IstreamLength result{.length = 0, .exhaustive = true};

	for (const auto &input : inputs)
		result += input.GetLength();

	return result;
}

void
CatIstream::_Read() noexcept
{
	if (IsEOF()) {
		DestroyEof();
		return;
	}

	const DestructObserver destructed(*this);

	reading = true;

	std::size_t n;
	do {
		n = inputs.size();
		GetCurrent().Read();
		if (destructed)
			return;
	} while (!IsEOF() && inputs.size() != n);

	reading = false;
}

UnusedIstreamPtr
_NewConcatIstream(std::span<UnusedIstreamPtr> inputs)
{
	return NewIstreamPtr<CatIstream>(inputs);
}
