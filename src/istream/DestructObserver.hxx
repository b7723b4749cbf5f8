// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class DestructObserver;

/**
 * An object which can be watched by #DestructObserver instances.
 * When it is destroyed, all observers are notified.
 */
class DestructAnchor {
	friend class DestructObserver;

	DestructObserver *observers = nullptr;

public:
	DestructAnchor() noexcept = default;

	DestructAnchor(const DestructAnchor &) = delete;
	DestructAnchor &operator=(const DestructAnchor &) = delete;

	inline ~DestructAnchor() noexcept;
};

/**
 * A scoped helper which finds out whether the given #DestructAnchor
 * was destroyed while this object was alive.  This is needed by
 * #Istream implementations which invoke handler callbacks that may
 * close the #Istream.
 */
class DestructObserver {
	friend class DestructAnchor;

	DestructAnchor *anchor;
	DestructObserver *next;

public:
	explicit DestructObserver(DestructAnchor &_anchor) noexcept
		:anchor(&_anchor), next(_anchor.observers)
	{
		_anchor.observers = this;
	}

	DestructObserver(const DestructObserver &) = delete;
	DestructObserver &operator=(const DestructObserver &) = delete;

	~DestructObserver() noexcept {
		if (anchor == nullptr)
			return;

		for (auto **p = &anchor->observers; *p != nullptr; p = &(*p)->next) {
			if (*p == this) {
				*p = next;
				break;
			}
		}
	}

	/**
	 * Was the #DestructAnchor destroyed?
	 */
	operator bool() const noexcept {
		return anchor == nullptr;
	}
};

inline
DestructAnchor::~DestructAnchor() noexcept
{
	for (auto *i = observers; i != nullptr; i = i->next)
		i->anchor = nullptr;
}
