// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Captured values, indexed by capture name.  Values are stored
 * percent-decoded.
 */
using PathCaptures = std::map<std::string, std::string, std::less<>>;

/**
 * A compiled path template like "/a/<x>/c?k=<y>".  A segment
 * wrapped in angle brackets captures exactly one path segment (or
 * one query parameter value); all other segments are literals which
 * must match exactly (after percent-decoding).
 *
 * Instances are immutable after Compile().
 */
class PathPattern {
	struct Part {
		/**
		 * The capture name or the percent-decoded literal.
		 */
		std::string value;

		/**
		 * The literal as it appeared in the template; Render()
		 * emits it verbatim.
		 */
		std::string raw;

		bool capture;
	};

	struct QueryParameter {
		/**
		 * The percent-decoded parameter name.
		 */
		std::string name;

		std::string raw_name;

		Part value;
	};

	std::vector<Part> segments;
	std::vector<QueryParameter> query;

	PathPattern() = default;

public:
	/**
	 * Throws #CsrfConfigError on syntax errors.
	 */
	static PathPattern Compile(std::string_view pattern);

	/**
	 * Match a concrete request URI (path plus optional query
	 * string).  If this pattern has no query part, the query
	 * string of the URI is ignored.
	 *
	 * @return the captured values or std::nullopt if the URI does
	 * not match (or cannot be percent-decoded)
	 */
	std::optional<PathCaptures> Match(std::string_view uri) const;

	/**
	 * Build a URI from this template, substituting captures with
	 * the given (percent-encoded) values.
	 *
	 * @return the URI or std::nullopt if a capture referenced by
	 * this template is missing
	 */
	std::optional<std::string> Render(const PathCaptures &captures) const;

	[[gnu::pure]]
	bool HasCapture(std::string_view name) const noexcept;

	std::vector<std::string_view> GetCaptureNames() const;

private:
	template<typename F>
	void ForEachCapture(F &&f) const {
		for (const auto &i : segments)
			if (i.capture)
				f(i.value);

		for (const auto &i : query)
			if (i.value.capture)
				f(i.value.value);
	}
};

/**
 * Compile the target which violating requests are rerouted to by
 * default.  It may only use the capture "uri" (the original request
 * URI).
 *
 * Throws #CsrfConfigError on error.
 */
PathPattern
CompileDefaultTarget(std::string_view pattern);

/**
 * Compile the target which violating requests matching the given
 * exception source are rerouted to.  It may only use captures
 * defined by the source.
 *
 * Throws #CsrfConfigError on error.
 */
PathPattern
CompileExceptionTarget(const PathPattern &source, std::string_view pattern);
