// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(FileLineParser &line);

	virtual void ParseLine(FileLineParser &line) = 0;

	/**
	 * Called at the end of the file, to validate the
	 * configuration.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can "@include" other files.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  This is a
	 * kludge to avoid calling a foreign child's Finish() method
	 * multiple times, once for each included file.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path, ConfigParser &_child,
			    bool _finish_child=true) noexcept
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

/**
 * Parse the given file line by line.  Errors are wrapped (with
 * std::throw_with_nested()) in a #LineParser::Error which names the
 * file and the line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
