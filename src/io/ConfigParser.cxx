// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"

#include <boost/filesystem/operations.hpp>

#include <algorithm>
#include <memory>
#include <system_error>
#include <vector>

#include <errno.h>
#include <fnmatch.h>
#include <stdio.h>

namespace fs = boost::filesystem;

using UniqueFile = std::unique_ptr<FILE, decltype(&fclose)>;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
IncludeConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(FileLineParser &line)
{
	if (line.SkipWord("@include")) {
		IncludePath(line.ExpectPathAndEnd());
	} else if (line.SkipWord("@include_optional")) {
		IncludeOptionalPath(line.ExpectPathAndEnd());
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	if (finish_child)
		child.Finish();
}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		FileLineParser line_parser(path, line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	const auto pattern = p.filename();

	if (pattern.native().find('*') != std::string::npos ||
	    pattern.native().find('?') != std::string::npos) {
		std::vector<fs::path> files;

		for (const auto &i : fs::directory_iterator(directory))
			if (fnmatch(pattern.c_str(), i.path().filename().c_str(), 0) == 0)
				files.emplace_back(i.path());

		std::sort(files.begin(), files.end());

		for (auto &i : files) {
			IncludeConfigParser sub(std::move(i), child, false);
			ParseConfigFile(sub.path, sub);
		}
	} else {
		IncludeConfigParser sub(std::move(p), child, false);
		ParseConfigFile(sub.path, sub);
	}
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(std::move(p), child, false);

	UniqueFile file(fopen(sub.path.c_str(), "r"), fclose);
	if (!file) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw std::system_error(e, std::system_category(),
						"Failed to open " + sub.path.native());
		}
	}

	ParseConfigFile(sub.path, file.get(), sub);
	sub.Finish();
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	UniqueFile file(fopen(path.c_str(), "r"), fclose);
	if (!file)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.native());

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}
