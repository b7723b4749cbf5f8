// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "Key.hxx"
#include "PathPattern.hxx"
#include "io/FileLineParser.hxx"
#include "io/ConfigParser.hxx"

#include <string.h>

class CsrfConfigParser final : public ConfigParser {
	CsrfConfig &config;

public:
	explicit CsrfConfigParser(CsrfConfig &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
};

/**
 * Parse an optional HTTP method name at the end of the line.
 */
static HttpMethod
ParseOptionalMethodAndEnd(LineParser &line, HttpMethod default_value)
{
	if (line.IsEnd())
		return default_value;

	const HttpMethod method = ParseHttpMethod(line.ExpectWord());
	if (method == HttpMethod::INVALID)
		throw LineParser::Error("Unknown HTTP method");

	line.ExpectEnd();
	return method;
}

void
CsrfConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "timeout") == 0) {
		config.timeout = std::chrono::seconds(line.NextPositiveInteger());
		line.ExpectEnd();
	} else if (strcmp(word, "default_target") == 0) {
		const char *pattern = line.ExpectValue();
		const HttpMethod method =
			ParseOptionalMethodAndEnd(line, HttpMethod::GET);

		/* compile it now to report errors with the line
		   number */
		CompileDefaultTarget(pattern);

		config.default_target = pattern;
		config.default_target_method = method;
	} else if (strcmp(word, "exception") == 0) {
		const char *source = line.ExpectValue();
		const char *target = line.ExpectValue();
		const HttpMethod method =
			ParseOptionalMethodAndEnd(line, HttpMethod::GET);

		CompileExceptionTarget(PathPattern::Compile(source), target);

		config.exceptions.push_back({source, target, method});
	} else if (strcmp(word, "secret") == 0) {
		const char *secret = line.ExpectValueAndEnd();

		CsrfKey key;
		if (!key.ParseBase64(secret))
			throw LineParser::Error("Malformed secret key (expected base64 of 32 bytes)");

		config.secret = secret;
	} else if (strcmp(word, "auto_insert") == 0) {
		config.auto_insert = line.ExpectBoolAndEnd();
	} else if (strcmp(word, "auto_insert_disable_prefix") == 0) {
		config.auto_insert_disable_prefixes.emplace_back(line.ExpectValueAndEnd());
	} else if (strcmp(word, "auto_insert_max_size") == 0) {
		config.auto_insert_max_size = line.NextPositiveInteger();
		line.ExpectEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadCsrfConfigFile(CsrfConfig &config, const char *path)
{
	CsrfConfigParser parser(config);
	CommentConfigParser parser2(parser);
	IncludeConfigParser parser3(path, parser2);

	ParseConfigFile(path, parser3);
}
