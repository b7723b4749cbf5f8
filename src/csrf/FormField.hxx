// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Extract form fields from request bodies.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Is this the "Content-Type" of a "multipart/form-data" request
 * body?  Parameters (e.g. "boundary") are ignored.
 */
[[gnu::pure]]
bool
IsMultipartFormData(std::string_view content_type) noexcept;

/**
 * Find the first parameter with the given name in an
 * "application/x-www-form-urlencoded" body.
 *
 * @return the unescaped value or std::nullopt if there is no such
 * parameter (or if its value is malformed)
 */
std::optional<std::string>
ExtractUrlEncodedField(std::string_view body, std::string_view name);

/**
 * Find the part with the given name in a "multipart/form-data" body
 * and return the first line of its contents.  The boundary is not
 * checked; the part is identified by its "Content-Disposition"
 * header.
 *
 * @return a pointer into the body or std::nullopt if there is no such
 * part
 */
[[gnu::pure]]
std::optional<std::string_view>
ExtractMultipartField(std::string_view body, std::string_view name) noexcept;

/**
 * Extract the submitted "csrf-token" field from a request body,
 * choosing the body format according to the "Content-Type".
 */
std::optional<std::string>
ExtractCsrfFormToken(std::string_view content_type, std::string_view body);
