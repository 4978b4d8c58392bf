#pragma once

#include <string>

/**
 * Small string helpers for URLs and link-list lines.
 */
namespace url_utils
{
/**
 * Remove leading and trailing whitespace (spaces, tabs, CR, LF).
 */
std::string strip(const std::string &text);

/**
 * True if text looks like a remote URL (http, https or ftp scheme,
 * case-insensitive, leading spaces allowed).
 */
bool isRemoteUrl(const std::string &text);

/**
 * True if url uses the http or https scheme (case-insensitive).
 */
bool isHttpUrl(const std::string &url);

/**
 * Percent-encode characters that cannot appear raw in a request line
 * (space, double quote, angle brackets, backtick, braces, pipe).
 * Existing %XX sequences are left untouched.
 */
std::string uriEncode(const std::string &url);

/**
 * Decode %XX sequences. Malformed sequences are copied as-is.
 */
std::string uriDecode(const std::string &text);

/**
 * Replace every occurrence of token in text.
 */
std::string replaceAll(std::string text, const std::string &token, const std::string &value);

/**
 * Last path component of a URL, with query string and fragment removed.
 * Example: "http://host/dir/file.zip?x=1" -> "file.zip"
 */
std::string basenameFromUrl(const std::string &url);
}
