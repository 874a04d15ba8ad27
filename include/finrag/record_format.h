#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace finrag {

// Tab-separated records. Backslash, tab, newline and '|' are escaped so that
// a raw tab always separates fields and a raw '|' always separates list items.
// A leading '#' is escaped too, so only header lines start with one.
std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::vector<std::string> SplitEscaped(const std::string &line);
std::string JoinEscaped(const std::vector<std::string> &fields);

std::string EncodeList(const std::vector<std::string> &values);
std::vector<std::string> DecodeList(const std::string &field);

// Parses a non-negative decimal field. Throws CacheInconsistency naming
// `location` when the field is empty, signed, or not a number.
std::size_t ParseCount(const std::string &field, const std::string &location);

std::string EncodeVector(const std::vector<float> &values);
std::vector<float> DecodeVector(const std::string &field);

// Writes `content` to a sibling temporary file and renames it over `path`.
// Throws std::runtime_error when any step fails; `path` is then untouched.
void WriteFileAtomically(const std::filesystem::path &path,
                         const std::string &content);

std::string UtcTimestamp();

} // namespace finrag
