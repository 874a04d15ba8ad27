#include <finrag/record_format.h>

#include <finrag/errors.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace finrag {

std::string Escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 1);
  // A raw '#' at the start of a line marks a header record.
  if (!value.empty() && value.front() == '#') {
    escaped.push_back('\\');
  }
  for (const auto character : value) {
    if (character == '\\' || character == '\t' || character == '\n' ||
        character == '|') {
      escaped.push_back('\\');
      if (character == '\t') {
        escaped.push_back('t');
        continue;
      }
      if (character == '\n') {
        escaped.push_back('n');
        continue;
      }
    }
    escaped.push_back(character);
  }
  return escaped;
}

std::string Unescape(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const auto next = value[++i];
      if (next == 't') {
        unescaped.push_back('\t');
      } else if (next == 'n') {
        unescaped.push_back('\n');
      } else {
        unescaped.push_back(next);
      }
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::vector<std::string> SplitEscaped(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (const auto character : line) {
    if (character == '\t') {
      fields.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  fields.push_back(Unescape(current));
  return fields;
}

std::string JoinEscaped(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(Escape(fields[i]));
  }
  return line;
}

std::string EncodeList(const std::vector<std::string> &values) {
  std::string encoded;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      encoded.push_back('|');
    }
    encoded.append(Escape(values[i]));
  }
  return encoded;
}

std::vector<std::string> DecodeList(const std::string &field) {
  std::vector<std::string> values;
  if (field.empty()) {
    return values;
  }
  std::string current;
  for (std::size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 1 < field.size()) {
      current.push_back(field[i]);
      current.push_back(field[++i]);
      continue;
    }
    if (field[i] == '|') {
      values.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(field[i]);
  }
  values.push_back(Unescape(current));
  return values;
}

std::size_t ParseCount(const std::string &field, const std::string &location) {
  const auto digits =
      !field.empty() && std::all_of(field.begin(), field.end(), [](char c) {
        return c >= '0' && c <= '9';
      });
  if (!digits) {
    throw CacheInconsistency("Malformed number '" + field + "' at " +
                             location);
  }
  try {
    return static_cast<std::size_t>(std::stoull(field));
  } catch (const std::out_of_range &) {
    throw CacheInconsistency("Number out of range '" + field + "' at " +
                             location);
  }
}

std::string EncodeVector(const std::vector<float> &values) {
  std::ostringstream stream;
  stream << std::setprecision(9);
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      stream << ' ';
    }
    stream << values[i];
  }
  return stream.str();
}

std::vector<float> DecodeVector(const std::string &field) {
  std::vector<float> values;
  const char *cursor = field.c_str();
  const char *const end = cursor + field.size();
  while (cursor < end) {
    char *parsed_end = nullptr;
    const float value = std::strtof(cursor, &parsed_end);
    if (parsed_end == cursor) {
      if (*cursor == ' ') {
        ++cursor;
        continue;
      }
      throw std::runtime_error("Malformed vector field near: " +
                               std::string(cursor, std::min<std::ptrdiff_t>(
                                                       16, end - cursor)));
    }
    values.push_back(value);
    cursor = parsed_end;
  }
  return values;
}

void WriteFileAtomically(const std::filesystem::path &path,
                         const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto temporary = path;
  temporary += ".tmp";
  {
    std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to open for writing: " +
                               temporary.string());
    }
    stream << content;
    stream.flush();
    if (!stream) {
      throw std::runtime_error("Failed to write: " + temporary.string());
    }
  }
  std::error_code error;
  std::filesystem::rename(temporary, path, error);
  if (error) {
    const auto reason = error.message();
    std::filesystem::remove(temporary, error);
    throw std::runtime_error("Failed to replace " + path.string() + ": " +
                             reason);
  }
}

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &time);
#else
  gmtime_r(&time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return stream.str();
}

} // namespace finrag
