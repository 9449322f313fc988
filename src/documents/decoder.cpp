#include "documents/decoder.hpp"

#include "core/fs_utils.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace packforge::documents {

namespace {

using core::json::Value;

constexpr std::string_view kYamlStrTag = "tag:yaml.org,2002:str";
constexpr std::string_view kNonSpecificTag = "!";
constexpr std::size_t kMaxYamlNesting = core::json::kMaxNestingDepth;

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool IsYamlNull(std::string_view text) {
  return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

bool ParseYamlBool(std::string_view text, bool& value) {
  if (text == "true" || text == "True" || text == "TRUE") {
    value = true;
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    value = false;
    return true;
  }
  return false;
}

bool IsDecimalDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
}

bool IsHexDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
}

bool IsOctalDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return c >= '0' && c <= '7';
  });
}

// YAML 1.2 core-schema integers: decimal with optional sign, 0o octal, 0x hex.
bool ParseYamlInteger(std::string_view text, double& value) {
  int base = 10;
  bool negative = false;
  std::string_view digits = text;

  if (digits.size() > 2U && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'o')) {
    base = digits[1] == 'x' ? 16 : 8;
    digits.remove_prefix(2);
    if ((base == 16 && !IsHexDigits(digits)) || (base == 8 && !IsOctalDigits(digits))) {
      return false;
    }
  } else {
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
      negative = digits[0] == '-';
      digits.remove_prefix(1);
    }
    if (!IsDecimalDigits(digits)) {
      return false;
    }
  }

  std::uint64_t magnitude = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude,
                                         base);
  if (ec == std::errc() && ptr == digits.data() + digits.size()) {
    value = negative ? -static_cast<double>(magnitude) : static_cast<double>(magnitude);
    return true;
  }

  // Wider than 64 bits: keep the nearest double rather than rejecting it.
  const std::string spelled(text);
  value = std::strtod(spelled.c_str(), nullptr);
  return base == 10;
}

// YAML 1.2 core-schema floats, including .inf/-.inf/.nan spellings.
bool ParseYamlFloat(std::string_view text, double& value) {
  const std::string lowered = ToLower(std::string(text));
  if (lowered == ".inf" || lowered == "+.inf") {
    value = std::numeric_limits<double>::infinity();
    return true;
  }
  if (lowered == "-.inf") {
    value = -std::numeric_limits<double>::infinity();
    return true;
  }
  if (lowered == ".nan") {
    value = std::numeric_limits<double>::quiet_NaN();
    return true;
  }

  std::string_view body = text;
  if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
    body.remove_prefix(1);
  }
  if (body.empty() || (std::isdigit(static_cast<unsigned char>(body[0])) == 0 && body[0] != '.')) {
    return false;
  }

  const std::string spelled(text[0] == '+' ? text.substr(1) : text);
  char* end = nullptr;
  const double parsed = std::strtod(spelled.c_str(), &end);
  if (end != spelled.c_str() + spelled.size()) {
    return false;
  }
  // strtod also accepts hex floats and "inf"/"nan" words, which YAML does not.
  if (spelled.find_first_of("xXiInN") != std::string::npos) {
    return false;
  }
  value = parsed;
  return true;
}

Value ResolvePlainScalar(const std::string& text) {
  if (IsYamlNull(text)) {
    return core::json::MakeNull();
  }

  bool flag = false;
  if (ParseYamlBool(text, flag)) {
    return core::json::MakeBool(flag);
  }

  double number = 0.0;
  if (ParseYamlInteger(text, number) || ParseYamlFloat(text, number)) {
    return core::json::MakeNumber(number);
  }

  return core::json::MakeString(text);
}

bool ConvertYamlNode(const YAML::Node& node, std::size_t depth, Value& value,
                     std::string& error) {
  // Same container limit as the JSON parser.
  if (depth >= kMaxYamlNesting && (node.IsMap() || node.IsSequence())) {
    error = "yaml nesting exceeds " + std::to_string(kMaxYamlNesting) +
            " levels (self-referencing anchor?)";
    return false;
  }

  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    value = core::json::MakeNull();
    return true;
  case YAML::NodeType::Scalar: {
    const std::string& tag = node.Tag();
    if (tag == kNonSpecificTag || tag == kYamlStrTag) {
      value = core::json::MakeString(node.Scalar());
    } else {
      value = ResolvePlainScalar(node.Scalar());
    }
    return true;
  }
  case YAML::NodeType::Sequence: {
    value = core::json::MakeArray();
    value.array_value.reserve(node.size());
    for (const YAML::Node& item : node) {
      Value converted;
      if (!ConvertYamlNode(item, depth + 1U, converted, error)) {
        return false;
      }
      value.array_value.push_back(std::move(converted));
    }
    return true;
  }
  case YAML::NodeType::Map: {
    value = core::json::MakeObject();
    for (const auto& member : node) {
      if (!member.first.IsScalar()) {
        const YAML::Mark mark = member.first.Mark();
        error = "mapping key at line " + std::to_string(mark.line + 1) + " is not a scalar";
        return false;
      }
      Value converted;
      if (!ConvertYamlNode(member.second, depth + 1U, converted, error)) {
        return false;
      }
      value.object_value[member.first.Scalar()] = std::move(converted);
    }
    return true;
  }
  }

  error = "unsupported YAML node type";
  return false;
}

bool DecodeYaml(std::string_view text, Value& document, std::string& error) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::ParserException& e) {
    error = "yaml parse error at line " + std::to_string(e.mark.line + 1) + ", col " +
            std::to_string(e.mark.column + 1) + ": " + e.msg;
    return false;
  } catch (const YAML::Exception& e) {
    error = std::string("yaml error: ") + e.what();
    return false;
  }

  return ConvertYamlNode(root, 0U, document, error);
}

} // namespace

const char* ToString(SourceFormat format) {
  switch (format) {
  case SourceFormat::kJson:
    return "json";
  case SourceFormat::kYaml:
    return "yaml";
  }
  return "json";
}

SourceFormat DetectSourceFormat(const std::filesystem::path& path) {
  const std::string extension = ToLower(path.extension().string());
  if (extension == ".yml" || extension == ".yaml") {
    return SourceFormat::kYaml;
  }
  return SourceFormat::kJson;
}

bool DecodeDocumentText(std::string_view text, SourceFormat format, Value& document,
                        std::string& error) {
  Value decoded;
  const bool ok = format == SourceFormat::kYaml ? DecodeYaml(text, decoded, error)
                                                : core::json::Parse(text, decoded, error);
  if (!ok) {
    return false;
  }

  if (!decoded.IsObject()) {
    error = std::string("top-level ") + ToString(format) + " value must be an object";
    return false;
  }

  document = std::move(decoded);
  return true;
}

bool DecodeDocumentFile(const std::filesystem::path& path, Value& document, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return false;
  }

  std::string decode_error;
  if (!DecodeDocumentText(contents, DetectSourceFormat(path), document, decode_error)) {
    error = path.string() + ": " + decode_error;
    return false;
  }
  return true;
}

} // namespace packforge::documents
