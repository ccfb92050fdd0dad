#include "mdvault/cli/output.hpp"

#include <iostream>
#include <iterator>

#include "mdvault/cli/application.hpp"

namespace mdvault::cli {

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      auto object = nlohmann::json::object();
      for (const auto& entry : node) {
        object[entry.first.Scalar()] = yamlToJson(entry.second);
      }
      return object;
    }
    case YAML::NodeType::Sequence: {
      auto array = nlohmann::json::array();
      for (const auto& item : node) {
        array.push_back(yamlToJson(item));
      }
      return array;
    }
    case YAML::NodeType::Scalar: {
      if (core::FrontMatter::isStringScalar(node)) {
        return node.Scalar();
      }
      bool flag = false;
      if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
      }
      long long integer = 0;
      if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
      }
      double number = 0.0;
      if (YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return node.Scalar();
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

YAML::Node jsonToYaml(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::object: {
      YAML::Node map(YAML::NodeType::Map);
      for (const auto& [key, item] : value.items()) {
        map[key] = jsonToYaml(item);
      }
      return map;
    }
    case nlohmann::json::value_t::array: {
      YAML::Node list(YAML::NodeType::Sequence);
      for (const auto& item : value) {
        list.push_back(jsonToYaml(item));
      }
      return list;
    }
    case nlohmann::json::value_t::string:
      return core::FrontMatter::stringValue(value.get<std::string>());
    case nlohmann::json::value_t::boolean:
      return YAML::Node(value.get<bool>());
    case nlohmann::json::value_t::number_integer:
      return YAML::Node(value.get<long long>());
    case nlohmann::json::value_t::number_unsigned:
      return YAML::Node(value.get<unsigned long long>());
    case nlohmann::json::value_t::number_float:
      return YAML::Node(value.get<double>());
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::binary:
    case nlohmann::json::value_t::discarded:
      break;
  }
  return YAML::Node(YAML::NodeType::Null);
}

nlohmann::json frontMatterToJson(const core::FrontMatter& front_matter) {
  return yamlToJson(front_matter.node());
}

YAML::Node parseFieldValue(const std::string& text) {
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_discarded() &&
      (parsed.is_array() || parsed.is_object() || parsed.is_boolean() || parsed.is_null())) {
    return jsonToYaml(parsed);
  }
  return core::FrontMatter::stringValue(text);
}

nlohmann::json warningsToJson(const store::Warnings& warnings) {
  auto array = nlohmann::json::array();
  for (const auto& warning : warnings) {
    array.push_back({{"line", warning.line},
                     {"message", warning.message},
                     {"rule", std::string(validation::warningRuleToString(warning.rule))}});
  }
  return array;
}

nlohmann::json errorToJson(const Error& error) {
  return {{"error", error.message()},
          {"code", static_cast<int>(error.code())},
          {"kind", std::string(errorCodeToString(error.code()))}};
}

void printWarnings(const GlobalOptions& options, const store::Warnings& warnings) {
  if (options.quiet) {
    return;
  }
  for (const auto& warning : warnings) {
    std::cerr << "Warning";
    if (warning.line > 0) {
      std::cerr << " (line " << warning.line << ")";
    }
    std::cerr << " [" << validation::warningRuleToString(warning.rule) << "]: "
              << warning.message << "\n";
  }
}

void printError(const GlobalOptions& options, const Error& error) {
  if (options.json) {
    std::cout << errorToJson(error).dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

Result<std::string> readStdin() {
  std::string content((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
  if (std::cin.bad()) {
    return makeErrorResult<std::string>(ErrorCode::kFileReadError, "Failed to read stdin");
  }
  return content;
}

Result<std::string> inputText(const std::string& text, bool from_stdin) {
  if (from_stdin) {
    return readStdin();
  }
  return text;
}

void printJson(const nlohmann::json& value) {
  std::cout << value.dump(2) << "\n";
}

}  // namespace mdvault::cli
