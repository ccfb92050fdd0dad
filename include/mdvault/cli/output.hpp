#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "mdvault/common.hpp"
#include "mdvault/core/front_matter.hpp"
#include "mdvault/store/operations.hpp"

namespace mdvault::cli {

struct GlobalOptions;

// JSON <-> YAML value conversion for front matter
nlohmann::json yamlToJson(const YAML::Node& node);
YAML::Node jsonToYaml(const nlohmann::json& value);
nlohmann::json frontMatterToJson(const core::FrontMatter& front_matter);

// Command-line value for a front matter field: JSON arrays, objects,
// booleans and null are decoded, anything else is kept as a string
YAML::Node parseFieldValue(const std::string& text);

nlohmann::json warningsToJson(const store::Warnings& warnings);
nlohmann::json errorToJson(const Error& error);

// Human-readable warnings on stderr (suppressed by --quiet)
void printWarnings(const GlobalOptions& options, const store::Warnings& warnings);

// Error in the format selected by --json
void printError(const GlobalOptions& options, const Error& error);

// Read all of standard input
Result<std::string> readStdin();

// Positional text argument, or all of stdin when from_stdin is set
Result<std::string> inputText(const std::string& text, bool from_stdin);

// Print a JSON document on stdout
void printJson(const nlohmann::json& value);

}  // namespace mdvault::cli
