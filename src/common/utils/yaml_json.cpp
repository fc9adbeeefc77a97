// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <cctype>
#include <charconv>
#include <string>
#include <stdexcept>
#include <system_error>

namespace agentgraph {

namespace {

bool parse_integer(const std::string& s, long long& out) {
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    if (begin != end && *begin == '+') ++begin;
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

bool parse_float(const std::string& s, double& out) {
    try {
        std::size_t consumed = 0;
        out = std::stod(s, &consumed);
        return consumed == s.size();
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range: keep the scalar as a string
        return false;
    }
}

nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    // Tag "!" marks a quoted scalar, which is always a string
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") return nullptr;

    long long integer = 0;
    if (parse_integer(s, integer)) return integer;
    double number = 0.0;
    if (!s.empty() && (std::isdigit(static_cast<unsigned char>(s.front())) || s.front() == '-' ||
                       s.front() == '+' || s.front() == '.') &&
        parse_float(s, number)) {
        return number;
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

} // namespace agentgraph
