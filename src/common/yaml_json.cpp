// common/yaml_json.cpp
#include "graphflow/common/yaml_json.h"
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>

namespace graphflow {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Accepts integers, decimals and scientific notation; the whole string must parse.
bool is_numeric(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // Quoted scalars ("42", "true") stay strings.
            if (node.Tag() == "!") {
                return s;
            }
            if (s == "true" || s == "True") return true;
            if (s == "false" || s == "False") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // 超出范围时按字符串处理
                }
            }
            return s;
        }
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

} // namespace graphflow
