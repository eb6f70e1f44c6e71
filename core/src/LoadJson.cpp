#include "tc/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace tc::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    if (!json.is_object()) {
        throw std::runtime_error(context + " is not a JSON object");
    }
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::invalid_argument&) {
            return def;
        } catch (const std::out_of_range&) {
            return def;
        }
    }
    return def;
}

std::string string_or(const nlohmann::json* m, const char* key, const std::string& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_string()) return it->get<std::string>();
    return def;
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_boolean()) return it->get<bool>();
    return def;
}

} // namespace tc::json
