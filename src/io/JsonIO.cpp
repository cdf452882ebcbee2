#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// absent or null -> empty string
static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static bool optional_bool(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return false;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

// ---------- AST -> JSON ----------

namespace {

struct NodeWriter {
    json operator()(const prereq::Course& c) const {
        json j;
        j["type"] = "course";
        j["course_code"] = c.course_code;
        j["is_concurrent"] = c.is_concurrent;
        j["is_optional"] = c.is_optional;
        return j;
    }

    json children(const char* type, const std::vector<prereq::Node>& kids) const {
        json j;
        j["type"] = type;
        json arr = json::array();
        for (const auto& k : kids) arr.push_back(nodeToJson(k));
        j["children"] = arr;
        return j;
    }

    json operator()(const prereq::And& a) const { return children("and", a.children); }
    json operator()(const prereq::Or& o) const { return children("or", o.children); }

    json operator()(const prereq::Group& g) const {
        json j;
        j["type"] = "group";
        j["expression"] = g.expression ? nodeToJson(*g.expression) : json(nullptr);
        return j;
    }

    json operator()(const prereq::Concurrent& c) const {
        json j;
        j["type"] = "concurrent";
        j["course"] = c.course ? nodeToJson(*c.course) : json(nullptr);
        j["note"] = c.note;
        return j;
    }

    json operator()(const prereq::TextCondition& t) const {
        json j;
        j["type"] = "text_condition";
        j["condition"] = t.condition;
        j["category"] = prereq::category_name(t.category);
        return j;
    }
};

} // namespace

json nodeToJson(const prereq::Node& node) {
    return std::visit(NodeWriter{}, node.value);
}

json nodeToJson(const std::optional<prereq::Node>& node) {
    if (!node) return json(nullptr);
    return nodeToJson(*node);
}

json astToJson(const prereq::PrerequisiteAst& ast) {
    json j;
    j["prerequisites"] = nodeToJson(ast.prerequisites);
    j["corequisites"] = nodeToJson(ast.corequisites);
    j["raw_text"] = ast.raw_text;
    if (ast.has_error()) j["parse_error"] = ast.parse_error;
    return j;
}

// ---------- JSON -> AST ----------

static std::vector<prereq::Node> parseChildren(const json& j, const std::string& where) {
    if (!j.contains("children")) {
        throw std::runtime_error(where + " missing required field: children");
    }
    const json& arr = j.at("children");
    require_array(arr, where + ".children");
    if (arr.empty()) {
        throw std::runtime_error(where + ".children must not be empty");
    }

    std::vector<prereq::Node> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << ".children[" << i << "]";
        out.push_back(nodeFromJson(arr.at(i), oss.str()));
    }
    return out;
}

static prereq::Node requireChildNode(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return nodeFromJson(j.at(key), where + "." + key);
}

prereq::Node nodeFromJson(const json& j, const std::string& where) {
    require_object(j, where);
    const std::string type = require_string(j, "type", where);

    if (type == "course") {
        prereq::Course c;
        c.course_code = require_string(j, "course_code", where);
        c.is_concurrent = optional_bool(j, "is_concurrent", where);
        c.is_optional = optional_bool(j, "is_optional", where);
        return prereq::Node{std::move(c)};
    }
    if (type == "and") return prereq::make_and(parseChildren(j, where));
    if (type == "or") return prereq::make_or(parseChildren(j, where));
    if (type == "group") return prereq::make_group(requireChildNode(j, "expression", where));
    if (type == "concurrent") {
        prereq::Node course = requireChildNode(j, "course", where);
        return prereq::make_concurrent(std::move(course), optional_string(j, "note", where));
    }
    if (type == "text_condition") {
        const std::string condition = require_string(j, "condition", where);
        const std::string cat = require_string(j, "category", where);
        auto category = prereq::category_from_name(cat);
        if (!category) {
            throw std::runtime_error(where + ".category has unknown value: " + cat);
        }
        return prereq::make_text(condition, *category);
    }

    throw std::runtime_error(where + ".type has unknown value: " + type);
}

static std::optional<prereq::Node> optionalNode(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return nodeFromJson(j.at(key), where + "." + key);
}

prereq::PrerequisiteAst astFromJson(const json& j, const std::string& where) {
    require_object(j, where);

    prereq::PrerequisiteAst ast;
    ast.prerequisites = optionalNode(j, "prerequisites", where);
    ast.corequisites = optionalNode(j, "corequisites", where);
    ast.raw_text = optional_string(j, "raw_text", where);
    ast.parse_error = optional_string(j, "parse_error", where);
    return ast;
}

// ---------- course records ----------

// Reads a string field; a wrong type is noted on `error` (first one wins)
// and the field reads as empty.
static std::string record_string(const json& j, const char* key, const std::string& where, std::string& error) {
    try {
        return optional_string(j, key, where);
    } catch (const std::runtime_error& e) {
        if (error.empty()) error = e.what();
        return "";
    }
}

catalog::CourseRecord parseCourseRecord(const json& j, const std::string& where) {
    catalog::CourseRecord rec;
    rec.source = j;

    if (!j.is_object()) {
        rec.load_error = where + " must be an object";
        return rec;
    }

    rec.title = record_string(j, "title", where, rec.load_error);
    rec.prerequisites = record_string(j, "prerequisites", where, rec.load_error);
    rec.concurrent = record_string(j, "concurrent", where, rec.load_error);

    if (j.contains("prerequisite_ast") && !j.at("prerequisite_ast").is_null()) {
        try {
            rec.ast = astFromJson(j.at("prerequisite_ast"), where + ".prerequisite_ast");
        } catch (const std::runtime_error& e) {
            rec.ast_error = e.what();
        }
    }
    return rec;
}

json courseRecordToJson(const catalog::CourseRecord& rec) {
    // a non-object entry is not a course; write it back as found
    if (!rec.source.is_object() && !rec.source.is_null()) return rec.source;

    json j = rec.source.is_object() ? rec.source : json::object();

    if (rec.ast) j["prerequisite_ast"] = astToJson(*rec.ast);

    if (rec.linked) {
        j["is_prerequisite_for"] = rec.is_prerequisite_for;
        j["is_corequisite_for"] = rec.is_corequisite_for;
    }

    if (rec.title_fields) {
        j["course_code"] = rec.title_fields->course_code;
        j["course_title"] = rec.title_fields->course_title;
        j["difficulty_level"] = rec.title_fields->difficulty_level;
    }
    return j;
}

std::vector<catalog::CourseRecord> loadCatalog(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open catalog file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    require_array(j, "root");

    std::vector<catalog::CourseRecord> records;
    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        records.push_back(parseCourseRecord(j.at(i), oss.str()));
    }
    return records;
}

void saveCatalog(const std::string& path, const std::vector<catalog::CourseRecord>& records) {
    json arr = json::array();
    for (const auto& rec : records) arr.push_back(courseRecordToJson(rec));

    std::string text;
    try {
        text = arr.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to serialize catalog: ") + e.what());
    }

    const fs::path out_path(path);
    if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path());

    const fs::path tmp_path = fs::path(path + ".tmp");
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("failed to open output file: " + tmp_path.string());
        out << text << "\n";
        out.flush();
        if (!out) throw std::runtime_error("failed to write output file: " + tmp_path.string());
    }

    std::error_code ec;
    fs::rename(tmp_path, out_path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp_path, ec);
        throw std::runtime_error("failed to replace " + path + ": " + reason);
    }
}
