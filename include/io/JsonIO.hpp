#pragma once
#include "catalog/CourseRecord.hpp"
#include "prereq/CourseAstAssembler.hpp"
#include "prereq/Node.hpp"

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

// ---------- AST <-> JSON ----------

nlohmann::ordered_json nodeToJson(const prereq::Node& node);
nlohmann::ordered_json nodeToJson(const std::optional<prereq::Node>& node);  // null for nullopt
prereq::Node nodeFromJson(const nlohmann::ordered_json& j, const std::string& where);

nlohmann::ordered_json astToJson(const prereq::PrerequisiteAst& ast);
prereq::PrerequisiteAst astFromJson(const nlohmann::ordered_json& j, const std::string& where);

// ---------- catalog ----------

// Does not throw for a malformed record: field type problems land in
// rec.load_error, an unreadable stored AST in rec.ast_error.
catalog::CourseRecord parseCourseRecord(const nlohmann::ordered_json& j, const std::string& where);
nlohmann::ordered_json courseRecordToJson(const catalog::CourseRecord& rec);

// Throws std::runtime_error on I/O failure, malformed JSON, or a root that
// is not an array. Problems inside one record stay on that record.
std::vector<catalog::CourseRecord> loadCatalog(const std::string& path);

// Serializes everything to "<path>.tmp" and renames it over `path`, so a
// failure leaves the previous file untouched. Throws std::runtime_error.
void saveCatalog(const std::string& path, const std::vector<catalog::CourseRecord>& records);
