// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "query/request.hpp"

#include <cctype>

#include <nlohmann/json.hpp>

#include "query/exceptions.hpp"
#include "utils/string.hpp"

namespace predacl::query {
namespace {
// Reads one N-Quad term (`<iri>`, `_:blank`, `uid(v)` or `*`) from the front of `text`.
std::string ReadTerm(std::string_view &text, std::string_view line) {
  text = utils::LTrim(text);
  if (text.empty()) throw SyntaxException("Incomplete N-Quad: {}", line);
  size_t end = 0;
  std::string term;
  if (text.front() == '<') {
    end = text.find('>');
    if (end == std::string_view::npos) throw SyntaxException("Unterminated IRI in N-Quad: {}", line);
    term = std::string(text.substr(1, end - 1));
    ++end;
  } else if (utils::StartsWith(text, "uid(")) {
    end = text.find(')');
    if (end == std::string_view::npos) throw SyntaxException("Unterminated uid() in N-Quad: {}", line);
    ++end;
    term = std::string(text.substr(0, end));
  } else {
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
    term = std::string(text.substr(0, end));
  }
  text.remove_prefix(end);
  if (term.empty()) throw SyntaxException("Empty term in N-Quad: {}", line);
  return term;
}

std::vector<std::string> StringArray(const nlohmann::json &data, const char *key) {
  std::vector<std::string> result;
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) return result;
  if (!it->is_array()) throw SyntaxException("'{}' must be an array.", key);
  for (const auto &item : *it) {
    if (!item.is_string()) throw SyntaxException("'{}' must contain strings.", key);
    result.push_back(item.get<std::string>());
  }
  return result;
}

std::string StringValue(const nlohmann::json &data, const char *key, bool required = false) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    if (required) throw SyntaxException("Missing '{}'.", key);
    return "";
  }
  if (!it->is_string()) throw SyntaxException("'{}' must be a string.", key);
  return it->get<std::string>();
}

bool BoolValue(const nlohmann::json &data, const char *key, bool default_value) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) return default_value;
  if (!it->is_boolean()) throw SyntaxException("'{}' must be a boolean.", key);
  return it->get<bool>();
}

void ExpectObject(const nlohmann::json &data, std::string_view what) {
  if (!data.is_object()) throw SyntaxException("{} must be a JSON object.", what);
}

std::string FunctionPredicate(const nlohmann::json &data, const std::string &function) {
  auto predicate = StringValue(data, "predicate");
  if (predicate.empty() && NamesPredicate(function)) throw SyntaxException("Function '{}' needs a predicate.", function);
  return predicate;
}

Field ParseField(const nlohmann::json &data) {
  ExpectObject(data, "A field");
  Field field;
  field.predicate = StringValue(data, "predicate", true);
  field.alias = StringValue(data, "alias");
  field.count = BoolValue(data, "count", false);
  if (auto it = data.find("fields"); it != data.end() && !it->is_null()) {
    if (!it->is_array()) throw SyntaxException("'fields' must be an array.");
    for (const auto &child : *it) field.children.push_back(ParseField(child));
  }
  return field;
}

FilterNode ParseFilter(const nlohmann::json &data) {
  ExpectObject(data, "A filter");
  FilterNode node;
  for (const auto [key, op] : {std::pair{"and", FilterNode::Op::AND}, std::pair{"or", FilterNode::Op::OR}}) {
    if (auto it = data.find(key); it != data.end()) {
      if (!it->is_array() || it->empty()) throw SyntaxException("'{}' needs a non-empty array of filters.", key);
      node.op = op;
      for (const auto &child : *it) node.children.push_back(ParseFilter(child));
      return node;
    }
  }
  if (auto it = data.find("not"); it != data.end()) {
    node.op = FilterNode::Op::NOT;
    node.children.push_back(ParseFilter(*it));
    return node;
  }
  node.op = FilterNode::Op::LEAF;
  node.function = StringValue(data, "func", true);
  node.predicate = FunctionPredicate(data, node.function);
  node.args = StringArray(data, "args");
  return node;
}

QueryBlock ParseBlock(const nlohmann::json &data) {
  ExpectObject(data, "A query block");
  QueryBlock block;
  block.name = StringValue(data, "name", true);
  auto func_it = data.find("func");
  if (func_it == data.end()) throw SyntaxException("Query block '{}' has no root function.", block.name);
  ExpectObject(*func_it, "A root function");
  block.root.name = StringValue(*func_it, "name", true);
  block.root.predicate = FunctionPredicate(*func_it, block.root.name);
  block.root.args = StringArray(*func_it, "args");
  if (auto it = data.find("filter"); it != data.end() && !it->is_null()) block.filter = ParseFilter(*it);
  if (auto it = data.find("order"); it != data.end() && !it->is_null()) {
    if (!it->is_array()) throw SyntaxException("'order' must be an array.");
    for (const auto &order : *it) {
      ExpectObject(order, "An order clause");
      block.order.push_back({StringValue(order, "predicate", true), BoolValue(order, "desc", false)});
    }
  }
  block.group_by = StringArray(data, "group_by");
  if (auto it = data.find("fields"); it != data.end() && !it->is_null()) {
    if (!it->is_array()) throw SyntaxException("'fields' must be an array.");
    for (const auto &field : *it) block.fields.push_back(ParseField(field));
  }
  return block;
}

std::vector<NQuad> ParseTriples(const nlohmann::json &data, const char *key) {
  std::vector<NQuad> result;
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) return result;
  if (!it->is_array()) throw SyntaxException("'{}' must be an array.", key);
  for (const auto &triple : *it) {
    ExpectObject(triple, "A triple");
    result.push_back(
        {StringValue(triple, "subject", true), StringValue(triple, "predicate", true), StringValue(triple, "object")});
  }
  return result;
}

template <typename TFunc>
auto WrapJsonErrors(TFunc &&func) {
  try {
    return func();
  } catch (const nlohmann::json::exception &e) {
    throw SyntaxException("Malformed request: {}", e.what());
  }
}

nlohmann::json FieldToJson(const Field &field) {
  nlohmann::json data = {{"predicate", field.predicate}};
  if (!field.alias.empty()) data["alias"] = field.alias;
  if (field.count) data["count"] = true;
  if (!field.children.empty()) {
    auto children = nlohmann::json::array();
    for (const auto &child : field.children) children.push_back(FieldToJson(child));
    data["fields"] = std::move(children);
  }
  return data;
}

nlohmann::json FilterToJson(const FilterNode &node) {
  switch (node.op) {
    case FilterNode::Op::AND:
    case FilterNode::Op::OR: {
      auto children = nlohmann::json::array();
      for (const auto &child : node.children) children.push_back(FilterToJson(child));
      return {{node.op == FilterNode::Op::AND ? "and" : "or", std::move(children)}};
    }
    case FilterNode::Op::NOT:
      return {{"not", FilterToJson(node.children.at(0))}};
    case FilterNode::Op::LEAF:
      return {{"func", node.function}, {"predicate", node.predicate}, {"args", node.args}};
  }
  return nullptr;
}

nlohmann::json TriplesToJson(const std::vector<NQuad> &triples) {
  auto data = nlohmann::json::array();
  for (const auto &triple : triples) {
    data.push_back({{"subject", triple.subject}, {"predicate", triple.predicate}, {"object", triple.object}});
  }
  return data;
}
}  // namespace

std::set<std::string> MutationRequest::Predicates() const {
  std::set<std::string> predicates;
  for (const auto &triple : set) predicates.insert(triple.predicate);
  for (const auto &triple : del) predicates.insert(triple.predicate);
  return predicates;
}

NQuad ParseNQuad(std::string_view line) {
  auto rest = utils::Trim(line);
  if (rest.empty() || rest.back() != '.') throw SyntaxException("N-Quad must end with '.': {}", line);
  rest.remove_suffix(1);

  NQuad quad;
  quad.subject = ReadTerm(rest, line);
  quad.predicate = ReadTerm(rest, line);
  quad.object = std::string(utils::Trim(rest));
  if (quad.object.empty()) throw SyntaxException("N-Quad has no object: {}", line);
  return quad;
}

std::vector<NQuad> ParseNQuads(std::string_view text) {
  std::vector<NQuad> quads;
  for (const auto &line : utils::Split(text, "\n")) {
    auto trimmed = utils::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;
    quads.push_back(ParseNQuad(trimmed));
  }
  return quads;
}

std::vector<AlterOperation> ParseSchema(std::string_view text) {
  std::vector<AlterOperation> operations;
  for (const auto &line : utils::Split(text, "\n")) {
    auto trimmed = utils::Trim(line);
    if (trimmed.empty() || trimmed.front() == '#') continue;
    if (utils::StartsWith(trimmed, "type ") || trimmed.front() == '}') {
      throw SyntaxException("Type definitions are not supported: {}", trimmed);
    }
    const auto colon = trimmed.find(':');
    if (colon == std::string_view::npos) throw SyntaxException("Schema line has no ':': {}", trimmed);
    auto predicate = utils::Trim(trimmed.substr(0, colon));
    if (predicate.size() >= 2 && predicate.front() == '<' && predicate.back() == '>') {
      predicate = predicate.substr(1, predicate.size() - 2);
    }
    auto definition = utils::Trim(trimmed.substr(colon + 1));
    if (predicate.empty() || definition.empty() || definition.back() != '.') {
      throw SyntaxException("Malformed schema line: {}", trimmed);
    }
    definition.remove_suffix(1);
    definition = utils::Trim(definition);
    if (definition.empty()) throw SyntaxException("Schema line has no type: {}", trimmed);
    operations.push_back({std::string(predicate), std::string(definition) + " ."});
  }
  return operations;
}

QueryRequest ParseQueryRequest(const nlohmann::json &data) {
  return WrapJsonErrors([&] {
    ExpectObject(data, "A query");
    auto it = data.find("blocks");
    if (it == data.end() || !it->is_array() || it->empty()) throw SyntaxException("A query needs at least one block.");
    QueryRequest request;
    for (const auto &block : *it) request.blocks.push_back(ParseBlock(block));
    return request;
  });
}

MutationRequest ParseMutationRequest(const nlohmann::json &data) {
  return WrapJsonErrors([&] {
    ExpectObject(data, "A mutation");
    MutationRequest request;
    request.set = ParseTriples(data, "set");
    request.del = ParseTriples(data, "delete");
    for (auto &quad : ParseNQuads(StringValue(data, "set_nquads"))) request.set.push_back(std::move(quad));
    for (auto &quad : ParseNQuads(StringValue(data, "del_nquads"))) request.del.push_back(std::move(quad));
    request.commit_now = BoolValue(data, "commit_now", true);
    if (request.set.empty() && request.del.empty()) throw SyntaxException("Empty mutation.");
    return request;
  });
}

AlterRequest ParseAlterRequest(const nlohmann::json &data) {
  return WrapJsonErrors([&] {
    ExpectObject(data, "An alter");
    AlterRequest request;
    request.drop_all = BoolValue(data, "drop_all", false);
    request.operations = ParseSchema(StringValue(data, "schema"));
    if (auto drop = StringValue(data, "drop_attr"); !drop.empty()) {
      request.operations.push_back({std::move(drop), std::nullopt});
    }
    if (!request.drop_all && request.operations.empty()) throw SyntaxException("Empty alter.");
    return request;
  });
}

SchemaRequest ParseSchemaRequest(const nlohmann::json &data) {
  return WrapJsonErrors([&] {
    ExpectObject(data, "A schema request");
    return SchemaRequest{StringArray(data, "predicates")};
  });
}

nlohmann::json ToJson(const QueryRequest &request) {
  auto blocks = nlohmann::json::array();
  for (const auto &block : request.blocks) {
    nlohmann::json data = {{"name", block.name},
                           {"func",
                            {{"name", block.root.name}, {"predicate", block.root.predicate}, {"args", block.root.args}}}};
    if (block.filter) data["filter"] = FilterToJson(*block.filter);
    if (!block.order.empty()) {
      auto order = nlohmann::json::array();
      for (const auto &clause : block.order) order.push_back({{"predicate", clause.predicate}, {"desc", clause.descending}});
      data["order"] = std::move(order);
    }
    if (!block.group_by.empty()) data["group_by"] = block.group_by;
    auto fields = nlohmann::json::array();
    for (const auto &field : block.fields) fields.push_back(FieldToJson(field));
    data["fields"] = std::move(fields);
    blocks.push_back(std::move(data));
  }
  return {{"blocks", std::move(blocks)}};
}

nlohmann::json ToJson(const MutationRequest &request) {
  return {{"set", TriplesToJson(request.set)}, {"delete", TriplesToJson(request.del)}, {"commit_now", request.commit_now}};
}

nlohmann::json ToJson(const AlterRequest &request) {
  auto operations = nlohmann::json::array();
  for (const auto &operation : request.operations) {
    nlohmann::json data = {{"predicate", operation.predicate}};
    if (operation.schema) {
      data["schema"] = *operation.schema;
    } else {
      data["drop"] = true;
    }
    operations.push_back(std::move(data));
  }
  return {{"operations", std::move(operations)}, {"drop_all", request.drop_all}};
}

nlohmann::json ToJson(const SchemaRequest &request) { return {{"predicates", request.predicates}}; }

}  // namespace predacl::query
