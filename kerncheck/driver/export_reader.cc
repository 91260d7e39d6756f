/* Copyright 2016 Google Inc. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#include "kerncheck/driver/export_reader.h"

#include "tensorflow/core/lib/strings/numbers.h"
#include "tensorflow/core/lib/strings/str_util.h"
#include "tensorflow/core/platform/env.h"
#include "tensorflow/core/platform/logging.h"

namespace kerncheck {

using tensorflow::Status;
namespace str_util = tensorflow::str_util;

ExportReader::ExportReader() { Load("<empty>", ""); }

Status ExportReader::Open(const std::string& path) {
  std::string contents;
  TF_RETURN_IF_ERROR(tensorflow::ReadFileToString(tensorflow::Env::Default(),
                                                  path, &contents));
  LOG(INFO) << "Read " << contents.size() << " bytes from " << path;
  Load(path, contents);
  return Status::OK();
}

void ExportReader::Load(const std::string& name, const std::string& contents) {
  name_ = name;
  lines_ = str_util::Split(contents, '\n');
  next_line_ = 0;
  names_.assign(1, anonymous_name());
  levels_.assign(1, mk_zero());
  exprs_.clear();
}

Status ExportReader::Next(ExportedDeclaration* decl, bool* done) {
  *done = false;
  while (next_line_ < lines_.size()) {
    const Tokens tokens =
        str_util::Split(lines_[next_line_++], " \t\r", str_util::SkipEmpty());
    if (tokens.empty()) continue;
    bool is_declaration = false;
    *decl = ExportedDeclaration();
    TF_RETURN_IF_ERROR(ParseLine(tokens, decl, &is_declaration));
    if (is_declaration) return Status::OK();
  }
  *done = true;
  return Status::OK();
}

Status ExportReader::ParseLine(const Tokens& tokens, ExportedDeclaration* decl,
                               bool* is_declaration) {
  const std::string& head = tokens[0];
  if (head == "#AX" || head == "#DEF") {
    *is_declaration = true;
    return ParseAxiom(tokens, head == "#DEF", decl);
  } else if (head == "#IND") {
    *is_declaration = true;
    return ParseInductive(tokens, decl);
  } else if (head == "#QUOT") {
    *is_declaration = true;
    decl->kind = ExportedDeclaration::QUOTIENT;
    decl->name = mk_name("quot");
    return Status::OK();
  } else if (head == "#INFIX" || head == "#PREFIX" || head == "#POSTFIX") {
    return Status::OK();
  }

  uint64_t index;
  TF_RETURN_IF_ERROR(GetNumber(tokens, 0, &index));
  if (tokens.size() < 2) return ParseError("missing component code");
  const std::string& code = tokens[1];
  if (str_util::StartsWith(code, "#N")) {
    return ParseName(index, code, tokens);
  } else if (str_util::StartsWith(code, "#U")) {
    return ParseLevel(index, code, tokens);
  } else if (str_util::StartsWith(code, "#E")) {
    return ParseExpr(index, code, tokens);
  }
  return ParseError("unknown component code ", code);
}

Status ExportReader::ParseName(uint64_t index, const std::string& code,
                               const Tokens& tokens) {
  if (index != names_.size()) {
    return ParseError("name ", index, " defined out of order, expected ",
                      names_.size());
  }
  NamePtr prefix;
  TF_RETURN_IF_ERROR(GetName(tokens, 2, &prefix));
  if (code == "#NS") {
    if (tokens.size() < 4) return ParseError("missing name component");
    std::vector<std::string> parts(tokens.begin() + 3, tokens.end());
    names_.push_back(name_extend(prefix, str_util::Join(parts, " ")));
  } else if (code == "#NI") {
    uint64_t component;
    TF_RETURN_IF_ERROR(GetNumber(tokens, 3, &component));
    names_.push_back(name_extend(prefix, component));
  } else {
    return ParseError("unknown name code ", code);
  }
  return Status::OK();
}

Status ExportReader::ParseLevel(uint64_t index, const std::string& code,
                                const Tokens& tokens) {
  if (index != levels_.size()) {
    return ParseError("level ", index, " defined out of order, expected ",
                      levels_.size());
  }
  LevelPtr lhs, rhs;
  if (code == "#US") {
    TF_RETURN_IF_ERROR(GetLevel(tokens, 2, &lhs));
    levels_.push_back(mk_succ(lhs));
  } else if (code == "#UM" || code == "#UIM" || code == "#UI") {
    TF_RETURN_IF_ERROR(GetLevel(tokens, 2, &lhs));
    TF_RETURN_IF_ERROR(GetLevel(tokens, 3, &rhs));
    levels_.push_back(code == "#UM" ? mk_max(lhs, rhs) : mk_imax(lhs, rhs));
  } else if (code == "#UP") {
    NamePtr name;
    TF_RETURN_IF_ERROR(GetName(tokens, 2, &name));
    levels_.push_back(mk_param(name));
  } else {
    return ParseError("unknown level code ", code);
  }
  return Status::OK();
}

Status ExportReader::ParseExpr(uint64_t index, const std::string& code,
                               const Tokens& tokens) {
  if (index != exprs_.size()) {
    return ParseError("expression ", index, " defined out of order, expected ",
                      exprs_.size());
  }
  if (code == "#EV") {
    uint64_t var;
    TF_RETURN_IF_ERROR(GetNumber(tokens, 2, &var));
    exprs_.push_back(mk_var(var));
  } else if (code == "#ES") {
    LevelPtr level;
    TF_RETURN_IF_ERROR(GetLevel(tokens, 2, &level));
    exprs_.push_back(mk_sort(level));
  } else if (code == "#EC") {
    NamePtr name;
    TF_RETURN_IF_ERROR(GetName(tokens, 2, &name));
    std::vector<LevelPtr> levels(tokens.size() > 3 ? tokens.size() - 3 : 0);
    for (size_t i = 0; i < levels.size(); ++i) {
      TF_RETURN_IF_ERROR(GetLevel(tokens, 3 + i, &levels[i]));
    }
    exprs_.push_back(mk_const(name, levels));
  } else if (code == "#EA") {
    ExprPtr fn, arg;
    TF_RETURN_IF_ERROR(GetExpr(tokens, 2, &fn));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 3, &arg));
    exprs_.push_back(mk_app(fn, arg));
  } else if (code == "#EL" || code == "#EP") {
    BinderInfo binfo;
    NamePtr name;
    ExprPtr domain, body;
    TF_RETURN_IF_ERROR(GetBinderInfo(tokens, 2, &binfo));
    TF_RETURN_IF_ERROR(GetName(tokens, 3, &name));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 4, &domain));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 5, &body));
    exprs_.push_back(code == "#EL" ? mk_lambda(name, domain, body, binfo)
                                   : mk_pi(name, domain, body, binfo));
  } else if (code == "#EZ") {
    NamePtr name;
    ExprPtr type, value, body;
    TF_RETURN_IF_ERROR(GetName(tokens, 2, &name));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 3, &type));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 4, &value));
    TF_RETURN_IF_ERROR(GetExpr(tokens, 5, &body));
    exprs_.push_back(mk_let(name, type, value, body));
  } else {
    return ParseError("unknown expression code ", code);
  }
  return Status::OK();
}

Status ExportReader::ParseAxiom(const Tokens& tokens, bool definition,
                                ExportedDeclaration* decl) {
  decl->kind = definition ? ExportedDeclaration::DEFINITION
                          : ExportedDeclaration::AXIOM;
  TF_RETURN_IF_ERROR(GetName(tokens, 1, &decl->name));
  TF_RETURN_IF_ERROR(GetExpr(tokens, 2, &decl->type));
  size_t pos = 3;
  if (definition) TF_RETURN_IF_ERROR(GetExpr(tokens, pos++, &decl->value));
  return GetUnivParams(tokens, pos, &decl->univ_params);
}

Status ExportReader::ParseInductive(const Tokens& tokens,
                                    ExportedDeclaration* decl) {
  decl->kind = ExportedDeclaration::INDUCTIVE;
  TF_RETURN_IF_ERROR(GetNumber(tokens, 1, &decl->num_params));
  TF_RETURN_IF_ERROR(GetName(tokens, 2, &decl->name));
  TF_RETURN_IF_ERROR(GetExpr(tokens, 3, &decl->type));
  uint64_t num_constructors;
  TF_RETURN_IF_ERROR(GetNumber(tokens, 4, &num_constructors));
  if (tokens.size() < 5 + 2 * num_constructors) {
    return ParseError(decl->name->to_string(), " declares ", num_constructors,
                      " constructors but lists fewer");
  }
  size_t pos = 5;
  for (uint64_t i = 0; i < num_constructors; ++i, pos += 2) {
    NamePtr name;
    ExprPtr type;
    TF_RETURN_IF_ERROR(GetName(tokens, pos, &name));
    TF_RETURN_IF_ERROR(GetExpr(tokens, pos + 1, &type));
    decl->constructors.emplace_back(name, type);
  }
  return GetUnivParams(tokens, pos, &decl->univ_params);
}

Status ExportReader::GetNumber(const Tokens& tokens, size_t pos,
                               uint64_t* value) const {
  if (pos >= tokens.size()) return ParseError("missing field ", pos);
  tensorflow::uint64 parsed;
  if (!tensorflow::strings::safe_strtou64(tokens[pos], &parsed)) {
    return ParseError("expected a number, got '", tokens[pos], "'");
  }
  *value = parsed;
  return Status::OK();
}

Status ExportReader::GetName(const Tokens& tokens, size_t pos,
                             NamePtr* name) const {
  uint64_t index;
  TF_RETURN_IF_ERROR(GetNumber(tokens, pos, &index));
  if (index >= names_.size()) return ParseError("undefined name ", index);
  *name = names_[index];
  return Status::OK();
}

Status ExportReader::GetLevel(const Tokens& tokens, size_t pos,
                              LevelPtr* level) const {
  uint64_t index;
  TF_RETURN_IF_ERROR(GetNumber(tokens, pos, &index));
  if (index >= levels_.size()) return ParseError("undefined level ", index);
  *level = levels_[index];
  return Status::OK();
}

Status ExportReader::GetExpr(const Tokens& tokens, size_t pos,
                             ExprPtr* expr) const {
  uint64_t index;
  TF_RETURN_IF_ERROR(GetNumber(tokens, pos, &index));
  if (index >= exprs_.size()) return ParseError("undefined expression ", index);
  *expr = exprs_[index];
  return Status::OK();
}

Status ExportReader::GetBinderInfo(const Tokens& tokens, size_t pos,
                                   BinderInfo* binfo) const {
  if (pos >= tokens.size()) return ParseError("missing binder info");
  const std::string& token = tokens[pos];
  if (token == "#BD") {
    *binfo = BINDER_DEFAULT;
  } else if (token == "#BI") {
    *binfo = BINDER_IMPLICIT;
  } else if (token == "#BS") {
    *binfo = BINDER_STRICT_IMPLICIT;
  } else if (token == "#BC") {
    *binfo = BINDER_INST_IMPLICIT;
  } else {
    return ParseError("unknown binder info ", token);
  }
  return Status::OK();
}

Status ExportReader::GetUnivParams(const Tokens& tokens, size_t pos,
                                   std::vector<NamePtr>* params) const {
  params->clear();
  for (; pos < tokens.size(); ++pos) {
    NamePtr name;
    TF_RETURN_IF_ERROR(GetName(tokens, pos, &name));
    params->push_back(name);
  }
  return Status::OK();
}

}  // namespace kerncheck
