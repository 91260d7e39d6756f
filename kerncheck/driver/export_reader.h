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

// Reader for the line-oriented export format.
//
// Every line either defines a component at the next free index of its table
// or declares something:
//
//   n #NS p s           name n is name p extended by string s
//   n #NI p k           name n is name p extended by number k
//   n #US l             level n is Succ l
//   n #UM a b           level n is Max a b
//   n #UIM a b          level n is IMax a b (#UI is accepted too)
//   n #UP nm            level n is Param nm
//   n #EV i             expr n is Var i
//   n #ES l             expr n is Sort l
//   n #EC nm l*         expr n is Const nm with levels l*
//   n #EA f a           expr n is App f a
//   n #EL bi nm d b     expr n is Lambda, bi in #BD #BI #BS #BC
//   n #EP bi nm d b     expr n is Pi
//   n #EZ nm t v b      expr n is Let
//   #AX nm ty up*
//   #DEF nm ty val up*
//   #QUOT
//   #IND np nm ty k (cn ct){k} up*
//   #INFIX, #PREFIX, #POSTFIX    notation, ignored
//
// Name 0 is the anonymous name and level 0 is Zero. Expressions start at 0.

#ifndef KERNCHECK_DRIVER_EXPORT_READER_H_
#define KERNCHECK_DRIVER_EXPORT_READER_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "kerncheck/driver/declaration_source.h"
#include "kerncheck/kernel/declaration.h"
#include "tensorflow/core/lib/core/errors.h"
#include "tensorflow/core/lib/core/status.h"
#include "tensorflow/core/platform/macros.h"

namespace kerncheck {

class ExportReader : public DeclarationSource {
 public:
  ExportReader();

  // Loads an export file. Parsing happens lazily in Next.
  tensorflow::Status Open(const std::string& path);
  // Uses contents as the export, reported under the given name
  void Load(const std::string& name, const std::string& contents);

  // Parse errors are InvalidArgument and name the offending line
  tensorflow::Status Next(ExportedDeclaration* decl, bool* done) override;

  // 1-based number of the last line read
  uint64_t line_number() const { return next_line_; }

 private:
  typedef std::vector<std::string> Tokens;

  tensorflow::Status ParseLine(const Tokens& tokens, ExportedDeclaration* decl,
                               bool* is_declaration);
  tensorflow::Status ParseName(uint64_t index, const std::string& code,
                               const Tokens& tokens);
  tensorflow::Status ParseLevel(uint64_t index, const std::string& code,
                                const Tokens& tokens);
  tensorflow::Status ParseExpr(uint64_t index, const std::string& code,
                               const Tokens& tokens);
  tensorflow::Status ParseAxiom(const Tokens& tokens, bool definition,
                                ExportedDeclaration* decl);
  tensorflow::Status ParseInductive(const Tokens& tokens,
                                    ExportedDeclaration* decl);

  tensorflow::Status GetNumber(const Tokens& tokens, size_t pos,
                               uint64_t* value) const;
  tensorflow::Status GetName(const Tokens& tokens, size_t pos,
                             NamePtr* name) const;
  tensorflow::Status GetLevel(const Tokens& tokens, size_t pos,
                              LevelPtr* level) const;
  tensorflow::Status GetExpr(const Tokens& tokens, size_t pos,
                             ExprPtr* expr) const;
  tensorflow::Status GetBinderInfo(const Tokens& tokens, size_t pos,
                                   BinderInfo* binfo) const;
  tensorflow::Status GetUnivParams(const Tokens& tokens, size_t pos,
                                   std::vector<NamePtr>* params) const;

  template <typename... Args>
  tensorflow::Status ParseError(Args... args) const {
    return tensorflow::errors::InvalidArgument(name_, ":", next_line_, ": ",
                                               args...);
  }

  std::string name_;
  std::vector<std::string> lines_;
  size_t next_line_ = 0;

  std::vector<NamePtr> names_;
  std::vector<LevelPtr> levels_;
  std::vector<ExprPtr> exprs_;

  TF_DISALLOW_COPY_AND_ASSIGN(ExportReader);
};

}  // namespace kerncheck

#endif  // KERNCHECK_DRIVER_EXPORT_READER_H_
