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

#include <iostream>
#include <sstream>
#include <vector>

#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/printer.h"
#include "kerncheck/kernel/stack_guard.h"

namespace kerncheck {

std::ostream& operator<<(std::ostream& out, NamePtr name) {
  if (name == nullptr) {
    out << "null";
  } else {
    out << name->to_string();
  }
  return out;
}

std::ostream& operator<<(std::ostream& out, LevelPtr level) {
  if (level == nullptr) {
    out << "null";
    return out;
  }
  // Succ chains print as offsets: u+2
  int succs = 0;
  while (level->is_succ()) {
    level = level->pred();
    succs++;
  }
  if (level->is_zero()) {
    out << succs;
    return out;
  }
  if (level->is_param()) {
    out << level->param();
  } else {
    out << "(" << (level->is_max() ? "max " : "imax ") << level->lhs() << " "
        << level->rhs() << ")";
  }
  if (succs > 0) out << "+" << succs;
  return out;
}

namespace {

const char* binder_open(BinderInfo binfo) {
  switch (binfo) {
    case BINDER_IMPLICIT:
      return "{";
    case BINDER_STRICT_IMPLICIT:
      return "{{";
    case BINDER_INST_IMPLICIT:
      return "[";
    case BINDER_DEFAULT:
      break;
  }
  return "(";
}

const char* binder_close(BinderInfo binfo) {
  switch (binfo) {
    case BINDER_IMPLICIT:
      return "}";
    case BINDER_STRICT_IMPLICIT:
      return "}}";
    case BINDER_INST_IMPLICIT:
      return "]";
    case BINDER_DEFAULT:
      break;
  }
  return ")";
}

class Printer {
 public:
  explicit Printer(std::ostream* out) : out_(*out) {}

  void Print(ExprPtr e, bool parens) {
    if (StackGuard::near_limit()) {
      StackGuard::run_on_new_segment([&] { PrintCore(e, parens); });
      return;
    }
    PrintCore(e, parens);
  }

 private:
  void PrintCore(ExprPtr e, bool parens) {
    switch (e->kind()) {
      case Expr::VAR:
        if (e->var_index() < binders_.size()) {
          out_ << binders_[binders_.size() - 1 - e->var_index()];
        } else {
          out_ << "#" << e->var_index();
        }
        return;
      case Expr::SORT:
        if (e->sort_level()->is_zero()) {
          out_ << "Prop";
        } else {
          if (parens) out_ << "(";
          out_ << "Sort " << e->sort_level();
          if (parens) out_ << ")";
        }
        return;
      case Expr::CONST:
        out_ << e->const_name();
        if (!e->const_levels().empty()) {
          out_ << ".{";
          for (size_t i = 0; i < e->const_levels().size(); ++i) {
            if (i > 0) out_ << " ";
            out_ << e->const_levels()[i];
          }
          out_ << "}";
        }
        return;
      case Expr::LOCAL:
        out_ << e->local_name();
        return;
      case Expr::APP: {
        ExprPtr fn;
        std::vector<ExprPtr> args;
        std::tie(fn, args) = strip_app(e);
        if (parens) out_ << "(";
        Print(fn, true);
        for (ExprPtr arg : args) {
          out_ << " ";
          Print(arg, true);
        }
        if (parens) out_ << ")";
        return;
      }
      case Expr::LAMBDA:
      case Expr::PI: {
        if (parens) out_ << "(";
        if (e->is_pi() && e->binder_body()->var_bound() == 0) {
          Print(e->binder_domain(), true);
          out_ << " → ";
        } else {
          out_ << (e->is_pi() ? "Π " : "λ ") << binder_open(e->binder_info())
               << e->binder_name() << " : ";
          Print(e->binder_domain(), false);
          out_ << binder_close(e->binder_info()) << ", ";
        }
        binders_.push_back(e->binder_name());
        Print(e->binder_body(), false);
        binders_.pop_back();
        if (parens) out_ << ")";
        return;
      }
      case Expr::LET:
        if (parens) out_ << "(";
        out_ << "let " << e->let_name() << " : ";
        Print(e->let_type(), false);
        out_ << " := ";
        Print(e->let_value(), false);
        out_ << " in ";
        binders_.push_back(e->let_name());
        Print(e->let_body(), false);
        binders_.pop_back();
        if (parens) out_ << ")";
        return;
    }
  }

  std::ostream& out_;
  std::vector<NamePtr> binders_;
};

}  // namespace

std::ostream& operator<<(std::ostream& out, ExprPtr expr) {
  if (expr == nullptr) {
    out << "null";
  } else {
    Printer(&out).Print(expr, false);
  }
  return out;
}

std::string to_string(LevelPtr level) {
  std::ostringstream out;
  out << level;
  return out.str();
}

std::string to_string(ExprPtr expr) {
  std::ostringstream out;
  out << expr;
  return out.str();
}

}  // namespace kerncheck
