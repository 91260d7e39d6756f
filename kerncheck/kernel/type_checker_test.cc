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

#include "kerncheck/kernel/type_checker.h"

#include <vector>

#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/printer.h"
#include "kerncheck/kernel/test_fixtures.h"
#include "tensorflow/core/lib/core/status_test_util.h"
#include "tensorflow/core/platform/test.h"

namespace kerncheck {
namespace {

using fixtures::Const;
using fixtures::MkAxiom;
using fixtures::MkDefinition;

class TypeCheckerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::vector<ExportedDeclaration> decls = fixtures::Prelude();
    decls.push_back(MkDefinition("one", nat_, mk_app(succ_, zero_)));
    decls.push_back(MkDefinition("two", nat_, mk_app(succ_, Const("one"))));
    decls.push_back(
        MkDefinition("two'", nat_, mk_app(succ_, mk_app(succ_, zero_))));
    decls.push_back(MkAxiom("p", mk_prop()));
    decls.push_back(MkAxiom("h1", Const("p")));
    decls.push_back(MkAxiom("h2", Const("p")));
    decls.push_back(MkAxiom("n1", nat_));
    decls.push_back(MkAxiom("n2", nat_));
    TF_ASSERT_OK(fixtures::CertifyAll(&env_, decls));
    checker_.reset(new TypeChecker(&env_));
  }

  ExprPtr Succ(ExprPtr e) const { return mk_app(succ_, e); }

  // λ (x : Nat), body(x)
  template <typename Body>
  ExprPtr NatLambda(const char* name, Body body) {
    ExprPtr x = checker_->local_context()->mk_local(mk_name(name), nat_);
    return fold_lambdas({x}, body(x));
  }

  ErrorKind InferFailure(ExprPtr e) {
    ExprPtr type;
    tensorflow::Status status = checker_->Infer(e, &type);
    ErrorKind kind = kStackExhausted;
    EXPECT_TRUE(GetErrorKind(status, &kind)) << status;
    return kind;
  }

  const ExprPtr nat_ = Const("Nat");
  const ExprPtr bool_ = Const("Bool");
  const ExprPtr zero_ = Const("Nat.zero");
  const ExprPtr succ_ = Const("Nat.succ");
  Environment env_;
  std::unique_ptr<TypeChecker> checker_;
};

TEST_F(TypeCheckerTest, InferBasics) {
  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(mk_prop(), &type));
  EXPECT_EQ(type, mk_sort(mk_level_num(1)));
  TF_ASSERT_OK(checker_->Infer(Succ(zero_), &type));
  EXPECT_EQ(type, nat_);
  TF_ASSERT_OK(
      checker_->Infer(NatLambda("x", [this](ExprPtr x) { return Succ(x); }),
                      &type));
  EXPECT_TRUE(checker_->IsDefEq(type, mk_arrow(nat_, nat_)));
  TF_ASSERT_OK(checker_->Infer(mk_arrow(nat_, mk_prop()), &type));
  EXPECT_EQ(type, mk_sort(mk_level_num(2)));
  TF_ASSERT_OK(checker_->Infer(mk_arrow(nat_, Const("p")), &type));
  EXPECT_EQ(type, mk_prop());

  LevelPtr level;
  TF_ASSERT_OK(checker_->InferSortLevel(nat_, &level));
  EXPECT_TRUE(is_equivalent(level, mk_level_num(1)));
  TF_EXPECT_OK(checker_->CheckType(zero_, nat_));
}

TEST_F(TypeCheckerTest, InferLet) {
  ExprPtr x = checker_->local_context()->mk_local(mk_name("x"), nat_);
  ExprPtr let = mk_let(mk_name("x"), nat_, zero_, abstract(Succ(x), {x}));
  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(let, &type));
  EXPECT_EQ(type, nat_);
  EXPECT_EQ(checker_->WhnfCore(let), Succ(zero_));
}

TEST_F(TypeCheckerTest, Failures) {
  EXPECT_EQ(InferFailure(mk_app(zero_, zero_)), kNotAFunction);
  EXPECT_EQ(InferFailure(Succ(Const("Bool.true"))), kTypeMismatch);
  EXPECT_EQ(checker_->mismatch_lhs(), nat_);
  EXPECT_EQ(checker_->mismatch_rhs(), bool_);
  EXPECT_EQ(InferFailure(Const("eq")), kUniverseArityError);
  EXPECT_EQ(InferFailure(Const("Missing")), kUnknownReference);
  EXPECT_EQ(InferFailure(mk_sort(mk_param(mk_name("u")))), kUnknownReference);

  LevelPtr level;
  tensorflow::Status status = checker_->InferSortLevel(zero_, &level);
  ErrorKind kind;
  ASSERT_TRUE(GetErrorKind(status, &kind));
  EXPECT_EQ(kind, kTypeMismatch);

  status = checker_->CheckType(zero_, bool_);
  ASSERT_TRUE(GetErrorKind(status, &kind));
  EXPECT_EQ(kind, kTypeMismatch);
}

TEST_F(TypeCheckerTest, UniverseParams) {
  checker_->set_univ_params({mk_name("u")});
  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(mk_sort(mk_param(mk_name("u"))), &type));
  EXPECT_EQ(type, mk_sort(mk_succ(mk_param(mk_name("u")))));
  TF_ASSERT_OK(
      checker_->Infer(Const("eq", {mk_succ(mk_param(mk_name("u")))}), &type));
}

TEST_F(TypeCheckerTest, SortsOfImax) {
  checker_->set_univ_params({mk_name("u"), mk_name("v")});
  const LevelPtr imax =
      mk_imax(mk_param(mk_name("u")), mk_param(mk_name("v")));
  EXPECT_TRUE(checker_->IsDefEq(mk_sort(imax), mk_sort(imax)));
  EXPECT_FALSE(checker_->IsDefEq(mk_sort(mk_succ(imax)), mk_sort(imax)));
  EXPECT_FALSE(checker_->IsDefEq(mk_sort(imax), mk_sort(mk_succ(imax))));
}

TEST_F(TypeCheckerTest, Beta) {
  ExprPtr id = NatLambda("x", [](ExprPtr x) { return x; });
  EXPECT_EQ(checker_->WhnfCore(mk_app(id, zero_)), zero_);
  ExprPtr succ_lambda = NatLambda("x", [this](ExprPtr x) { return Succ(x); });
  EXPECT_EQ(checker_->WhnfCore(mk_app(succ_lambda, zero_)), Succ(zero_));
  EXPECT_TRUE(checker_->IsDefEq(mk_app(succ_lambda, zero_), Succ(zero_)));
  EXPECT_TRUE(checker_->IsDefEq(Succ(zero_), mk_app(succ_lambda, zero_)));
  // Head reduction stops at the first non-redex
  EXPECT_EQ(checker_->WhnfCore(Succ(mk_app(id, zero_))),
            Succ(mk_app(id, zero_)));
}

TEST_F(TypeCheckerTest, BoolRecursor) {
  // Bool.rec.{1} (λ b, Nat) Nat.zero (Nat.succ Nat.zero) b
  ExprPtr motive = mk_lambda(mk_name("b"), bool_, nat_);
  ExprPtr rec = fold_apps(Const("Bool.rec", {mk_level_num(1)}),
                          {motive, zero_, Succ(zero_)});
  EXPECT_EQ(checker_->Whnf(mk_app(rec, Const("Bool.true"))), zero_);
  EXPECT_EQ(checker_->Whnf(mk_app(rec, Const("Bool.false"))), Succ(zero_));

  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(mk_app(rec, Const("Bool.true")), &type));
  EXPECT_TRUE(checker_->IsDefEq(type, nat_));

  // A stuck major premise
  ExprPtr b = checker_->local_context()->mk_local(mk_name("b"), bool_);
  EXPECT_EQ(checker_->Whnf(mk_app(rec, b)), mk_app(rec, b));
}

TEST_F(TypeCheckerTest, NatRecursor) {
  // Nat.rec.{1} (λ n, Nat) zero (λ n ih, succ ih) computes the identity
  ExprPtr motive = mk_lambda(mk_name("n"), nat_, nat_);
  LocalContext* locals = checker_->local_context();
  ExprPtr n = locals->mk_local(mk_name("n"), nat_);
  ExprPtr ih = locals->mk_local(mk_name("ih"), nat_);
  ExprPtr step = fold_lambdas({n, ih}, Succ(ih));
  ExprPtr rec = fold_apps(Const("Nat.rec", {mk_level_num(1)}),
                          {motive, zero_, step});
  EXPECT_EQ(checker_->Whnf(mk_app(rec, zero_)), zero_);
  EXPECT_EQ(checker_->Whnf(mk_app(rec, Succ(zero_))),
            Succ(mk_app(rec, zero_)));
  EXPECT_TRUE(
      checker_->IsDefEq(mk_app(rec, Succ(Succ(zero_))), Succ(Succ(zero_))));
  // The major premise is reduced to a constructor first
  EXPECT_TRUE(checker_->IsDefEq(mk_app(rec, Const("two")), Const("two'")));

  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(mk_app(rec, Const("two")), &type));
  EXPECT_TRUE(checker_->IsDefEq(type, nat_));
}

TEST_F(TypeCheckerTest, EqRecursorIsKLike) {
  const Declaration* rec = env_.Lookup(mk_name("eq.rec"));
  ASSERT_NE(rec, nullptr);
  EXPECT_TRUE(rec->k_like);
  ASSERT_EQ(rec->univ_params.size(), 2);
  EXPECT_EQ(rec->univ_params[0], mk_name("l"));

  // eq.rec.{1 1} Nat zero (λ b, Nat) m b h with h an arbitrary proof
  LocalContext* locals = checker_->local_context();
  ExprPtr h = locals->mk_local(
      mk_name("h"), fold_apps(Const("eq", {mk_level_num(1)}),
                              {nat_, zero_, zero_}));
  ExprPtr m = locals->mk_local(mk_name("m"), nat_);
  ExprPtr motive = mk_lambda(mk_name("b"), nat_, nat_);
  ExprPtr app =
      fold_apps(Const("eq.rec", {mk_level_num(1), mk_level_num(1)}),
                {nat_, zero_, motive, m, zero_, h});
  EXPECT_EQ(checker_->WhnfCore(app), m);

  ExprPtr type;
  TF_ASSERT_OK(checker_->Infer(app, &type));
  EXPECT_TRUE(checker_->IsDefEq(type, nat_));

  // The index must agree with the one of eq.refl
  ExprPtr stuck =
      fold_apps(Const("eq.rec", {mk_level_num(1), mk_level_num(1)}),
                {nat_, zero_, motive, m, Succ(zero_), h});
  EXPECT_EQ(checker_->WhnfCore(stuck), stuck);
}

TEST_F(TypeCheckerTest, Delta) {
  EXPECT_EQ(checker_->WhnfCore(Const("one")), Const("one"));
  EXPECT_EQ(checker_->Whnf(Const("one")), Succ(zero_));
  EXPECT_EQ(checker_->Whnf(Const("two")), Succ(Const("one")));
  EXPECT_EQ(env_.Height(mk_name("one")), 1);
  EXPECT_EQ(env_.Height(mk_name("two")), 2);
  EXPECT_EQ(env_.Height(mk_name("two'")), 1);
  EXPECT_TRUE(checker_->IsDefEq(Const("two"), Const("two'")));
  EXPECT_TRUE(checker_->IsDefEq(Const("two'"), Const("two")));
  EXPECT_TRUE(checker_->IsDefEq(Const("two"), Succ(Succ(zero_))));
  EXPECT_FALSE(checker_->IsDefEq(Const("two"), Const("one")));
  EXPECT_FALSE(checker_->IsDefEq(Const("one"), zero_));
}

TEST_F(TypeCheckerTest, DefEq) {
  EXPECT_TRUE(checker_->IsDefEq(nat_, nat_));
  EXPECT_FALSE(checker_->IsDefEq(nat_, bool_));
  EXPECT_FALSE(checker_->IsDefEq(Const("n1"), Const("n2")));
  EXPECT_TRUE(checker_->IsDefEq(
      mk_sort(mk_max(mk_level_num(1), mk_level_num(1))),
      mk_sort(mk_level_num(1))));
  EXPECT_FALSE(checker_->IsDefEq(mk_prop(), mk_sort(mk_level_num(1))));
  // Binder names and infos are irrelevant
  EXPECT_TRUE(checker_->IsDefEq(
      mk_lambda(mk_name("x"), nat_, mk_var(0)),
      mk_lambda(mk_name("y"), nat_, mk_var(0), BINDER_IMPLICIT)));
  EXPECT_FALSE(checker_->IsDefEq(mk_pi(mk_name("x"), nat_, nat_),
                                 mk_pi(mk_name("x"), bool_, nat_)));
}

TEST_F(TypeCheckerTest, ProofIrrelevance) {
  EXPECT_TRUE(checker_->IsDefEq(Const("h1"), Const("h2")));
  EXPECT_TRUE(checker_->IsDefEq(Const("h2"), Const("h1")));
}

TEST_F(TypeCheckerTest, Eta) {
  ExprPtr expanded = NatLambda("x", [this](ExprPtr x) { return Succ(x); });
  EXPECT_TRUE(checker_->IsDefEq(expanded, succ_));
  EXPECT_TRUE(checker_->IsDefEq(succ_, expanded));
  ExprPtr other = NatLambda("x", [](ExprPtr x) { return x; });
  EXPECT_FALSE(checker_->IsDefEq(other, succ_));
}

TEST_F(TypeCheckerTest, NormalizePis) {
  std::vector<ExprPtr> locals;
  ExprPtr body = checker_->NormalizePis(
      mk_arrow(nat_, mk_app(mk_lambda(mk_name("x"), mk_sort(mk_level_num(1)),
                                      mk_arrow(mk_var(0), bool_)),
                            nat_)),
      &locals);
  EXPECT_EQ(body, bool_);
  ASSERT_EQ(locals.size(), 2);
  EXPECT_EQ(locals[1]->local_type(), nat_);
}

}  // namespace
}  // namespace kerncheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
