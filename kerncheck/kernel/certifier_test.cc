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

#include "kerncheck/kernel/certifier.h"

#include <vector>

#include "kerncheck/kernel/general.h"
#include "kerncheck/kernel/test_fixtures.h"
#include "tensorflow/core/lib/core/status_test_util.h"
#include "tensorflow/core/lib/strings/str_util.h"
#include "tensorflow/core/platform/test.h"

namespace kerncheck {
namespace {

using fixtures::Const;
using fixtures::MkAxiom;
using fixtures::MkDefinition;
using tensorflow::str_util::StartsWith;
using tensorflow::str_util::StrContains;

class CertifierTest : public ::testing::Test {
 protected:
  CertifierTest() : certifier_(&env_) {}

  void SetUp() override {
    TF_ASSERT_OK(fixtures::CertifyAll(&env_, fixtures::Prelude()));
  }

  // Certifies decl, expecting a rejection, and returns it
  std::unique_ptr<Rejection> Reject(const ExportedDeclaration& decl) {
    std::unique_ptr<Rejection> rejection;
    TF_EXPECT_OK(certifier_.Certify(decl, &rejection));
    EXPECT_NE(rejection.get(), nullptr) << decl.name;
    return rejection;
  }

  void Accept(const ExportedDeclaration& decl) {
    std::unique_ptr<Rejection> rejection;
    TF_EXPECT_OK(certifier_.Certify(decl, &rejection));
    EXPECT_EQ(rejection.get(), nullptr) << RejectionReport(*rejection);
    EXPECT_NE(env_.Lookup(decl.name), nullptr);
  }

  const ExprPtr type_ = mk_sort(mk_level_num(1));
  const ExprPtr nat_ = Const("Nat");
  const ExprPtr zero_ = Const("Nat.zero");
  Environment env_;
  Certifier certifier_;
};

TEST_F(CertifierTest, ValueOfTheWrongType) {
  Accept(MkAxiom("A", type_));
  std::unique_ptr<Rejection> rejection =
      Reject(MkDefinition("B", Const("A"), Const("A")));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kTypeMismatch);
  EXPECT_EQ(rejection->name, mk_name("B"));
  EXPECT_EQ(rejection->lhs, Const("A"));
  EXPECT_EQ(rejection->rhs, type_);
  EXPECT_TRUE(StartsWith(rejection->message, "TypeMismatch: "))
      << rejection->message;
  const std::string report = RejectionReport(*rejection);
  EXPECT_TRUE(StrContains(report, "declaration B rejected: TypeMismatch"))
      << report;
  EXPECT_TRUE(StrContains(report, "expected: A")) << report;
}

TEST_F(CertifierTest, TypesEqualUpToDelta) {
  Accept(MkDefinition("MyNat", type_, nat_));
  Accept(MkDefinition("z", Const("MyNat"), zero_));
  Accept(MkDefinition("z'", nat_, Const("z")));
  EXPECT_EQ(env_.Lookup(mk_name("z"))->height, 1);
  EXPECT_EQ(env_.Lookup(mk_name("z'"))->height, 2);
}

TEST_F(CertifierTest, UniversePolymorphism) {
  // id.{u} : Π {α : Sort u}, α → α := λ {α} (a : α), a
  NamePtr u = mk_name("u");
  LocalContext locals;
  ExprPtr alpha =
      locals.mk_local(mk_name("α"), mk_sort(mk_param(u)), BINDER_IMPLICIT);
  ExprPtr a = locals.mk_local(mk_name("a"), alpha);
  Accept(MkDefinition("id", fold_pis({alpha, a}, alpha),
                      fold_lambdas({alpha, a}, a), {u}));
  Accept(MkDefinition("z", nat_,
                      fold_apps(Const("id", {mk_level_num(1)}), {nat_, zero_})));

  std::unique_ptr<Rejection> rejection =
      Reject(MkAxiom("w", fold_apps(Const("id"), {type_, nat_})));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUniverseArityError);

  // Values are only resolved when the signature is committed
  rejection =
      Reject(MkDefinition("z'", nat_, fold_apps(Const("id"), {nat_, zero_})));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUnknownReference);

  rejection = Reject(MkAxiom("bad", mk_sort(mk_param(u))));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUnknownReference);
}

TEST_F(CertifierTest, SortIsNotItsOwnType) {
  // sort.{u v} : Sort (imax u v) := Sort (imax u v)
  NamePtr u = mk_name("u");
  NamePtr v = mk_name("v");
  ExprPtr sort = mk_sort(mk_imax(mk_param(u), mk_param(v)));
  std::unique_ptr<Rejection> rejection =
      Reject(MkDefinition("sort", sort, sort, {u, v}));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kTypeMismatch);

  Accept(MkDefinition("sort'", mk_sort(mk_succ(mk_imax(mk_param(u),
                                                        mk_param(v)))),
                      sort, {u, v}));
}

TEST_F(CertifierTest, Header) {
  NamePtr u = mk_name("u");
  std::unique_ptr<Rejection> rejection =
      Reject(MkAxiom("dup", mk_sort(mk_param(u)), {u, u}));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kDuplicateName);

  rejection = Reject(MkAxiom("loose", mk_var(0)));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUnknownReference);

  rejection = Reject(MkAxiom("missing", Const("Missing")));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUnknownReference);

  rejection = Reject(MkAxiom("Nat", type_));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kDuplicateName);

  // A term that is not a type
  rejection = Reject(MkAxiom("notype", zero_));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kTypeMismatch);
  EXPECT_EQ(env_.Lookup(mk_name("notype")), nullptr);
}

TEST_F(CertifierTest, FreeLocalsAreNotRejections) {
  LocalContext locals;
  ExprPtr x = locals.mk_local(mk_name("x"), type_);
  std::unique_ptr<Rejection> rejection;
  EXPECT_FALSE(certifier_.Certify(MkAxiom("x", x), &rejection).ok());
  EXPECT_EQ(rejection.get(), nullptr);
}

TEST_F(CertifierTest, NoSelfReference) {
  std::unique_ptr<Rejection> rejection =
      Reject(MkDefinition("loop", nat_, Const("loop")));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kUnknownReference);
  EXPECT_EQ(env_.Lookup(mk_name("loop")), nullptr);
}

TEST_F(CertifierTest, Stages) {
  const ExportedDeclaration bad = MkDefinition("bad", nat_, nat_);
  std::unique_ptr<Rejection> rejection;
  TF_ASSERT_OK(certifier_.CertifySignature(bad, &rejection));
  EXPECT_EQ(rejection.get(), nullptr);
  // The signature is committed before the body is checked
  EXPECT_NE(env_.Lookup(mk_name("bad")), nullptr);
  TF_ASSERT_OK(certifier_.CertifyBody(bad, &rejection));
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kTypeMismatch);

  // Bodies of other kinds are trivially fine
  TF_ASSERT_OK(certifier_.CertifyBody(MkAxiom("ax", nat_), &rejection));
  EXPECT_EQ(rejection.get(), nullptr);
}

TEST_F(CertifierTest, Inductives) {
  std::unique_ptr<Rejection> rejection = Reject(fixtures::NatDecl());
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kDuplicateName);

  ExportedDeclaration bad;
  bad.kind = ExportedDeclaration::INDUCTIVE;
  bad.name = mk_name("Bad");
  bad.type = type_;
  bad.constructors.emplace_back(mk_name("Bad.mk"), nat_);
  rejection = Reject(bad);
  ASSERT_NE(rejection.get(), nullptr);
  EXPECT_EQ(rejection->kind, kMalformedConstructor);
  EXPECT_EQ(env_.Lookup(mk_name("Bad")), nullptr);
  EXPECT_EQ(env_.Lookup(mk_name("Bad.rec")), nullptr);
}

TEST_F(CertifierTest, DefinitionHeight) {
  Accept(MkDefinition("one", nat_, mk_app(Const("Nat.succ"), zero_)));
  EXPECT_EQ(DefinitionHeight(env_, zero_), 1);
  EXPECT_EQ(DefinitionHeight(env_, Const("one")), 2);
  EXPECT_EQ(env_.Lookup(mk_name("one"))->height, 1);
}

}  // namespace
}  // namespace kerncheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
