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

// Tests for export_reader.h

#include "kerncheck/driver/export_reader.h"

#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/lib/core/status_test_util.h"
#include "tensorflow/core/lib/io/path.h"
#include "tensorflow/core/lib/strings/str_util.h"
#include "tensorflow/core/platform/env.h"
#include "tensorflow/core/platform/test.h"

namespace kerncheck {
namespace {

using tensorflow::str_util::StrContains;

// Nat with its constructors, one := succ zero and T.{u} : Sort u
const char kNatExport[] =
    "1 #NS 0 Nat\n"
    "2 #NS 1 zero\n"
    "3 #NS 1 succ\n"
    "4 #NS 0 one\n"
    "1 #US 0\n"
    "0 #ES 1\n"
    "1 #EC 1\n"
    "2 #EP #BD 0 1 1\n"
    "#IND 0 1 0 2 2 1 3 2\n"
    "3 #EC 2\n"
    "4 #EC 3\n"
    "5 #EA 4 3\n"
    "#INFIX 4 65 +\n"
    "\n"
    "#DEF 4 1 5\n"
    "5 #NS 0 u\n"
    "6 #NS 0 T\n"
    "2 #UP 5\n"
    "6 #ES 2\n"
    "#AX 6 6 5\n";

ExprPtr Const(const char* name) { return mk_const(mk_name(name), {}); }

class ExportReaderTest : public ::testing::Test {
 protected:
  // Reads the next declaration, which must exist
  ExportedDeclaration Next() {
    ExportedDeclaration decl;
    bool done = true;
    TF_EXPECT_OK(reader_.Next(&decl, &done));
    EXPECT_FALSE(done);
    return decl;
  }

  void ExpectDone() {
    ExportedDeclaration decl;
    bool done = false;
    TF_EXPECT_OK(reader_.Next(&decl, &done));
    EXPECT_TRUE(done);
  }

  // Error from the first declaration of contents
  tensorflow::Status Error(const std::string& contents) {
    reader_.Load("bad", contents);
    ExportedDeclaration decl;
    bool done;
    tensorflow::Status status = reader_.Next(&decl, &done);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), tensorflow::error::INVALID_ARGUMENT);
    return status;
  }

  ExportReader reader_;
};

TEST_F(ExportReaderTest, Declarations) {
  reader_.Load("nat", kNatExport);

  ExportedDeclaration nat = Next();
  EXPECT_EQ(reader_.line_number(), 9);
  EXPECT_EQ(nat.kind, ExportedDeclaration::INDUCTIVE);
  EXPECT_EQ(nat.name, mk_name("Nat"));
  EXPECT_EQ(nat.num_params, 0);
  EXPECT_EQ(nat.type, mk_sort(mk_level_num(1)));
  ASSERT_EQ(nat.constructors.size(), 2);
  EXPECT_EQ(nat.constructors[0].first, mk_name("Nat.zero"));
  EXPECT_EQ(nat.constructors[0].second, Const("Nat"));
  EXPECT_EQ(nat.constructors[1].first, mk_name("Nat.succ"));
  EXPECT_EQ(nat.constructors[1].second,
            mk_pi(anonymous_name(), Const("Nat"), Const("Nat")));
  EXPECT_TRUE(nat.univ_params.empty());

  ExportedDeclaration one = Next();
  EXPECT_EQ(one.kind, ExportedDeclaration::DEFINITION);
  EXPECT_EQ(one.name, mk_name("one"));
  EXPECT_EQ(one.type, Const("Nat"));
  EXPECT_EQ(one.value, mk_app(Const("Nat.succ"), Const("Nat.zero")));

  ExportedDeclaration t = Next();
  EXPECT_EQ(t.kind, ExportedDeclaration::AXIOM);
  EXPECT_EQ(t.name, mk_name("T"));
  EXPECT_EQ(t.type, mk_sort(mk_param(mk_name("u"))));
  ASSERT_EQ(t.univ_params.size(), 1);
  EXPECT_EQ(t.univ_params[0], mk_name("u"));
  ExpectDone();
  ExpectDone();
}

TEST_F(ExportReaderTest, Components) {
  reader_.Load("components",
               "1 #NS 0 a b\n"
               "2 #NI 1 3\n"
               "1 #UP 2\n"
               "2 #UM 1 0\n"
               "3 #UIM 1 0\n"
               "4 #UI 0 1\n"
               "0 #ES 2\n"
               "1 #ES 3\n"
               "2 #ES 4\n"
               "3 #EV 0\n"
               "4 #EL #BI 1 0 3\n"
               "5 #EP #BS 1 0 3\n"
               "6 #EP #BC 1 0 3\n"
               "7 #EZ 1 0 1 3\n"
               "8 #EC 2 1 0\n"
               "#AX 1 0 2\n"
               "#AX 1 1 2\n"
               "#AX 1 2 2\n"
               "#AX 1 4 2\n"
               "#AX 1 5 2\n"
               "#AX 1 6 2\n"
               "#AX 1 7 2\n"
               "#AX 1 8 2\n"
               "#QUOT\n");
  NamePtr a = mk_name("a b");
  NamePtr u = name_extend(a, 3);
  LevelPtr param = mk_param(u);
  ExprPtr s0 = mk_sort(mk_max(param, mk_zero()));

  ExportedDeclaration decl = Next();
  EXPECT_EQ(decl.name, a);
  EXPECT_EQ(decl.name->to_string(), "a b");
  EXPECT_EQ(decl.univ_params[0]->to_string(), "a b.3");
  EXPECT_EQ(decl.type, s0);
  EXPECT_EQ(Next().type, mk_sort(mk_imax(param, mk_zero())));
  EXPECT_EQ(Next().type, mk_sort(mk_imax(mk_zero(), param)));
  EXPECT_EQ(Next().type, mk_lambda(a, s0, mk_var(0), BINDER_IMPLICIT));
  EXPECT_EQ(Next().type, mk_pi(a, s0, mk_var(0), BINDER_STRICT_IMPLICIT));
  EXPECT_EQ(Next().type, mk_pi(a, s0, mk_var(0), BINDER_INST_IMPLICIT));
  EXPECT_EQ(Next().type,
            mk_let(a, s0, mk_sort(mk_imax(param, mk_zero())), mk_var(0)));
  EXPECT_EQ(Next().type, mk_const(u, {param, mk_zero()}));

  decl = Next();
  EXPECT_EQ(decl.kind, ExportedDeclaration::QUOTIENT);
  EXPECT_EQ(decl.name, mk_name("quot"));
  ExpectDone();
}

TEST_F(ExportReaderTest, Open) {
  const std::string path =
      tensorflow::io::JoinPath(tensorflow::testing::TmpDir(), "nat.export");
  TF_ASSERT_OK(tensorflow::WriteStringToFile(tensorflow::Env::Default(), path,
                                             kNatExport));
  TF_ASSERT_OK(reader_.Open(path));
  EXPECT_EQ(Next().name, mk_name("Nat"));

  EXPECT_FALSE(reader_.Open(path + ".missing").ok());
}

TEST_F(ExportReaderTest, Errors) {
  tensorflow::Status status = Error("1 #NS 0 a\n3 #NS 0 b\n#AX 1 0\n");
  EXPECT_TRUE(StrContains(status.error_message(), "bad:2:")) << status;
  EXPECT_TRUE(StrContains(status.error_message(), "out of order")) << status;

  status = Error("1 #NS 0 a\n0 #ES 0\n#AX 1 7\n");
  EXPECT_TRUE(StrContains(status.error_message(), "bad:3:")) << status;
  EXPECT_TRUE(StrContains(status.error_message(), "undefined expression"))
      << status;

  status = Error("1 #XX 0 a\n");
  EXPECT_TRUE(StrContains(status.error_message(), "bad:1:")) << status;

  status = Error("one #NS 0 a\n");
  EXPECT_TRUE(StrContains(status.error_message(), "expected a number"))
      << status;

  status = Error("0 #EP #BX 0 0 0\n");
  EXPECT_TRUE(StrContains(status.error_message(), "binder info")) << status;

  status = Error("1 #US 5\n");
  EXPECT_TRUE(StrContains(status.error_message(), "undefined level"))
      << status;

  status = Error("1 #NS 0 a\n0 #ES 0\n#IND 0 1 0 2 1 0\n");
  EXPECT_TRUE(StrContains(status.error_message(), "constructors")) << status;

  status = Error("1 #NS 0\n");
  EXPECT_TRUE(StrContains(status.error_message(), "missing")) << status;
}

}  // namespace
}  // namespace kerncheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
