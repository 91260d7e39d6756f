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

// Tests for level.h

#include "kerncheck/kernel/level.h"

#include "kerncheck/kernel/printer.h"
#include "tensorflow/core/platform/test.h"

namespace kerncheck {
namespace {

class LevelTest : public ::testing::Test {
 protected:
  LevelTest()
      : zero_(mk_zero()),
        one_(mk_level_num(1)),
        u_(mk_param(mk_name("u"))),
        v_(mk_param(mk_name("v"))) {}

  const LevelPtr zero_;
  const LevelPtr one_;
  const LevelPtr u_;
  const LevelPtr v_;
};

TEST_F(LevelTest, HashConsed) {
  EXPECT_EQ(mk_max(u_, v_), mk_max(u_, v_));
  EXPECT_NE(mk_max(u_, v_), mk_max(v_, u_));
  EXPECT_EQ(mk_succ(zero_), one_);
  EXPECT_TRUE(mk_imax(u_, zero_)->has_param());
  EXPECT_FALSE(mk_max(one_, zero_)->has_param());
}

TEST_F(LevelTest, Simplify) {
  EXPECT_EQ(simplify(mk_imax(u_, zero_)), zero_);
  EXPECT_EQ(simplify(mk_imax(u_, one_)), mk_max(u_, one_));
  EXPECT_EQ(simplify(mk_max(zero_, u_)), u_);
  EXPECT_EQ(simplify(mk_max(u_, u_)), u_);
  EXPECT_EQ(simplify(mk_max(mk_succ(u_), mk_succ(v_))),
            mk_succ(mk_max(u_, v_)));
  EXPECT_EQ(simplify(mk_imax(u_, v_)), mk_imax(u_, v_));
  EXPECT_EQ(to_string(simplify(mk_max(mk_succ(u_), mk_level_num(3)))),
            "(max u 2)+1");
}

TEST_F(LevelTest, Leq) {
  EXPECT_TRUE(leq(mk_max(u_, v_), mk_max(v_, u_)));
  EXPECT_TRUE(leq(mk_max(v_, u_), mk_max(u_, v_)));
  EXPECT_TRUE(leq(zero_, u_));
  EXPECT_FALSE(leq(u_, zero_));
  EXPECT_FALSE(leq(u_, v_));
  EXPECT_FALSE(leq(v_, u_));
  EXPECT_TRUE(leq(u_, mk_succ(u_)));
  EXPECT_FALSE(leq(mk_succ(u_), u_));
  EXPECT_TRUE(leq(u_, mk_max(u_, v_)));
  EXPECT_TRUE(leq(mk_level_num(2), mk_max(one_, mk_succ(mk_succ(u_)))));
  EXPECT_FALSE(leq(mk_level_num(2), mk_max(one_, u_)));
}

TEST_F(LevelTest, LeqImax) {
  // imax u v <= max u v holds whether v is zero or not
  EXPECT_TRUE(leq(mk_imax(u_, v_), mk_max(u_, v_)));
  EXPECT_FALSE(leq(mk_max(u_, v_), mk_imax(u_, v_)));
  EXPECT_TRUE(leq(v_, mk_imax(u_, v_)));
  EXPECT_TRUE(leq(mk_imax(u_, mk_imax(v_, u_)), mk_max(u_, v_)));
  EXPECT_TRUE(is_equivalent(mk_imax(u_, mk_max(v_, one_)),
                            mk_max(mk_max(u_, v_), one_)));
}

TEST_F(LevelTest, LeqImaxOffsets) {
  const LevelPtr imax = mk_imax(u_, v_);
  EXPECT_TRUE(leq(imax, imax));
  EXPECT_TRUE(leq(imax, mk_succ(imax)));
  EXPECT_FALSE(leq(mk_succ(imax), imax));
  EXPECT_FALSE(leq(mk_succ(mk_succ(imax)), mk_succ(imax)));
  EXPECT_FALSE(leq(mk_max(mk_succ(imax), u_), imax));
  EXPECT_FALSE(is_equivalent(mk_succ(imax), imax));
  EXPECT_FALSE(is_equivalent(imax, mk_succ(imax)));
  EXPECT_TRUE(is_equivalent(mk_succ(imax), mk_succ(imax)));
}

TEST_F(LevelTest, ZeroTests) {
  EXPECT_TRUE(is_zero(zero_));
  EXPECT_TRUE(is_zero(mk_imax(u_, zero_)));
  EXPECT_TRUE(is_nonzero(one_));
  EXPECT_TRUE(is_nonzero(mk_max(u_, one_)));
  EXPECT_TRUE(is_nonzero(mk_imax(zero_, mk_succ(v_))));
  EXPECT_TRUE(maybe_zero(u_));
  EXPECT_TRUE(maybe_nonzero(u_));
  EXPECT_TRUE(maybe_zero(mk_imax(one_, u_)));
  EXPECT_FALSE(maybe_zero(mk_succ(u_)));
  EXPECT_FALSE(maybe_nonzero(mk_imax(u_, zero_)));
}

TEST_F(LevelTest, Equivalent) {
  EXPECT_TRUE(is_equivalent(mk_max(u_, v_), mk_max(v_, u_)));
  EXPECT_TRUE(is_equivalent(mk_max(u_, zero_), u_));
  EXPECT_TRUE(is_equivalent(mk_imax(one_, mk_succ(u_)), mk_succ(u_)));
  EXPECT_FALSE(is_equivalent(u_, v_));
  EXPECT_FALSE(is_equivalent(mk_imax(u_, v_), mk_max(u_, v_)));
}

TEST_F(LevelTest, Instantiate) {
  LevelSubstitution subst = {{mk_name("u"), one_}, {mk_name("v"), u_}};
  EXPECT_EQ(instantiate_level(mk_max(u_, v_), subst), mk_max(one_, u_));
  EXPECT_EQ(instantiate_level(mk_succ(zero_), subst), one_);
  EXPECT_EQ(instantiate_level(mk_param(mk_name("w")), subst),
            mk_param(mk_name("w")));
}

TEST_F(LevelTest, Params) {
  std::unordered_set<NamePtr> params;
  collect_level_params(mk_imax(mk_succ(u_), mk_max(v_, one_)), &params);
  EXPECT_EQ(params.size(), 2);
  EXPECT_EQ(params.count(mk_name("u")), 1);
  EXPECT_EQ(params.count(mk_name("v")), 1);
  EXPECT_TRUE(params_declared(mk_max(u_, one_), {mk_name("u")}));
  EXPECT_FALSE(params_declared(mk_max(u_, v_), {mk_name("u")}));
}

}  // namespace
}  // namespace kerncheck

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
