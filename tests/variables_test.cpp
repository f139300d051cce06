#include "agency/recipe/variables.hpp"

#include "gtest/gtest.h"

using namespace agency;

class VariablesTest : public ::testing::Test {
protected:
  void SetUp() override {
    recipe_.name = "review";
    recipe_.variables["target"] = VariableDef{.type = VariableType::String,
                                              .description = "what to review",
                                              .default_value = std::nullopt,
                                              .required = true};
    recipe_.variables["depth"] = VariableDef{.type = VariableType::Number,
                                             .description = {},
                                             .default_value = 2,
                                             .required = false};
    recipe_.variables["strict"] = VariableDef{.type = VariableType::Boolean,
                                              .description = {},
                                              .default_value = std::nullopt,
                                              .required = false};
  }

  Recipe recipe_;
};

TEST_F(VariablesTest, DefaultsFillMissingValues) {
  auto resolved = resolve_variables(recipe_, {{"target", "src"}});
  EXPECT_EQ(resolved.at("target"), "src");
  EXPECT_EQ(resolved.at("depth"), 2);
  EXPECT_FALSE(resolved.contains("strict"));
  EXPECT_TRUE(validate_variables(recipe_, resolved).empty());
}

TEST_F(VariablesTest, ProvidedValuesWinOverDefaults) {
  auto resolved = resolve_variables(recipe_, {{"target", "src"}, {"depth", 5}});
  EXPECT_EQ(resolved.at("depth"), 5);
}

TEST_F(VariablesTest, UndeclaredValuesPassThrough) {
  auto resolved =
      resolve_variables(recipe_, {{"target", "src"}, {"extra", "kept"}});
  EXPECT_EQ(resolved.at("extra"), "kept");
  EXPECT_TRUE(validate_variables(recipe_, resolved).empty());
}

TEST_F(VariablesTest, MissingRequiredVariable) {
  auto resolved = resolve_variables(recipe_, {});
  auto errors = validate_variables(recipe_, resolved);
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0], "Required variable 'target' not provided");
}

TEST_F(VariablesTest, TypeMismatch) {
  auto resolved = resolve_variables(
      recipe_, {{"target", "src"}, {"depth", "deep"}, {"strict", 1}});
  auto errors = validate_variables(recipe_, resolved);
  ASSERT_EQ(errors.size(), 2);
  EXPECT_EQ(errors[0], "Variable 'depth' must be of type 'number'");
  EXPECT_EQ(errors[1], "Variable 'strict' must be of type 'boolean'");
}

TEST_F(VariablesTest, ScalarsGivenForStringBecomeText) {
  auto resolved = resolve_variables(
      recipe_, {{"target", parse_variable_value("2")}, {"depth", 3}});
  EXPECT_EQ(resolved.at("target"), "2");
  EXPECT_EQ(resolved.at("depth"), 3);
  EXPECT_TRUE(validate_variables(recipe_, resolved).empty());

  resolved = resolve_variables(recipe_, {{"target", parse_variable_value("true")}});
  EXPECT_EQ(resolved.at("target"), "true");

  resolved = resolve_variables(
      recipe_, {{"target", nlohmann::json::array({1})}});
  ASSERT_EQ(validate_variables(recipe_, resolved).size(), 1);
}

TEST_F(VariablesTest, MatchesType) {
  EXPECT_TRUE(matches_type("x", VariableType::String));
  EXPECT_TRUE(matches_type(1.5, VariableType::Number));
  EXPECT_TRUE(matches_type(true, VariableType::Boolean));
  EXPECT_TRUE(matches_type(nlohmann::json::array(), VariableType::Array));
  EXPECT_FALSE(matches_type("1", VariableType::Number));
  EXPECT_FALSE(matches_type(nullptr, VariableType::String));
}

TEST(ParseVariableValueTest, JsonWhenItParses) {
  EXPECT_EQ(parse_variable_value("3"), 3);
  EXPECT_EQ(parse_variable_value("true"), true);
  EXPECT_EQ(parse_variable_value(R"(["a","b"])"),
            nlohmann::json::array({"a", "b"}));
  EXPECT_EQ(parse_variable_value(R"("quoted")"), "quoted");
}

TEST(ParseVariableValueTest, RawStringOtherwise) {
  EXPECT_EQ(parse_variable_value("src/api"), "src/api");
  EXPECT_EQ(parse_variable_value("null"), "null");
  EXPECT_EQ(parse_variable_value(R"({"k":1})"), R"({"k":1})");
  EXPECT_EQ(parse_variable_value(""), "");
}

TEST(VariableTypeTest, NamesRoundTrip) {
  EXPECT_EQ(to_string_view(VariableType::Array), "array");
  EXPECT_EQ(parse_variable_type("boolean"), VariableType::Boolean);
  EXPECT_FALSE(parse_variable_type("object").has_value());
}
