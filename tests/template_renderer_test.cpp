#include "agency/executor/template_renderer.hpp"

#include "gtest/gtest.h"

using namespace agency;

class TemplateRendererTest : public ::testing::Test {
protected:
  VariableMap vars_{{"name", "api"},
                    {"count", 3},
                    {"strict", true},
                    {"files", nlohmann::json::array({"a.ts", "b.ts"})},
                    {"nothing", nullptr}};
};

TEST_F(TemplateRendererTest, ReplacesKnownPlaceholders) {
  EXPECT_EQ(render_template("Review {{name}} ({{ count }} passes)", vars_),
            "Review api (3 passes)");
  EXPECT_EQ(render_template("strict={{strict}}", vars_), "strict=true");
  EXPECT_EQ(render_template("{{files}}", vars_), R"(["a.ts","b.ts"])");
  EXPECT_EQ(render_template("[{{nothing}}]", vars_), "[]");
}

TEST_F(TemplateRendererTest, InvalidUtf8InsideStructuredValue) {
  VariableMap vars{{"tags", nlohmann::json::array({"caf\xe9"})}};
  EXPECT_EQ(render_template("{{tags}}", vars), "[\"caf\xef\xbf\xbd\"]");
}

TEST_F(TemplateRendererTest, UnknownPlaceholdersStayVerbatim) {
  EXPECT_EQ(render_template("Hello {{ who }}!", vars_), "Hello {{ who }}!");
}

TEST_F(TemplateRendererTest, UnclosedBracesAreLiteral) {
  EXPECT_EQ(render_template("open {{name and more", vars_),
            "open {{name and more");
}

TEST_F(TemplateRendererTest, EscapedBracesAreLiteral) {
  EXPECT_EQ(render_template(R"(literal \{{name}} vs {{name}})", vars_),
            "literal {{name}} vs api");
}

TEST_F(TemplateRendererTest, NoPlaceholdersIsIdentity) {
  EXPECT_EQ(render_template("plain { text }", vars_), "plain { text }");
  EXPECT_EQ(render_template("", vars_), "");
}

TEST_F(TemplateRendererTest, ListsPlaceholdersOnce) {
  auto names = template_placeholders("{{a}} {{ b }} {{a}} \\{{c}} {{}}");
  EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}

TEST(StringifyTest, ScalarsAndStructures) {
  EXPECT_EQ(stringify("text"), "text");
  EXPECT_EQ(stringify(42), "42");
  EXPECT_EQ(stringify(false), "false");
  EXPECT_EQ(stringify(nullptr), "");
  EXPECT_EQ(stringify(nlohmann::json{{"k", 1}}), R"({"k":1})");
}
