// tests/unit/graph/test_json_dump.cpp - Unit tests for JSON graph dumps
//

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "rvir/graph/function.hpp"
#include "rvir/graph/json_dump.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/store/value_store.hpp"

using namespace rvir;
using json = nlohmann::json;

TEST(GraphJsonDump, EmptyRoot)
{
  const json j = to_json(ValId{});
  EXPECT_TRUE(j["root"].is_null());
  EXPECT_TRUE(j["nodes"].empty());
}

TEST(GraphJsonDump, ConstantWithItsTypes)
{
  ValueStore store;
  const json j = to_json(make_bool(store, true));

  ASSERT_EQ(j["nodes"].size(), 3u);
  EXPECT_EQ(j["root"], 2);

  const json & universe = j["nodes"][0];
  EXPECT_EQ(universe["kind"], "universe");
  EXPECT_EQ(universe["level"], 0);
  EXPECT_TRUE(universe["type"].is_null());

  const json & value = j["nodes"][2];
  EXPECT_EQ(value["kind"], "bool");
  EXPECT_EQ(value["value"], true);
  EXPECT_EQ(value["type"], 1);
  EXPECT_EQ(value["depth"], 0);
  EXPECT_TRUE(value["deps"].empty());
}

TEST(GraphJsonDump, IdentityFunction)
{
  ValueStore store;
  const json j = to_json(make_identity(store, make_finite(store, 2)).value());
  const json & nodes = j["nodes"];
  const json & root = nodes[j["root"].get<size_t>()];

  EXPECT_EQ(root["kind"], "lambda");
  EXPECT_EQ(root["def_region"]["depth"], 1);
  ASSERT_EQ(root["def_region"]["params"].size(), 1u);

  const json & result = nodes[root["result"].get<size_t>()];
  EXPECT_EQ(result["kind"], "parameter");
  EXPECT_EQ(result["index"], 0);
  EXPECT_EQ(result["depth"], 1);
  EXPECT_EQ(nodes[result["type"].get<size_t>()]["kind"], "finite");
  EXPECT_EQ(nodes[result["type"].get<size_t>()]["size"], 2);
}

TEST(GraphJsonDump, ReferencesPointBackwards)
{
  ValueStore store;
  const json j = to_json(make_identity(store, make_bool_type(store)).value());
  const json & nodes = j["nodes"];
  for (size_t i = 0; i < nodes.size(); ++i) {
    EXPECT_EQ(nodes[i]["id"], i);
    for (const auto & dep : nodes[i]["deps"]) {
      EXPECT_LT(dep.get<size_t>(), i);
    }
    if (!nodes[i]["type"].is_null()) {
      EXPECT_LT(nodes[i]["type"].get<size_t>(), i);
    }
  }
}
