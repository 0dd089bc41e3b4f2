#include "ipld.hh"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

TEST_CASE("Value reports the alternative it holds", "[value]") {
  REQUIRE(ipld::Value().is_null());
  REQUIRE(ipld::Value(nullptr).type() == ipld::ValueType::Null);
  REQUIRE(ipld::Value(true).is_boolean());
  REQUIRE(ipld::Value(42).is_integer());
  REQUIRE(ipld::Value(std::size_t{7}).as_integer() == 7);
  REQUIRE(ipld::Value(1.5).is_float_number());
  REQUIRE(ipld::Value("Qm").is_string());
  REQUIRE(ipld::Value(ipld::Bytes{{0x01, 0x02}}).is_bytes());
  REQUIRE(ipld::Value(ipld::Value::Sequence{1, 2}).is_sequence());
  REQUIRE(ipld::Value(ipld::Node{{"a", 1}}).is_mapping());

  REQUIRE(ipld::Value(ipld::Bytes{}).is_scalar());
  REQUIRE_FALSE(ipld::Value(ipld::Node{}).is_scalar());
  REQUIRE_FALSE(ipld::Value(ipld::Value::Sequence{}).is_scalar());
}

TEST_CASE("Checked accessors reject the wrong shape", "[value]") {
  const ipld::Value v("text");
  REQUIRE(v.as_string() == "text");
  REQUIRE_THROWS_AS(v.as_integer(), ipld::TypeError);
  REQUIRE_THROWS_AS(v.as_mapping(), ipld::TypeError);
  REQUIRE_THROWS_AS(ipld::Value(3).as_float(), ipld::TypeError);
  REQUIRE(std::string(ipld::type_name(ipld::ValueType::Mapping)) == "mapping");
}

TEST_CASE("Node keeps insertion order and replaces on set", "[value][node]") {
  ipld::Node n{{"b", 1}, {"a", 2}};
  n.set("c", 3);
  n.set("b", 10);

  std::vector<std::string> order;
  for (const auto& [key, value] : n) {
    order.push_back(key);
  }
  REQUIRE(order == std::vector<std::string>{"b", "a", "c"});
  REQUIRE(n.at("b").as_integer() == 10);
  REQUIRE(n.size() == 3);

  REQUIRE(n.erase("a"));
  REQUIRE_FALSE(n.erase("a"));
  REQUIRE_FALSE(n.contains("a"));
  REQUIRE(n.find("missing") == nullptr);
  REQUIRE_THROWS_AS(n.at("missing"), std::out_of_range);

  n["d"];
  REQUIRE(n.at("d").is_null());
}

TEST_CASE("Node equality ignores entry order", "[value][node]") {
  const ipld::Node a{{"x", 1}, {"y", ipld::Node{{"z", "q"}}}};
  const ipld::Node b{{"y", ipld::Node{{"z", "q"}}}, {"x", 1}};
  const ipld::Node c{{"x", 1}, {"y", ipld::Node{{"z", "r"}}}};
  const ipld::Node d{{"x", 1}};

  REQUIRE(a == b);
  REQUIRE(b == a);
  REQUIRE(a != c);
  REQUIRE(a != d);
  REQUIRE(ipld::Value(a) == ipld::Value(b));
}

TEST_CASE("Sorted keys use byte-wise order", "[value][node]") {
  const ipld::Node n{{"b", 1}, {"\xc3\xa9", 2}, {"B", 3}, {"a", 4}, {"", 5}};
  REQUIRE(n.sorted_keys() ==
          std::vector<std::string>{"", "B", "a", "b", "\xc3\xa9"});
}

TEST_CASE("Unsigned integers beyond the signed range are rejected", "[value]") {
  const std::uint64_t largest = std::numeric_limits<std::int64_t>::max();
  REQUIRE(ipld::Value(largest).as_integer() == std::numeric_limits<std::int64_t>::max());
  REQUIRE(ipld::Value(std::uint32_t{4000000000u}).as_integer() == 4000000000);

  REQUIRE_THROWS_AS(ipld::Value(largest + 1), ipld::TypeError);
  REQUIRE_THROWS_AS(ipld::Value(std::numeric_limits<std::uint64_t>::max()), ipld::TypeError);
}

TEST_CASE("Lookups stay correct after erasing from the middle", "[value][node]") {
  ipld::Node n{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}};
  REQUIRE(n.erase("b"));

  REQUIRE(n.at("a").as_integer() == 1);
  REQUIRE(n.at("c").as_integer() == 3);
  REQUIRE(n.at("d").as_integer() == 4);
  REQUIRE_FALSE(n.contains("b"));

  n.set("b", 5);
  n.set("c", 6);
  std::vector<std::string> order;
  for (const auto& [key, value] : n) order.push_back(key);
  REQUIRE(order == std::vector<std::string>{"a", "c", "d", "b"});
  REQUIRE(n.at("c").as_integer() == 6);
  REQUIRE(n.at("b").as_integer() == 5);
}
