#include "ipld.hh"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

const std::string kCidO = "QmZku7P7KeeHAnwMr6c4HveYfMzmtVinNXzibkiNbfDbPo";
const std::string kCidB = "QmZku7P7KeeHAnwMr6c4HveYfMzmtVinNXzibkiNbfDbPb";
const std::string kCidA = "QmZku7P7KeeHAnwMr6c4HveYfMzmtVinNXzibkiNbfDbPa";

std::map<std::string, std::string> LinkStrings(const ipld::Node& doc) {
  std::map<std::string, std::string> out;
  for (const auto& [path, link] : doc.links()) {
    out.emplace(path, link.link_string());
  }
  return out;
}

// {"k": {"k": ... {"/": cid}}} with `levels` wrapping mappings
ipld::Node Nested(std::size_t levels) {
  ipld::Node n{{"/", kCidO}};
  for (std::size_t i = 0; i < levels; ++i) {
    ipld::Node outer;
    outer.set("k", std::move(n));
    n = std::move(outer);
  }
  return n;
}

}  // namespace

TEST_CASE("links finds a single nested link", "[links]") {
  const ipld::Node doc{{"a", ipld::Node{{"/", "Qm1"}}}};
  const auto found = ipld::links(doc);
  REQUIRE(found.size() == 1);
  REQUIRE(found.at("a") == ipld::Link("Qm1"));
}

TEST_CASE("links is empty without link-shaped mappings", "[links]") {
  const ipld::Node doc{
      {"a", ipld::Node{{"b", ipld::Node{{"c", 1}}}}},
      {"d", ipld::Node{{"/", 5}}},
      {"e", ipld::Node{{"/", kCidO}, {"name", "sibling"}}},
      {"f", "plain"},
  };
  REQUIRE(ipld::links(doc).empty());
}

TEST_CASE("links keeps raw key text in paths", "[links]") {
  const ipld::Node doc{
      {"baz", ipld::Node{{"/", kCidO}}},
      {"bazz", ipld::Node{{"/", kCidO}}},
      {"bar", ipld::Node{{"/", kCidB}}},
      {"bar2",
       ipld::Node{
           {"@bar", ipld::Node{{"/", kCidA}}},
           {"\\@foo", ipld::Node{{"/", kCidA}}},
       }},
  };

  const std::map<std::string, std::string> expected{
      {"baz", kCidO},
      {"bazz", kCidO},
      {"bar", kCidB},
      {"bar2/@bar", kCidA},
      {"bar2/\\@foo", kCidA},
  };
  REQUIRE(LinkStrings(doc) == expected);
}

TEST_CASE("links skips non-link siblings but finds links beneath them", "[links]") {
  const ipld::Node doc{
      {"foo", "bar"},
      {"bar", ipld::Value::Sequence{1, 2, 3}},
      {"baz", ipld::Node{{"/", kCidO}}},
      {"holder", ipld::Node{{"/", kCidO}, {"inner", ipld::Node{{"/", kCidB}}}}},
  };

  const std::map<std::string, std::string> expected{
      {"baz", kCidO},
      {"holder/inner", kCidB},
  };
  REQUIRE(LinkStrings(doc) == expected);
}

TEST_CASE("A marker key holding a mapping yields a doubled separator path", "[links]") {
  const ipld::Node doc{
      {"baz", ipld::Node{{"/", kCidO}}},
      {"test", ipld::Node{{"/", ipld::Node{{"/", kCidO}}}}},
  };

  const std::map<std::string, std::string> expected{
      {"baz", kCidO},
      {"test//", kCidO},
  };
  REQUIRE(LinkStrings(doc) == expected);
}

TEST_CASE("links reaches mappings stored in sequences", "[links]") {
  const ipld::Node doc{
      {"entries", ipld::Value::Sequence{
                      ipld::Node{{"/", kCidO}},
                      "not a link",
                      ipld::Value::Sequence{ipld::Node{{"/", kCidB}}},
                  }},
  };

  const std::map<std::string, std::string> expected{
      {"entries/0", kCidO},
      {"entries/2/0", kCidB},
  };
  REQUIRE(LinkStrings(doc) == expected);
}

TEST_CASE("A link at the root is keyed by the empty path", "[links]") {
  const ipld::Node doc{{"/", kCidO}};
  const auto found = ipld::links(doc);
  REQUIRE(found.size() == 1);
  REQUIRE(found.at("").link_string() == kCidO);
}

TEST_CASE("walk visits the root first with an empty path", "[links][walk]") {
  const ipld::Node doc{{"a", ipld::Node{{"b", ipld::Node{}}}}, {"c", 1}};

  std::vector<std::string> paths;
  const ipld::Control result = ipld::walk(
      doc, [&](const ipld::Node& root, const ipld::Node&, const std::string& path,
               std::exception_ptr err) {
        REQUIRE(&root == &doc);
        REQUIRE_FALSE(err);
        paths.push_back(path);
        return ipld::Control::Continue;
      });

  REQUIRE(result == ipld::Control::Continue);
  REQUIRE(paths == std::vector<std::string>{"", "a", "a/b"});
}

TEST_CASE("walk stops on the first non-Continue result and returns it", "[links][walk]") {
  const ipld::Node doc{
      {"a", ipld::Node{{"x", ipld::Node{}}}},
      {"b", ipld::Node{}},
  };

  for (const ipld::Control stop : {ipld::Control::Abort, ipld::Control::SkipSubtree}) {
    std::size_t visits = 0;
    const ipld::Control result = ipld::walk(
        doc, [&](const ipld::Node&, const ipld::Node&, const std::string& path,
                 std::exception_ptr) {
          ++visits;
          return path == "a" ? stop : ipld::Control::Continue;
        });
    REQUIRE(result == stop);
    REQUIRE(visits == 2);
  }
}

TEST_CASE("walk propagates exceptions thrown by the visitor", "[links][walk]") {
  const ipld::Node doc{{"a", ipld::Node{}}};
  REQUIRE_THROWS_AS(ipld::walk(doc,
                               [](const ipld::Node&, const ipld::Node&,
                                  const std::string& path, std::exception_ptr) {
                                 if (path == "a") throw std::logic_error("consumer failed");
                                 return ipld::Control::Continue;
                               }),
                    std::logic_error);
}

TEST_CASE("walk reports nodes beyond the depth bound without descending", "[links][walk]") {
  const ipld::Node doc = Nested(5);

  std::vector<std::string> reported;
  std::size_t visits = 0;
  const ipld::Control result = ipld::walk(
      doc,
      [&](const ipld::Node&, const ipld::Node&, const std::string& path,
          std::exception_ptr err) {
        ++visits;
        if (err) {
          REQUIRE_THROWS_AS(std::rethrow_exception(err), ipld::DepthLimitError);
          reported.push_back(path);
        }
        return ipld::Control::Continue;
      },
      3);

  REQUIRE(result == ipld::Control::Continue);
  REQUIRE(reported == std::vector<std::string>{"k/k/k/k"});
  REQUIRE(visits == 5);
}

TEST_CASE("links raises the depth error for overly nested documents", "[links]") {
  REQUIRE_THROWS_AS(ipld::links(Nested(5), 3), ipld::DepthLimitError);
  REQUIRE(ipld::links(Nested(5), 5).count("k/k/k/k/k") == 1);
  REQUIRE_THROWS_AS(Nested(2000).links(), ipld::DepthLimitError);
}

TEST_CASE("Sequences past the depth bound are reported against their mapping", "[links][walk]") {
  // Lists nested three deep under "a", below the root mapping
  const ipld::Node doc{
      {"a", ipld::Value::Sequence{ipld::Value::Sequence{ipld::Value::Sequence{
                ipld::Node{{"/", kCidO}}}}}},
  };

  std::vector<std::string> reported;
  const ipld::Node* reported_node = nullptr;
  const ipld::Control result = ipld::walk(
      doc,
      [&](const ipld::Node&, const ipld::Node& current, const std::string& path,
          std::exception_ptr err) {
        if (err) {
          REQUIRE_THROWS_AS(std::rethrow_exception(err), ipld::DepthLimitError);
          reported.push_back(path);
          reported_node = &current;
        }
        return ipld::Control::Continue;
      },
      2);

  REQUIRE(result == ipld::Control::Continue);
  REQUIRE(reported == std::vector<std::string>{"a/0/0"});
  REQUIRE(reported_node == &doc);

  REQUIRE_THROWS_AS(ipld::links(doc, 2), ipld::DepthLimitError);
  REQUIRE(ipld::links(doc, 4).count("a/0/0/0") == 1);
}
