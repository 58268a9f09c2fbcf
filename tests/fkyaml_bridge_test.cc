#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>

#include "yeti_fkyaml.hh"

namespace yeti {
namespace {

class FkyamlBridgeTest : public ::testing::Test {};

constexpr const char* kKubeService =
    "apiVersion: v1\n"
    "kind: Service\n"
    "metadata:\n"
    "  name: fancy-name\n"
    "spec:\n"
    "  ports:\n"
    "    - port: 80\n"
    "      targetPort: 3000\n"
    "  selector:\n"
    "    app: fancy-name\n";

// =============================================================================
// Conversion
// =============================================================================

TEST_F(FkyamlBridgeTest, ScalarKinds) {
  Value tree = from_yaml(
      "name: web\n"
      "replicas: 3\n"
      "ratio: 0.5\n"
      "enabled: true\n"
      "missing: null\n");

  const Mapping& m = tree.as_mapping();
  ASSERT_EQ(m.size(), 5u);
  EXPECT_EQ(m[0].value.as_text(), "web");
  EXPECT_TRUE(m[1].value.as_number().is_integer());
  EXPECT_EQ(m[1].value.as_number().as_integer(), 3);
  EXPECT_DOUBLE_EQ(m[2].value.as_number().as_float(), 0.5);
  EXPECT_STREQ(m[3].value.kind_name(), "boolean");
  EXPECT_STREQ(m[4].value.kind_name(), "null");
}

TEST_F(FkyamlBridgeTest, DocumentOrderIsKept) {
  Value tree = from_yaml("zeta: 1\nalpha: 2\nmid: 3\n");
  const Mapping& m = tree.as_mapping();
  ASSERT_EQ(m.size(), 3u);
  EXPECT_EQ(*m[0].key.text(), "zeta");
  EXPECT_EQ(*m[1].key.text(), "alpha");
  EXPECT_EQ(*m[2].key.text(), "mid");
}

TEST_F(FkyamlBridgeTest, Collections) {
  Value tree = from_yaml(
      "list:\n"
      "  - a\n"
      "  - b: 1\n"
      "    c: 2\n"
      "flow: [1, 2, 3]\n");

  const Mapping& m = tree.as_mapping();
  const Sequence& list = m[0].value.as_sequence();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].as_text(), "a");
  EXPECT_EQ(list[1].as_mapping().size(), 2u);
  EXPECT_EQ(m[1].value.as_sequence().size(), 3u);
}

TEST_F(FkyamlBridgeTest, ReadsFromStream) {
  std::istringstream in(kKubeService);
  Value tree = from_yaml(in);
  EXPECT_EQ(tree.as_mapping().size(), 4u);
}

TEST_F(FkyamlBridgeTest, ScalarKeysAreCarriedOver) {
  Value tree = from_yaml("80: http\ntrue: yes\n");
  const Mapping& m = tree.as_mapping();
  ASSERT_EQ(m.size(), 2u);
  EXPECT_EQ(m[0].key.kind(), Key::Kind::Number);
  EXPECT_EQ(m[1].key.kind(), Key::Kind::Boolean);
}

// =============================================================================
// Encoding parsed documents
// =============================================================================

TEST_F(FkyamlBridgeTest, BlockDocumentReencodesUnchanged) {
  EXPECT_EQ(encode(from_yaml(kKubeService)), kKubeService);
}

TEST_F(FkyamlBridgeTest, FlowStyleBecomesBlockStyle) {
  Value tree = from_yaml(
      "metadata: {name: fancy-name, labels: {app: web}}\n"
      "ports: [80, 443]\n");
  EXPECT_EQ(encode(tree),
            "metadata:\n"
            "  name: fancy-name\n"
            "  labels:\n"
            "    app: web\n"
            "ports:\n"
            "  - 80\n"
            "  - 443\n");
}

TEST_F(FkyamlBridgeTest, EncodedOutputParses) {
  Value tree = Mapping{
      {Symbol{"kind"}, "Deployment"},
      {Symbol{"spec"},
       Mapping{{Symbol{"replicas"}, 2},
               {Symbol{"containers"},
                Sequence{Mapping{{Symbol{"name"}, "web"},
                                 {Symbol{"image"}, "nginx:1.25"},
                                 {Symbol{"command"}, "run server"}}}}}},
  };

  ordered_node doc = ordered_node::deserialize(encode(tree));
  EXPECT_EQ(doc["kind"].get_value<std::string>(), "Deployment");
  EXPECT_EQ(doc["spec"]["replicas"].get_value<std::int64_t>(), 2);
  ordered_node& container = doc["spec"]["containers"][0];
  EXPECT_EQ(container["name"].get_value<std::string>(), "web");
  EXPECT_EQ(container["image"].get_value<std::string>(), "nginx:1.25");
  EXPECT_EQ(container["command"].get_value<std::string>(), "run server");
}

TEST_F(FkyamlBridgeTest, NumericKeyFailsAtEncode) {
  Value tree = from_yaml("spec:\n  80: http\n");
  try {
    encode(tree);
    FAIL() << "expected yeti::Error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnsupportedKeyType);
    EXPECT_EQ(std::string(e.what()).rfind("root.spec: ", 0), 0u) << e.what();
  }
}

TEST_F(FkyamlBridgeTest, SequenceRootFailsAtEncode) {
  Value tree = from_yaml("- a\n- b\n");
  EXPECT_TRUE(tree.is_sequence());
  try {
    encode(tree);
    FAIL() << "expected yeti::Error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidInputKind);
  }
}

}  // namespace
}  // namespace yeti
