#include <gtest/gtest.h>
#include <revreg/schema/endorsement.hpp>
#include <revreg/testing/common.hpp>

#include <algorithm>
#include <string_view>

namespace {

bool contains(const revreg::schema::bytes_t& haystack,
              const std::string_view needle) {
  return std::search(std::begin(haystack), std::end(haystack),
                     std::begin(needle), std::end(needle)) !=
         std::end(haystack);
}

revreg::schema::create_definition_t make_definition() {
  auto operation = revreg::schema::create_definition_t{};
  operation.id = revreg::testing::make_hash(1);
  operation.credential_definition_id = revreg::testing::make_hash(2);
  operation.issuer_id = "did:example:123";
  operation.definition = revreg::schema::bytes_t{0xAA, 0xBB};
  return operation;
}

}  // namespace

TEST(endorsement_payload, definition_payload_layout) {
  auto registry = revreg::testing::make_address(0x33);
  auto identity = revreg::testing::make_address(0x44);
  auto payload =
      revreg::schema::make_author_payload(registry, identity, make_definition());

  ASSERT_GE(payload.size(), 2u + 20u + 20u);
  EXPECT_EQ(payload[0], 0x19);
  EXPECT_EQ(payload[1], 0x00);
  EXPECT_TRUE(std::equal(std::begin(registry), std::end(registry),
                         payload.begin() + 2));
  EXPECT_TRUE(std::equal(std::begin(identity), std::end(identity),
                         payload.begin() + 22));
  EXPECT_TRUE(contains(payload, "createRevocationRegistryDefinition"));
  EXPECT_FALSE(contains(payload, "did:example:123"));
  EXPECT_EQ(payload.back(), 0xBB);
  EXPECT_EQ(payload.size(),
            2u + 20u + 20u +
                revreg::schema::kCreateDefinitionOperation.size() + 32u + 32u +
                32u + 2u);
}

TEST(endorsement_payload, payload_is_deterministic) {
  auto registry = revreg::testing::make_address(0x33);
  auto identity = revreg::testing::make_address(0x44);
  EXPECT_EQ(
      revreg::schema::make_author_payload(registry, identity, make_definition()),
      revreg::schema::make_author_payload(registry, identity,
                                          make_definition()));
}

TEST(endorsement_payload, registry_address_is_bound) {
  auto identity = revreg::testing::make_address(0x44);
  EXPECT_NE(revreg::schema::make_author_payload(
                revreg::testing::make_address(0x33), identity,
                make_definition()),
            revreg::schema::make_author_payload(
                revreg::testing::make_address(0x34), identity,
                make_definition()));
}

TEST(endorsement_payload, entry_payload_names_operation) {
  auto operation = revreg::schema::create_entry_t{};
  operation.definition_id = revreg::testing::make_hash(1);
  operation.issuer_id = "did:example:123";
  operation.data.current_accumulator = revreg::schema::bytes_t{0x01};
  operation.data.revoked = {2, 3};

  auto payload = revreg::schema::make_author_payload(
      revreg::testing::make_address(0x33), revreg::testing::make_address(0x44),
      operation);
  EXPECT_TRUE(contains(payload, "createRevocationRegistryEntry"));

  auto changed = operation;
  changed.data.revoked = {2, 4};
  EXPECT_NE(payload, revreg::schema::make_author_payload(
                         revreg::testing::make_address(0x33),
                         revreg::testing::make_address(0x44), changed));
}

TEST(endorsement_payload, endorser_payload_layout) {
  auto author_signature = revreg::schema::signature_t{};
  author_signature.fill(0x5A);
  auto payload = revreg::schema::make_endorser_payload(
      revreg::testing::make_address(0x33), revreg::testing::make_address(0x55),
      revreg::testing::make_hash(9), author_signature);
  EXPECT_EQ(payload[0], 0x19);
  EXPECT_TRUE(contains(payload, "endorseTransaction"));
  EXPECT_EQ(payload.size(), 2u + 20u + 20u +
                                revreg::schema::kEndorseOperation.size() +
                                32u + 65u);
  EXPECT_EQ(payload.back(), 0x5A);
}
