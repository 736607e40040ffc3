#include <gtest/gtest.h>
#include <revreg/schema/identifier.hpp>
#include <revreg/schema/revocation_status_list.hpp>

TEST(identifier, same_text_maps_to_same_identifier) {
  auto first = revreg::schema::make_identifier("did:example:123/anoncreds");
  auto second = revreg::schema::make_identifier("did:example:123/anoncreds");
  auto other = revreg::schema::make_identifier("did:example:124/anoncreds");
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other);
}

TEST(identifier, revocation_registry_definition_id_layout) {
  EXPECT_EQ(revreg::schema::make_revocation_registry_definition_id(
                "did:ethr:testnet:0xf0e2db6c8dc6c681bb5d6ad121a107f300e9b2b5",
                "cred-def", "default"),
            "did:ethr:testnet:0xf0e2db6c8dc6c681bb5d6ad121a107f300e9b2b5/"
            "anoncreds/v0/REV_REG_DEF/cred-def/default");
}

TEST(identifier, credential_definition_id_layout) {
  EXPECT_EQ(revreg::schema::make_credential_definition_id("did:example:123",
                                                          "schema", "tag"),
            "did:example:123/anoncreds/v0/CLAIM_DEF/schema/tag");
}

TEST(identifier, ethr_did_embeds_address) {
  auto with_network = revreg::schema::try_address_from_did(
      "did:ethr:testnet:0xf0e2db6c8dc6c681bb5d6ad121a107f300e9b2b5");
  auto without_network = revreg::schema::try_address_from_did(
      "did:ethr:0xf0e2db6c8dc6c681bb5d6ad121a107f300e9b2b5");
  ASSERT_TRUE(with_network.has_value());
  ASSERT_TRUE(without_network.has_value());
  EXPECT_EQ(*with_network, *without_network);
}

TEST(identifier, non_ethr_did_has_no_embedded_address) {
  EXPECT_FALSE(revreg::schema::try_address_from_did("did:example:123"));
  EXPECT_FALSE(revreg::schema::try_address_from_did("did:ethr:0x1234"));
  EXPECT_FALSE(revreg::schema::try_address_from_did(
      "did:ethr:f0e2db6c8dc6c681bb5d6ad121a107f300e9b2b5"));
}

TEST(revocation_status_list, make_revocation_list_marks_revoked_slots) {
  auto status_list = revreg::schema::revocation_status_list_t{};
  status_list.revoked = {0, 3, 11};
  auto list = revreg::schema::make_revocation_list(status_list, 5);
  EXPECT_EQ(list, (std::vector<uint32_t>{1, 0, 0, 1, 0}));
}
