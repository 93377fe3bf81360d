#include "Block.h"
#include "BlockChain.h"
#include "Canonical.h"
#include "Utilities.h"
#include <gtest/gtest.h>

namespace {

cl::Block makeBlock() {
  cl::Block block;
  block.index = 4;
  block.timestamp = 1715000000000;
  block.data.reportId = "9b2f7c1e-0000-4000-8000-000000000001";
  block.data.category = "Sanitation";
  block.data.urgency = cl::Urgency::CRITICAL;
  block.data.location = {"Salt Lake", "Sector V", "Bidhannagar PS"};
  block.data.descriptionHash = cl::Digest::of("Overflowing drain next to the market");
  block.data.evidenceHashes = {cl::Digest::of("clip.mp4")};
  block.data.reporter = cl::Reporter::named("CIT-1001");
  block.data.timestamp = 1714999999000;
  block.data.authorityRouted = {"KMC", "Police"};
  block.data.status = cl::ReportStatus::PENDING;
  block.previousHash = std::string(64, 'a');
  block.nonce = 12;
  block.hash = block.calculateHash();
  return block;
}

} // namespace

TEST(EnumNamesTest, ConvertBothWays) {
  cl::Urgency urgency;
  ASSERT_TRUE(cl::urgencyFromString("Critical", urgency));
  EXPECT_EQ(urgency, cl::Urgency::CRITICAL);
  EXPECT_EQ(cl::toString(cl::Urgency::LOW), "Low");
  EXPECT_FALSE(cl::urgencyFromString("critical", urgency));

  cl::ReportStatus status;
  ASSERT_TRUE(cl::statusFromString("UNDER_REVIEW", status));
  EXPECT_EQ(status, cl::ReportStatus::UNDER_REVIEW);
  EXPECT_FALSE(cl::statusFromString("CLOSED", status));

  cl::Identity identity;
  ASSERT_TRUE(cl::identityFromString("anonymous", identity));
  EXPECT_EQ(identity, cl::Identity::ANONYMOUS);
  EXPECT_FALSE(cl::identityFromString("name", identity));
}

TEST(ReporterTest, IdentityAndCitizenIdGoTogether) {
  cl::Reporter anonymous = cl::Reporter::anonymous();
  EXPECT_TRUE(anonymous.isAnonymous());
  EXPECT_FALSE(anonymous.getCitizenId().has_value());
  EXPECT_EQ(anonymous, cl::Reporter());

  cl::Reporter named = cl::Reporter::named("CIT-1");
  EXPECT_EQ(named.getIdentity(), cl::Identity::NAMED);
  EXPECT_EQ(named.getCitizenId().value(), "CIT-1");
  EXPECT_NE(named, anonymous);
}

TEST(BlockTest, HashCoversCanonicalEncoding) {
  cl::Block block = makeBlock();
  std::string encoded = cl::canonical::encodeBlock(block.index, block.timestamp, block.data,
                                                   block.previousHash, block.nonce);
  EXPECT_EQ(block.hash, cl::Block::hashEncoded(encoded));
  // OpenSSL sealing hash and libsodium privacy hash agree
  EXPECT_EQ(block.hash, cl::utl::sha256(encoded));
}

TEST(BlockTest, JsonRoundTripPreservesBlock) {
  cl::Block block = makeBlock();
  auto decoded = cl::Block::fromJson(block.toJson());
  ASSERT_TRUE(decoded.isOk()) << decoded.error().message;
  EXPECT_EQ(decoded.value(), block);
  EXPECT_EQ(decoded.value().calculateHash(), block.hash);
}

TEST(BlockTest, JsonUsesReadableFieldNames) {
  nlohmann::json j = makeBlock().toJson();
  EXPECT_EQ(j["index"], 4);
  EXPECT_EQ(j["data"]["urgency"], "Critical");
  EXPECT_EQ(j["data"]["identity"], "named");
  EXPECT_EQ(j["data"]["citizenId"], "CIT-1001");
  EXPECT_EQ(j["data"]["location"]["nearestStation"], "Bidhannagar PS");
  EXPECT_EQ(j["data"]["evidenceHashes"].size(), 1u);
}

TEST(BlockTest, FromJsonRejectsMalformedDocuments) {
  nlohmann::json good = makeBlock().toJson();

  EXPECT_TRUE(cl::Block::fromJson(nlohmann::json::array()).isError());

  auto missingHash = good;
  missingHash.erase("hash");
  EXPECT_TRUE(cl::Block::fromJson(missingHash).isError());

  auto wrongType = good;
  wrongType["index"] = "four";
  EXPECT_TRUE(cl::Block::fromJson(wrongType).isError());

  auto badUrgency = good;
  badUrgency["data"]["urgency"] = "Urgent";
  auto urgency = cl::Block::fromJson(badUrgency);
  ASSERT_TRUE(urgency.isError());
  EXPECT_EQ(urgency.error().code, 2);

  auto rawDescription = good;
  rawDescription["data"]["descriptionHash"] = "Overflowing drain next to the market";
  auto digest = cl::Block::fromJson(rawDescription);
  ASSERT_TRUE(digest.isError());
  EXPECT_EQ(digest.error().code, 3);

  auto badStatus = good;
  badStatus["data"]["status"] = "CLOSED";
  EXPECT_EQ(cl::Block::fromJson(badStatus).error().code, 6);
}

TEST(BlockTest, FromJsonEnforcesReporterRules) {
  nlohmann::json j = makeBlock().toJson();

  auto anonymousWithId = j;
  anonymousWithId["data"]["identity"] = "anonymous";
  auto rejected = cl::Block::fromJson(anonymousWithId);
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, 5);

  auto namedWithoutId = j;
  namedWithoutId["data"].erase("citizenId");
  EXPECT_TRUE(cl::Block::fromJson(namedWithoutId).isError());

  auto anonymous = j;
  anonymous["data"]["identity"] = "anonymous";
  anonymous["data"].erase("citizenId");
  auto accepted = cl::Block::fromJson(anonymous);
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  EXPECT_TRUE(accepted.value().data.reporter.isAnonymous());
}

TEST(BlockTest, GenesisSurvivesJson) {
  cl::Block genesis = cl::BlockChain::createGenesis();
  auto decoded = cl::Block::fromJson(genesis.toJson());
  ASSERT_TRUE(decoded.isOk()) << decoded.error().message;
  EXPECT_EQ(decoded.value(), genesis);
}
