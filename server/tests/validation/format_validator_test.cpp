#include <gtest/gtest.h>

#include "service/validation/validators/format_validator.hpp"

#include <string>
#include <thread>

namespace service::validation {
namespace {

TEST(FormatValidatorTest, AcceptsCommonAddresses) {
  EXPECT_TRUE(isValidFormat("a@b.com"));
  EXPECT_TRUE(isValidFormat("john.doe@example.co.uk"));
  EXPECT_TRUE(isValidFormat("user+tag@sub-domain.example.org"));
  EXPECT_TRUE(isValidFormat("first_last@x1.io"));
}

TEST(FormatValidatorTest, AcceptsSpecialLocalPartCharacters) {
  EXPECT_TRUE(isValidFormat("!#$%&'*+/=?^_`{|}~-@example.com"));
}

TEST(FormatValidatorTest, AcceptsSingleLabelDomain) {
  EXPECT_TRUE(isValidFormat("root@localhost"));
}

TEST(FormatValidatorTest, RejectsMissingAt) {
  EXPECT_FALSE(isValidFormat("bad-email"));
}

TEST(FormatValidatorTest, RejectsEmptyParts) {
  EXPECT_FALSE(isValidFormat(""));
  EXPECT_FALSE(isValidFormat("@example.com"));
  EXPECT_FALSE(isValidFormat("user@"));
}

TEST(FormatValidatorTest, RejectsSeveralAt) {
  EXPECT_FALSE(isValidFormat("a@b@example.com"));
}

TEST(FormatValidatorTest, RejectsHyphenAtLabelEdges) {
  EXPECT_FALSE(isValidFormat("user@-example.com"));
  EXPECT_FALSE(isValidFormat("user@example-.com"));
  EXPECT_FALSE(isValidFormat("user@example.-com"));
  EXPECT_TRUE(isValidFormat("user@ex-am-ple.com"));
}

TEST(FormatValidatorTest, RejectsEmptyLabels) {
  EXPECT_FALSE(isValidFormat("user@example..com"));
  EXPECT_FALSE(isValidFormat("user@.example.com"));
  EXPECT_FALSE(isValidFormat("user@example.com."));
}

TEST(FormatValidatorTest, LabelLengthLimit) {
  const std::string label63(63, 'a');
  const std::string label64(64, 'a');

  EXPECT_TRUE(isValidFormat("user@" + label63 + ".com"));
  EXPECT_FALSE(isValidFormat("user@" + label64 + ".com"));
}

TEST(FormatValidatorTest, RejectsWhitespaceAndDisallowedCharacters) {
  EXPECT_FALSE(isValidFormat("us er@example.com"));
  EXPECT_FALSE(isValidFormat("user@exa mple.com"));
  EXPECT_FALSE(isValidFormat("user@exam_ple.com"));
  EXPECT_FALSE(isValidFormat("\"quoted\"@example.com"));
  EXPECT_FALSE(isValidFormat("user(comment)@example.com"));
}

TEST(FormatValidatorTest, RejectsNonAsciiCharacters) {
  EXPECT_FALSE(isValidFormat("j\xc3\xb6rg@example.com"));
  EXPECT_FALSE(isValidFormat("user@b\xc3\xbc" "cher.de"));
}

TEST(FormatValidatorTest, HugeTokensAreCheckedOnWorkerThread) {
  const std::string longLocal = std::string(200000, 'a') + "@example.com";
  const std::string longLabel = "user@" + std::string(200000, 'b') + ".com";
  const std::string manyLabels = [] {
    std::string address = "user@a";
    for (int i = 0; i < 50000; ++i) {
      address += ".a";
    }
    return address;
  }();
  const std::string junk(300000, '-');

  bool localResult = false;
  bool labelResult = true;
  bool labelsResult = false;
  bool junkResult = true;
  std::jthread worker([&] {
    localResult = isValidFormat(longLocal);
    labelResult = isValidFormat(longLabel);
    labelsResult = isValidFormat(manyLabels);
    junkResult = isValidFormat(junk);
  });
  worker.join();

  EXPECT_TRUE(localResult);
  EXPECT_FALSE(labelResult);
  EXPECT_TRUE(labelsResult);
  EXPECT_FALSE(junkResult);
}

TEST(FormatValidatorTest, Validator_ReportsInvalidFormatCode) {
  FormatValidator validator;

  const auto failed = validator.validate({.email = "bad-email"});
  EXPECT_FALSE(failed.valid);
  EXPECT_EQ(failed.code, domain::ReasonCode::kInvalidFormat);

  const auto passed =
      validator.validate({.email = "a@b.com", .domain = "b.com"});
  EXPECT_TRUE(passed.valid);
  EXPECT_EQ(passed.code, domain::ReasonCode::kNone);
}

} // namespace
} // namespace service::validation
