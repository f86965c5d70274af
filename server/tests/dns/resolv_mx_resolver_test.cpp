#include <gtest/gtest.h>

#include "dns/resolv_answer.hpp"

#include <arpa/nameser.h>
#include <netdb.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dns {
namespace {

// Assembles a DNS response for one MX question.
class DnsResponseBuilder {
public:
  explicit DnsResponseBuilder(std::string_view domain, int rcode = ns_r_noerror)
      : domain_(domain), rcode_(rcode) {}

  DnsResponseBuilder &mx(std::uint16_t preference, std::string_view exchange) {
    std::vector<unsigned char> rdata;
    put16(rdata, preference);
    putName(rdata, exchange);
    return record(ns_t_mx, rdata);
  }

  DnsResponseBuilder &record(std::uint16_t type,
                             const std::vector<unsigned char> &rdata) {
    putName(answers_, domain_);
    put16(answers_, type);
    put16(answers_, ns_c_in);
    put16(answers_, 0);
    put16(answers_, 300);
    put16(answers_, static_cast<std::uint16_t>(rdata.size()));
    answers_.insert(answers_.end(), rdata.begin(), rdata.end());
    ++answerCount_;
    return *this;
  }

  std::vector<unsigned char> build() const {
    std::vector<unsigned char> message;
    put16(message, 0x1234);
    // QR, RD and RA set, rcode in the low nibble
    put16(message, static_cast<std::uint16_t>(0x8180 | (rcode_ & 0x0f)));
    put16(message, 1);
    put16(message, answerCount_);
    put16(message, 0);
    put16(message, 0);

    putName(message, domain_);
    put16(message, ns_t_mx);
    put16(message, ns_c_in);

    message.insert(message.end(), answers_.begin(), answers_.end());
    return message;
  }

private:
  static void put16(std::vector<unsigned char> &out, std::uint16_t value) {
    out.push_back(static_cast<unsigned char>(value >> 8));
    out.push_back(static_cast<unsigned char>(value & 0xff));
  }

  static void putName(std::vector<unsigned char> &out, std::string_view name) {
    while (!name.empty()) {
      const auto dot = name.find('.');
      const auto label = name.substr(0, dot);
      out.push_back(static_cast<unsigned char>(label.size()));
      out.insert(out.end(), label.begin(), label.end());
      if (dot == std::string_view::npos) {
        break;
      }
      name.remove_prefix(dot + 1);
    }
    out.push_back(0);
  }

  std::string domain_;
  int rcode_;
  std::vector<unsigned char> answers_;
  std::uint16_t answerCount_ = 0;
};

MxQueryResult parse(const std::vector<unsigned char> &message,
                    std::string_view domain = "example.com") {
  return parseMxAnswer(message.data(), static_cast<int>(message.size()),
                       domain);
}

TEST(ResolvAnswerTest, HostNotFoundAndNoDataArePermanent) {
  EXPECT_EQ(classifyQueryFailure(HOST_NOT_FOUND, "gone.test").kind,
            DnsErrorKind::kNotFound);
  EXPECT_EQ(classifyQueryFailure(NO_DATA, "gone.test").kind,
            DnsErrorKind::kNoData);
}

TEST(ResolvAnswerTest, TryAgainAndNoRecoveryAreTransient) {
  EXPECT_EQ(classifyQueryFailure(TRY_AGAIN, "slow.test").kind,
            DnsErrorKind::kTimeout);
  EXPECT_EQ(classifyQueryFailure(NO_RECOVERY, "slow.test").kind,
            DnsErrorKind::kServerFailure);
}

TEST(ResolvAnswerTest, UnknownHErrnoIsOtherAndNamesDomain) {
  const auto error = classifyQueryFailure(-1, "odd.test");

  EXPECT_EQ(error.kind, DnsErrorKind::kOther);
  EXPECT_NE(error.message.find("odd.test"), std::string::npos);
}

TEST(ResolvAnswerTest, ParsesMxRecords) {
  const auto result = parse(DnsResponseBuilder("example.com")
                                .mx(10, "mx1.example.com")
                                .mx(20, "mx2.example.com")
                                .build());

  ASSERT_TRUE(result.has_value()) << result.error().message;
  ASSERT_EQ(result->size(), 2u);
  EXPECT_EQ((*result)[0].preference, 10);
  EXPECT_EQ((*result)[0].exchange, "mx1.example.com");
  EXPECT_EQ((*result)[1].preference, 20);
  EXPECT_EQ((*result)[1].exchange, "mx2.example.com");
}

TEST(ResolvAnswerTest, NxDomainRcodeIsNotFound) {
  const auto result =
      parse(DnsResponseBuilder("gone.test", ns_r_nxdomain).build(), "gone.test");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kNotFound);
}

TEST(ResolvAnswerTest, RefusedRcodeIsRefused) {
  const auto result = parse(DnsResponseBuilder("example.com", ns_r_refused)
                                .mx(10, "mx.example.com")
                                .build());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kRefused);
}

TEST(ResolvAnswerTest, OtherRcodeIsServerFailure) {
  const auto result =
      parse(DnsResponseBuilder("example.com", ns_r_servfail).build());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kServerFailure);
}

TEST(ResolvAnswerTest, NoErrorWithoutAnswersIsNoData) {
  const auto result = parse(DnsResponseBuilder("example.com").build());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kNoData);
}

TEST(ResolvAnswerTest, NonMxAnswersAreIgnored) {
  // A record only: 93.184.216.34
  const auto result =
      parse(DnsResponseBuilder("example.com")
                .record(ns_t_a, {93, 184, 216, 34})
                .build());

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kNoData);
}

TEST(ResolvAnswerTest, TruncatedMxRdataIsSkipped) {
  // Preference only, no exchange name
  const auto shortOnly =
      parse(DnsResponseBuilder("example.com").record(ns_t_mx, {0, 10}).build());

  ASSERT_FALSE(shortOnly.has_value());
  EXPECT_EQ(shortOnly.error().kind, DnsErrorKind::kNoData);

  const auto mixed = parse(DnsResponseBuilder("example.com")
                               .record(ns_t_mx, {0, 5})
                               .mx(30, "backup.example.com")
                               .build());

  ASSERT_TRUE(mixed.has_value());
  ASSERT_EQ(mixed->size(), 1u);
  EXPECT_EQ((*mixed)[0].preference, 30);
  EXPECT_EQ((*mixed)[0].exchange, "backup.example.com");
}

TEST(ResolvAnswerTest, MalformedMessageIsOther) {
  const std::vector<unsigned char> garbage{0x12, 0x34, 0x81};

  const auto result = parse(garbage);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, DnsErrorKind::kOther);
}

} // namespace
} // namespace dns
