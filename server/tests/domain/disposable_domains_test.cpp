#include <gtest/gtest.h>

#include "domain/disposable_domains.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace domain {
namespace {

TEST(ExtractDomainTest, SingleAt_ReturnsLowercasedDomain) {
  EXPECT_EQ(extractDomain("user@Example.COM"), "example.com");
}

TEST(ExtractDomainTest, NoAt_ReturnsEmpty) {
  EXPECT_EQ(extractDomain("bad-email"), "");
}

TEST(ExtractDomainTest, SeveralAt_ReturnsEmpty) {
  EXPECT_EQ(extractDomain("a@b@mailinator.com"), "");
}

TEST(ExtractDomainTest, TrailingAt_ReturnsEmptyDomain) {
  EXPECT_EQ(extractDomain("user@"), "");
}

TEST(DisposableDomainSetTest, Builtin_ContainsKnownProviders) {
  const auto domains = DisposableDomainSet::builtin();

  EXPECT_TRUE(domains->containsDomain("mailinator.com"));
  EXPECT_TRUE(domains->containsDomain("yopmail.com"));
  EXPECT_TRUE(domains->containsDomain("10minutemail.com"));
  EXPECT_FALSE(domains->containsDomain("gmail.com"));
  EXPECT_GE(domains->size(), 40u);
}

TEST(DisposableDomainSetTest, Builtin_IsSharedInstance) {
  EXPECT_EQ(DisposableDomainSet::builtin(), DisposableDomainSet::builtin());
}

TEST(DisposableDomainSetTest, ExactMatchOnly_NoSubdomains) {
  const DisposableDomainSet domains({"mailinator.com"});

  EXPECT_FALSE(domains.containsDomain("eu.mailinator.com"));
  EXPECT_FALSE(domains.containsDomain("mailinator.com.evil.org"));
  EXPECT_TRUE(domains.containsDomain("mailinator.com"));
}

TEST(DisposableDomainSetTest, IsDisposableAddress_IgnoresCase) {
  const DisposableDomainSet domains({"Trash.Example"});

  EXPECT_TRUE(domains.isDisposableAddress("someone@TRASH.example"));
}

TEST(DisposableDomainSetTest, IsDisposableAddress_FailsClosedWithoutSingleAt) {
  const DisposableDomainSet domains({"mailinator.com"});

  EXPECT_FALSE(domains.isDisposableAddress("mailinator.com"));
  EXPECT_FALSE(domains.isDisposableAddress("a@b@mailinator.com"));
}

TEST(DisposableDomainSetTest, Empty_MatchesNothing) {
  const DisposableDomainSet domains;

  EXPECT_EQ(domains.size(), 0u);
  EXPECT_FALSE(domains.containsDomain(""));
  EXPECT_FALSE(domains.isDisposableAddress("user@mailinator.com"));
}

TEST(DisposableDomainSetTest, LoadFromFile_SkipsCommentsAndBlankLines) {
  const auto path = std::filesystem::temp_directory_path() /
                    "disposable_domains_test_list.txt";
  {
    std::ofstream file(path);
    file << "# fixture list\n"
         << "fixture-trash.test\n"
         << "\n"
         << "  Other-Trash.TEST  # trailing comment\n";
  }

  const auto loaded = DisposableDomainSet::loadFromFile(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(loaded.has_value()) << loaded.error();
  EXPECT_EQ((*loaded)->size(), 2u);
  EXPECT_TRUE((*loaded)->containsDomain("fixture-trash.test"));
  EXPECT_TRUE((*loaded)->containsDomain("other-trash.test"));
}

TEST(DisposableDomainSetTest, LoadFromFile_MissingFileIsAnError) {
  const auto loaded =
      DisposableDomainSet::loadFromFile("/nonexistent/disposable/list.txt");

  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().find("/nonexistent/disposable/list.txt"),
            std::string::npos);
}

} // namespace
} // namespace domain
