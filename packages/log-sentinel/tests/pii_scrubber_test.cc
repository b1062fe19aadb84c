#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>

#include "detect/sentinel_pii_scrubber.h"
#include "redaction/sentinel_detector.h"

using SentinelPII::GetCategoryName;
using SentinelPII::ParseCategoryName;
using SentinelPII::PIICategory;
using SentinelPII::PiiScrubber;
using SentinelPII::ScrubStats;
using SentinelRedaction::Detector;
using SentinelRedaction::PatternRecord;
using SentinelRedaction::RegexDetector;

class PiiScrubberTest : public ::testing::Test {
 protected:
  PiiScrubber scrubber_;
};

TEST_F(PiiScrubberTest, DefaultCategories) {
  EXPECT_TRUE(scrubber_.IsCategoryEnabled(PIICategory::EMAIL));
  EXPECT_TRUE(scrubber_.IsCategoryEnabled(PIICategory::PHONE));
  EXPECT_TRUE(scrubber_.IsCategoryEnabled(PIICategory::SENSITIVE_URL));
  EXPECT_TRUE(scrubber_.IsCategoryEnabled(PIICategory::PERSON_NAME));
  EXPECT_FALSE(scrubber_.IsCategoryEnabled(PIICategory::IP_ADDRESS));
  EXPECT_FALSE(scrubber_.IsCategoryEnabled(PIICategory::MAC_ADDRESS));
  EXPECT_FALSE(scrubber_.IsCategoryEnabled(PIICategory::FILE_PATH));
}

TEST_F(PiiScrubberTest, Emails) {
  EXPECT_EQ(scrubber_.Scrub("Contact: john.doe@example.com"), "Contact: {{EMAIL}}");
  EXPECT_EQ(scrubber_.Scrub("from a@b.io to c.d+tag@mail.co.uk"), "from {{EMAIL}} to {{EMAIL}}");
}

TEST_F(PiiScrubberTest, WhitelistedEmailDomains) {
  scrubber_.SetWhitelistedEmailDomains({"Example.com"});

  EXPECT_EQ(scrubber_.Scrub("ops@example.com"), "ops@example.com");
  EXPECT_EQ(scrubber_.Scrub("ops@alerts.example.com"), "ops@alerts.example.com");
  EXPECT_EQ(scrubber_.Scrub("ops@notexample.com"), "{{EMAIL}}");
}

TEST_F(PiiScrubberTest, PhoneNumbers) {
  EXPECT_EQ(scrubber_.Scrub("Call me at 555-123-4567"), "Call me at {{PHONE}}");
  EXPECT_EQ(scrubber_.Scrub("Call (555) 123-4567 now"), "Call {{PHONE}} now");
  EXPECT_EQ(scrubber_.Scrub("intl +1 555.123.4567"), "intl {{PHONE}}");
}

TEST_F(PiiScrubberTest, DigitRunsAreLeftForProfiles) {
  const std::string texts[] = {
    "Payment with card: 4111111111111111",
    "Card number: 4111 1111 1111 1111",
    "CC: 4111-1111-1111-1111",
    "SSN: 123-45-6789",
    "build 20240115 finished",
  };
  for (const auto& text : texts) {
    EXPECT_EQ(scrubber_.Scrub(text), text);
  }
}

TEST_F(PiiScrubberTest, SensitiveUrlParametersKeepName) {
  EXPECT_EQ(scrubber_.Scrub("GET /callback?code=abc123&state=xyz"),
            "GET /callback?code={{URL_SECRET}}&state=xyz");
  EXPECT_EQ(scrubber_.Scrub("https://cdn.io/f?token=abc&sig=def 200"),
            "https://cdn.io/f?token={{URL_SECRET}}&sig={{URL_SECRET}} 200");
}

TEST_F(PiiScrubberTest, SensitiveUrlBraceValuesThatAreNotTags) {
  EXPECT_EQ(scrubber_.Scrub("GET /x?token={{s3cr3tvalue"), "GET /x?token={{URL_SECRET}}");
  EXPECT_EQ(scrubber_.Scrub("GET /x?token={{URL_SECRET}}&page=2"),
            "GET /x?token={{URL_SECRET}}&page=2");
}

TEST_F(PiiScrubberTest, PersonNamesWithHonorific) {
  EXPECT_EQ(scrubber_.Scrub("Patient seen by Dr. Jane Smith today"),
            "Patient seen by {{NAME}} today");
  EXPECT_EQ(scrubber_.Scrub("This is a normal log message"), "This is a normal log message");
}

TEST_F(PiiScrubberTest, IpAddressesWhenEnabled) {
  EXPECT_EQ(scrubber_.Scrub("host 10.0.0.1"), "host 10.0.0.1");

  scrubber_.SetCategoryEnabled(PIICategory::IP_ADDRESS, true);
  EXPECT_EQ(scrubber_.Scrub("host 10.0.0.1 up"), "host {{IP_ADDRESS}} up");
  EXPECT_EQ(scrubber_.Scrub("bogus 999.1.1.1"), "bogus 999.1.1.1");
}

TEST_F(PiiScrubberTest, MacAddressesWhenEnabled) {
  scrubber_.SetCategoryEnabled(PIICategory::MAC_ADDRESS, true);
  EXPECT_EQ(scrubber_.Scrub("nic aa:bb:cc:dd:ee:ff"), "nic {{MAC_ADDRESS}}");
}

TEST_F(PiiScrubberTest, HomeDirectoryUserWhenEnabled) {
  scrubber_.SetCategoryEnabled(PIICategory::FILE_PATH, true);
  EXPECT_EQ(scrubber_.Scrub("open /home/alice/app.log failed"),
            "open /home/{{USERNAME}}/app.log failed");
}

TEST_F(PiiScrubberTest, DisableAllCategories) {
  scrubber_.DisableAllCategories();
  EXPECT_EQ(scrubber_.Scrub("mail bob@corp.io, call 555-123-4567"),
            "mail bob@corp.io, call 555-123-4567");
}

TEST_F(PiiScrubberTest, Stats) {
  ScrubStats stats;
  std::string result = scrubber_.Scrub("a@b.io and c@d.io call 555-123-4567", &stats);

  EXPECT_EQ(result, "{{EMAIL}} and {{EMAIL}} call {{PHONE}}");
  EXPECT_EQ(stats.total_items_found, 3);
  EXPECT_EQ(stats.by_category[PIICategory::EMAIL], 2);
  EXPECT_EQ(stats.by_category[PIICategory::PHONE], 1);
  EXPECT_EQ(stats.ToString(), "PII Scrubbing Stats: 3 items redacted (EMAIL:2, PHONE:1)");
}

TEST_F(PiiScrubberTest, CountsByCategoryName) {
  std::map<std::string, int> detections = {{"EMAIL", 1}};
  std::string result = scrubber_.ApplyAndCount("x@y.io, Dr. Jane Smith", &detections);

  EXPECT_EQ(result, "{{EMAIL}}, {{NAME}}");
  EXPECT_EQ(detections, (std::map<std::string, int>{{"EMAIL", 2}, {"PERSON_NAME", 1}}));
}

TEST_F(PiiScrubberTest, VeryLongLines) {
  scrubber_.SetCategoryEnabled(PIICategory::IP_ADDRESS, true);
  scrubber_.SetCategoryEnabled(PIICategory::FILE_PATH, true);

  const std::string run(150000, 'b');
  EXPECT_EQ(scrubber_.Scrub(run), run);
  EXPECT_EQ(scrubber_.Scrub("mail " + run + "@corp.io"), "mail {{EMAIL}}");
  EXPECT_EQ(scrubber_.Scrub("GET /x?token=" + run), "GET /x?token={{URL_SECRET}}");
  EXPECT_EQ(scrubber_.Scrub("/home/" + run), "/home/{{USERNAME}}");
}

TEST_F(PiiScrubberTest, Idempotent) {
  scrubber_.SetCategoryEnabled(PIICategory::IP_ADDRESS, true);
  scrubber_.SetCategoryEnabled(PIICategory::MAC_ADDRESS, true);
  scrubber_.SetCategoryEnabled(PIICategory::FILE_PATH, true);

  const std::string text =
      "Dr. Jane Smith <jane@clinic.org> (555) 123-4567 /home/jane/x "
      "?token=abc 10.1.2.3 aa:bb:cc:dd:ee:ff";
  std::string once = scrubber_.Scrub(text);
  EXPECT_NE(once, text);
  EXPECT_EQ(scrubber_.Scrub(once), once);
}

TEST_F(PiiScrubberTest, SupplementalDetectorsRunAfterCategories) {
  auto detector = std::make_shared<RegexDetector>(
      PatternRecord("employee_id", R"(\bEMP-[0-9]{6}\b)", "{{EMPLOYEE_ID}}"));

  scrubber_.AddDetector(detector);
  ASSERT_EQ(scrubber_.GetDetectorNames(), std::vector<std::string>{"employee_id"});
  EXPECT_EQ(scrubber_.Apply("EMP-123456 mailed x@y.io"), "{{EMPLOYEE_ID}} mailed {{EMAIL}}");

  // Still runs with every built-in category off
  scrubber_.DisableAllCategories();
  EXPECT_EQ(scrubber_.Apply("EMP-123456 mailed x@y.io"), "{{EMPLOYEE_ID}} mailed x@y.io");

  EXPECT_TRUE(scrubber_.RemoveDetector(detector));
  EXPECT_FALSE(scrubber_.RemoveDetector(detector));
  EXPECT_TRUE(scrubber_.GetDetectorNames().empty());
  EXPECT_EQ(scrubber_.Apply("EMP-123456"), "EMP-123456");
}

TEST_F(PiiScrubberTest, RemoveMatchesInstanceNotName) {
  auto first = std::make_shared<RegexDetector>(PatternRecord("hook", "a", "b"));
  auto second = std::make_shared<RegexDetector>(PatternRecord("hook", "c", "d"));
  scrubber_.AddDetector(first);
  scrubber_.AddDetector(second);

  EXPECT_TRUE(scrubber_.RemoveDetector(first));
  EXPECT_EQ(scrubber_.GetDetectorNames().size(), 1u);
  EXPECT_EQ(scrubber_.Apply("ac"), "ad");
}

TEST(PiiCategoryTest, NamesRoundTrip) {
  PIICategory category = PIICategory::EMAIL;
  EXPECT_TRUE(ParseCategoryName("ip_address", &category));
  EXPECT_EQ(category, PIICategory::IP_ADDRESS);
  EXPECT_EQ(GetCategoryName(category), "IP_ADDRESS");

  EXPECT_FALSE(ParseCategoryName("BLOOD_TYPE", &category));
  EXPECT_EQ(category, PIICategory::IP_ADDRESS);
}
