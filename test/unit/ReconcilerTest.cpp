#include <gtest/gtest.h>
#include "../../agents/login-page-detection/include/reconciler.hpp"

namespace {
Candidate make(const std::string& url, Strategy s) {
    Candidate c;
    c.url = url;
    c.strategy = s;
    return c;
}

Candidate crawled(const std::string& url, int clicks) {
    Candidate c = make(url, Strategy::Crawling);
    CrawlPath p;
    for (int i = 1; i <= clicks; ++i) {
        CrawlAction a;
        a.step = i;
        a.click_position = ClickPoint{10 * i, 20 * i};
        a.url = "https://example.com/";
        p.clicks.push_back(a);
    }
    c.actions = p;
    c.info = CrawlingInfo{1, clicks, "page.png"};
    return c;
}
}

TEST(ReconcilerTest, KeepsFirstSeenWithoutCrawling) {
    std::vector<Candidate> in = {
        make("https://example.com/login", Strategy::Robots),
        make("https://example.com/signin", Strategy::Metasearch),
        make("https://example.com/login", Strategy::Sitemap),
    };
    auto out = merge_candidates(in, "example.com");
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, 1);
    EXPECT_EQ(out[0].url, "https://example.com/login");
    EXPECT_EQ(out[0].strategy, Strategy::Robots);
    EXPECT_EQ(out[1].id, 2);
    EXPECT_EQ(out[1].strategy, Strategy::Metasearch);
    EXPECT_EQ(out[1].scan_domain, "example.com");
}

TEST(ReconcilerTest, CrawlingRecordWinsItsGroup) {
    std::vector<Candidate> in = {
        make("https://example.com/login", Strategy::Metasearch),
        crawled("https://example.com/login", 2),
    };
    auto out = merge_candidates(in, "example.com");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, 1);
    EXPECT_EQ(out[0].strategy, Strategy::Crawling);
    ASSERT_TRUE(out[0].actions.has_value());
    EXPECT_EQ(out[0].actions->clicks.size(), 2u);
}

TEST(ReconcilerTest, FirstCrawlingRecordIsNotReplaced) {
    std::vector<Candidate> in = {
        crawled("https://example.com/login", 3),
        crawled("https://example.com/login", 1),
    };
    auto out = merge_candidates(in, "example.com");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].actions->clicks.size(), 3u);
}

TEST(ReconcilerTest, TrimsAndSkipsEmptyUrls) {
    std::vector<Candidate> in = {
        make("  ", Strategy::Robots),
        make(" https://example.com/auth ", Strategy::Robots),
        make("https://example.com/auth", Strategy::Sitemap),
        make("", Strategy::Sitemap),
    };
    auto out = merge_candidates(in, "scan.example.com");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].url, "https://example.com/auth");
    EXPECT_EQ(out[0].id, 1);
}

TEST(ReconcilerTest, IdsAreContiguousAndDeterministic) {
    std::vector<Candidate> in;
    for (int i = 0; i < 5; ++i) in.push_back(make("https://example.com/p" + std::to_string(i % 3), Strategy::Robots));
    auto a = merge_candidates(in, "example.com");
    auto b = merge_candidates(in, "example.com");
    ASSERT_EQ(a.size(), 3u);
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].id, (int)i + 1);
        EXPECT_EQ(a[i].url, b[i].url);
    }
    EXPECT_TRUE(merge_candidates({}, "example.com").empty());
}

TEST(ReconcilerTest, CollectorPayload) {
    std::vector<Candidate> in = {
        make("https://example.com/login", Strategy::Robots),
        crawled("https://example.com/account", 1),
    };
    auto j = collector_payload(merge_candidates(in, "example.com"), "task-7");
    EXPECT_EQ(j["task_id"], "task-7");
    ASSERT_EQ(j["candidates"].size(), 2u);
    EXPECT_EQ(j["candidates"][0]["id"], 1);
    EXPECT_EQ(j["candidates"][0]["url"], "https://example.com/login");
    EXPECT_TRUE(j["candidates"][0]["actions"].is_null());
    EXPECT_EQ(j["candidates"][0]["scan_domain"], "example.com");
    EXPECT_TRUE(j["candidates"][1]["actions"].is_array());
}
