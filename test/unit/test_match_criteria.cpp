#include "tamper/core/match_criteria.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using tamper::match_criteria;
using tamper::response_descriptor;

namespace {

match_criteria with_codes(std::vector<std::string> codes) {
    match_criteria::fields f;
    f.codes = std::move(codes);
    return match_criteria(std::move(f));
}

} // namespace

TEST(MatchCriteria, CodeClassesAndExactCodes) {
    auto criteria = with_codes({"2XX", "400"});
    EXPECT_TRUE(criteria.matches_code("200"));
    EXPECT_TRUE(criteria.matches_code("202"));
    EXPECT_TRUE(criteria.matches_code("400"));
    EXPECT_FALSE(criteria.matches_code("404"));
    EXPECT_FALSE(criteria.matches_code("500"));
    EXPECT_FALSE(criteria.matches_code(""));
}

TEST(MatchCriteria, LowercaseClassPattern) {
    auto criteria = with_codes({"5xx"});
    EXPECT_TRUE(criteria.matches_code("503"));
    EXPECT_FALSE(criteria.matches_code("403"));
}

TEST(MatchCriteria, ClassPatternsStartAtTwo) {
    EXPECT_TRUE(tamper::is_code_class("2XX"));
    EXPECT_TRUE(tamper::is_code_class("9xX"));
    EXPECT_FALSE(tamper::is_code_class("1XX"));
    EXPECT_FALSE(tamper::is_code_class("4X"));
    EXPECT_FALSE(tamper::is_code_class("4XXX"));
    EXPECT_FALSE(tamper::is_code_class("X4X"));
}

TEST(MatchCriteria, NothingConfiguredNeverMatches) {
    match_criteria criteria;
    EXPECT_FALSE(criteria.is_any_criterion_configured());
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(200, "ok")));
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(500, "")));
    EXPECT_EQ(criteria.describe(), "");
}

TEST(MatchCriteria, MatchInputAloneIsNotACriterion) {
    match_criteria::fields f;
    f.match_input = true;
    match_criteria criteria(std::move(f));
    EXPECT_FALSE(criteria.is_any_criterion_configured());
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(200, "payload")));
}

TEST(MatchCriteria, SingleSatisfiedCriterionMatches) {
    match_criteria::fields f;
    f.lines = std::vector<int64_t>{2};
    match_criteria criteria(std::move(f));
    EXPECT_TRUE(criteria.is_any_criterion_configured());
    EXPECT_TRUE(criteria.evaluate(response_descriptor::from_body(500, "a\nb")));
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(500, "a")));
}

TEST(MatchCriteria, EveryConfiguredCriterionMustHold) {
    match_criteria::fields f;
    f.codes = std::vector<std::string>{"2XX"};
    f.words = std::vector<int64_t>{3};
    match_criteria criteria(std::move(f));

    EXPECT_TRUE(criteria.evaluate(response_descriptor::from_body(201, "one two three")));
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(201, "one two")));
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(404, "one two three")));
}

TEST(MatchCriteria, SizesAndWords) {
    match_criteria::fields f;
    f.sizes = std::vector<int64_t>{5, 10};
    f.words = std::vector<int64_t>{1};
    match_criteria criteria(std::move(f));
    EXPECT_TRUE(criteria.matches_sizes(10));
    EXPECT_FALSE(criteria.matches_sizes(6));
    EXPECT_TRUE(criteria.matches_words(1));
    EXPECT_FALSE(criteria.matches_lines(1));
    EXPECT_TRUE(criteria.evaluate(response_descriptor::from_body(200, "hello")));
}

TEST(MatchCriteria, RegexMustMatchWholeBody) {
    match_criteria::fields f;
    f.regex = ".*error.*";
    match_criteria criteria(std::move(f));
    EXPECT_TRUE(criteria.matches_regex("an error occurred"));
    EXPECT_FALSE(criteria.matches_regex("all good"));

    match_criteria::fields partial;
    partial.regex = "error";
    match_criteria strict(std::move(partial));
    EXPECT_FALSE(strict.matches_regex("an error occurred"));
    EXPECT_TRUE(strict.matches_regex("error"));
}

TEST(MatchCriteria, RegexHandlesMegabyteBodies) {
    match_criteria::fields f;
    f.regex = ".*error.*";
    match_criteria criteria(std::move(f));

    std::string body(1024 * 1024, 'a');
    body += " error";
    EXPECT_TRUE(criteria.matches_regex(body));
    EXPECT_TRUE(criteria.evaluate(response_descriptor::from_body(500, body)));

    std::string clean(2 * 1024 * 1024, 'b');
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(500, std::move(clean))));
}

TEST(MatchCriteria, InvalidRegexNeverMatchesButIsDescribed) {
    match_criteria::fields f;
    f.regex = "*";
    match_criteria criteria(std::move(f));
    EXPECT_TRUE(criteria.is_any_criterion_configured());
    EXPECT_FALSE(criteria.matches_regex("*"));
    EXPECT_FALSE(criteria.evaluate(response_descriptor::from_body(200, "*")));
    EXPECT_EQ(criteria.describe(), " regex: *");
}

TEST(MatchCriteria, DescribeListsConfiguredCriteriaInOrder) {
    match_criteria::fields f;
    f.codes = std::vector<std::string>{"200"};
    f.regex = "*";
    f.lines = std::vector<int64_t>{200};
    f.words = std::vector<int64_t>{200};
    f.sizes = std::vector<int64_t>{200};
    match_criteria criteria(std::move(f));
    EXPECT_EQ(criteria.describe(),
              " response codes: [200], regex: *, number of lines: [200], number of words: "
              "[200], response sizes: [200]");
}

TEST(MatchCriteria, DescribeRendersLists) {
    match_criteria::fields f;
    f.codes = std::vector<std::string>{"2XX", "400"};
    f.sizes = std::vector<int64_t>{1, 22};
    match_criteria criteria(std::move(f));
    EXPECT_EQ(criteria.describe(), " response codes: [2XX, 400], response sizes: [1, 22]");
}

TEST(MatchCriteria, InputReflection) {
    match_criteria::fields on;
    on.match_input = true;
    match_criteria reflecting(std::move(on));
    auto body = response_descriptor::from_body(400, "invalid value <script>");
    EXPECT_TRUE(reflecting.is_input_reflected(body, "<script>"));
    EXPECT_FALSE(reflecting.is_input_reflected(body, "<img>"));

    match_criteria quiet;
    EXPECT_FALSE(quiet.is_input_reflected(body, "<script>"));
}

TEST(MatchCriteria, ConcurrentEvaluationAgreesWithSequential) {
    match_criteria::fields f;
    f.codes = std::vector<std::string>{"2XX", "404"};
    f.regex = "[a-z ]*";
    f.words = std::vector<int64_t>{1, 2};
    const match_criteria criteria(std::move(f));

    std::vector<response_descriptor> responses = {
        response_descriptor::from_body(200, "ok"),
        response_descriptor::from_body(404, "not found"),
        response_descriptor::from_body(500, "ok"),
        response_descriptor::from_body(201, "Upper"),
        response_descriptor::from_body(204, "three words here"),
    };
    std::vector<bool> expected;
    for (const auto& r : responses) {
        expected.push_back(criteria.evaluate(r));
    }
    EXPECT_EQ(expected, (std::vector<bool>{true, true, false, false, false}));

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int round = 0; round < 500; ++round) {
                for (size_t i = 0; i < responses.size(); ++i) {
                    if (criteria.evaluate(responses[i]) != expected[i]) {
                        mismatches.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
