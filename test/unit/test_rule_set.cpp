// test/unit/test_rule_set.cpp
// -----------------------------------------------------------
// RuleSet construction, validation and derivation (subset/extended).

#include <gtest/gtest.h>

#include <regex>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "rules/builtin_catalog.hpp"
#include "rules/rule_set.hpp"

using piiguard::core::ConfigError;
using piiguard::rules::RuleSet;
using piiguard::rules::RuleSpec;

namespace {

RuleSpec makeRule(const std::string& name, const std::string& pattern, int priority = 0) {
    RuleSpec spec;
    spec.name = name;
    spec.pattern = pattern;
    spec.priority = priority;
    return spec;
}

}  // namespace

TEST(RuleSetTest, BuiltinCatalogCompiles) {
    RuleSet set = RuleSet::build(piiguard::rules::builtinRuleSpecs());
    EXPECT_EQ(set.size(), (size_t)19);

    std::vector<std::string> names = set.names();
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.front(), "email");
    EXPECT_EQ(names.back(), "apartment");

    const auto* passport = set.find("passport");
    const auto* license = set.find("license");
    ASSERT_NE(passport, nullptr);
    ASSERT_NE(license, nullptr);
    EXPECT_GT(passport->priority(), license->priority());

    const auto* card = set.find("credit_card");
    ASSERT_NE(card, nullptr);
    EXPECT_TRUE(card->hasValidator());
    EXPECT_EQ(card->validatorId(), "luhn");
    EXPECT_FALSE(card->accepts("1234-5678-9012-3456"));
    EXPECT_TRUE(card->accepts("4111 1111 1111 1111"));

    EXPECT_EQ(set.maxMatchLength(), (size_t)2048);  // url
}

TEST(RuleSetTest, KeepsDeclarationOrder) {
    RuleSet set = RuleSet::build({makeRule("b", "b+"), makeRule("a", "a+"), makeRule("c", "c+")});
    std::vector<std::string> expected = {"b", "a", "c"};
    EXPECT_EQ(set.names(), expected);
    EXPECT_EQ(set.rules()[1].source(), "a+");
}

TEST(RuleSetTest, RejectsInvalidSpecs) {
    // Duplicate names
    EXPECT_THROW(RuleSet::build({makeRule("dup", "a"), makeRule("dup", "b")}), ConfigError);
    // Pattern that does not compile
    EXPECT_THROW(RuleSet::build({makeRule("broken", "([a-z")}), ConfigError);
    // Negative priority
    EXPECT_THROW(RuleSet::build({makeRule("neg", "a", -1)}), ConfigError);
    // Empty name and empty pattern
    EXPECT_THROW(RuleSet::build({makeRule("", "a")}), ConfigError);
    EXPECT_THROW(RuleSet::build({makeRule("empty", "")}), ConfigError);

    RuleSpec zeroLength = makeRule("zero", "a");
    zeroLength.maxMatchLength = 0;
    EXPECT_THROW(RuleSet::build({zeroLength}), ConfigError);

    RuleSpec unknownValidator = makeRule("card", "\\d+");
    unknownValidator.validatorId = "no_such_validator";
    EXPECT_THROW(RuleSet::build({unknownValidator}), ConfigError);
}

TEST(RuleSetTest, UnknownValidatorListsKnownIds) {
    RuleSpec spec = makeRule("card", "\\d+");
    spec.validatorId = "lunh";
    try {
        RuleSet::build({spec});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("'lunh'"), std::string::npos);
        EXPECT_NE(what.find("known: iban, ipv4, luhn, not_common_word, ssn"), std::string::npos);
    }
}

TEST(RuleSetTest, BuiltinIdAndAddressRules) {
    RuleSet set = RuleSet::build(piiguard::rules::builtinRuleSpecs());
    auto matches = [&set](const std::string& rule, const std::string& text) {
        return std::regex_search(text, set.find(rule)->pattern());
    };

    EXPECT_TRUE(matches("employee_id", "badge PAT-2024-0815 issued"));
    EXPECT_FALSE(matches("employee_id", "badge XYZ-2024-0815 issued"));
    EXPECT_TRUE(matches("po_box", "send to po box 4412"));
    EXPECT_TRUE(matches("apartment", "12 Elm St Apt 4B"));
    EXPECT_FALSE(matches("apartment", "the room for two"));
}

TEST(RuleSetTest, BuiltinPatternsStayWithinMaxLength) {
    RuleSet set = RuleSet::build(piiguard::rules::builtinRuleSpecs());
    std::smatch m;

    const std::string url = "see https://example.org/" + std::string(3000, 'p');
    ASSERT_TRUE(std::regex_search(url, m, set.find("url")->pattern()));
    EXPECT_EQ((size_t)m.length(0), (size_t)1044);  // path capped at 1024
    EXPECT_LE((size_t)m.length(0), set.find("url")->maxMatchLength());

    // The local part is capped at 64, so the match starts late
    std::string mail;
    for (int i = 0; i < 40; ++i) {
        mail += "ab.";
    }
    mail += "x@example.org";
    ASSERT_TRUE(std::regex_search(mail, m, set.find("email")->pattern()));
    EXPECT_GT(m.position(0), 0);
    EXPECT_LE((size_t)m.length(0), (size_t)(64 + 12));
}

TEST(RuleSetTest, DirectValidatorOverridesId) {
    RuleSpec spec = makeRule("short", "\\w+");
    spec.validatorId = "label-only";
    spec.validator = [](std::string_view s) { return s.size() <= 3; };

    RuleSet set = RuleSet::build({spec});
    const auto* rule = set.find("short");
    ASSERT_NE(rule, nullptr);
    EXPECT_TRUE(rule->accepts("abc"));
    EXPECT_FALSE(rule->accepts("abcd"));
}

TEST(RuleSetTest, CaseInsensitiveFlag) {
    RuleSpec spec = makeRule("word", "^secret$");
    spec.caseInsensitive = true;
    RuleSet set = RuleSet::build({spec});
    EXPECT_TRUE(std::regex_search("SeCrEt", set.rules()[0].pattern()));
}

TEST(RuleSetTest, SubsetAndExtendedReturnNewSets) {
    RuleSet all = RuleSet::build(piiguard::rules::builtinRuleSpecs());

    RuleSet contact = all.subset({"phone_us", "email"});
    std::vector<std::string> expected = {"email", "phone_us"};  // original order
    EXPECT_EQ(contact.names(), expected);
    EXPECT_EQ(all.size(), (size_t)19);
    EXPECT_THROW(all.subset({"email", "nope"}), ConfigError);

    RuleSet more = contact.extended({makeRule("ticket", "TCK-\\d{6}", 20)});
    EXPECT_EQ(more.size(), (size_t)3);
    EXPECT_EQ(more.names().back(), "ticket");
    EXPECT_EQ(contact.size(), (size_t)2);
    EXPECT_THROW(contact.extended({makeRule("email", "x")}), ConfigError);
}

TEST(RuleSetTest, EmptySet) {
    RuleSet empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.maxMatchLength(), (size_t)0);
    EXPECT_EQ(empty.find("email"), nullptr);
}
