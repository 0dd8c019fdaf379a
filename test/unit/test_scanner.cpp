// test/unit/test_scanner.cpp
// -----------------------------------------------------------
// Whole-buffer, chunked, parallel and streamed scanning.

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "resolver/conflict_resolver.hpp"
#include "rules/builtin_catalog.hpp"
#include "rules/rule_set.hpp"
#include "scanner/scanner.hpp"
#include "scanner/stream_scanner.hpp"
#include "util/thread_pool.hpp"

using piiguard::core::RawMatch;
using piiguard::core::ScanDiagnostic;
using piiguard::rules::RuleSet;
using piiguard::rules::RuleSpec;
using piiguard::scanner::Scanner;
using piiguard::scanner::StreamScanner;

namespace {

RuleSet builtinSubset(const std::vector<std::string>& names) {
    return RuleSet::build(piiguard::rules::builtinRuleSpecs()).subset(names);
}

RuleSpec makeRule(const std::string& name, const std::string& pattern, int priority = 0) {
    RuleSpec spec;
    spec.name = name;
    spec.pattern = pattern;
    spec.priority = priority;
    spec.maxMatchLength = 32;
    return spec;
}

// About 10 000 bytes of records with emails, phone numbers and SSNs.
std::string makeRecords(size_t size) {
    std::string text;
    for (int i = 0; text.size() < size + 200; ++i) {
        text += "Record " + std::to_string(i) + ": contact user" + std::to_string(i)
                + "@example.com, phone 555-" + std::to_string(200 + i % 700) + "-"
                + std::to_string(1000 + i) + ", ssn 123-45-" + std::to_string(1000 + i)
                + ". Notes follow here.\n";
    }
    text.resize(size);
    return text;
}

}  // namespace

// Email and phone rules over a single sentence
TEST(ScannerTest, FindsEmailAndPhone) {
    Scanner scanner(builtinSubset({"email", "phone_us"}));
    const std::string text = "Contact me at john@example.com or 555-123-4567.";

    auto raw = scanner.scan(text);
    ASSERT_EQ(raw.size(), (size_t)2);

    EXPECT_EQ(raw[0].ruleName, "email");
    EXPECT_EQ(raw[0].start, (size_t)14);
    EXPECT_EQ(raw[0].end, (size_t)30);
    EXPECT_EQ(raw[0].text, "john@example.com");
    EXPECT_EQ(raw[0].priority, 80);

    EXPECT_EQ(raw[1].ruleName, "phone_us");
    EXPECT_EQ(raw[1].start, (size_t)34);
    EXPECT_EQ(raw[1].end, (size_t)46);
    EXPECT_EQ(raw[1].text, "555-123-4567");

    EXPECT_FALSE(raw[0].overlaps(raw[1]));
}

// Empty input
TEST(ScannerTest, EmptyInputYieldsNothing) {
    Scanner scanner(RuleSet::build(piiguard::rules::builtinRuleSpecs()));
    std::vector<ScanDiagnostic> diagnostics;

    EXPECT_TRUE(scanner.scan("", &diagnostics).empty());
    EXPECT_TRUE(scanner.scanChunked("", 1024, 0, Scanner::ProgressFn(), &diagnostics).empty());
    EXPECT_TRUE(diagnostics.empty());

    StreamScanner stream(RuleSet::build(piiguard::rules::builtinRuleSpecs()));
    EXPECT_TRUE(stream.finish(&diagnostics).empty());
    EXPECT_TRUE(diagnostics.empty());
}

TEST(ScannerTest, FindAllIsNonOverlappingPerRule) {
    Scanner scanner(RuleSet::build({makeRule("pair", "aa")}));
    auto raw = scanner.scan("aaaaa");
    ASSERT_EQ(raw.size(), (size_t)2);
    EXPECT_EQ(raw[0].start, (size_t)0);
    EXPECT_EQ(raw[1].start, (size_t)2);
}

TEST(ScannerTest, DifferentRulesMayOverlap) {
    Scanner scanner(RuleSet::build({makeRule("digits", "\\d+"), makeRule("dashed", "\\d+-\\d+")}));
    auto raw = scanner.scan("12-34");
    ASSERT_EQ(raw.size(), (size_t)3);
    // Sorted by (start, end, rule order)
    EXPECT_EQ(raw[0].ruleName, "digits");
    EXPECT_EQ(raw[0].end, (size_t)2);
    EXPECT_EQ(raw[1].ruleName, "dashed");
    EXPECT_EQ(raw[1].end, (size_t)5);
    EXPECT_EQ(raw[2].ruleName, "digits");
    EXPECT_EQ(raw[2].start, (size_t)3);
}

// Through the scanner: the Luhn validator filters the card rule
TEST(ScannerTest, ValidatorDiscardsMatches) {
    Scanner scanner(builtinSubset({"credit_card"}));
    const std::string text = "Card 4111 1111 1111 1111 and 1234-5678-9012-3456 on file";

    auto raw = scanner.scan(text);
    ASSERT_EQ(raw.size(), (size_t)1);
    EXPECT_EQ(raw[0].text, "4111 1111 1111 1111");
    EXPECT_EQ(raw[0].start, (size_t)5);
}

TEST(ScannerTest, ThrowingValidatorIsRecordedAndRejected) {
    RuleSpec flaky = makeRule("flaky", "\\d{3}");
    flaky.validator = [](std::string_view s) -> bool {
        if (s == "666") {
            throw std::runtime_error("unlucky number");
        }
        return true;
    };
    Scanner scanner(RuleSet::build({flaky, makeRule("word", "[a-z]+")}));

    std::vector<ScanDiagnostic> diagnostics;
    auto raw = scanner.scan("abc 123 666 789", &diagnostics);

    std::vector<std::string> flakyTexts;
    for (const auto& m : raw) {
        if (m.ruleName == "flaky") {
            flakyTexts.push_back(m.text);
        }
    }
    std::vector<std::string> expected = {"123", "789"};
    EXPECT_EQ(flakyTexts, expected);
    EXPECT_EQ(raw.front().ruleName, "word");

    ASSERT_EQ(diagnostics.size(), (size_t)1);
    EXPECT_EQ(diagnostics[0].kind, ScanDiagnostic::Kind::ValidatorFailure);
    EXPECT_EQ(diagnostics[0].ruleName, "flaky");
    EXPECT_EQ(diagnostics[0].start, (size_t)8);
    EXPECT_EQ(diagnostics[0].end, (size_t)11);
}

TEST(ScannerTest, ZeroLengthMatchesAreDroppedWithDiagnostics) {
    Scanner scanner(RuleSet::build({makeRule("maybe_x", "x*"), makeRule("word", "[a-z]+")}));

    std::vector<ScanDiagnostic> diagnostics;
    auto raw = scanner.scan("ab xx", &diagnostics);

    // "xx" is a real match, every other position yields an empty one
    std::vector<RawMatch> xs;
    for (const auto& m : raw) {
        EXPECT_GT(m.end, m.start);
        if (m.ruleName == "maybe_x") {
            xs.push_back(m);
        }
    }
    ASSERT_EQ(xs.size(), (size_t)1);
    EXPECT_EQ(xs[0].start, (size_t)3);
    EXPECT_EQ(xs[0].end, (size_t)5);

    // Reported once for the rule, at the first empty hit
    ASSERT_EQ(diagnostics.size(), (size_t)1);
    EXPECT_EQ(diagnostics[0].kind, ScanDiagnostic::Kind::InvalidMatch);
    EXPECT_EQ(diagnostics[0].ruleName, "maybe_x");
    EXPECT_EQ(diagnostics[0].start, (size_t)0);
    EXPECT_EQ(diagnostics[0].end, (size_t)0);
    EXPECT_EQ(raw.size(), (size_t)3);  // "ab", "xx" as word, "xx" as maybe_x

    std::vector<ScanDiagnostic> longDiagnostics;
    EXPECT_TRUE(Scanner(RuleSet::build({makeRule("maybe_x", "x*")}))
                    .scan(std::string(5000, '.'), &longDiagnostics).empty());
    EXPECT_EQ(longDiagnostics.size(), (size_t)1);

    longDiagnostics.clear();
    piiguard::util::ThreadPool pool(2);
    EXPECT_TRUE(Scanner(RuleSet::build({makeRule("maybe_x", "x*")}))
                    .scanChunkedParallel(std::string(5000, '.'), 600, 100, pool, &longDiagnostics)
                    .empty());
    EXPECT_EQ(longDiagnostics.size(), (size_t)1);
}

TEST(ScannerTest, LongRunsDoNotMatch) {
    std::vector<ScanDiagnostic> diagnostics;

    Scanner email(builtinSubset({"email"}));
    EXPECT_TRUE(email.scan(std::string(50000, 'a'), &diagnostics).empty());

    Scanner name(builtinSubset({"name"}));
    EXPECT_TRUE(name.scan("Z" + std::string(50000, 'q') + " Bob", &diagnostics).empty());

    Scanner url(builtinSubset({"url"}));
    auto raw = url.scan("http://" + std::string(50000, 'h'), &diagnostics);
    ASSERT_EQ(raw.size(), (size_t)1);
    EXPECT_EQ(raw[0].end - raw[0].start, (size_t)(7 + 253));

    EXPECT_TRUE(diagnostics.empty());
}

TEST(ScannerTest, SkipsJsonKeysWhenAsked) {
    const std::string json = R"({"john@example.com": "owner", "contact": "jane@example.com"})";

    Scanner plain(builtinSubset({"email"}));
    EXPECT_EQ(plain.scan(json).size(), (size_t)2);

    piiguard::scanner::ScanOptions options;
    options.skipJsonKeys = true;
    Scanner skipping(builtinSubset({"email"}), options);
    auto raw = skipping.scan(json);
    ASSERT_EQ(raw.size(), (size_t)1);
    EXPECT_EQ(raw[0].text, "jane@example.com");
}

// Three overlapping windows reproduce the whole-buffer scan
TEST(ScannerChunkTest, ThreeWindowsMatchWholeBuffer) {
    const std::string text = makeRecords(10000);
    ASSERT_EQ(text.size(), (size_t)10000);

    Scanner scanner(builtinSubset({"email", "phone_us", "ssn"}));
    auto whole = scanner.scan(text);
    ASSERT_GT(whole.size(), (size_t)100);

    std::vector<size_t> progressCalls;
    auto chunked = scanner.scanChunked(text, 4000, 256,
        [&progressCalls](size_t index, size_t count) {
            EXPECT_EQ(count, (size_t)3);
            progressCalls.push_back(index);
            return true;
        });
    EXPECT_EQ(progressCalls, (std::vector<size_t>{1, 2}));
    EXPECT_EQ(chunked, whole);

    using piiguard::resolver::ConflictResolver;
    EXPECT_EQ(ConflictResolver::resolve(chunked), ConflictResolver::resolve(whole));
}

TEST(ScannerChunkTest, MatchStraddlingEveryBoundary) {
    // Windows of 40 bytes with 16 bytes of overlap start at 0, 24, 48, 72...
    std::string text(200, ' ');
    const std::string email = "ab@cd.io";
    for (size_t pos : {20, 36, 47, 68, 94, 119, 190}) {
        text.replace(pos, email.size(), email);
    }
    text.resize(200);

    RuleSpec spec = makeRule("email", "\\b[a-z]+@[a-z]+\\.[a-z]{2,}\\b");
    spec.maxMatchLength = 16;
    Scanner scanner(RuleSet::build({spec}));

    auto whole = scanner.scan(text);
    for (size_t chunk : {17, 25, 40, 64, 199, 200, 1000}) {
        EXPECT_EQ(scanner.scanChunked(text, chunk, 16), whole) << "chunkSize=" << chunk;
    }
}

TEST(ScannerChunkTest, DefaultOverlapIsLongestRule) {
    const std::string text = makeRecords(3000);
    Scanner scanner(builtinSubset({"email", "phone_us"}));
    // overlap 0 -> 254 (email)
    EXPECT_EQ(scanner.scanChunked(text, 600), scanner.scan(text));
    EXPECT_THROW(scanner.scanChunked(text, 254), std::invalid_argument);
}

TEST(ScannerChunkTest, ProgressCallbackCancels) {
    const std::string text = makeRecords(10000);
    Scanner scanner(builtinSubset({"email"}));
    size_t calls = 0;
    EXPECT_THROW(scanner.scanChunked(text, 1000, 300,
                     [&calls](size_t, size_t) {
                         ++calls;
                         return calls < 2;
                     }),
                 piiguard::core::ScanCancelled);
    EXPECT_EQ(calls, (size_t)2);
}

TEST(ScannerChunkTest, ParallelWindowsMatchWholeBuffer) {
    const std::string text = makeRecords(10000);
    Scanner scanner(builtinSubset({"email", "phone_us", "ssn"}));
    piiguard::util::ThreadPool pool(3);

    auto whole = scanner.scan(text);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 4000, 256, pool), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 1000, 256, pool), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 20000, 256, pool), whole);
}

// The name rule resumes at the end of its last match, so a window that starts
// inside "Anna Lee" must not report "Lee Bob"
TEST(ScannerChunkTest, ParallelWindowsKeepAdjacentNames) {
    std::string text = "-----Anna Lee Bob Kay";
    text.resize(60, ' ');
    Scanner scanner(builtinSubset({"name"}));
    piiguard::util::ThreadPool pool(2);

    auto whole = scanner.scan(text);
    ASSERT_EQ(whole.size(), (size_t)2);
    EXPECT_EQ(whole[0].text, "Anna Lee");
    EXPECT_EQ(whole[0].start, (size_t)5);
    EXPECT_EQ(whole[1].text, "Bob Kay");
    EXPECT_EQ(whole[1].start, (size_t)14);

    EXPECT_EQ(scanner.scanChunked(text, 30, 20), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 30, 20, pool), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 21, 20, pool), whole);
}

TEST(ScannerChunkTest, ParallelWindowsMatchWholeBufferOnFullCatalog) {
    std::string text;
    for (int i = 0; text.size() < 9000; ++i) {
        text += "Anna Lee Bob Kay Tom Fox met Maria Chen at 12 Oak Street Apt 3B on 03/14/2024; "
                "mail ann" + std::to_string(i) + "@example.org, call 415-555-"
                + std::to_string(1000 + i % 9000) + ", see https://example.org/r/"
                + std::to_string(i) + "?q=1 or PO Box " + std::to_string(100 + i) + ".\n";
    }
    Scanner scanner(RuleSet::build(piiguard::rules::builtinRuleSpecs()));
    piiguard::util::ThreadPool pool(4);

    auto whole = scanner.scan(text);
    size_t names = 0;
    for (const auto& m : whole) {
        names += m.ruleName == "name" ? 1 : 0;
    }
    ASSERT_GT(names, (size_t)100);

    EXPECT_EQ(scanner.scanChunked(text, 3000), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 3000, 0, pool), whole);
    EXPECT_EQ(scanner.scanChunked(text, 200, 120), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 200, 120, pool), whole);
    EXPECT_EQ(scanner.scanChunkedParallel(text, 137, 120, pool), whole);
}

TEST(StreamScannerTest, PiecewiseFeedMatchesWholeBuffer) {
    const std::string text = makeRecords(10000);
    RuleSet rules = builtinSubset({"email", "phone_us", "ssn"});
    auto whole = Scanner(rules).scan(text);

    for (size_t piece : {1, 7, 300, 997, 10000}) {
        StreamScanner stream(rules, 256);
        for (size_t pos = 0; pos < text.size(); pos += piece) {
            stream.feed(std::string_view(text).substr(pos, piece));
            EXPECT_LE(stream.bufferedBytes(), 256 + piece + 1) << "piece=" << piece;
        }
        EXPECT_EQ(stream.bytesConsumed(), text.size());
        EXPECT_EQ(stream.finish(), whole) << "piece=" << piece;
    }
}

TEST(StreamScannerTest, UseAfterFinishThrows) {
    StreamScanner stream(builtinSubset({"email"}));
    stream.feed("mail me: a@b.io");
    auto raw = stream.finish();
    ASSERT_EQ(raw.size(), (size_t)1);
    EXPECT_EQ(raw[0].start, (size_t)9);
    EXPECT_THROW(stream.feed("more"), std::logic_error);
    EXPECT_THROW(stream.finish(), std::logic_error);
}
