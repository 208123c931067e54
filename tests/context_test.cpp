#include <array>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <cstdint>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <bindiag.hpp>

using namespace bindiag;

namespace {

// Formattable value that counts how often it is formatted
struct CountedArg {
    int* calls;
};

// Two-byte magic followed by a little-endian u32 length
auto record_parser() {
    return [](Input input) -> ParseResult<uint32_t> {
        auto magic = context("magic", tag({0xCA, 0xFE}))(input);
        if (!magic.has_value()) {
            return unexpected(std::move(magic).error());
        }
        return context("length (4-byte little-endian)", le_u32())(magic->remaining);
    };
}

std::string_view label_of(const TraceEntry& entry) {
    return std::get<ContextLabel>(entry.annotation).text;
}

} // namespace

template <>
struct fmt::formatter<CountedArg> : fmt::formatter<std::string_view> {
    auto format(const CountedArg& arg, fmt::format_context& ctx) const {
        ++*arg.calls;
        return fmt::formatter<std::string_view>::format("counted", ctx);
    }
};

class ContextTest : public ::testing::Test {
protected:
    std::array<uint8_t, 6> good{0xCA, 0xFE, 0x10, 0x00, 0x00, 0x00};
    std::array<uint8_t, 4> short_length{0xCA, 0xFE, 0x10, 0x00};
    std::array<uint8_t, 6> bad_magic{0xCA, 0xFF, 0x10, 0x00, 0x00, 0x00};
};

TEST_F(ContextTest, SuccessIsTransparent) {
    int label_calls = 0;
    auto annotated = context(
        [&label_calls] {
            ++label_calls;
            return std::string("record");
        },
        record_parser());

    Input input{good};
    auto plain = record_parser()(input);
    auto result = annotated(input);

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->value, plain->value);
    EXPECT_EQ(result->value, 0x10u);
    EXPECT_EQ(result->remaining.data(), plain->remaining.data());
    EXPECT_TRUE(result->remaining.empty());
    EXPECT_EQ(label_calls, 0);
}

TEST_F(ContextTest, FailureRecordsWrapperPosition) {
    Input input{short_length};
    auto result = context("record", record_parser())(input);

    ASSERT_FALSE(result.has_value());
    const auto& failure = result.error();
    EXPECT_EQ(failure.severity, Severity::recoverable);

    // eof from le_u32, then the two annotators it passed through
    ASSERT_EQ(failure.trace.size(), 3u);
    EXPECT_EQ(std::get<ErrorKind>(failure.trace[0].annotation), ErrorKind::eof);
    EXPECT_EQ(offset_of(input, failure.trace[0].position), 2u);

    EXPECT_EQ(label_of(failure.trace[1]), "length (4-byte little-endian)");
    EXPECT_EQ(offset_of(input, failure.trace[1].position), 2u);

    // The outer entry points where the wrapper started, not where parsing failed
    EXPECT_EQ(label_of(failure.trace[2]), "record");
    EXPECT_EQ(offset_of(input, failure.trace[2].position), 0u);
    EXPECT_EQ(failure.trace[2].position.size(), short_length.size());
}

TEST_F(ContextTest, LabelEvaluatedOncePerFailure) {
    int label_calls = 0;
    auto annotated = context(
        [&label_calls] {
            ++label_calls;
            return std::string("record");
        },
        record_parser());

    auto result = annotated(Input{bad_magic});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(label_calls, 1);
    EXPECT_EQ(result.error().trace.size(), 3u);
    EXPECT_EQ(std::get<ErrorKind>(result.error().trace.front().annotation), ErrorKind::tag);
}

TEST_F(ContextTest, FatalSeverityPreserved) {
    auto committed = [](Input input) -> ParseResult<int> {
        return bail_fatal(input, "unsupported version");
    };

    Input input{good};
    auto result = context("file header", committed)(input.subspan(2));

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_fatal());
    ASSERT_EQ(result.error().trace.size(), 2u);
    EXPECT_EQ(label_of(result.error().trace[0]), "unsupported version");
    EXPECT_EQ(label_of(result.error().trace[1]), "file header");
    EXPECT_EQ(offset_of(input, result.error().trace[1].position), 2u);
}

TEST_F(ContextTest, IncompletePassesThroughUnannotated) {
    int label_calls = 0;
    auto streaming = [](Input input) -> ParseResult<int> {
        return unexpected(
            ParseFailure{Severity::incomplete, Trace::from_error_kind(input, ErrorKind::eof)});
    };
    auto annotated = context(
        [&label_calls] {
            ++label_calls;
            return std::string("chunk");
        },
        streaming);

    auto result = annotated(Input{good});

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_incomplete());
    EXPECT_EQ(result.error().trace.size(), 1u);
    EXPECT_EQ(label_calls, 0);
}

TEST_F(ContextTest, FormattedLabelIsLazy) {
    int format_calls = 0;
    auto annotated = context_fmt(le_u32(), "field {} #{}", CountedArg{&format_calls}, 3);

    auto ok = annotated(Input{good});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(format_calls, 0);

    auto failed = annotated(Input{good}.subspan(4));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(format_calls, 1);
    EXPECT_EQ(label_of(failed.error().trace.back()), "field counted #3");
}

TEST_F(ContextTest, FormattedLabelOwnsItsArguments) {
    auto make_parser = [] {
        std::string name = "count";
        return context_fmt(le_u32(), "field `{}` (4-byte little-endian)", name);
    };
    auto annotated = make_parser();

    auto failed = annotated(Input{good}.subspan(3));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(label_of(failed.error().trace.back()), "field `count` (4-byte little-endian)");
}

TEST_F(ContextTest, DisplayLabelIsLazy) {
    int format_calls = 0;
    auto annotated = context_display(le_u16(), CountedArg{&format_calls});

    ASSERT_TRUE(annotated(Input{good}).has_value());
    EXPECT_EQ(format_calls, 0);

    auto failed = annotated(Input{good}.subspan(5));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(format_calls, 1);
    EXPECT_EQ(label_of(failed.error().trace.back()), "counted");
}

TEST_F(ContextTest, DisplayLabelFromNumber) {
    auto failed = context_display(u8(), 42)(Input{good}.subspan(6));

    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(label_of(failed.error().trace.back()), "42");
}

TEST_F(ContextTest, PrecomputedStringLabel) {
    std::string label = "section ";
    label += "table";
    auto annotated = context(label, take(16));

    auto failed = annotated(Input{good});
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(label_of(failed.error().trace.back()), "section table");
}

TEST_F(ContextTest, BailSeedsContextEntry) {
    Input input{bad_magic};

    auto plain = bail(input.subspan(1), "bad magic");
    EXPECT_EQ(plain.value().severity, Severity::recoverable);
    ASSERT_EQ(plain.value().trace.size(), 1u);
    EXPECT_EQ(label_of(plain.value().trace.front()), "bad magic");
    EXPECT_EQ(offset_of(input, plain.value().trace.front().position), 1u);

    auto formatted = bail(input, "bad magic {:#06x}", 0xCAFF);
    EXPECT_EQ(label_of(formatted.value().trace.front()), "bad magic 0xcaff");

    auto fatal = bail_fatal(input, "version {} not supported", 9);
    EXPECT_EQ(fatal.value().severity, Severity::fatal);
    EXPECT_EQ(label_of(fatal.value().trace.front()), "version 9 not supported");

    auto error = context_error(input, "truncated", Severity::fatal);
    EXPECT_TRUE(error.is_fatal());
}

TEST_F(ContextTest, SummaryPrefersOutermostLabel) {
    Input input{short_length};

    auto labelled = context("record", record_parser())(input);
    ASSERT_FALSE(labelled.has_value());
    EXPECT_EQ(labelled.error().summary(), "record");

    auto raw = le_u32()(input.subspan(2));
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().summary(), "Eof");
}

TEST_F(ContextTest, SummaryOfMovedOutTraceIsEmpty) {
    auto failed = context("record", record_parser())(Input{short_length});
    ASSERT_FALSE(failed.has_value());

    auto failure = std::move(failed).error();
    Trace taken = std::move(failure.trace);
    EXPECT_EQ(taken.back().annotation, Annotation{ContextLabel{"record"}});

    ASSERT_TRUE(failure.trace.empty());
    EXPECT_TRUE(failure.summary().empty());
}
