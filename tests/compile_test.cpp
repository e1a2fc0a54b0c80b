#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "compiled_pattern.hpp"
#include "engine.hpp"
#include "from_pattern.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "matcher.hpp"
#include "pattern.hpp"

namespace {

using ::bytepat::CaptureError;
using ::bytepat::CaptureErrorKind;
using ::bytepat::CaptureKind;
using ::bytepat::compile_pattern;
using ::bytepat::compile::CaptureInfo;
using ::bytepat::compile::CaptureStep;
using ::bytepat::compile::CompiledPattern;
using ::bytepat::compile::LiteralStep;
using ::bytepat::compile::RestStep;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::SizeIs;

namespace pattern_constants = ::bytepat::pattern_constants;

auto CaptureIs(std::string name, CaptureKind kind) {
    return ::testing::AllOf(Field(&CaptureInfo::name, name),
                            Field(&CaptureInfo::kind, kind));
}

TEST(CompileTest, EmptyPattern) {
    auto compiled = compile_pattern("");
    EXPECT_EQ(compiled.fixed_length(), 0u);
    EXPECT_FALSE(compiled.has_rest());
    EXPECT_THAT(compiled.steps(), IsEmpty());
    EXPECT_THAT(compiled.captures(), IsEmpty());

    CompiledPattern defaulted;
    EXPECT_EQ(defaulted.fixed_length(), 0u);
    EXPECT_FALSE(defaulted.has_rest());
}

TEST(CompileTest, MovedFromPatternIsEmpty) {
    auto source = compile_pattern(R"("k" key [value])");
    CompiledPattern moved(std::move(source));
    EXPECT_EQ(moved.captures().size(), 2u);

    EXPECT_EQ(source.fixed_length(), 0u);
    EXPECT_FALSE(source.has_rest());
    EXPECT_THAT(source.steps(), IsEmpty());
    EXPECT_THAT(source.captures(), IsEmpty());
    EXPECT_EQ(source.find_capture("key"), nullptr);
    EXPECT_TRUE(bytepat::engine::is_match(source, ""));
    EXPECT_FALSE(bytepat::engine::is_match(source, "ka"));

    CompiledPattern assigned;
    assigned = std::move(moved);
    EXPECT_TRUE(assigned.has_rest());
    EXPECT_THAT(moved.captures(), IsEmpty());
    EXPECT_EQ(to_str(moved), "");
}

TEST(CompileTest, FixedLengthWithoutRest) {
    auto compiled = compile_pattern(R"("one" _ "two"x2 _ "three"x3)");
    EXPECT_EQ(compiled.fixed_length(), 26u);
    EXPECT_FALSE(compiled.has_rest());
    EXPECT_THAT(compiled.captures(), IsEmpty());
    EXPECT_TRUE(compiled.accepts_length(26));
    EXPECT_FALSE(compiled.accepts_length(25));
    EXPECT_FALSE(compiled.accepts_length(27));
}

TEST(CompileTest, MinimumLengthWithRest) {
    auto compiled =
        compile_pattern(R"("one" ' ' "two"x2 space "three"x2 [rest])");
    EXPECT_EQ(compiled.fixed_length(), 21u);
    EXPECT_TRUE(compiled.has_rest());
    EXPECT_FALSE(compiled.accepts_length(20));
    EXPECT_TRUE(compiled.accepts_length(21));
    EXPECT_TRUE(compiled.accepts_length(1000));
}

TEST(CompileTest, CaptureKinds) {
    auto compiled = compile_pattern("a max10 [tail]");
    EXPECT_THAT(compiled.captures(),
                ElementsAre(CaptureIs("a", CaptureKind::Byte),
                            CaptureIs("max10", CaptureKind::Byte),
                            CaptureIs("tail", CaptureKind::Slice)));
    EXPECT_EQ(compiled.fixed_length(), 2u);
}

TEST(CompileTest, StepsCarryOffsets) {
    auto compiled = compile_pattern(R"("ab" _ id "cd"x2 [_])");
    const auto& steps = compiled.steps();
    ASSERT_THAT(steps, SizeIs(3));

    const auto& first = std::get<LiteralStep>(steps[0]);
    EXPECT_EQ(first.offset, 0u);
    EXPECT_EQ(first.bytes, "ab");

    const auto& capture = std::get<CaptureStep>(steps[1]);
    EXPECT_EQ(capture.offset, 3u);
    EXPECT_EQ(capture.length, 1u);

    const auto& second = std::get<LiteralStep>(steps[2]);
    EXPECT_EQ(second.offset, 4u);
    EXPECT_EQ(second.bytes, "cd");
    EXPECT_EQ(second.repeat, 2u);

    EXPECT_EQ(compiled.fixed_length(), 8u);
    EXPECT_TRUE(compiled.has_rest());
}

TEST(CompileTest, BoundRestEmitsStep) {
    auto compiled = compile_pattern(R"("ab" [tail])");
    ASSERT_THAT(compiled.steps(), SizeIs(2));
    EXPECT_TRUE(std::holds_alternative<RestStep>(compiled.steps()[1]));
}

TEST(CompileTest, NoCapturesOption) {
    auto compiled = compile_pattern(R"(a "b" _x2 [r])",
                                    pattern_constants::no_captures);
    EXPECT_THAT(compiled.captures(), IsEmpty());
    ASSERT_THAT(compiled.steps(), SizeIs(1));
    EXPECT_EQ(compiled.fixed_length(), 4u);
    EXPECT_TRUE(compiled.has_rest());
}

TEST(CompileTest, NoCapturesStillRejectsDuplicates) {
    EXPECT_THROW(compile_pattern("a a", pattern_constants::no_captures),
                 bytepat::ParseError);
}

TEST(CompileTest, OptimizeFusesAdjacentLiterals) {
    auto plain = compile_pattern(R"("ab" "cd"x2 ' ')");
    EXPECT_THAT(plain.steps(), SizeIs(3));

    auto fused =
        compile_pattern(R"("ab" "cd"x2 ' ')", pattern_constants::optimize);
    ASSERT_THAT(fused.steps(), SizeIs(1));
    const auto& step = std::get<LiteralStep>(fused.steps()[0]);
    EXPECT_EQ(step.offset, 0u);
    EXPECT_EQ(step.bytes, "abcdcd ");
    EXPECT_EQ(step.repeat, 1u);
    EXPECT_EQ(fused.fixed_length(), plain.fixed_length());
}

TEST(CompileTest, OptimizeDoesNotFuseAcrossGaps) {
    auto compiled =
        compile_pattern(R"("ab" _ "cd")", pattern_constants::optimize);
    ASSERT_THAT(compiled.steps(), SizeIs(2));
    EXPECT_EQ(std::get<LiteralStep>(compiled.steps()[1]).offset, 3u);
}

TEST(CompileTest, OptimizeKeepsLongRunsUnexpanded) {
    auto compiled =
        compile_pattern(R"("a"x1000)", pattern_constants::optimize);
    ASSERT_THAT(compiled.steps(), SizeIs(1));
    const auto& step = std::get<LiteralStep>(compiled.steps()[0]);
    EXPECT_EQ(step.bytes, "a");
    EXPECT_EQ(step.repeat, 1000u);
}

TEST(CompileTest, EmptyLiteralsEmitNoSteps) {
    auto compiled = compile_pattern(R"("" "ab"x0 _)");
    EXPECT_THAT(compiled.steps(), IsEmpty());
    EXPECT_EQ(compiled.fixed_length(), 1u);
}

TEST(CompileTest, TypedAccessors) {
    bytepat::ast::Pattern pattern{{
        bytepat::ast::Wildcard{"sep"},
        bytepat::ast::Wildcard{"field", 3},
        bytepat::ast::Rest{"rest"},
    }};
    auto compiled = bytepat::compile::from_pattern(pattern);
    EXPECT_EQ(compiled.byte_capture("sep").slot, 0u);
    EXPECT_EQ(compiled.slice_capture("field").slot, 1u);
    EXPECT_EQ(compiled.slice_capture("rest").slot, 2u);

    try {
        compiled.slice_capture("sep");
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::WrongCaptureKind);
        EXPECT_EQ(e.name(), "sep");
    }

    try {
        compiled.byte_capture("missing");
        FAIL() << "expected CaptureError";
    } catch (const CaptureError& e) {
        EXPECT_EQ(e.kind(), CaptureErrorKind::UnknownCaptureName);
    }
}

TEST(CompileTest, FindCapture) {
    auto compiled = compile_pattern("x [y]");
    ASSERT_NE(compiled.find_capture("y"), nullptr);
    EXPECT_EQ(compiled.find_capture("y")->kind, CaptureKind::Slice);
    EXPECT_EQ(compiled.find_capture("z"), nullptr);
}

TEST(CompileTest, RendersCanonicalText) {
    EXPECT_EQ(to_str(compile_pattern(R"("one" _ "two"x2 _ "three"x3)")),
              R"("one" _ "two"x2 _ "three"x3)");
    EXPECT_EQ(
        to_str(compile_pattern(R"("one" ' ' "two"x2 space "three"x2 [rest])")),
        R"("one" " " "two"x2 space "three"x2 [rest])");
    EXPECT_EQ(to_str(compile_pattern(R"('a' _x3 field _ [_])")),
              R"("a" _x3 field _ [_])");
    EXPECT_EQ(to_str(compile_pattern(R"(a "b" [r])",
                                     pattern_constants::no_captures)),
              R"(_ "b" [_])");
    EXPECT_EQ(to_str(compile_pattern("")), "");
}

TEST(CompileTest, RenderedTextRecompilesIdentically) {
    for (std::string_view source :
         {R"("GET " _x2 id [path])", R"(b"\x00\xff"x2 _ "\n")",
          R"("a" "b"x3 c)"}) {
        auto first = compile_pattern(source);
        auto second = compile_pattern(to_str(first));
        EXPECT_EQ(to_str(second), to_str(first));
        EXPECT_EQ(second.fixed_length(), first.fixed_length());
        EXPECT_EQ(second.has_rest(), first.has_rest());
        EXPECT_EQ(second.captures().size(), first.captures().size());
    }
}

TEST(AstTest, RendersEscapes) {
    bytepat::ast::Pattern pattern{
        {bytepat::ast::Literal{std::string("\n\x01\"\\\0", 5), 2}}};
    EXPECT_EQ(bytepat::ast::to_str(pattern), R"("\n\x01\"\\\0"x2)");
    EXPECT_EQ(bytepat::ast::byte_length(pattern.terms[0]), 10u);
}

TEST(AstTest, LoweringHandBuiltPattern) {
    bytepat::ast::Pattern pattern{{
        bytepat::ast::Wildcard{"len", 2},
        bytepat::ast::Literal{":"},
        bytepat::ast::Wildcard{"empty", 0},
        bytepat::ast::Rest{"body"},
    }};
    auto compiled = bytepat::compile::from_pattern(pattern);
    EXPECT_EQ(compiled.fixed_length(), 3u);
    EXPECT_THAT(compiled.captures(),
                ElementsAre(CaptureIs("len", CaptureKind::Slice),
                            CaptureIs("empty", CaptureKind::Slice),
                            CaptureIs("body", CaptureKind::Slice)));
    EXPECT_EQ(to_str(compiled), R"(lenx2 ":" emptyx0 [body])");
}

}  // namespace
