#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "wph/plugin/command.hpp"

using namespace wph::plugin;
using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;

// ---------------------------------------------------------------------------
// Sample commands
// ---------------------------------------------------------------------------

namespace {

struct DoubleIn {
    int32_t value = 0;
};

struct DoubleOut {
    int32_t doubled = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DoubleIn, value)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DoubleOut, doubled)

class DoubleCommand : public TypedCommand<DoubleIn, DoubleOut> {
public:
    std::string_view Name() const override { return "double"; }

    HostResult<DoubleOut> RunTyped(std::string_view /*widgetId*/, const EngineInterface& /*engine*/,
                                   DoubleIn input) const override {
        return HostResult<DoubleOut>::ok(DoubleOut{input.value * 2});
    }
};

class PingCommand : public TypedCommand<NoInput, std::string> {
public:
    std::string_view Name() const override { return "ping"; }

    HostResult<std::string> RunTyped(std::string_view widgetId, const EngineInterface& /*engine*/,
                                     NoInput /*input*/) const override {
        return HostResult<std::string>::ok("pong from " + std::string(widgetId));
    }
};

class FailingCommand : public TypedCommand<NoInput, NoOutput> {
public:
    std::string_view Name() const override { return "fail"; }

    HostResult<NoOutput> RunTyped(std::string_view, const EngineInterface&,
                                  NoInput) const override {
        return HostResult<NoOutput>::err(HostError(ErrorCode::CommandFailed, "disk on fire"));
    }
};

class BadOutputCommand : public TypedCommand<NoInput, std::string> {
public:
    std::string_view Name() const override { return "bad_output"; }

    HostResult<std::string> RunTyped(std::string_view, const EngineInterface&,
                                     NoInput) const override {
        return HostResult<std::string>::ok("\xFF\xFE");
    }
};

class ThrowingCommand : public TypedCommand<NoInput, NoOutput> {
public:
    std::string_view Name() const override { return "throwing"; }

    HostResult<NoOutput> RunTyped(std::string_view, const EngineInterface&,
                                  NoInput) const override {
        throw std::runtime_error("device unplugged");
    }
};

nlohmann::json parse(const std::string& text) {
    return nlohmann::json::parse(text);
}

}  // namespace

// ---------------------------------------------------------------------------
// Typed round trip
// ---------------------------------------------------------------------------

TEST(TypedCommandTest, DoublesValue) {
    DoubleCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, R"({"value": 5})");
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(parse(result.value()), parse(R"({"doubled": 10})"));
}

TEST(TypedCommandTest, NoInputAcceptsAbsentNullAndEmptyObject) {
    PingCommand command;
    EngineInterface engine;

    auto absent = command.Run("w1", engine, "");
    auto blank = command.Run("w1", engine, "  \n ");
    auto nullText = command.Run("w1", engine, "null");
    auto object = command.Run("w1", engine, "{}");

    ASSERT_TRUE(absent.hasValue());
    ASSERT_TRUE(blank.hasValue());
    ASSERT_TRUE(nullText.hasValue());
    ASSERT_TRUE(object.hasValue());
    EXPECT_EQ(parse(absent.value()).get<std::string>(), "pong from w1");
    EXPECT_EQ(absent.value(), nullText.value());
    EXPECT_EQ(absent.value(), blank.value());
    EXPECT_EQ(absent.value(), object.value());
}

TEST(TypedCommandTest, NoInputRejectsScalars) {
    PingCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, "42");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidPayload);
}

TEST(TypedCommandTest, NoOutputSerializesAsNull) {
    nlohmann::json j = NoOutput{};
    EXPECT_TRUE(j.is_null());
}

// ---------------------------------------------------------------------------
// Failures become dispatch errors
// ---------------------------------------------------------------------------

TEST(TypedCommandTest, MalformedJsonIsInvalidPayload) {
    DoubleCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, R"({"value": )");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidPayload);
    EXPECT_TRUE(wph::foundation::isDispatchError(result.error().code()));
}

TEST(TypedCommandTest, WrongShapeIsInvalidPayload) {
    DoubleCommand command;
    EngineInterface engine;

    auto missingField = command.Run("w1", engine, R"({"other": 1})");
    ASSERT_TRUE(missingField.hasError());
    EXPECT_EQ(missingField.error().code(), ErrorCode::InvalidPayload);

    auto wrongType = command.Run("w1", engine, R"({"value": "five"})");
    ASSERT_TRUE(wrongType.hasError());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::InvalidPayload);

    auto nullPayload = command.Run("w1", engine, "");
    ASSERT_TRUE(nullPayload.hasError());
    EXPECT_EQ(nullPayload.error().code(), ErrorCode::InvalidPayload);
}

TEST(TypedCommandTest, CommandErrorPassesThrough) {
    FailingCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, "null");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CommandFailed);
    EXPECT_EQ(result.error().message(), "disk on fire");
}

TEST(TypedCommandTest, UnserializableOutputIsInvalidResult) {
    BadOutputCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, "null");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidResult);
}

TEST(TypedCommandTest, ExceptionFromBodyIsCommandFailed) {
    ThrowingCommand command;
    EngineInterface engine;
    auto result = command.Run("w1", engine, "");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CommandFailed);
    EXPECT_NE(result.error().message().find("device unplugged"), std::string_view::npos);
    EXPECT_NE(result.error().message().find("throwing"), std::string_view::npos);
}
