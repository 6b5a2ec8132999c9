#include <widgetcore/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace WC;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NotSupported);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when the message is absent.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::ChannelClosed, "receiver dropped"};
        CHECK(describeError(withMsg) == "channel_closed:receiver dropped");

        Error withoutMsg{Error::Code::MalformedInput, {}};
        CHECK(describeError(withoutMsg) == "malformed_input");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("make_error defaults to UnknownError") {
        auto err = make_error("boom");
        CHECK(err.code == Error::Code::UnknownError);
        REQUIRE(err.message.has_value());
        CHECK(*err.message == "boom");

        auto invalid = make_error("bad size", Error::Code::InvalidArgument);
        CHECK(invalid.code == Error::Code::InvalidArgument);
    }
}
