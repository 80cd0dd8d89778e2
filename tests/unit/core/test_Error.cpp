#include "core/Error.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace WP;

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

        Error withMsg{Error::Code::Rejected, "pool full"};
        CHECK(describeError(withMsg) == "rejected:pool full");

        Error withoutMsg{Error::Code::Timeout, {}};
        CHECK(describeError(withoutMsg) == "timeout");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("ErrorException carries the error") {
        Error original{Error::Code::Cancelled, "stopped"};
        try {
            throw ErrorException(original);
        } catch (ErrorException const& e) {
            CHECK(e.error().code == Error::Code::Cancelled);
            CHECK(e.error().message == std::optional<std::string>{"stopped"});
            CHECK(std::string(e.what()) == "cancelled:stopped");
        }
    }
}
